// Errors raised while moving types, members and expressions between universes.
#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "retarget/metadata.hpp"

namespace retarget
{

    struct Note { std::string message; int line=-1; int col=-1; };
    struct Diagnostic { std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::vector<Note> notes; };

    class RetargetError : public std::runtime_error
    {
    public:
        explicit RetargetError(Diagnostic d) : std::runtime_error(d.message), diag_(std::move(d)) {}
        const Diagnostic &diagnostic() const { return diag_; }
        const std::string &code() const { return diag_.code; }
        const std::string &hint() const { return diag_.hint; }
        const std::vector<Note> &notes() const { return diag_.notes; }

    private:
        Diagnostic diag_;
    };

    // E2001: no candidate in the destination universe.
    class TypeNotFound : public RetargetError
    {
    public:
        TypeNotFound(Diagnostic d, TypeId type) : RetargetError(std::move(d)), type_(type) {}
        TypeId type() const { return type_; }

    private:
        TypeId type_;
    };

    // E2002: more than one distinct candidate.
    class AmbiguousType : public RetargetError
    {
    public:
        AmbiguousType(Diagnostic d, TypeId type, std::vector<TypeId> candidates)
            : RetargetError(std::move(d)), type_(type), candidates_(std::move(candidates)) {}
        TypeId type() const { return type_; }
        const std::vector<TypeId> &candidates() const { return candidates_; }

    private:
        TypeId type_;
        std::vector<TypeId> candidates_;
    };

    // E2101..E2104 depending on the member kind.
    class MemberNotFound : public RetargetError
    {
    public:
        MemberNotFound(Diagnostic d, MemberId member, TypeId declaring)
            : RetargetError(std::move(d)), member_(member), declaring_(declaring) {}
        MemberId member() const { return member_; }
        TypeId declaring_type() const { return declaring_; }

    private:
        MemberId member_;
        TypeId declaring_;
    };

    // E2201: a construct that cannot cross universes.
    class UnsupportedConstruct : public RetargetError
    {
    public:
        using RetargetError::RetargetError;
    };

} // namespace retarget
