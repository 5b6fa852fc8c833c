// Re-finds properties, fields, methods and constructors on the resolved declaring type.
#pragma once
#include "retarget/errors.hpp"
#include "retarget/metadata.hpp"
#include "retarget/options.hpp"
#include "retarget/type_resolver.hpp"

namespace retarget
{

    class MemberResolver
    {
    public:
        MemberResolver(Metadata &md, TypeResolver &types, const ReplacerOptions &opts) : md_(md), types_(types), opts_(opts) {}

        // Dispatches on the member kind. Throws MemberNotFound, or the declaring type's resolution error.
        MemberId resolve(Direction d, MemberId m);

        MemberId resolve_property(Direction d, MemberId p);
        MemberId resolve_field(Direction d, MemberId f);
        MemberId resolve_method(Direction d, MemberId m);
        MemberId resolve_constructor(Direction d, MemberId c);

    private:
        std::vector<TypeId> resolve_all(Direction d, const std::vector<TypeId> &ts);
        [[noreturn]] void fail(const char *code, const std::string &message, MemberId m, TypeId declaring) const;

        Metadata &md_;
        TypeResolver &types_;
        const ReplacerOptions &opts_;
    };

} // namespace retarget
