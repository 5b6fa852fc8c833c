// Maps a type of one universe onto the structurally corresponding type of the other.
#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "retarget/errors.hpp"
#include "retarget/lookup.hpp"
#include "retarget/metadata.hpp"
#include "retarget/options.hpp"

namespace retarget
{

    enum class Direction
    {
        Forward,  // origin -> target
        Backward  // target -> origin
    };

    inline const char *direction_tag(Direction d) { return d == Direction::Forward ? "fwd" : "bwd"; }

    class TypeResolver
    {
    public:
        TypeResolver(Metadata &md, const TypeLookup &lookup, Universe origin, Universe target, const ReplacerOptions &opts);

        // Throws TypeNotFound or AmbiguousType.
        TypeId resolve(Direction d, TypeId t);

        // Strips the interactive host's leading "FSI_0004." segment.
        std::string fix_name(const std::string &full_name) const;

        const Universe &destination(Direction d) const { return d == Direction::Forward ? target_ : origin_; }
        const Universe &source(Direction d) const { return d == Direction::Forward ? origin_ : target_; }
        bool is_cached(Direction d, TypeId t) const { return cache(d).count(t) != 0; }
        size_t cache_size(Direction d) const { return cache(d).size(); }

    private:
        struct Candidate
        {
            TypeId type;
            bool stable;
        };

        TypeId resolve_definition(Direction d, TypeId t);
        std::optional<Candidate> find_in_module(ModuleId m, const std::string &fixed) const;
        [[noreturn]] void fail_not_found(Direction d, TypeId t) const;
        [[noreturn]] void fail_ambiguous(Direction d, TypeId t, const std::vector<Candidate> &found) const;
        std::unordered_map<TypeId, TypeId> &cache(Direction d) { return d == Direction::Forward ? fwd_ : bwd_; }
        const std::unordered_map<TypeId, TypeId> &cache(Direction d) const { return d == Direction::Forward ? fwd_ : bwd_; }

        Metadata &md_;
        const TypeLookup &lookup_;
        Universe origin_;
        Universe target_;
        const ReplacerOptions &opts_;
        std::unordered_map<TypeId, TypeId> fwd_;
        std::unordered_map<TypeId, TypeId> bwd_;
    };

} // namespace retarget
