// Identity-preserving variable mapping between universes.
#pragma once
#include <optional>
#include <unordered_map>

#include "retarget/expr.hpp"
#include "retarget/options.hpp"
#include "retarget/type_resolver.hpp"

namespace retarget
{

    class VarTable
    {
    public:
        VarTable(Metadata &md, VarPool &vars, TypeResolver &types, const ReplacerOptions &opts)
            : md_(md), vars_(vars), types_(types), opts_(opts) {}

        // Forward is memoized; backward of a forward image returns the original binder and
        // otherwise creates a fresh binder on every call.
        VarId rewrite(Direction d, VarId v);

        std::optional<VarId> forward_of(VarId v) const;
        std::optional<VarId> backward_of(VarId v) const;
        size_t size() const { return forward_.size(); }

    private:
        VarId clone(Direction d, VarId v);

        Metadata &md_;
        VarPool &vars_;
        TypeResolver &types_;
        const ReplacerOptions &opts_;
        std::unordered_map<VarId, VarId> forward_;  // origin binder -> target binder
        std::unordered_map<VarId, VarId> backward_; // target binder -> origin binder
    };

} // namespace retarget
