#include "retarget/var_table.hpp"

#include <cstdio>

namespace retarget
{

    VarId VarTable::clone(Direction d, VarId v)
    {
        Var copy = vars_.at(v);
        TypeId t = types_.resolve(d, copy.type);
        VarId nv = vars_.create(copy.name, t, copy.is_mutable);
        if (opts_.debugVars)
            std::fprintf(stderr, "[dbg][vars][%s] %s#%u -> %s#%u : %s\n", direction_tag(d), copy.name.c_str(), v, copy.name.c_str(), nv,
                         md_.to_string(t).c_str());
        return nv;
    }

    VarId VarTable::rewrite(Direction d, VarId v)
    {
        if (md_.is_host_defined(vars_.at(v).type))
            return v;
        if (d == Direction::Forward)
        {
            auto it = forward_.find(v);
            if (it != forward_.end())
                return it->second;
            VarId nv = clone(d, v);
            forward_[v] = nv;
            backward_[nv] = v;
            return nv;
        }
        auto it = backward_.find(v);
        if (it != backward_.end())
            return it->second;
        VarId nv = clone(d, v);
        forward_[nv] = v;
        return nv;
    }

    std::optional<VarId> VarTable::forward_of(VarId v) const
    {
        auto it = forward_.find(v);
        if (it == forward_.end())
            return std::nullopt;
        return it->second;
    }

    std::optional<VarId> VarTable::backward_of(VarId v) const
    {
        auto it = backward_.find(v);
        if (it == backward_.end())
            return std::nullopt;
        return it->second;
    }

} // namespace retarget
