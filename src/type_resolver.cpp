#include "retarget/type_resolver.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace retarget
{

    namespace
    {
        bool starts_with(const std::string &s, const std::string &prefix)
        {
            return !prefix.empty() && s.compare(0, prefix.size(), prefix) == 0;
        }
    }

    TypeResolver::TypeResolver(Metadata &md, const TypeLookup &lookup, Universe origin, Universe target, const ReplacerOptions &opts)
        : md_(md), lookup_(lookup), origin_(std::move(origin)), target_(std::move(target)), opts_(opts) {}

    std::string TypeResolver::fix_name(const std::string &full_name) const
    {
        if (!starts_with(full_name, opts_.interactiveTypePrefix))
            return full_name;
        auto dot = full_name.find('.');
        return dot == std::string::npos ? full_name : full_name.substr(dot + 1);
    }

    TypeId TypeResolver::resolve(Direction d, TypeId t)
    {
        const Type ty = md_.type(t);
        if (ty.host_defined || ty.kind == Type::Kind::Abbreviation)
            return t;
        switch (ty.kind)
        {
        case Type::Kind::GenericInstance:
        {
            TypeId def = resolve_definition(d, ty.definition);
            std::vector<TypeId> args;
            for (TypeId a : ty.args)
                args.push_back(resolve(d, a));
            return md_.make_generic(def, args);
        }
        case Type::Kind::GenericParameter:
            return t;
        case Type::Kind::Array:
            return md_.make_array(resolve(d, ty.element), ty.rank);
        case Type::Kind::ByRef:
            return md_.make_byref(resolve(d, ty.element));
        case Type::Kind::Pointer:
            return md_.make_pointer(resolve(d, ty.element));
        case Type::Kind::Tuple:
        {
            std::vector<TypeId> elems;
            for (TypeId a : ty.args)
                elems.push_back(resolve(d, a));
            return md_.make_tuple(elems);
        }
        case Type::Kind::Definition:
        case Type::Kind::Abbreviation:
            break;
        }
        return resolve_definition(d, t);
    }

    TypeId TypeResolver::resolve_definition(Direction d, TypeId t)
    {
        auto &c = cache(d);
        auto hit = c.find(t);
        if (hit != c.end())
        {
            if (opts_.debugResolve)
                std::fprintf(stderr, "[dbg][resolve][%s] %s -> %s (cached)\n", direction_tag(d), md_.to_string(t).c_str(), md_.to_string(hit->second).c_str());
            return hit->second;
        }
        const std::string fixed = fix_name(lookup_.type_name(t));
        // The host expects the one canonical void whichever universe asked.
        if (fixed == opts_.voidName)
            return md_.void_type();

        std::vector<Candidate> found;
        for (ModuleId m : destination(d))
        {
            auto cand = find_in_module(m, fixed);
            if (!cand)
                continue;
            auto same = std::find_if(found.begin(), found.end(), [&](const Candidate &x) { return x.type == cand->type; });
            if (same == found.end())
                found.push_back(*cand);
            else
                same->stable = same->stable && cand->stable;
        }
        if (found.size() > 1)
            fail_ambiguous(d, t, found);
        if (found.empty())
            fail_not_found(d, t);

        const Candidate &r = found.front();
        if (r.stable && opts_.cacheTypes)
            c[t] = r.type;
        if (opts_.debugResolve)
            std::fprintf(stderr, "[dbg][resolve][%s] %s -> %s%s\n", direction_tag(d), md_.to_string(t).c_str(), md_.to_string(r.type).c_str(),
                         r.stable ? "" : " (unstable, not cached)");
        return r.type;
    }

    std::optional<TypeResolver::Candidate> TypeResolver::find_in_module(ModuleId m, const std::string &fixed) const
    {
        if (!starts_with(lookup_.module_name(m), opts_.interactiveModulePrefix))
        {
            if (auto t = lookup_.type_in_module(m, fixed))
                return Candidate{*t, true};
            return std::nullopt;
        }
        // Successive interactive submissions redefine the same type; the last one by name wins.
        std::vector<std::pair<std::string, TypeId>> matches;
        for (TypeId t : lookup_.types_in_module(m))
        {
            std::string name = lookup_.type_name(t);
            if (fix_name(name) == fixed)
                matches.emplace_back(std::move(name), t);
        }
        if (matches.empty())
            return std::nullopt;
        std::sort(matches.begin(), matches.end());
        return Candidate{matches.back().second, false};
    }

    void TypeResolver::fail_not_found(Direction d, TypeId t) const
    {
        Diagnostic diag;
        diag.code = "E2001";
        const std::string set = md_.universe_to_string(destination(d));
        if (d == Direction::Forward)
        {
            diag.message = "Type '" + md_.to_string(t) + "' not found in reference assembly set '" + set + "'";
            diag.hint = "the reference assemblies may be a portable profile which contains fewer types than the design-time set; check the referenced assemblies";
        }
        else
        {
            diag.message = "Type '" + md_.to_string(t) + "' not found in the design-time assembly set '" + set +
                           "'. Please report this problem to the project site for the type provider";
            diag.hint = "the design-time assemblies should define every type the reference assemblies expose";
        }
        for (ModuleId m : destination(d))
            diag.notes.push_back(Note{"searched module '" + lookup_.module_name(m) + "'"});
        throw TypeNotFound(std::move(diag), t);
    }

    void TypeResolver::fail_ambiguous(Direction d, TypeId t, const std::vector<Candidate> &found) const
    {
        Diagnostic diag;
        diag.code = "E2002";
        const std::string set = md_.universe_to_string(destination(d));
        if (d == Direction::Forward)
        {
            diag.message = "Type '" + md_.to_string(t) + "' found in multiple assemblies in the reference assembly set '" + set +
                           "'. You may need to adjust your assembly references to avoid ambiguities";
            diag.hint = "keep only one of the assemblies defining this type in the reference set";
        }
        else
        {
            diag.message = "Type '" + md_.to_string(t) + "' found in multiple assemblies in the design-time assembly set '" + set +
                           "'. Please report this problem to the project site for the type provider";
            diag.hint = "the design-time assemblies define this type more than once";
        }
        std::vector<TypeId> ids;
        for (const auto &c : found)
        {
            ids.push_back(c.type);
            const Type &ct = md_.type(c.type);
            std::string where = ct.module == kNone ? std::string("<no module>") : lookup_.module_name(ct.module);
            diag.notes.push_back(Note{"candidate '" + lookup_.type_name(c.type) + "' in module '" + where + "'"});
        }
        throw AmbiguousType(std::move(diag), t, std::move(ids));
    }

} // namespace retarget
