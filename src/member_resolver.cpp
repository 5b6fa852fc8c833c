#include "retarget/member_resolver.hpp"

#include <cstdio>

namespace retarget
{

    MemberId MemberResolver::resolve(Direction d, MemberId m)
    {
        switch (md_.member(m).kind)
        {
        case Member::Kind::Property: return resolve_property(d, m);
        case Member::Kind::Field: return resolve_field(d, m);
        case Member::Kind::Method: return resolve_method(d, m);
        case Member::Kind::Constructor: return resolve_constructor(d, m);
        }
        return m;
    }

    std::vector<TypeId> MemberResolver::resolve_all(Direction d, const std::vector<TypeId> &ts)
    {
        std::vector<TypeId> out;
        out.reserve(ts.size());
        for (TypeId t : ts)
            out.push_back(types_.resolve(d, t));
        return out;
    }

    void MemberResolver::fail(const char *code, const std::string &message, MemberId m, TypeId declaring) const
    {
        Diagnostic diag;
        diag.code = code;
        diag.message = message;
        diag.hint = "check that the member exists with this exact signature in '" + md_.universe_to_string(types_.destination(Direction::Forward)) +
                    "' and '" + md_.universe_to_string(types_.destination(Direction::Backward)) + "'";
        diag.notes.push_back(Note{"declaring type resolved to '" + md_.to_string(declaring) + "'"});
        throw MemberNotFound(std::move(diag), m, declaring);
    }

    MemberId MemberResolver::resolve_property(Direction d, MemberId p)
    {
        const Member prop = md_.member(p);
        if (prop.host_defined)
            return p;
        TypeId decl = types_.resolve(d, prop.declaring);
        unsigned flags = binding::Public | binding::NonPublic | (md_.is_static_property(p) ? binding::Static : binding::Instance);
        auto r = md_.find_property(decl, prop.name, flags);
        if (!r)
            fail("E2101", "Property '" + md_.member_to_string(p) + "' of type '" + md_.to_string(decl) + "' not found", p, decl);
        if (opts_.debugResolve)
            std::fprintf(stderr, "[dbg][resolve][%s] property %s::%s\n", direction_tag(d), md_.to_string(decl).c_str(), prop.name.c_str());
        return *r;
    }

    MemberId MemberResolver::resolve_field(Direction d, MemberId f)
    {
        const Member field = md_.member(f);
        if (field.host_defined)
            return f;
        TypeId decl = types_.resolve(d, field.declaring);
        unsigned flags = (field.is_public ? binding::Public : binding::NonPublic) | (field.is_static ? binding::Static : binding::Instance);
        auto r = md_.find_field(decl, field.name, flags);
        if (!r)
            fail("E2102", "Field '" + md_.member_to_string(f) + "' of type '" + md_.to_string(decl) + "' not found", f, decl);
        return *r;
    }

    MemberId MemberResolver::resolve_method(Direction d, MemberId m)
    {
        const Member method = md_.member(m);
        if (method.host_defined)
            return m;
        TypeId decl = types_.resolve(d, method.declaring);
        if (!method.generic_args.empty())
        {
            const Member def = md_.member(md_.generic_method_definition(m));
            auto params = resolve_all(d, def.params);
            auto found = md_.find_method(decl, def.name, params);
            if (!found)
                fail("E2103", "Method '" + md_.member_to_string(m) + "' not found in type '" + md_.to_string(decl) + "'", m, decl);
            auto args = resolve_all(d, method.generic_args);
            return md_.make_generic_method(*found, args);
        }
        auto params = resolve_all(d, method.params);
        auto found = md_.find_method(decl, method.name, params);
        if (!found)
            fail("E2103", "Method '" + md_.member_to_string(m) + "' not found in type '" + md_.to_string(decl) + "'", m, decl);
        if (opts_.debugResolve)
            std::fprintf(stderr, "[dbg][resolve][%s] method %s\n", direction_tag(d), md_.member_to_string(*found).c_str());
        return *found;
    }

    MemberId MemberResolver::resolve_constructor(Direction d, MemberId c)
    {
        const Member ctor = md_.member(c);
        if (ctor.host_defined)
            return c;
        TypeId decl = types_.resolve(d, ctor.declaring);
        auto params = resolve_all(d, ctor.params);
        auto found = md_.find_constructor(decl, params);
        if (!found)
            fail("E2104", "Constructor '" + md_.member_to_string(c) + "' not found in type '" + md_.to_string(decl) + "'", c, decl);
        return *found;
    }

} // namespace retarget
