#include "retarget/metadata.hpp"

#include <algorithm>
#include <stdexcept>

namespace retarget
{

    namespace
    {
        bool visible(bool is_public, unsigned flags)
        {
            return is_public ? (flags & binding::Public) != 0 : (flags & binding::NonPublic) != 0;
        }
        bool binds(bool is_static, unsigned flags)
        {
            return is_static ? (flags & binding::Static) != 0 : (flags & binding::Instance) != 0;
        }
    }

    Metadata::Metadata()
    {
        Type v;
        v.kind = Type::Kind::Definition;
        v.full_name = "System.Void";
        v.repr = Repr::Void;
        void_ = add_type(std::move(v));
    }

    ModuleId Metadata::add_module(std::string name)
    {
        modules_.push_back(Module{std::move(name), {}});
        module_index_.emplace_back();
        return static_cast<ModuleId>(modules_.size() - 1);
    }

    std::optional<TypeId> Metadata::find_type_in_module(ModuleId m, std::string_view full_name) const
    {
        const auto &idx = module_index_.at(m);
        auto it = idx.find(std::string(full_name));
        if (it == idx.end())
            return std::nullopt;
        return it->second;
    }

    TypeId Metadata::add_type(Type t)
    {
        types_.push_back(std::move(t));
        return static_cast<TypeId>(types_.size() - 1);
    }

    MemberId Metadata::add_member(Member m)
    {
        members_.push_back(std::move(m));
        return static_cast<MemberId>(members_.size() - 1);
    }

    MemberId Metadata::attach(TypeId declaring, Member m)
    {
        if (type(declaring).kind != Type::Kind::Definition)
            throw std::invalid_argument("members can only be declared on type definitions, got '" + to_string(declaring) + "'");
        m.declaring = declaring;
        MemberId id = add_member(std::move(m));
        types_[declaring].members.push_back(id);
        return id;
    }

    TypeId Metadata::define_type(ModuleId m, std::string full_name, const TypeDef &def)
    {
        if (m >= modules_.size())
            throw std::invalid_argument("unknown module id " + std::to_string(m));
        if (module_index_[m].count(full_name))
            throw std::invalid_argument("duplicate type '" + full_name + "' in module '" + modules_[m].name + "'");
        Type t;
        t.kind = Type::Kind::Definition;
        t.full_name = full_name;
        t.module = m;
        t.base = def.base;
        t.repr = def.repr;
        TypeId id = add_type(std::move(t));
        std::vector<TypeId> params;
        for (size_t i = 0; i < def.generic_params.size(); ++i)
        {
            Type gp;
            gp.kind = Type::Kind::GenericParameter;
            gp.full_name = def.generic_params[i];
            gp.owner = id;
            gp.position = static_cast<unsigned>(i);
            params.push_back(add_type(std::move(gp)));
        }
        types_[id].generic_params = std::move(params);
        modules_[m].types.push_back(id);
        module_index_[m].emplace(std::move(full_name), id);
        return id;
    }

    TypeId Metadata::define_abbreviation(std::string name, TypeId target)
    {
        Type t;
        t.kind = Type::Kind::Abbreviation;
        t.full_name = std::move(name);
        t.element = target;
        t.host_defined = true;
        return add_type(std::move(t));
    }

    TypeId Metadata::define_provided_type(ModuleId m, std::string full_name, TypeId base, bool hide_object_methods, bool non_nullable)
    {
        Type t;
        t.kind = Type::Kind::Definition;
        t.full_name = full_name;
        t.module = m;
        t.base = base;
        t.host_defined = true;
        t.hide_object_methods = hide_object_methods;
        t.non_nullable = non_nullable;
        TypeId id = add_type(std::move(t));
        if (m != kNone)
        {
            modules_.at(m).types.push_back(id);
            module_index_[m].emplace(std::move(full_name), id);
        }
        return id;
    }

    void Metadata::add_nested_type(TypeId outer, TypeId inner)
    {
        types_.at(outer).nested.push_back(inner);
    }

    TypeId Metadata::generic_param(TypeId owner, unsigned position) const
    {
        return type(owner).generic_params.at(position);
    }

    TypeId Metadata::make_generic(TypeId definition, const std::vector<TypeId> &args)
    {
        const Type &def = type(definition);
        if (def.kind != Type::Kind::Definition || def.generic_params.size() != args.size() || args.empty())
            throw std::invalid_argument("cannot instantiate '" + to_string(definition) + "' with " + std::to_string(args.size()) + " argument(s)");
        auto key = std::make_pair(definition, args);
        auto it = generic_cache_.find(key);
        if (it != generic_cache_.end())
            return it->second;
        Type t;
        t.kind = Type::Kind::GenericInstance;
        t.definition = definition;
        t.args = args;
        t.repr = def.repr;
        t.base = def.base;
        t.host_defined = def.host_defined;
        TypeId id = add_type(std::move(t));
        generic_cache_[key] = id;
        return id;
    }

    TypeId Metadata::make_array(TypeId element, unsigned rank)
    {
        if (rank == 0)
            throw std::invalid_argument("array rank must be at least 1");
        auto key = std::make_pair(element, rank);
        auto it = array_cache_.find(key);
        if (it != array_cache_.end())
            return it->second;
        Type t;
        t.kind = Type::Kind::Array;
        t.element = element;
        t.rank = rank;
        TypeId id = add_type(std::move(t));
        array_cache_[key] = id;
        return id;
    }

    TypeId Metadata::make_byref(TypeId element)
    {
        auto it = byref_cache_.find(element);
        if (it != byref_cache_.end())
            return it->second;
        Type t;
        t.kind = Type::Kind::ByRef;
        t.element = element;
        TypeId id = add_type(std::move(t));
        byref_cache_[element] = id;
        return id;
    }

    TypeId Metadata::make_pointer(TypeId element)
    {
        auto it = pointer_cache_.find(element);
        if (it != pointer_cache_.end())
            return it->second;
        Type t;
        t.kind = Type::Kind::Pointer;
        t.element = element;
        TypeId id = add_type(std::move(t));
        pointer_cache_[element] = id;
        return id;
    }

    TypeId Metadata::make_tuple(const std::vector<TypeId> &elements)
    {
        if (elements.size() < 2)
            throw std::invalid_argument("tuple types need at least two elements");
        auto it = tuple_cache_.find(elements);
        if (it != tuple_cache_.end())
            return it->second;
        Type t;
        t.kind = Type::Kind::Tuple;
        t.args = elements;
        t.repr = Repr::Tuple;
        TypeId id = add_type(std::move(t));
        tuple_cache_[elements] = id;
        return id;
    }

    MemberId Metadata::define_method(TypeId declaring, const MethodDef &def)
    {
        Member m;
        m.kind = Member::Kind::Method;
        m.name = def.name;
        m.params = def.params;
        m.type = def.ret == kNone ? void_ : def.ret;
        m.is_static = def.is_static;
        m.is_public = def.is_public;
        m.intrinsic = def.intrinsic;
        m.intrinsic_arg = def.intrinsic_arg;
        return attach(declaring, std::move(m));
    }

    MemberId Metadata::define_generic_method(TypeId declaring, std::string name, const std::vector<std::string> &generic_names, bool is_static)
    {
        if (generic_names.empty())
            throw std::invalid_argument("generic method '" + name + "' needs at least one type parameter");
        Member m;
        m.kind = Member::Kind::Method;
        m.name = std::move(name);
        m.type = void_;
        m.is_static = is_static;
        MemberId id = attach(declaring, std::move(m));
        std::vector<TypeId> params;
        for (size_t i = 0; i < generic_names.size(); ++i)
        {
            Type gp;
            gp.kind = Type::Kind::GenericParameter;
            gp.full_name = generic_names[i];
            gp.owner_method = id;
            gp.position = static_cast<unsigned>(i);
            params.push_back(add_type(std::move(gp)));
        }
        members_[id].generic_params = std::move(params);
        return id;
    }

    void Metadata::set_signature(MemberId method, std::vector<TypeId> params, TypeId ret)
    {
        Member &m = members_.at(method);
        m.params = std::move(params);
        m.type = ret == kNone ? void_ : ret;
    }

    MemberId Metadata::define_property(TypeId declaring, const PropertyDef &def)
    {
        MemberId getter = kNone, setter = kNone;
        if (def.can_read)
            getter = define_method(declaring, {"get_" + def.name, def.index_params, def.type, def.is_static, def.is_public, def.intrinsic, def.intrinsic_arg});
        if (def.can_write)
        {
            auto params = def.index_params;
            params.push_back(def.type);
            setter = define_method(declaring, {"set_" + def.name, params, kNone, def.is_static, def.is_public});
        }
        Member p;
        p.kind = Member::Kind::Property;
        p.name = def.name;
        p.params = def.index_params;
        p.type = def.type;
        p.is_static = def.is_static;
        p.is_public = def.is_public;
        p.getter = getter;
        p.setter = setter;
        p.intrinsic = def.intrinsic;
        p.intrinsic_arg = def.intrinsic_arg;
        return attach(declaring, std::move(p));
    }

    MemberId Metadata::define_field(TypeId declaring, const FieldDef &def)
    {
        Member f;
        f.kind = Member::Kind::Field;
        f.name = def.name;
        f.type = def.type;
        f.is_static = def.is_static;
        f.is_public = def.is_public;
        return attach(declaring, std::move(f));
    }

    MemberId Metadata::define_constructor(TypeId declaring, std::vector<TypeId> params, bool is_public, Intrinsic intrinsic, unsigned intrinsic_arg)
    {
        Member c;
        c.kind = Member::Kind::Constructor;
        c.name = ".ctor";
        c.params = std::move(params);
        c.type = void_;
        c.is_public = is_public;
        c.intrinsic = intrinsic;
        c.intrinsic_arg = intrinsic_arg;
        return attach(declaring, std::move(c));
    }

    MemberId Metadata::define_provided_member(TypeId declaring, Member m)
    {
        m.host_defined = true;
        if (m.type == kNone)
            m.type = void_;
        return attach(declaring, std::move(m));
    }

    void Metadata::define_union_cases(TypeId t, const std::vector<UnionCaseDef> &cases, TagShape shape, TypeId tag_type)
    {
        if (cases.empty())
            throw std::invalid_argument("union '" + to_string(t) + "' needs at least one case");
        if (!type(t).cases.empty())
            throw std::invalid_argument("union cases of '" + to_string(t) + "' are already defined");
        auto gps = type(t).generic_params;
        TypeId self = gps.empty() ? t : make_generic(t, gps);
        std::vector<UnionCaseInfo> infos;
        for (size_t i = 0; i < cases.size(); ++i)
        {
            UnionCaseInfo info{cases[i].name, static_cast<unsigned>(i), cases[i].fields, kNone};
            if (cases[i].fields.empty())
            {
                PropertyDef pd;
                pd.name = cases[i].name;
                pd.type = self;
                pd.is_static = true;
                pd.intrinsic = Intrinsic::UnionNew;
                pd.intrinsic_arg = info.tag;
                info.constructor = member(define_property(t, pd)).getter;
            }
            else
                info.constructor = define_method(t, {"New" + cases[i].name, cases[i].fields, self, true, true, Intrinsic::UnionNew, info.tag});
            infos.push_back(std::move(info));
        }
        MemberId tag = kNone;
        switch (shape)
        {
        case TagShape::InstanceProperty:
        {
            PropertyDef pd;
            pd.name = "Tag";
            pd.type = tag_type;
            pd.intrinsic = Intrinsic::UnionTag;
            tag = define_property(t, pd);
            break;
        }
        case TagShape::StaticMethod:
            tag = define_method(t, {"GetTag", {self}, tag_type, true, true, Intrinsic::UnionTag});
            break;
        case TagShape::InstanceMethod:
            tag = define_method(t, {"GetTag", {}, tag_type, false, true, Intrinsic::UnionTag});
            break;
        }
        Type &ty = types_[t];
        ty.cases = std::move(infos);
        ty.tag_member = tag;
        ty.repr = Repr::Union;
    }

    void Metadata::define_record_fields(TypeId t, const std::vector<std::pair<std::string, TypeId>> &fields)
    {
        if (type(t).record_ctor != kNone)
            throw std::invalid_argument("record fields of '" + to_string(t) + "' are already defined");
        std::vector<MemberId> props;
        std::vector<TypeId> ctor_params;
        for (size_t i = 0; i < fields.size(); ++i)
        {
            PropertyDef pd;
            pd.name = fields[i].first;
            pd.type = fields[i].second;
            pd.intrinsic = Intrinsic::RecordGet;
            pd.intrinsic_arg = static_cast<unsigned>(i);
            props.push_back(define_property(t, pd));
            ctor_params.push_back(fields[i].second);
        }
        MemberId ctor = define_constructor(t, ctor_params, true, Intrinsic::RecordNew);
        Type &ty = types_[t];
        ty.record_fields = std::move(props);
        ty.record_ctor = ctor;
        ty.repr = Repr::Record;
    }

    Member Metadata::instantiate_member(const Member &decl, const std::vector<TypeId> &from, const std::vector<TypeId> &to, TypeId declaring)
    {
        Member m = decl;
        m.declaring = declaring;
        for (auto &p : m.params)
            p = substitute(p, from, to);
        m.type = substitute(m.type, from, to);
        return m;
    }

    const std::vector<MemberId> &Metadata::members_of(TypeId t)
    {
        static const std::vector<MemberId> none;
        const Type &ty = type(t);
        if (ty.kind == Type::Kind::Definition)
            return ty.members;
        if (ty.kind != Type::Kind::GenericInstance)
            return none;
        auto it = instance_members_.find(t);
        if (it != instance_members_.end())
            return it->second;
        TypeId def = ty.definition;
        std::vector<TypeId> args = ty.args;
        std::vector<TypeId> from = type(def).generic_params;
        std::vector<MemberId> declared = type(def).members;
        std::vector<MemberId> out;
        for (MemberId d : declared)
        {
            Member m = instantiate_member(members_[d], from, args, t);
            m.definition = d;
            out.push_back(add_member(std::move(m)));
        }
        // accessors point at the materialized copies
        for (MemberId id : out)
        {
            auto remap = [&](MemberId &acc) {
                if (acc == kNone)
                    return;
                auto pos = std::find(declared.begin(), declared.end(), acc);
                acc = out[static_cast<size_t>(pos - declared.begin())];
            };
            remap(members_[id].getter);
            remap(members_[id].setter);
        }
        return instance_members_.emplace(t, std::move(out)).first->second;
    }

    MemberId Metadata::member_on(TypeId t, MemberId declared)
    {
        TypeId def = definition_of(t);
        if (def == t)
            return declared;
        const auto &decls = type(def).members;
        auto pos = std::find(decls.begin(), decls.end(), declared);
        if (pos == decls.end())
            throw std::invalid_argument("member '" + member_to_string(declared) + "' is not declared on '" + to_string(def) + "'");
        size_t idx = static_cast<size_t>(pos - decls.begin());
        return members_of(t).at(idx);
    }

    std::optional<MemberId> Metadata::find_property(TypeId t, std::string_view name, unsigned flags)
    {
        for (TypeId cur = t; cur != kNone; cur = type(definition_of(cur)).base)
        {
            std::vector<MemberId> ms = members_of(cur);
            for (MemberId id : ms)
            {
                const Member &m = member(id);
                if (m.kind == Member::Kind::Property && m.name == name && visible(m.is_public, flags) && binds(is_static_property(id), flags))
                    return id;
            }
        }
        return std::nullopt;
    }

    std::optional<MemberId> Metadata::find_field(TypeId t, std::string_view name, unsigned flags)
    {
        for (TypeId cur = t; cur != kNone; cur = type(definition_of(cur)).base)
        {
            std::vector<MemberId> ms = members_of(cur);
            for (MemberId id : ms)
            {
                const Member &m = member(id);
                if (m.kind == Member::Kind::Field && m.name == name && visible(m.is_public, flags) && binds(m.is_static, flags))
                    return id;
            }
        }
        return std::nullopt;
    }

    std::optional<MemberId> Metadata::find_method(TypeId t, std::string_view name, const std::vector<TypeId> &params)
    {
        for (TypeId cur = t; cur != kNone; cur = type(definition_of(cur)).base)
        {
            std::vector<MemberId> ms = members_of(cur);
            std::optional<MemberId> found;
            for (MemberId id : ms)
            {
                const Member &m = member(id);
                if (m.kind != Member::Kind::Method || !m.is_public || m.name != name || m.params.size() != params.size())
                    continue;
                bool same = true;
                for (size_t i = 0; i < params.size() && same; ++i)
                    same = signature_equal(m.params[i], params[i]);
                if (!same)
                    continue;
                if (found)
                    return std::nullopt; // more than one exact match
                found = id;
            }
            if (found)
                return found;
        }
        return std::nullopt;
    }

    std::optional<MemberId> Metadata::find_constructor(TypeId t, const std::vector<TypeId> &params)
    {
        std::vector<MemberId> ms = members_of(t);
        for (MemberId id : ms)
        {
            const Member &m = member(id);
            if (m.kind != Member::Kind::Constructor || !m.is_public || m.params.size() != params.size())
                continue;
            bool same = true;
            for (size_t i = 0; i < params.size() && same; ++i)
                same = signature_equal(m.params[i], params[i]);
            if (same)
                return id;
        }
        return std::nullopt;
    }

    std::optional<MemberId> Metadata::find_unique_method(TypeId t, std::string_view name)
    {
        std::optional<MemberId> found;
        std::vector<MemberId> ms = members_of(t);
        for (MemberId id : ms)
        {
            const Member &m = member(id);
            if (m.kind == Member::Kind::Method && m.is_public && !m.is_static && m.name == name)
            {
                if (found)
                    return std::nullopt;
                found = id;
            }
        }
        return found;
    }

    MemberId Metadata::make_generic_method(MemberId definition, const std::vector<TypeId> &args)
    {
        const Member &def = member(definition);
        if (def.generic_params.empty() || def.generic_params.size() != args.size())
            throw std::invalid_argument("cannot instantiate method '" + member_to_string(definition) + "' with " + std::to_string(args.size()) + " argument(s)");
        auto key = std::make_pair(definition, args);
        auto it = method_inst_cache_.find(key);
        if (it != method_inst_cache_.end())
            return it->second;
        Member copy = def;
        Member m = instantiate_member(copy, copy.generic_params, args, copy.declaring);
        m.generic_params.clear();
        m.generic_args = args;
        m.definition = definition;
        MemberId id = add_member(std::move(m));
        method_inst_cache_[key] = id;
        return id;
    }

    MemberId Metadata::generic_method_definition(MemberId m) const
    {
        const Member &mm = member(m);
        return mm.generic_args.empty() ? m : mm.definition;
    }

    bool Metadata::is_generic_method(MemberId m) const
    {
        const Member &mm = member(m);
        return mm.kind == Member::Kind::Method && (!mm.generic_params.empty() || !mm.generic_args.empty());
    }

    bool Metadata::is_static_property(MemberId p) const
    {
        const Member &m = member(p);
        if (m.getter == kNone && m.setter == kNone)
            return m.is_static;
        return (m.getter != kNone && member(m.getter).is_static) || (m.setter != kNone && member(m.setter).is_static);
    }

    TypeId Metadata::definition_of(TypeId t) const
    {
        const Type &ty = type(t);
        return ty.kind == Type::Kind::GenericInstance ? ty.definition : t;
    }

    bool Metadata::signature_equal(TypeId a, TypeId b) const
    {
        if (a == b)
            return true;
        const Type &x = type(a);
        const Type &y = type(b);
        if (x.kind != y.kind)
            return false;
        auto all_equal = [&](const std::vector<TypeId> &l, const std::vector<TypeId> &r) {
            if (l.size() != r.size())
                return false;
            for (size_t i = 0; i < l.size(); ++i)
                if (!signature_equal(l[i], r[i]))
                    return false;
            return true;
        };
        switch (x.kind)
        {
        case Type::Kind::GenericParameter:
            return (x.owner_method == kNone) == (y.owner_method == kNone) && x.position == y.position;
        case Type::Kind::GenericInstance:
            return x.definition == y.definition && all_equal(x.args, y.args);
        case Type::Kind::Array:
            return x.rank == y.rank && signature_equal(x.element, y.element);
        case Type::Kind::ByRef:
        case Type::Kind::Pointer:
            return signature_equal(x.element, y.element);
        case Type::Kind::Tuple:
            return all_equal(x.args, y.args);
        case Type::Kind::Definition:
        case Type::Kind::Abbreviation:
            return false;
        }
        return false;
    }

    bool Metadata::is_assignable(TypeId to, TypeId from) const
    {
        for (TypeId cur = from; cur != kNone; cur = type(definition_of(cur)).base)
            if (signature_equal(to, cur))
                return true;
        return false;
    }

    TypeId Metadata::substitute(TypeId t, const std::vector<TypeId> &from, const std::vector<TypeId> &to)
    {
        if (from.empty() || t == kNone)
            return t;
        Type ty = type(t);
        auto map_all = [&](std::vector<TypeId> xs) {
            for (auto &x : xs)
                x = substitute(x, from, to);
            return xs;
        };
        switch (ty.kind)
        {
        case Type::Kind::GenericParameter:
            for (size_t i = 0; i < from.size(); ++i)
                if (from[i] == t)
                    return to.at(i);
            return t;
        case Type::Kind::GenericInstance:
        {
            auto args = map_all(ty.args);
            return args == ty.args ? t : make_generic(ty.definition, args);
        }
        case Type::Kind::Array:
            return make_array(substitute(ty.element, from, to), ty.rank);
        case Type::Kind::ByRef:
            return make_byref(substitute(ty.element, from, to));
        case Type::Kind::Pointer:
            return make_pointer(substitute(ty.element, from, to));
        case Type::Kind::Tuple:
            return make_tuple(map_all(ty.args));
        case Type::Kind::Definition:
        case Type::Kind::Abbreviation:
            return t;
        }
        return t;
    }

    UnionCase Metadata::union_case(TypeId union_type, std::string_view name) const
    {
        const auto &cases = type(definition_of(union_type)).cases;
        for (const auto &c : cases)
            if (c.name == name)
                return UnionCase{union_type, c.tag};
        throw std::invalid_argument("union case '" + std::string(name) + "' not found in '" + to_string(union_type) + "'");
    }

    const UnionCaseInfo &Metadata::union_case_info(const UnionCase &uc) const
    {
        return type(definition_of(uc.union_type)).cases.at(uc.tag);
    }

    std::vector<TypeId> Metadata::union_case_fields(const UnionCase &uc)
    {
        std::vector<TypeId> fields = union_case_info(uc).fields;
        const Type &ty = type(uc.union_type);
        if (ty.kind != Type::Kind::GenericInstance)
            return fields;
        std::vector<TypeId> from = type(ty.definition).generic_params;
        std::vector<TypeId> to = ty.args;
        for (auto &f : fields)
            f = substitute(f, from, to);
        return fields;
    }

    MemberId Metadata::union_case_constructor(const UnionCase &uc)
    {
        return member_on(uc.union_type, union_case_info(uc).constructor);
    }

    MemberId Metadata::union_tag_member(TypeId union_type)
    {
        MemberId tag = type(definition_of(union_type)).tag_member;
        if (tag == kNone)
            throw std::invalid_argument("'" + to_string(union_type) + "' is not a union type");
        return member_on(union_type, tag);
    }

    MemberId Metadata::record_constructor(TypeId record_type)
    {
        MemberId ctor = type(definition_of(record_type)).record_ctor;
        if (ctor == kNone)
            throw std::invalid_argument("'" + to_string(record_type) + "' is not a record type");
        return member_on(record_type, ctor);
    }

    std::vector<TypeId> Metadata::record_field_types(TypeId record_type)
    {
        return member(record_constructor(record_type)).params;
    }

    std::string Metadata::to_string(TypeId id) const
    {
        if (id == kNone)
            return "<none>";
        const Type &t = type(id);
        auto join = [&](const std::vector<TypeId> &xs) {
            std::string s;
            for (size_t i = 0; i < xs.size(); ++i)
            {
                if (i)
                    s += ",";
                s += to_string(xs[i]);
            }
            return s;
        };
        switch (t.kind)
        {
        case Type::Kind::Definition:
        case Type::Kind::GenericParameter:
        case Type::Kind::Abbreviation:
            return t.full_name;
        case Type::Kind::GenericInstance:
            return to_string(t.definition) + "[" + join(t.args) + "]";
        case Type::Kind::Array:
            return to_string(t.element) + "[" + std::string(t.rank - 1, ',') + "]";
        case Type::Kind::ByRef:
            return to_string(t.element) + "&";
        case Type::Kind::Pointer:
            return to_string(t.element) + "*";
        case Type::Kind::Tuple:
            return "System.Tuple`" + std::to_string(t.args.size()) + "[" + join(t.args) + "]";
        }
        return "<bad-type>";
    }

    std::string Metadata::member_to_string(MemberId id) const
    {
        const Member &m = member(id);
        auto params = [&] {
            std::string s = "(";
            for (size_t i = 0; i < m.params.size(); ++i)
            {
                if (i)
                    s += ", ";
                s += to_string(m.params[i]);
            }
            return s + ")";
        };
        switch (m.kind)
        {
        case Member::Kind::Property:
            return to_string(m.type) + " " + m.name + (m.params.empty() ? "" : "[" + params() + "]");
        case Member::Kind::Field:
            return to_string(m.type) + " " + m.name;
        case Member::Kind::Constructor:
            return "Void .ctor" + params();
        case Member::Kind::Method:
        {
            const auto &gs = m.generic_args.empty() ? m.generic_params : m.generic_args;
            std::string g;
            for (size_t i = 0; i < gs.size(); ++i)
                g += (i ? "," : "") + to_string(gs[i]);
            return to_string(m.type) + " " + m.name + (g.empty() ? "" : "[" + g + "]") + params();
        }
        }
        return "<bad-member>";
    }

    std::string Metadata::universe_to_string(const Universe &u) const
    {
        std::string s = "[";
        for (size_t i = 0; i < u.size(); ++i)
        {
            if (i)
                s += "; ";
            s += module(u[i]).name;
        }
        return s + "]";
    }

} // namespace retarget
