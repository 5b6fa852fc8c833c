#include "retarget/text/loader.hpp"
#include "retarget/errors.hpp"
#include "retarget/text/reader.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

namespace retarget::text {

namespace {

[[noreturn]] void fail(const FormPtr& at, const std::string& msg, std::string hint = {}){
    Diagnostic d{"E1002", msg, std::move(hint), at ? at->line : -1, at ? at->col : -1, {}};
    throw RetargetError(std::move(d));
}

std::string text_of(const FormPtr& f){
    if(auto s = as_symbol(f)) return s->name;
    if(f) if(auto str = std::get_if<std::string>(&f->data)) return *str;
    fail(f, "expected a name, got '" + to_string(f) + "'");
}

// Keyword arguments of a list form, (head positional... :k v :k v rest...).
struct Args {
    FormPtr form;
    std::map<std::string, FormPtr> kw;
    std::vector<FormPtr> rest;

    static Args of(const FormPtr& f, size_t first = 1){
        auto l = as_list(f);
        if(!l) fail(f, "expected a list form");
        Args a; a.form = f;
        size_t i = first;
        for(; i < l->elems.size(); ++i){
            auto k = as_keyword(l->elems[i]);
            if(!k) break;
            if(i + 1 >= l->elems.size()) fail(l->elems[i], "keyword ':" + k->name + "' has no value");
            a.kw[k->name] = l->elems[++i];
        }
        for(; i < l->elems.size(); ++i) a.rest.push_back(l->elems[i]);
        return a;
    }
    FormPtr get(const char* k) const { auto it = kw.find(k); return it == kw.end() ? nullptr : it->second; }
    FormPtr need(const char* k) const {
        auto f = get(k);
        if(!f) fail(form, std::string("'") + head_of(form) + "' is missing :" + k);
        return f;
    }
    std::string name() const { return text_of(need("name")); }
    bool flag(const char* k, bool dflt = false) const {
        auto f = get(k);
        if(!f) return dflt;
        auto b = std::get_if<bool>(&f->data);
        if(!b) fail(f, std::string(":") + k + " expects true or false");
        return *b;
    }
    unsigned number(const char* k, unsigned dflt) const {
        auto f = get(k);
        if(!f) return dflt;
        auto n = std::get_if<int64_t>(&f->data);
        if(!n || *n < 0) fail(f, std::string(":") + k + " expects a non-negative integer");
        return static_cast<unsigned>(*n);
    }
    std::vector<FormPtr> items(const char* k) const {
        auto f = get(k);
        if(!f) return {};
        auto v = as_vector(f);
        if(!v) fail(f, std::string(":") + k + " expects a vector");
        return v->elems;
    }
};

Intrinsic intrinsic_of(const FormPtr& f){
    static const std::map<std::string, Intrinsic> table = {
        {"equality", Intrinsic::Equality}, {"add", Intrinsic::Add}, {"sub", Intrinsic::Sub}, {"mul", Intrinsic::Mul},
        {"less-than", Intrinsic::LessThan}, {"union-new", Intrinsic::UnionNew}, {"union-tag", Intrinsic::UnionTag},
        {"record-new", Intrinsic::RecordNew}, {"record-get", Intrinsic::RecordGet}};
    if(!f) return Intrinsic::None;
    auto it = table.find(text_of(f));
    if(it == table.end()) fail(f, "unknown intrinsic '" + text_of(f) + "'");
    return it->second;
}

Repr repr_of(const FormPtr& f){
    static const std::map<std::string, Repr> table = {
        {"opaque", Repr::Opaque}, {"void", Repr::Void}, {"bool", Repr::Bool}, {"i32", Repr::I32}, {"i64", Repr::I64}};
    if(!f) return Repr::Opaque;
    auto it = table.find(text_of(f));
    if(it == table.end()) fail(f, "unknown representation '" + text_of(f) + "'", "use one of opaque, void, bool, i32, i64");
    return it->second;
}

TagShape tag_shape_of(const FormPtr& f){
    if(!f) return TagShape::InstanceProperty;
    std::string s = text_of(f);
    if(s == "property") return TagShape::InstanceProperty;
    if(s == "static-method") return TagShape::StaticMethod;
    if(s == "instance-method") return TagShape::InstanceMethod;
    fail(f, "unknown tag shape '" + s + "'", "use property, static-method or instance-method");
}

class Loader {
public:
    explicit Loader(Manifest& m) : m_(m), md_(m.md), b_(m.md, m.vars) {}

    void load(const std::vector<FormPtr>& forms){
        for(auto& f : forms){
            std::string h = head_of(f);
            if(h != "module" && h != "universe" && h != "expr")
                fail(f, "unknown top-level form '" + to_string(f) + "'", "expected module, universe or expr");
        }
        for(auto& f : forms) if(head_of(f) == "module") declare_module(f);
        for(auto& f : forms) if(head_of(f) == "module") declare_types(f);
        for(auto& d : decls_) define_members(d);
        for(auto& f : forms) if(head_of(f) == "universe") define_universe(f);
        for(auto& f : forms) if(head_of(f) == "expr") define_expr(f);
    }

private:
    struct TypeScope {
        std::vector<ModuleId> search;
        std::vector<std::pair<std::string, TypeId>> generics;
    };
    struct Decl {
        FormPtr form;
        TypeId type;
        TypeScope scope;
    };

    void declare_module(const FormPtr& f){
        Args a = Args::of(f);
        std::string name = a.name();
        if(m_.modules.count(name)) fail(f, "module '" + name + "' is defined twice");
        m_.modules[name] = md_.add_module(name);
    }

    ModuleId module_named(const FormPtr& f){
        auto it = m_.modules.find(text_of(f));
        if(it == m_.modules.end()) fail(f, "unknown module '" + text_of(f) + "'");
        return it->second;
    }

    void declare_types(const FormPtr& f){
        Args a = Args::of(f);
        ModuleId m = m_.modules.at(a.name());
        TypeScope scope;
        scope.search.push_back(m);
        for(auto& r : a.items("refs")) scope.search.push_back(module_named(r));
        for(auto& t : a.items("types")){
            std::string h = head_of(t);
            if(h != "type" && h != "union" && h != "record") fail(t, "expected a type, union or record form");
            Args ta = Args::of(t);
            std::string name = ta.name();
            if(md_.find_type_in_module(m, name)) fail(t, "type '" + name + "' is defined twice in module '" + md_.module(m).name + "'");
            TypeDef def;
            for(auto& g : ta.items("generic")) def.generic_params.push_back(text_of(g));
            if(auto base = ta.get("base")) def.base = type_ref(base, scope);
            def.repr = h == "union" ? Repr::Union : h == "record" ? Repr::Record : repr_of(ta.get("repr"));
            TypeId id = md_.define_type(m, name, def);
            Decl d{t, id, scope};
            for(size_t i = 0; i < def.generic_params.size(); ++i)
                d.scope.generics.emplace_back(def.generic_params[i], md_.generic_param(id, static_cast<unsigned>(i)));
            decls_.push_back(std::move(d));
        }
    }

    TypeId named(const std::string& name, const TypeScope& s, const FormPtr& at){
        for(auto it = s.generics.rbegin(); it != s.generics.rend(); ++it)
            if(it->first == name) return it->second;
        if(name == "void") return md_.void_type();
        for(ModuleId m : s.search)
            if(auto t = md_.find_type_in_module(m, name)) return *t;
        fail(at, "unknown type '" + name + "'");
    }

    TypeId type_ref(const FormPtr& f, const TypeScope& s){
        if(as_symbol(f) || (f && std::holds_alternative<std::string>(f->data))) return named(text_of(f), s, f);
        auto l = as_list(f);
        if(!l || l->elems.empty()) fail(f, "expected a type, got '" + to_string(f) + "'");
        const std::string h = head_of(f);
        auto operand = [&](size_t i){
            if(i >= l->elems.size()) fail(f, "'" + h + "' is missing an operand");
            return l->elems[i];
        };
        try {
            if(h == "generic"){
                TypeId def = named(text_of(operand(1)), s, f);
                std::vector<TypeId> args;
                for(size_t i = 2; i < l->elems.size(); ++i) args.push_back(type_ref(l->elems[i], s));
                return md_.make_generic(def, args);
            }
            if(h == "array"){
                unsigned rank = 1;
                if(l->elems.size() > 2){
                    auto n = std::get_if<int64_t>(&l->elems[2]->data);
                    if(!n || *n < 1) fail(l->elems[2], "array rank must be a positive integer");
                    rank = static_cast<unsigned>(*n);
                }
                return md_.make_array(type_ref(operand(1), s), rank);
            }
            if(h == "byref") return md_.make_byref(type_ref(operand(1), s));
            if(h == "ptr") return md_.make_pointer(type_ref(operand(1), s));
            if(h == "tuple"){
                std::vector<TypeId> elems;
                for(size_t i = 1; i < l->elems.size(); ++i) elems.push_back(type_ref(l->elems[i], s));
                return md_.make_tuple(elems);
            }
        } catch(const std::invalid_argument& e){
            fail(f, e.what());
        }
        fail(f, "unknown type constructor '" + h + "'", "use generic, array, byref, ptr or tuple");
    }

    std::vector<TypeId> type_refs(const std::vector<FormPtr>& fs, const TypeScope& s){
        std::vector<TypeId> out;
        for(auto& f : fs) out.push_back(type_ref(f, s));
        return out;
    }

    void define_members(const Decl& d){
        Args a = Args::of(d.form);
        const std::string h = head_of(d.form);
        try {
            if(h == "union"){
                std::vector<UnionCaseDef> cases;
                for(auto& c : a.items("cases")){
                    if(head_of(c) != "case") fail(c, "expected a case form");
                    Args ca = Args::of(c);
                    cases.push_back(UnionCaseDef{ca.name(), type_refs(ca.items("fields"), d.scope)});
                }
                md_.define_union_cases(d.type, cases, tag_shape_of(a.get("tag")), type_ref(a.need("tag-type"), d.scope));
            }
            if(h == "record"){
                std::vector<std::pair<std::string, TypeId>> fields;
                for(auto& fl : a.items("fields")){
                    Args fa = Args::of(fl);
                    fields.emplace_back(fa.name(), type_ref(fa.need("type"), d.scope));
                }
                md_.define_record_fields(d.type, fields);
            }
            else {
                for(auto& fl : a.items("fields")) define_field(d, fl);
            }
            for(auto& mf : a.items("methods")) define_method(d, mf);
            for(auto& pf : a.items("properties")) define_property(d, pf);
            for(auto& cf : a.items("ctors")){
                Args ca = Args::of(cf);
                md_.define_constructor(d.type, type_refs(ca.items("params"), d.scope), ca.flag("public", true),
                                       intrinsic_of(ca.get("intrinsic")), ca.number("arg", 0));
            }
        } catch(const std::invalid_argument& e){
            fail(d.form, e.what());
        }
    }

    void define_method(const Decl& d, const FormPtr& f){
        Args a = Args::of(f);
        auto generic = a.items("generic");
        if(generic.empty()){
            MethodDef def;
            def.name = a.name();
            def.params = type_refs(a.items("params"), d.scope);
            def.ret = a.get("ret") ? type_ref(a.get("ret"), d.scope) : kNone;
            def.is_static = a.flag("static");
            def.is_public = a.flag("public", true);
            def.intrinsic = intrinsic_of(a.get("intrinsic"));
            def.intrinsic_arg = a.number("arg", 0);
            md_.define_method(d.type, def);
            return;
        }
        std::vector<std::string> names;
        for(auto& g : generic) names.push_back(text_of(g));
        MemberId id = md_.define_generic_method(d.type, a.name(), names, a.flag("static"));
        TypeScope inner = d.scope;
        const std::vector<TypeId> gps = md_.member(id).generic_params;
        for(size_t i = 0; i < names.size(); ++i) inner.generics.emplace_back(names[i], gps[i]);
        md_.set_signature(id, type_refs(a.items("params"), inner), a.get("ret") ? type_ref(a.get("ret"), inner) : kNone);
    }

    void define_property(const Decl& d, const FormPtr& f){
        Args a = Args::of(f);
        PropertyDef def;
        def.name = a.name();
        def.type = type_ref(a.need("type"), d.scope);
        def.is_static = a.flag("static");
        def.can_read = a.flag("read", true);
        def.can_write = a.flag("write");
        def.is_public = a.flag("public", true);
        def.index_params = type_refs(a.items("index"), d.scope);
        def.intrinsic = intrinsic_of(a.get("intrinsic"));
        def.intrinsic_arg = a.number("arg", 0);
        md_.define_property(d.type, def);
    }

    void define_field(const Decl& d, const FormPtr& f){
        Args a = Args::of(f);
        FieldDef def;
        def.name = a.name();
        def.type = type_ref(a.need("type"), d.scope);
        def.is_static = a.flag("static");
        def.is_public = a.flag("public", true);
        md_.define_field(d.type, def);
    }

    void define_universe(const FormPtr& f){
        Args a = Args::of(f);
        std::string name = a.name();
        Universe u;
        for(auto& m : a.items("modules")) u.push_back(module_named(m));
        if(name == "origin") m_.origin = std::move(u);
        else if(name == "target") m_.target = std::move(u);
        else fail(f, "unknown universe '" + name + "'", "name it origin or target");
    }

    void define_expr(const FormPtr& f){
        Args a = Args::of(f);
        std::string name = a.name();
        std::string in = a.get("in") ? text_of(a.get("in")) : std::string("origin");
        if(in == "origin") scope_.search = m_.origin;
        else if(in == "target") scope_.search = m_.target;
        else fail(a.get("in"), "unknown universe '" + in + "'");
        if(scope_.search.empty()) fail(f, "universe '" + in + "' is not defined");
        if(a.rest.size() != 1) fail(f, "expr '" + name + "' needs exactly one body form");
        locals_.clear();
        m_.exprs.push_back(NamedExpr{name, expr(a.rest.front()), f->line});
    }

    // Expressions

    TypeId builtin(const char* name, const FormPtr& at){ return named(name, scope_, at); }

    VarId local(const FormPtr& f){
        std::string name = text_of(f);
        for(auto it = locals_.rbegin(); it != locals_.rend(); ++it)
            if(it->first == name) return it->second;
        fail(f, "unbound variable '" + name + "'");
    }

    // i32 literals must fit; the evaluator lowers them at their declared width
    ExprPtr int_value(const FormPtr& at, int64_t v, TypeId t){
        if(md_.type(t).repr == Repr::I32 &&
           (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()))
            fail(at, "integer literal " + std::to_string(v) + " does not fit '" + md_.to_string(t) + "'",
                 "use (lit System.Int64 " + std::to_string(v) + ") for a 64-bit value");
        return b_.value(v, t);
    }

    Literal literal_of(const FormPtr& f){
        if(auto b = std::get_if<bool>(&f->data)) return *b;
        if(auto i = std::get_if<int64_t>(&f->data)) return *i;
        if(auto s = std::get_if<std::string>(&f->data)) return *s;
        if(std::holds_alternative<std::monostate>(f->data)) return std::monostate{};
        fail(f, "expected a literal");
    }

    std::vector<ExprPtr> exprs(const std::vector<FormPtr>& fs, size_t first){
        std::vector<ExprPtr> out;
        for(size_t i = first; i < fs.size(); ++i) out.push_back(expr(fs[i]));
        return out;
    }

    std::vector<TypeId> types_of(const std::vector<ExprPtr>& es){
        std::vector<TypeId> out;
        for(auto& e : es) out.push_back(type_of(md_, m_.vars, e));
        return out;
    }

    ExprPtr sequence(const std::vector<FormPtr>& fs, size_t first, const FormPtr& at){
        if(first >= fs.size()) fail(at, "'" + head_of(at) + "' needs a body");
        ExprPtr out = expr(fs.back());
        for(size_t i = fs.size() - 1; i > first; --i) out = b_.sequential(expr(fs[i - 1]), out);
        return out;
    }

    // [x T y U] parameter vector.
    std::vector<VarId> params_of(const FormPtr& f){
        auto v = as_vector(f);
        if(!v || v->elems.size() % 2) fail(f, "expected a [name type ...] vector");
        std::vector<VarId> out;
        for(size_t i = 0; i < v->elems.size(); i += 2)
            out.push_back(m_.vars.create(text_of(v->elems[i]), type_ref(v->elems[i + 1], scope_)));
        return out;
    }

    MemberId method_on(TypeId t, const std::string& name, const std::vector<FormPtr>& generic, const std::vector<ExprPtr>& args, const FormPtr& at){
        std::vector<TypeId> arg_types = types_of(args);
        if(generic.empty()){
            if(auto m = md_.find_method(t, name, arg_types)) return *m;
        } else {
            std::vector<TypeId> targs = type_refs(generic, scope_);
            const std::vector<MemberId> candidates = md_.members_of(t);
            for(MemberId id : candidates){
                const Member m = md_.member(id);
                if(m.kind != Member::Kind::Method || m.name != name || m.generic_params.size() != targs.size()) continue;
                MemberId inst = md_.make_generic_method(id, targs);
                const Member im = md_.member(inst);
                if(im.params.size() != arg_types.size()) continue;
                bool same = true;
                for(size_t i = 0; i < arg_types.size(); ++i) same = same && md_.signature_equal(im.params[i], arg_types[i]);
                if(same) return inst;
            }
        }
        std::string sig;
        for(size_t i = 0; i < arg_types.size(); ++i) sig += (i ? ", " : "") + md_.to_string(arg_types[i]);
        fail(at, "no method '" + name + "(" + sig + ")' on '" + md_.to_string(t) + "'");
    }

    MemberId property_on(TypeId t, const FormPtr& name, bool is_static){
        unsigned flags = binding::Public | binding::NonPublic | (is_static ? binding::Static : binding::Instance);
        if(auto p = md_.find_property(t, text_of(name), flags)) return *p;
        fail(name, "no property '" + text_of(name) + "' on '" + md_.to_string(t) + "'");
    }

    MemberId field_on(TypeId t, const FormPtr& name, bool is_static){
        unsigned flags = binding::Public | binding::NonPublic | (is_static ? binding::Static : binding::Instance);
        if(auto p = md_.find_field(t, text_of(name), flags)) return *p;
        fail(name, "no field '" + text_of(name) + "' on '" + md_.to_string(t) + "'");
    }

    ExprPtr expr(const FormPtr& f){
        try {
            return expr_form(f);
        } catch(const std::invalid_argument& e){
            fail(f, e.what());
        }
    }

    ExprPtr expr_form(const FormPtr& f){
        if(auto i = std::get_if<int64_t>(&f->data)) return int_value(f, *i, builtin("System.Int32", f));
        if(auto b = std::get_if<bool>(&f->data)) return b_.value(*b, builtin("System.Boolean", f));
        if(auto s = std::get_if<std::string>(&f->data)) return b_.value(*s, builtin("System.String", f));
        if(as_symbol(f)) return b_.var(local(f));
        auto l = as_list(f);
        if(!l || l->elems.empty()) fail(f, "expected an expression, got '" + to_string(f) + "'");
        const std::string h = head_of(f);
        const auto& e = l->elems;
        auto at = [&](size_t i) -> const FormPtr& {
            if(i >= e.size()) fail(f, "'" + h + "' is missing an operand");
            return e[i];
        };
        auto arity = [&](size_t n){
            if(e.size() != n + 1) fail(f, "'" + h + "' takes " + std::to_string(n) + " operand(s)");
        };

        if(h == "lit"){
            arity(2);
            TypeId t = type_ref(at(1), scope_);
            if(auto i = std::get_if<int64_t>(&at(2)->data)) return int_value(at(2), *i, t);
            return b_.value(literal_of(at(2)), t);
        }
        if(h == "let" || h == "let-mut"){
            auto binding = as_vector(at(1));
            if(!binding || binding->elems.size() != 2) fail(at(1), "expected a [name value] binding");
            ExprPtr value = expr(binding->elems[1]);
            VarId v = m_.vars.create(text_of(binding->elems[0]), type_of(md_, m_.vars, value), h == "let-mut");
            locals_.emplace_back(m_.vars.at(v).name, v);
            ExprPtr body = sequence(e, 2, f);
            locals_.pop_back();
            return b_.let(v, value, body);
        }
        if(h == "set!"){ arity(2); return b_.var_set(local(at(1)), expr(at(2))); }
        if(h == "call"){
            TypeId t = type_ref(at(1), scope_);
            Args a = Args::of(f, 3);
            auto args = exprs(a.rest, 0);
            return b_.call(nullptr, method_on(t, text_of(at(2)), a.items("generic"), args, f), args);
        }
        if(h == "invoke"){
            ExprPtr obj = expr(at(1));
            Args a = Args::of(f, 3);
            auto args = exprs(a.rest, 0);
            return b_.call(obj, method_on(type_of(md_, m_.vars, obj), text_of(at(2)), a.items("generic"), args, f), args);
        }
        if(h == "prop"){
            ExprPtr obj = expr(at(1));
            return b_.property_get(obj, property_on(type_of(md_, m_.vars, obj), at(2), false), exprs(e, 3));
        }
        if(h == "sprop") return b_.property_get(nullptr, property_on(type_ref(at(1), scope_), at(2), true), exprs(e, 3));
        if(h == "prop-set!"){
            arity(3);
            ExprPtr obj = expr(at(1));
            return b_.property_set(obj, property_on(type_of(md_, m_.vars, obj), at(2), false), {}, expr(at(3)));
        }
        if(h == "field"){
            arity(2);
            ExprPtr obj = expr(at(1));
            return b_.field_get(obj, field_on(type_of(md_, m_.vars, obj), at(2), false));
        }
        if(h == "sfield"){ arity(2); return b_.field_get(nullptr, field_on(type_ref(at(1), scope_), at(2), true)); }
        if(h == "field-set!"){
            arity(3);
            ExprPtr obj = expr(at(1));
            return b_.field_set(obj, field_on(type_of(md_, m_.vars, obj), at(2), false), expr(at(3)));
        }
        if(h == "new"){
            TypeId t = type_ref(at(1), scope_);
            auto args = exprs(e, 2);
            auto ctor = md_.find_constructor(t, types_of(args));
            if(!ctor) fail(f, "no matching constructor on '" + md_.to_string(t) + "'");
            return b_.new_object(*ctor, args);
        }
        if(h == "coerce"){ arity(2); return b_.coerce(expr(at(1)), type_ref(at(2), scope_)); }
        if(h == "array") return b_.new_array(type_ref(at(1), scope_), exprs(e, 2));
        if(h == "tuple") return b_.new_tuple(exprs(e, 1));
        if(h == "item"){
            arity(2);
            auto idx = std::get_if<int64_t>(&at(2)->data);
            if(!idx || *idx < 0) fail(at(2), "tuple index must be a non-negative integer");
            return b_.tuple_get(expr(at(1)), static_cast<unsigned>(*idx));
        }
        if(h == "union"){
            TypeId t = type_ref(at(1), scope_);
            return b_.new_union_case(md_.union_case(t, text_of(at(2))), exprs(e, 3));
        }
        if(h == "union?"){
            arity(2);
            ExprPtr operand = expr(at(1));
            return b_.union_case_test(operand, md_.union_case(type_of(md_, m_.vars, operand), text_of(at(2))));
        }
        if(h == "record") return b_.new_record(type_ref(at(1), scope_), exprs(e, 2));
        if(h == "fn"){
            auto ps = params_of(at(1));
            if(ps.size() != 1) fail(at(1), "'fn' takes exactly one parameter");
            for(VarId p : ps) locals_.emplace_back(m_.vars.at(p).name, p);
            ExprPtr body = sequence(e, 2, f);
            locals_.pop_back();
            TypeId func = md_.make_generic(builtin("Microsoft.FSharp.Core.FSharpFunc`2", f),
                                           {m_.vars.at(ps[0]).type, type_of(md_, m_.vars, body)});
            return b_.lambda(ps[0], body, func);
        }
        if(h == "apply"){ arity(2); return b_.application(expr(at(1)), expr(at(2))); }
        if(h == "if"){ arity(3); return b_.if_then_else(expr(at(1)), expr(at(2)), expr(at(3))); }
        if(h == "do") return sequence(e, 1, f);
        if(h == "while"){ ExprPtr c = expr(at(1)); return b_.while_loop(c, sequence(e, 2, f)); }
        if(h == "try"){ arity(2); return b_.try_finally(expr(at(1)), expr(at(2))); }
        if(h == "delegate"){
            TypeId t = type_ref(at(1), scope_);
            auto ps = params_of(at(2));
            for(VarId p : ps) locals_.emplace_back(m_.vars.at(p).name, p);
            ExprPtr body = sequence(e, 3, f);
            locals_.resize(locals_.size() - ps.size());
            return b_.new_delegate(t, ps, body);
        }
        fail(f, "unknown expression form '" + h + "'");
    }

    Manifest& m_;
    Metadata& md_;
    ExprBuilder b_;
    std::vector<Decl> decls_;
    TypeScope scope_;
    std::vector<std::pair<std::string, VarId>> locals_;
};

} // namespace

std::unique_ptr<Manifest> load_manifest(const std::vector<FormPtr>& forms){
    auto m = std::make_unique<Manifest>();
    Loader(*m).load(forms);
    return m;
}

std::unique_ptr<Manifest> load_manifest(std::string_view src, const std::string& source_name){
    return load_manifest(read(src, source_name));
}

} // namespace retarget::text
