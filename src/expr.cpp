#include "retarget/expr.hpp"

#include <stdexcept>
#include <type_traits>

namespace retarget
{

    namespace
    {
        template <typename T>
        ExprPtr make(T &&node) { return std::make_shared<const Expr>(Expr{ExprData{std::forward<T>(node)}}); }
    }

    TypeId type_of(Metadata &md, const VarPool &vars, const ExprPtr &e)
    {
        if (!e)
            throw std::invalid_argument("type_of: null expression");
        return std::visit([&](const auto &n) -> TypeId {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, expr::Value>) return n.type;
            else if constexpr (std::is_same_v<T, expr::VarRef>) return vars.at(n.var).type;
            else if constexpr (std::is_same_v<T, expr::VarSet> || std::is_same_v<T, expr::PropertySet> || std::is_same_v<T, expr::FieldSet>) return md.void_type();
            else if constexpr (std::is_same_v<T, expr::Call>) return md.member(n.method).type;
            else if constexpr (std::is_same_v<T, expr::PropertyGet>) return md.member(n.property).type;
            else if constexpr (std::is_same_v<T, expr::FieldGet>) return md.member(n.field).type;
            else if constexpr (std::is_same_v<T, expr::NewObject>) return md.member(n.ctor).declaring;
            else if constexpr (std::is_same_v<T, expr::Coerce>) return n.type;
            else if constexpr (std::is_same_v<T, expr::NewArray>) return md.make_array(n.element);
            else if constexpr (std::is_same_v<T, expr::NewTuple>) {
                std::vector<TypeId> ts;
                for (auto &x : n.elems) ts.push_back(type_of(md, vars, x));
                return md.make_tuple(ts);
            }
            else if constexpr (std::is_same_v<T, expr::TupleGet>) {
                TypeId tt = type_of(md, vars, n.tuple);
                const Type &t = md.type(tt);
                if (t.kind != Type::Kind::Tuple || n.index >= t.args.size())
                    throw std::invalid_argument("tuple-get: '" + md.to_string(tt) + "' has no item " + std::to_string(n.index));
                return t.args[n.index];
            }
            else if constexpr (std::is_same_v<T, expr::NewDelegate>) return n.delegate_type;
            else if constexpr (std::is_same_v<T, expr::Let>) return type_of(md, vars, n.body);
            else if constexpr (std::is_same_v<T, expr::Lambda>) return n.func_type;
            else if constexpr (std::is_same_v<T, expr::Application>) {
                TypeId ft = type_of(md, vars, n.func);
                auto invoke = md.find_unique_method(ft, "Invoke");
                if (!invoke)
                    throw std::invalid_argument("application: '" + md.to_string(ft) + "' is not a function type");
                return md.member(*invoke).type;
            }
            else if constexpr (std::is_same_v<T, expr::NewUnionCase>) return n.union_case.union_type;
            else if constexpr (std::is_same_v<T, expr::NewRecord>) return n.record_type;
            else if constexpr (std::is_same_v<T, expr::UnionCaseTest>) {
                TypeId tag_type = md.member(md.union_tag_member(n.union_case.union_type)).type;
                auto eq = md.find_method(tag_type, "op_Equality", {tag_type, tag_type});
                if (!eq)
                    throw std::invalid_argument("union-case-test: no op_Equality on '" + md.to_string(tag_type) + "'");
                return md.member(*eq).type;
            }
            else if constexpr (std::is_same_v<T, expr::Combination>) {
                switch (n.shape)
                {
                case Shape::IfThenElse: return type_of(md, vars, n.operands.at(1));
                case Shape::Sequential: return type_of(md, vars, n.operands.at(1));
                case Shape::WhileLoop: return md.void_type();
                case Shape::TryFinally: return type_of(md, vars, n.operands.at(0));
                }
                return md.void_type();
            }
        }, e->data);
    }

    namespace unchecked
    {
        ExprPtr value(Literal literal, TypeId type) { return make(expr::Value{std::move(literal), type}); }
        ExprPtr var(VarId v) { return make(expr::VarRef{v}); }
        ExprPtr var_set(VarId v, ExprPtr value) { return make(expr::VarSet{v, std::move(value)}); }
        ExprPtr call(ExprPtr object, MemberId method, std::vector<ExprPtr> args) { return make(expr::Call{std::move(object), method, std::move(args)}); }
        ExprPtr property_get(ExprPtr object, MemberId property, std::vector<ExprPtr> index_args) { return make(expr::PropertyGet{std::move(object), property, std::move(index_args)}); }
        ExprPtr property_set(ExprPtr object, MemberId property, std::vector<ExprPtr> index_args, ExprPtr value) { return make(expr::PropertySet{std::move(object), property, std::move(index_args), std::move(value)}); }
        ExprPtr field_get(ExprPtr object, MemberId field) { return make(expr::FieldGet{std::move(object), field}); }
        ExprPtr field_set(ExprPtr object, MemberId field, ExprPtr value) { return make(expr::FieldSet{std::move(object), field, std::move(value)}); }
        ExprPtr new_object(MemberId ctor, std::vector<ExprPtr> args) { return make(expr::NewObject{ctor, std::move(args)}); }
        ExprPtr coerce(ExprPtr operand, TypeId type) { return make(expr::Coerce{std::move(operand), type}); }
        ExprPtr new_array(TypeId element, std::vector<ExprPtr> elems) { return make(expr::NewArray{element, std::move(elems)}); }
        ExprPtr new_tuple(std::vector<ExprPtr> elems) { return make(expr::NewTuple{std::move(elems)}); }
        ExprPtr tuple_get(ExprPtr tuple, unsigned index) { return make(expr::TupleGet{std::move(tuple), index}); }
        ExprPtr new_delegate(TypeId delegate_type, std::vector<VarId> params, ExprPtr body) { return make(expr::NewDelegate{delegate_type, std::move(params), std::move(body)}); }
        ExprPtr let(VarId v, ExprPtr value, ExprPtr body) { return make(expr::Let{v, std::move(value), std::move(body)}); }
        ExprPtr lambda(VarId param, ExprPtr body, TypeId func_type) { return make(expr::Lambda{param, std::move(body), func_type}); }
        ExprPtr application(ExprPtr func, ExprPtr arg) { return make(expr::Application{std::move(func), std::move(arg)}); }
        ExprPtr new_union_case(UnionCase uc, std::vector<ExprPtr> args) { return make(expr::NewUnionCase{uc, std::move(args)}); }
        ExprPtr new_record(TypeId record_type, std::vector<ExprPtr> args) { return make(expr::NewRecord{record_type, std::move(args)}); }
        ExprPtr union_case_test(ExprPtr operand, UnionCase uc) { return make(expr::UnionCaseTest{std::move(operand), uc}); }
        ExprPtr combination(Shape shape, std::vector<ExprPtr> operands) { return make(expr::Combination{shape, std::move(operands)}); }
    }

    void ExprBuilder::expect(const char *what, TypeId expected, const ExprPtr &actual)
    {
        if (!actual)
            throw std::invalid_argument(std::string(what) + ": missing operand");
        TypeId got = type_of(actual);
        if (!md_.is_assignable(expected, got))
            throw std::invalid_argument(std::string(what) + ": expected '" + md_.to_string(expected) + "' but got '" + md_.to_string(got) + "'");
    }

    void ExprBuilder::check_args(const char *what, MemberId m, std::vector<TypeId> params, const std::vector<ExprPtr> &args)
    {
        if (params.size() != args.size())
            throw std::invalid_argument(std::string(what) + ": '" + md_.member_to_string(m) + "' takes " + std::to_string(params.size()) +
                                        " argument(s), got " + std::to_string(args.size()));
        for (size_t i = 0; i < args.size(); ++i)
            expect(what, params[i], args[i]);
    }

    void ExprBuilder::check_target(const char *what, MemberId m, bool is_static, const ExprPtr &object)
    {
        if (is_static && object)
            throw std::invalid_argument(std::string(what) + ": static member '" + md_.member_to_string(m) + "' used with an object");
        if (!is_static)
        {
            if (!object)
                throw std::invalid_argument(std::string(what) + ": instance member '" + md_.member_to_string(m) + "' used without an object");
            expect(what, md_.member(m).declaring, object);
        }
    }

    ExprPtr ExprBuilder::value(Literal literal, TypeId type) { return unchecked::value(std::move(literal), type); }

    ExprPtr ExprBuilder::var(VarId v)
    {
        vars_.at(v);
        return unchecked::var(v);
    }

    ExprPtr ExprBuilder::var_set(VarId v, ExprPtr value)
    {
        const Var &var = vars_.at(v);
        if (!var.is_mutable)
            throw std::invalid_argument("var-set: '" + var.name + "' is not mutable");
        expect("var-set", var.type, value);
        return unchecked::var_set(v, std::move(value));
    }

    ExprPtr ExprBuilder::call(ExprPtr object, MemberId method, std::vector<ExprPtr> args)
    {
        const Member m = md_.member(method);
        if (m.kind != Member::Kind::Method)
            throw std::invalid_argument("call: '" + md_.member_to_string(method) + "' is not a method");
        if (!m.generic_params.empty())
            throw std::invalid_argument("call: generic method '" + md_.member_to_string(method) + "' must be instantiated first");
        check_target("call", method, m.is_static, object);
        check_args("call", method, m.params, args);
        return unchecked::call(std::move(object), method, std::move(args));
    }

    ExprPtr ExprBuilder::property_get(ExprPtr object, MemberId property, std::vector<ExprPtr> index_args)
    {
        const Member p = md_.member(property);
        if (p.kind != Member::Kind::Property || (p.getter == kNone && !p.host_defined))
            throw std::invalid_argument("property-get: '" + md_.member_to_string(property) + "' is not a readable property");
        check_target("property-get", property, md_.is_static_property(property), object);
        check_args("property-get", property, p.params, index_args);
        return unchecked::property_get(std::move(object), property, std::move(index_args));
    }

    ExprPtr ExprBuilder::property_set(ExprPtr object, MemberId property, std::vector<ExprPtr> index_args, ExprPtr value)
    {
        const Member p = md_.member(property);
        if (p.kind != Member::Kind::Property || p.setter == kNone)
            throw std::invalid_argument("property-set: '" + md_.member_to_string(property) + "' is not a writable property");
        check_target("property-set", property, md_.is_static_property(property), object);
        check_args("property-set", property, p.params, index_args);
        expect("property-set", p.type, value);
        return unchecked::property_set(std::move(object), property, std::move(index_args), std::move(value));
    }

    ExprPtr ExprBuilder::field_get(ExprPtr object, MemberId field)
    {
        const Member f = md_.member(field);
        if (f.kind != Member::Kind::Field)
            throw std::invalid_argument("field-get: '" + md_.member_to_string(field) + "' is not a field");
        check_target("field-get", field, f.is_static, object);
        return unchecked::field_get(std::move(object), field);
    }

    ExprPtr ExprBuilder::field_set(ExprPtr object, MemberId field, ExprPtr value)
    {
        const Member f = md_.member(field);
        if (f.kind != Member::Kind::Field)
            throw std::invalid_argument("field-set: '" + md_.member_to_string(field) + "' is not a field");
        check_target("field-set", field, f.is_static, object);
        expect("field-set", f.type, value);
        return unchecked::field_set(std::move(object), field, std::move(value));
    }

    ExprPtr ExprBuilder::new_object(MemberId ctor, std::vector<ExprPtr> args)
    {
        const Member c = md_.member(ctor);
        if (c.kind != Member::Kind::Constructor)
            throw std::invalid_argument("new-object: '" + md_.member_to_string(ctor) + "' is not a constructor");
        check_args("new-object", ctor, c.params, args);
        return unchecked::new_object(ctor, std::move(args));
    }

    ExprPtr ExprBuilder::coerce(ExprPtr operand, TypeId type)
    {
        if (!operand)
            throw std::invalid_argument("coerce: missing operand");
        return unchecked::coerce(std::move(operand), type);
    }

    ExprPtr ExprBuilder::new_array(TypeId element, std::vector<ExprPtr> elems)
    {
        for (auto &e : elems)
            expect("new-array", element, e);
        return unchecked::new_array(element, std::move(elems));
    }

    ExprPtr ExprBuilder::new_tuple(std::vector<ExprPtr> elems)
    {
        if (elems.size() < 2)
            throw std::invalid_argument("new-tuple: needs at least two elements");
        return unchecked::new_tuple(std::move(elems));
    }

    ExprPtr ExprBuilder::tuple_get(ExprPtr tuple, unsigned index)
    {
        auto e = unchecked::tuple_get(std::move(tuple), index);
        type_of(e); // validates the index
        return e;
    }

    ExprPtr ExprBuilder::new_delegate(TypeId delegate_type, std::vector<VarId> params, ExprPtr body)
    {
        auto invoke = md_.find_unique_method(delegate_type, "Invoke");
        if (!invoke)
            throw std::invalid_argument("new-delegate: '" + md_.to_string(delegate_type) + "' has no Invoke method");
        const Member m = md_.member(*invoke);
        if (m.params.size() != params.size())
            throw std::invalid_argument("new-delegate: '" + md_.to_string(delegate_type) + "' takes " + std::to_string(m.params.size()) + " parameter(s)");
        for (size_t i = 0; i < params.size(); ++i)
            if (!md_.signature_equal(m.params[i], vars_.at(params[i]).type))
                throw std::invalid_argument("new-delegate: parameter '" + vars_.at(params[i]).name + "' has the wrong type");
        if (m.type != md_.void_type())
            expect("new-delegate", m.type, body);
        return unchecked::new_delegate(delegate_type, std::move(params), std::move(body));
    }

    ExprPtr ExprBuilder::let(VarId v, ExprPtr value, ExprPtr body)
    {
        expect("let", vars_.at(v).type, value);
        if (!body)
            throw std::invalid_argument("let: missing body");
        return unchecked::let(v, std::move(value), std::move(body));
    }

    ExprPtr ExprBuilder::lambda(VarId param, ExprPtr body, TypeId func_type)
    {
        auto invoke = md_.find_unique_method(func_type, "Invoke");
        if (!invoke || md_.member(*invoke).params.size() != 1)
            throw std::invalid_argument("lambda: '" + md_.to_string(func_type) + "' is not a single-argument function type");
        if (!md_.signature_equal(md_.member(*invoke).params[0], vars_.at(param).type))
            throw std::invalid_argument("lambda: parameter '" + vars_.at(param).name + "' does not match '" + md_.to_string(func_type) + "'");
        expect("lambda", md_.member(*invoke).type, body);
        return unchecked::lambda(param, std::move(body), func_type);
    }

    ExprPtr ExprBuilder::application(ExprPtr func, ExprPtr arg)
    {
        TypeId ft = type_of(func);
        auto invoke = md_.find_unique_method(ft, "Invoke");
        if (!invoke || md_.member(*invoke).params.size() != 1)
            throw std::invalid_argument("application: '" + md_.to_string(ft) + "' is not a single-argument function type");
        expect("application", md_.member(*invoke).params[0], arg);
        return unchecked::application(std::move(func), std::move(arg));
    }

    ExprPtr ExprBuilder::new_union_case(UnionCase uc, std::vector<ExprPtr> args)
    {
        if (!md_.is_union(uc.union_type))
            throw std::invalid_argument("new-union-case: '" + md_.to_string(uc.union_type) + "' is not a union type");
        auto fields = md_.union_case_fields(uc);
        check_args("new-union-case", md_.union_case_constructor(uc), fields, args);
        return unchecked::new_union_case(uc, std::move(args));
    }

    ExprPtr ExprBuilder::new_record(TypeId record_type, std::vector<ExprPtr> args)
    {
        auto fields = md_.record_field_types(record_type);
        check_args("new-record", md_.record_constructor(record_type), fields, args);
        return unchecked::new_record(record_type, std::move(args));
    }

    ExprPtr ExprBuilder::union_case_test(ExprPtr operand, UnionCase uc)
    {
        expect("union-case-test", uc.union_type, operand);
        return unchecked::union_case_test(std::move(operand), uc);
    }

    ExprPtr ExprBuilder::if_then_else(ExprPtr cond, ExprPtr then_branch, ExprPtr else_branch)
    {
        if (!cond)
            throw std::invalid_argument("if-then-else: missing condition");
        expect("if-then-else", type_of(then_branch), else_branch);
        return unchecked::combination(Shape::IfThenElse, {std::move(cond), std::move(then_branch), std::move(else_branch)});
    }

    ExprPtr ExprBuilder::sequential(ExprPtr first, ExprPtr second)
    {
        if (!first || !second)
            throw std::invalid_argument("sequential: missing operand");
        return unchecked::combination(Shape::Sequential, {std::move(first), std::move(second)});
    }

    ExprPtr ExprBuilder::while_loop(ExprPtr cond, ExprPtr body)
    {
        if (!cond || !body)
            throw std::invalid_argument("while-loop: missing operand");
        return unchecked::combination(Shape::WhileLoop, {std::move(cond), std::move(body)});
    }

    ExprPtr ExprBuilder::try_finally(ExprPtr body, ExprPtr finalizer)
    {
        if (!body || !finalizer)
            throw std::invalid_argument("try-finally: missing operand");
        return unchecked::combination(Shape::TryFinally, {std::move(body), std::move(finalizer)});
    }

} // namespace retarget
