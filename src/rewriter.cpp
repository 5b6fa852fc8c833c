#include "retarget/rewriter.hpp"

#include <cstdio>
#include <stdexcept>

namespace retarget
{

    struct ExprRewriter::Visitor
    {
        ExprRewriter &self;
        Direction d;
        const ExprPtr &whole;

        TypeId type(TypeId t) const { return self.types_.resolve(d, t); }
        MemberId member(MemberId m) const { return self.members_.resolve(d, m); }
        ExprPtr sub(const ExprPtr &e) const { return self.visit(d, e); }
        ExprPtr sub_opt(const ExprPtr &e) const { return self.visit_opt(d, e); }
        std::vector<ExprPtr> subs(const std::vector<ExprPtr> &es) const { return self.visit_all(d, es); }

        // Literal metadata is universe independent.
        ExprPtr operator()(const expr::Value &) const { return whole; }
        ExprPtr operator()(const expr::VarRef &n) const { return unchecked::var(self.binder(d, n.var)); }
        ExprPtr operator()(const expr::VarSet &n) const
        {
            VarId v = self.binder(d, n.var);
            return unchecked::var_set(v, sub(n.value));
        }
        ExprPtr operator()(const expr::Call &n) const
        {
            auto obj = sub_opt(n.object);
            MemberId m = member(n.method);
            return unchecked::call(obj, m, subs(n.args));
        }
        ExprPtr operator()(const expr::PropertyGet &n) const
        {
            auto obj = sub_opt(n.object);
            MemberId p = member(n.property);
            return unchecked::property_get(obj, p, subs(n.index_args));
        }
        ExprPtr operator()(const expr::PropertySet &n) const
        {
            auto obj = sub_opt(n.object);
            MemberId p = member(n.property);
            auto idx = subs(n.index_args);
            return unchecked::property_set(obj, p, idx, sub(n.value));
        }
        ExprPtr operator()(const expr::FieldGet &n) const
        {
            auto obj = sub_opt(n.object);
            return unchecked::field_get(obj, member(n.field));
        }
        ExprPtr operator()(const expr::FieldSet &n) const
        {
            auto obj = sub_opt(n.object);
            MemberId f = member(n.field);
            return unchecked::field_set(obj, f, sub(n.value));
        }
        ExprPtr operator()(const expr::NewObject &n) const
        {
            MemberId c = member(n.ctor);
            return unchecked::new_object(c, subs(n.args));
        }
        ExprPtr operator()(const expr::Coerce &n) const
        {
            auto e = sub(n.operand);
            return unchecked::coerce(e, type(n.type));
        }
        ExprPtr operator()(const expr::NewArray &n) const
        {
            TypeId t = type(n.element);
            return unchecked::new_array(t, subs(n.elems));
        }
        ExprPtr operator()(const expr::NewTuple &n) const { return unchecked::new_tuple(subs(n.elems)); }
        ExprPtr operator()(const expr::TupleGet &n) const { return unchecked::tuple_get(sub(n.tuple), n.index); }
        ExprPtr operator()(const expr::NewDelegate &n) const
        {
            TypeId t = type(n.delegate_type);
            std::vector<VarId> ps;
            for (VarId p : n.params)
                ps.push_back(self.binder(d, p));
            return unchecked::new_delegate(t, ps, sub(n.body));
        }
        ExprPtr operator()(const expr::Let &n) const
        {
            VarId v = self.binder(d, n.var);
            auto value = sub(n.value);
            return unchecked::let(v, value, sub(n.body));
        }
        ExprPtr operator()(const expr::Lambda &n) const { self.fail_lambda(n); }
        ExprPtr operator()(const expr::Application &n) const { return sub(self.desugar_application(n)); }
        ExprPtr operator()(const expr::NewUnionCase &n) const { return sub(self.desugar_union_case(n)); }
        ExprPtr operator()(const expr::NewRecord &n) const { return sub(self.desugar_record(n)); }
        ExprPtr operator()(const expr::UnionCaseTest &n) const { return sub(self.desugar_case_test(n)); }
        ExprPtr operator()(const expr::Combination &n) const { return unchecked::combination(n.shape, subs(n.operands)); }
    };

    ExprPtr ExprRewriter::rewrite(Direction d, const ExprPtr &e)
    {
        struct DepthGuard
        {
            int &depth;
            ~DepthGuard() { --depth; }
        };
        if (depth_ == 0)
            scope_.clear();
        ++depth_;
        DepthGuard guard{depth_};
        return visit(d, e);
    }

    ExprPtr ExprRewriter::visit(Direction d, const ExprPtr &e)
    {
        if (!e)
            throw std::invalid_argument("rewrite: null expression");
        return std::visit(Visitor{*this, d, e}, e->data);
    }

    std::vector<ExprPtr> ExprRewriter::visit_all(Direction d, const std::vector<ExprPtr> &es)
    {
        std::vector<ExprPtr> out;
        out.reserve(es.size());
        for (auto &e : es)
            out.push_back(visit(d, e));
        return out;
    }

    VarId ExprRewriter::binder(Direction d, VarId v)
    {
        auto it = scope_.find(v);
        if (it != scope_.end())
            return it->second;
        VarId nv = table_.rewrite(d, v);
        scope_.emplace(v, nv);
        return nv;
    }

    ExprPtr ExprRewriter::desugar_application(const expr::Application &n)
    {
        TypeId ft = type_of(md_, vars_, n.func);
        auto invoke = md_.find_unique_method(ft, "Invoke");
        if (!invoke)
        {
            Diagnostic diag{"E2103", "Method 'Invoke' not found in type '" + md_.to_string(ft) + "'",
                            "only function values with a single Invoke method can be applied", -1, -1, {}};
            throw MemberNotFound(std::move(diag), kNone, ft);
        }
        if (opts_.debugRewrite)
            std::fprintf(stderr, "[dbg][rewrite] application -> %s.Invoke\n", md_.to_string(ft).c_str());
        return unchecked::call(n.func, *invoke, {n.arg});
    }

    ExprPtr ExprRewriter::desugar_union_case(const expr::NewUnionCase &n)
    {
        MemberId ctor = md_.union_case_constructor(n.union_case);
        if (opts_.debugRewrite)
            std::fprintf(stderr, "[dbg][rewrite] union case %s -> %s\n", md_.union_case_info(n.union_case).name.c_str(), md_.member_to_string(ctor).c_str());
        return unchecked::call(nullptr, ctor, n.args);
    }

    ExprPtr ExprRewriter::desugar_record(const expr::NewRecord &n)
    {
        return unchecked::new_object(md_.record_constructor(n.record_type), n.args);
    }

    ExprPtr ExprRewriter::desugar_case_test(const expr::UnionCaseTest &n)
    {
        TypeId ut = type_of(md_, vars_, n.operand);
        MemberId tag = md_.union_tag_member(ut);
        const Member tm = md_.member(tag);
        ExprPtr read;
        switch (tm.kind)
        {
        case Member::Kind::Property:
            read = unchecked::property_get(n.operand, tag);
            break;
        case Member::Kind::Method:
            read = tm.is_static ? unchecked::call(nullptr, tag, {n.operand}) : unchecked::call(n.operand, tag, {});
            break;
        case Member::Kind::Field:
        case Member::Kind::Constructor:
            throw std::logic_error("unreachable: union tag member '" + md_.member_to_string(tag) + "' is neither a property nor a method");
        }
        TypeId tag_type = tm.type;
        auto eq = md_.find_method(tag_type, "op_Equality", {tag_type, tag_type});
        if (!eq)
        {
            Diagnostic diag{"E2103", "Method 'op_Equality' not found in type '" + md_.to_string(tag_type) + "'",
                            "union tags are compared with a static op_Equality on the tag type", -1, -1, {}};
            throw MemberNotFound(std::move(diag), kNone, tag_type);
        }
        unsigned tag_number = md_.union_case_info(n.union_case).tag;
        if (opts_.debugRewrite)
            std::fprintf(stderr, "[dbg][rewrite] case test %s -> tag == %u\n", md_.union_case_info(n.union_case).name.c_str(), tag_number);
        auto tag_value = unchecked::value(static_cast<int64_t>(tag_number), tag_type);
        return unchecked::call(nullptr, *eq, {read, tag_value});
    }

    void ExprRewriter::fail_lambda(const expr::Lambda &n) const
    {
        Diagnostic diag;
        diag.code = "E2201";
        diag.message = "It's not possible to create a Lambda when cross targetting to a different FSharp.Core.\n"
                       "Make sure you're not calling a function with signature A->(B->C) instead of A->B->C (using |> causes this).";
        diag.hint = "avoid point-free composition: apply the function to all of its arguments inside the expression";
        diag.notes.push_back(Note{"lambda over '" + vars_.at(n.param).name + "' of type '" + md_.to_string(n.func_type) + "'"});
        throw UnsupportedConstruct(std::move(diag));
    }

} // namespace retarget
