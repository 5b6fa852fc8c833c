// Recursive expression transform between universes.
#pragma once
#include <unordered_map>
#include <vector>

#include "retarget/errors.hpp"
#include "retarget/expr.hpp"
#include "retarget/member_resolver.hpp"
#include "retarget/options.hpp"
#include "retarget/type_resolver.hpp"
#include "retarget/var_table.hpp"

namespace retarget
{

    class ExprRewriter
    {
    public:
        ExprRewriter(Metadata &md, VarPool &vars, TypeResolver &types, MemberResolver &members, VarTable &table, const ReplacerOptions &opts)
            : md_(md), vars_(vars), types_(types), members_(members), table_(table), opts_(opts) {}

        // Rebuilds e against the destination universe of d. Application, union construction,
        // record construction and union case tests are desugared first. Lambda values throw
        // UnsupportedConstruct.
        ExprPtr rewrite(Direction d, const ExprPtr &e);

    private:
        struct Visitor;
        friend struct Visitor;

        ExprPtr visit(Direction d, const ExprPtr &e);
        ExprPtr visit_opt(Direction d, const ExprPtr &e) { return e ? visit(d, e) : nullptr; }
        std::vector<ExprPtr> visit_all(Direction d, const std::vector<ExprPtr> &es);
        VarId binder(Direction d, VarId v);

        ExprPtr desugar_application(const expr::Application &n);
        ExprPtr desugar_union_case(const expr::NewUnionCase &n);
        ExprPtr desugar_record(const expr::NewRecord &n);
        ExprPtr desugar_case_test(const expr::UnionCaseTest &n);
        [[noreturn]] void fail_lambda(const expr::Lambda &n) const;

        Metadata &md_;
        VarPool &vars_;
        TypeResolver &types_;
        MemberResolver &members_;
        VarTable &table_;
        const ReplacerOptions &opts_;
        // Binders seen during the current top-level call, so every reference to a binder
        // inside one tree maps to the same variable.
        std::unordered_map<VarId, VarId> scope_;
        int depth_{0};
    };

} // namespace retarget
