// One retargeting session: both type caches, the variable table and the declaration facade.
#pragma once
#include <string>
#include <vector>

#include "retarget/errors.hpp"
#include "retarget/expr.hpp"
#include "retarget/lookup.hpp"
#include "retarget/member_resolver.hpp"
#include "retarget/metadata.hpp"
#include "retarget/options.hpp"
#include "retarget/provided.hpp"
#include "retarget/rewriter.hpp"
#include "retarget/type_resolver.hpp"
#include "retarget/var_table.hpp"

namespace retarget
{

    // Not thread safe. md, vars and lookup must outlive the session and every declaration
    // it builds; wrapped bodies call back into it.
    class Replacer
    {
    public:
        Replacer(Metadata &md, VarPool &vars, const TypeLookup &lookup, Universe origin, Universe target,
                 ReplacerOptions opts = detect_options());
        Replacer(const Replacer &) = delete;
        Replacer &operator=(const Replacer &) = delete;

        TypeId resolve_type(Direction d, TypeId t) { return types_.resolve(d, t); }
        MemberId resolve_member(Direction d, MemberId m) { return members_.resolve(d, m); }
        VarId rewrite_var(Direction d, VarId v) { return table_.rewrite(d, v); }
        ExprPtr rewrite(Direction d, const ExprPtr &e) { return rewriter_.rewrite(d, e); }
        // Returns null and appends to errors instead of throwing. Failures that are not
        // RetargetErrors are reported as E9001.
        ExprPtr try_rewrite(Direction d, const ExprPtr &e, std::vector<Diagnostic> &errors);

        TypeId type_to_target(TypeId t) { return resolve_type(Direction::Forward, t); }
        TypeId type_to_origin(TypeId t) { return resolve_type(Direction::Backward, t); }
        ExprPtr expr_to_target(const ExprPtr &e) { return rewrite(Direction::Forward, e); }
        ExprPtr expr_to_origin(const ExprPtr &e) { return rewrite(Direction::Backward, e); }

        // Declaration facade: signatures take origin-universe types and come out in the target
        // universe; bodies are authored against origin types.
        ProvidedParameter provided_parameter(std::string name, TypeId type);
        ProvidedProperty provided_property(std::string name, TypeId type, InvokeCode getter, bool is_static = false);
        ProvidedConstructor provided_constructor(std::vector<ProvidedParameter> params, InvokeCode code);
        ProvidedMethod provided_method(std::string name, std::vector<ProvidedParameter> params, TypeId result, bool is_static, InvokeCode code);
        ProvidedTypeDefinition provided_type_definition(std::string name, TypeId base, bool hide_object_methods, bool non_nullable);
        ProvidedTypeDefinition provided_type_definition(ModuleId module, const std::string &ns, const std::string &name, TypeId base,
                                                        bool hide_object_methods, bool non_nullable);

        // Backward-rewrites the arguments, runs body, forward-rewrites its result.
        InvokeCode wrap(InvokeCode body);

        Metadata &metadata() { return md_; }
        VarPool &vars() { return vars_; }
        const ReplacerOptions &options() const { return opts_; }
        TypeResolver &types() { return types_; }
        VarTable &var_table() { return table_; }

    private:
        TypeId base_to_target(TypeId base) { return base == kNone ? kNone : type_to_target(base); }

        Metadata &md_;
        VarPool &vars_;
        ReplacerOptions opts_;
        TypeResolver types_;
        MemberResolver members_;
        VarTable table_;
        ExprRewriter rewriter_;
    };

} // namespace retarget
