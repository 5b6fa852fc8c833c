// Typed expression trees over a Metadata arena.
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "retarget/metadata.hpp"

namespace retarget
{

    using VarId = uint32_t;

    struct Var
    {
        std::string name;
        TypeId type{kNone};
        bool is_mutable{false};
    };

    // Variables are compared by handle only; two records with equal fields are still distinct binders.
    class VarPool
    {
    public:
        VarId create(std::string name, TypeId type, bool is_mutable = false)
        {
            vars_.push_back(Var{std::move(name), type, is_mutable});
            return static_cast<VarId>(vars_.size() - 1);
        }
        const Var &at(VarId id) const { return vars_.at(id); }
        size_t size() const { return vars_.size(); }

    private:
        std::vector<Var> vars_;
    };

    using Literal = std::variant<std::monostate, bool, int64_t, double, std::string>;

    enum class Shape
    {
        IfThenElse, // cond, then, else
        Sequential, // first, second
        WhileLoop,  // cond, body
        TryFinally  // body, finally
    };

    namespace expr
    {
        struct Value { Literal literal; TypeId type{kNone}; };
        struct VarRef { VarId var{0}; };
        struct VarSet { VarId var{0}; ExprPtr value; };
        struct Call { ExprPtr object; MemberId method{kNone}; std::vector<ExprPtr> args; }; // object is null for static calls
        struct PropertyGet { ExprPtr object; MemberId property{kNone}; std::vector<ExprPtr> index_args; };
        struct PropertySet { ExprPtr object; MemberId property{kNone}; std::vector<ExprPtr> index_args; ExprPtr value; };
        struct FieldGet { ExprPtr object; MemberId field{kNone}; };
        struct FieldSet { ExprPtr object; MemberId field{kNone}; ExprPtr value; };
        struct NewObject { MemberId ctor{kNone}; std::vector<ExprPtr> args; };
        struct Coerce { ExprPtr operand; TypeId type{kNone}; };
        struct NewArray { TypeId element{kNone}; std::vector<ExprPtr> elems; };
        struct NewTuple { std::vector<ExprPtr> elems; };
        struct TupleGet { ExprPtr tuple; unsigned index{0}; };
        struct NewDelegate { TypeId delegate_type{kNone}; std::vector<VarId> params; ExprPtr body; };
        struct Let { VarId var{0}; ExprPtr value; ExprPtr body; };
        struct Lambda { VarId param{0}; ExprPtr body; TypeId func_type{kNone}; };
        struct Application { ExprPtr func; ExprPtr arg; };
        struct NewUnionCase { UnionCase union_case; std::vector<ExprPtr> args; };
        struct NewRecord { TypeId record_type{kNone}; std::vector<ExprPtr> args; };
        struct UnionCaseTest { ExprPtr operand; UnionCase union_case; };
        struct Combination { Shape shape{Shape::Sequential}; std::vector<ExprPtr> operands; };
    }

    using ExprData = std::variant<expr::Value, expr::VarRef, expr::VarSet, expr::Call, expr::PropertyGet, expr::PropertySet,
                                  expr::FieldGet, expr::FieldSet, expr::NewObject, expr::Coerce, expr::NewArray, expr::NewTuple,
                                  expr::TupleGet, expr::NewDelegate, expr::Let, expr::Lambda, expr::Application,
                                  expr::NewUnionCase, expr::NewRecord, expr::UnionCaseTest, expr::Combination>;

    struct Expr
    {
        ExprData data;
    };

    // Static type of an expression. Throws std::invalid_argument on malformed trees.
    TypeId type_of(Metadata &md, const VarPool &vars, const ExprPtr &e);

    // Raw node constructors. Nothing is validated: nodes may refer to members and types of
    // a universe other than the one their children were typed in. Internal to rewriting.
    namespace unchecked
    {
        ExprPtr value(Literal literal, TypeId type);
        ExprPtr var(VarId v);
        ExprPtr var_set(VarId v, ExprPtr value);
        ExprPtr call(ExprPtr object, MemberId method, std::vector<ExprPtr> args);
        ExprPtr property_get(ExprPtr object, MemberId property, std::vector<ExprPtr> index_args = {});
        ExprPtr property_set(ExprPtr object, MemberId property, std::vector<ExprPtr> index_args, ExprPtr value);
        ExprPtr field_get(ExprPtr object, MemberId field);
        ExprPtr field_set(ExprPtr object, MemberId field, ExprPtr value);
        ExprPtr new_object(MemberId ctor, std::vector<ExprPtr> args);
        ExprPtr coerce(ExprPtr operand, TypeId type);
        ExprPtr new_array(TypeId element, std::vector<ExprPtr> elems);
        ExprPtr new_tuple(std::vector<ExprPtr> elems);
        ExprPtr tuple_get(ExprPtr tuple, unsigned index);
        ExprPtr new_delegate(TypeId delegate_type, std::vector<VarId> params, ExprPtr body);
        ExprPtr let(VarId v, ExprPtr value, ExprPtr body);
        ExprPtr lambda(VarId param, ExprPtr body, TypeId func_type);
        ExprPtr application(ExprPtr func, ExprPtr arg);
        ExprPtr new_union_case(UnionCase uc, std::vector<ExprPtr> args);
        ExprPtr new_record(TypeId record_type, std::vector<ExprPtr> args);
        ExprPtr union_case_test(ExprPtr operand, UnionCase uc);
        ExprPtr combination(Shape shape, std::vector<ExprPtr> operands);
    }

    // Checked construction: argument counts, static/instance use and argument types are
    // validated against the member signatures, throwing std::invalid_argument on mismatch.
    class ExprBuilder
    {
    public:
        ExprBuilder(Metadata &md, VarPool &vars) : md_(md), vars_(vars) {}

        ExprPtr value(Literal literal, TypeId type);
        ExprPtr var(VarId v);
        ExprPtr var_set(VarId v, ExprPtr value);
        ExprPtr call(ExprPtr object, MemberId method, std::vector<ExprPtr> args);
        ExprPtr property_get(ExprPtr object, MemberId property, std::vector<ExprPtr> index_args = {});
        ExprPtr property_set(ExprPtr object, MemberId property, std::vector<ExprPtr> index_args, ExprPtr value);
        ExprPtr field_get(ExprPtr object, MemberId field);
        ExprPtr field_set(ExprPtr object, MemberId field, ExprPtr value);
        ExprPtr new_object(MemberId ctor, std::vector<ExprPtr> args);
        ExprPtr coerce(ExprPtr operand, TypeId type);
        ExprPtr new_array(TypeId element, std::vector<ExprPtr> elems);
        ExprPtr new_tuple(std::vector<ExprPtr> elems);
        ExprPtr tuple_get(ExprPtr tuple, unsigned index);
        ExprPtr new_delegate(TypeId delegate_type, std::vector<VarId> params, ExprPtr body);
        ExprPtr let(VarId v, ExprPtr value, ExprPtr body);
        ExprPtr lambda(VarId param, ExprPtr body, TypeId func_type);
        ExprPtr application(ExprPtr func, ExprPtr arg);
        ExprPtr new_union_case(UnionCase uc, std::vector<ExprPtr> args);
        ExprPtr new_record(TypeId record_type, std::vector<ExprPtr> args);
        ExprPtr union_case_test(ExprPtr operand, UnionCase uc);
        ExprPtr if_then_else(ExprPtr cond, ExprPtr then_branch, ExprPtr else_branch);
        ExprPtr sequential(ExprPtr first, ExprPtr second);
        ExprPtr while_loop(ExprPtr cond, ExprPtr body);
        ExprPtr try_finally(ExprPtr body, ExprPtr finalizer);

    private:
        TypeId type_of(const ExprPtr &e) { return retarget::type_of(md_, vars_, e); }
        void expect(const char *what, TypeId expected, const ExprPtr &actual);
        void check_args(const char *what, MemberId m, std::vector<TypeId> params, const std::vector<ExprPtr> &args);
        void check_target(const char *what, MemberId m, bool is_static, const ExprPtr &object);

        Metadata &md_;
        VarPool &vars_;
    };

} // namespace retarget
