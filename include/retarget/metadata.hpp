// Type universe metadata: modules, types and members interned in one arena.
#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace retarget
{

    using TypeId = uint32_t;
    using MemberId = uint32_t;
    using ModuleId = uint32_t;

    inline constexpr uint32_t kNone = 0xffffffffu;

    // An ordered list of modules forming one closed set of types.
    using Universe = std::vector<ModuleId>;

    struct Expr;
    using ExprPtr = std::shared_ptr<const Expr>;
    // Body of a provided member: argument expressions in, spliced expression out.
    using InvokeCode = std::function<ExprPtr(const std::vector<ExprPtr> &)>;

    // Runtime representation, only consulted by the evaluator.
    enum class Repr
    {
        Opaque,
        Void,
        Bool,
        I32,
        I64,
        Union,
        Record,
        Tuple
    };

    enum class Intrinsic
    {
        None,
        Equality,
        Add,
        Sub,
        Mul,
        LessThan,
        UnionNew,  // arg = case tag
        UnionTag,
        RecordNew,
        RecordGet // arg = field index
    };

    // Where a union exposes its integer tag.
    enum class TagShape
    {
        InstanceProperty, // instance property "Tag"
        StaticMethod,     // static GetTag(union)
        InstanceMethod    // instance GetTag()
    };

    namespace binding
    {
        constexpr unsigned Public = 1u;
        constexpr unsigned NonPublic = 2u;
        constexpr unsigned Static = 4u;
        constexpr unsigned Instance = 8u;
    }

    struct Module
    {
        std::string name;
        std::vector<TypeId> types;
    };

    struct UnionCaseInfo
    {
        std::string name;
        unsigned tag{0};
        std::vector<TypeId> fields;
        MemberId constructor{kNone};
    };

    // A case of a (possibly instantiated) union type.
    struct UnionCase
    {
        TypeId union_type{kNone};
        unsigned tag{0};
    };

    struct Type
    {
        enum class Kind
        {
            Definition,
            GenericInstance,
            GenericParameter,
            Array,
            ByRef,
            Pointer,
            Tuple,
            Abbreviation
        } kind{Kind::Definition};
        std::string full_name;              // Definition, GenericParameter, Abbreviation
        ModuleId module{kNone};             // Definition
        std::vector<TypeId> generic_params; // Definition
        TypeId definition{kNone};           // GenericInstance
        std::vector<TypeId> args;           // GenericInstance, Tuple
        TypeId element{kNone};              // Array, ByRef, Pointer, Abbreviation
        unsigned rank{0};                   // Array
        TypeId owner{kNone};                // GenericParameter of a type
        MemberId owner_method{kNone};       // GenericParameter of a method
        unsigned position{0};               // GenericParameter
        TypeId base{kNone};
        Repr repr{Repr::Opaque};
        bool host_defined{false};
        bool hide_object_methods{false};
        bool non_nullable{false};
        std::vector<MemberId> members;    // Definition
        std::vector<UnionCaseInfo> cases; // union Definition
        MemberId tag_member{kNone};
        std::vector<MemberId> record_fields;
        MemberId record_ctor{kNone};
        std::vector<TypeId> nested;
    };

    struct Member
    {
        enum class Kind
        {
            Property,
            Field,
            Method,
            Constructor
        } kind{Kind::Method};
        std::string name;
        TypeId declaring{kNone};
        std::vector<TypeId> params;
        TypeId type{kNone}; // property/field type, method return type, void for constructors
        bool is_static{false};
        bool is_public{true};
        MemberId getter{kNone};             // Property
        MemberId setter{kNone};             // Property
        std::vector<TypeId> generic_params; // generic method definition
        std::vector<TypeId> generic_args;   // generic method instantiation
        MemberId definition{kNone};         // declared member this one was materialized from
        bool host_defined{false};
        Intrinsic intrinsic{Intrinsic::None};
        unsigned intrinsic_arg{0};
        InvokeCode invoke_code;
    };

    struct TypeDef
    {
        std::vector<std::string> generic_params;
        TypeId base{kNone};
        Repr repr{Repr::Opaque};
    };

    struct MethodDef
    {
        std::string name;
        std::vector<TypeId> params;
        TypeId ret{kNone}; // kNone means void
        bool is_static{false};
        bool is_public{true};
        Intrinsic intrinsic{Intrinsic::None};
        unsigned intrinsic_arg{0};
    };

    struct PropertyDef
    {
        std::string name;
        TypeId type{kNone};
        bool is_static{false};
        bool can_read{true};
        bool can_write{false};
        bool is_public{true};
        std::vector<TypeId> index_params;
        Intrinsic intrinsic{Intrinsic::None};
        unsigned intrinsic_arg{0};
    };

    struct FieldDef
    {
        std::string name;
        TypeId type{kNone};
        bool is_static{false};
        bool is_public{true};
    };

    struct UnionCaseDef
    {
        std::string name;
        std::vector<TypeId> fields;
    };

    class Metadata
    {
    public:
        Metadata();

        ModuleId add_module(std::string name);
        const Module &module(ModuleId id) const { return modules_.at(id); }
        size_t module_count() const { return modules_.size(); }
        std::optional<TypeId> find_type_in_module(ModuleId m, std::string_view full_name) const;

        TypeId define_type(ModuleId m, std::string full_name, const TypeDef &def = {});
        TypeId define_abbreviation(std::string name, TypeId target);
        TypeId define_provided_type(ModuleId m, std::string full_name, TypeId base, bool hide_object_methods, bool non_nullable);
        void add_nested_type(TypeId outer, TypeId inner);
        TypeId generic_param(TypeId owner, unsigned position) const;
        TypeId void_type() const { return void_; }

        // Interned constructors: equal structure yields the same id.
        TypeId make_generic(TypeId definition, const std::vector<TypeId> &args);
        TypeId make_array(TypeId element, unsigned rank = 1);
        TypeId make_byref(TypeId element);
        TypeId make_pointer(TypeId element);
        TypeId make_tuple(const std::vector<TypeId> &elements);

        MemberId define_method(TypeId declaring, const MethodDef &def);
        // Declares a generic method; its signature may mention the returned parameters and is set with set_signature.
        MemberId define_generic_method(TypeId declaring, std::string name, const std::vector<std::string> &generic_names, bool is_static = false);
        void set_signature(MemberId method, std::vector<TypeId> params, TypeId ret);
        MemberId define_property(TypeId declaring, const PropertyDef &def);
        MemberId define_field(TypeId declaring, const FieldDef &def);
        MemberId define_constructor(TypeId declaring, std::vector<TypeId> params, bool is_public = true,
                                    Intrinsic intrinsic = Intrinsic::None, unsigned intrinsic_arg = 0);
        MemberId define_provided_member(TypeId declaring, Member m);

        // F# compiled shapes.
        void define_union_cases(TypeId type, const std::vector<UnionCaseDef> &cases, TagShape shape, TypeId tag_type);
        void define_record_fields(TypeId type, const std::vector<std::pair<std::string, TypeId>> &fields);

        const Type &type(TypeId id) const { return types_.at(id); }
        const Member &member(MemberId id) const { return members_.at(id); }
        size_t type_count() const { return types_.size(); }
        size_t member_count() const { return members_.size(); }

        // Members of a definition, or of an instantiation (materialized by substitution on first use).
        const std::vector<MemberId> &members_of(TypeId t);
        MemberId member_on(TypeId t, MemberId declared);
        std::optional<MemberId> find_property(TypeId t, std::string_view name, unsigned flags);
        std::optional<MemberId> find_field(TypeId t, std::string_view name, unsigned flags);
        std::optional<MemberId> find_method(TypeId t, std::string_view name, const std::vector<TypeId> &params);
        std::optional<MemberId> find_constructor(TypeId t, const std::vector<TypeId> &params);
        std::optional<MemberId> find_unique_method(TypeId t, std::string_view name);

        MemberId make_generic_method(MemberId definition, const std::vector<TypeId> &args);
        MemberId generic_method_definition(MemberId m) const;
        bool is_generic_method(MemberId m) const;
        bool is_static_property(MemberId p) const;

        TypeId definition_of(TypeId t) const;
        bool is_host_defined(TypeId t) const { return type(t).host_defined; }
        bool signature_equal(TypeId a, TypeId b) const;
        bool is_assignable(TypeId to, TypeId from) const;
        TypeId substitute(TypeId t, const std::vector<TypeId> &from, const std::vector<TypeId> &to);

        bool is_union(TypeId t) const { return !type(definition_of(t)).cases.empty(); }
        bool is_record(TypeId t) const { return type(definition_of(t)).record_ctor != kNone; }
        UnionCase union_case(TypeId union_type, std::string_view name) const;
        const UnionCaseInfo &union_case_info(const UnionCase &uc) const;
        std::vector<TypeId> union_case_fields(const UnionCase &uc);
        MemberId union_case_constructor(const UnionCase &uc);
        MemberId union_tag_member(TypeId union_type);
        MemberId record_constructor(TypeId record_type);
        std::vector<TypeId> record_field_types(TypeId record_type);

        std::string to_string(TypeId id) const;
        std::string member_to_string(MemberId id) const;
        std::string universe_to_string(const Universe &u) const;

    private:
        TypeId add_type(Type t);
        MemberId add_member(Member m);
        MemberId attach(TypeId declaring, Member m);
        Member instantiate_member(const Member &decl, const std::vector<TypeId> &from, const std::vector<TypeId> &to, TypeId declaring);

        std::vector<Module> modules_;
        std::vector<Type> types_;
        std::vector<Member> members_;
        std::vector<std::unordered_map<std::string, TypeId>> module_index_;
        TypeId void_{kNone};
        std::map<std::pair<TypeId, std::vector<TypeId>>, TypeId> generic_cache_;
        std::map<std::pair<TypeId, unsigned>, TypeId> array_cache_;
        std::unordered_map<TypeId, TypeId> byref_cache_;
        std::unordered_map<TypeId, TypeId> pointer_cache_;
        std::map<std::vector<TypeId>, TypeId> tuple_cache_;
        std::unordered_map<TypeId, std::vector<MemberId>> instance_members_;
        std::map<std::pair<MemberId, std::vector<TypeId>>, MemberId> method_inst_cache_;
    };

} // namespace retarget
