// Host-defined declarations built by the facade. They are never resolved across universes.
#pragma once
#include <string>
#include <vector>

#include "retarget/expr.hpp"
#include "retarget/metadata.hpp"

namespace retarget
{

    struct ProvidedParameter
    {
        std::string name;
        TypeId type{kNone};
    };

    class ProvidedProperty
    {
    public:
        ProvidedProperty(std::string name, TypeId type, InvokeCode getter, bool is_static)
            : name_(std::move(name)), type_(type), getter_(std::move(getter)), is_static_(is_static) {}
        const std::string &name() const { return name_; }
        TypeId type() const { return type_; }
        bool is_static() const { return is_static_; }
        const InvokeCode &getter_code() const { return getter_; }

    private:
        std::string name_;
        TypeId type_;
        InvokeCode getter_;
        bool is_static_;
    };

    class ProvidedConstructor
    {
    public:
        ProvidedConstructor(std::vector<ProvidedParameter> params, InvokeCode code) : params_(std::move(params)), code_(std::move(code)) {}
        const std::vector<ProvidedParameter> &parameters() const { return params_; }
        const InvokeCode &invoke_code() const { return code_; }

    private:
        std::vector<ProvidedParameter> params_;
        InvokeCode code_;
    };

    class ProvidedMethod
    {
    public:
        ProvidedMethod(std::string name, std::vector<ProvidedParameter> params, TypeId result, bool is_static, InvokeCode code)
            : name_(std::move(name)), params_(std::move(params)), result_(result), is_static_(is_static), code_(std::move(code)) {}
        const std::string &name() const { return name_; }
        const std::vector<ProvidedParameter> &parameters() const { return params_; }
        TypeId result_type() const { return result_; }
        bool is_static() const { return is_static_; }
        const InvokeCode &invoke_code() const { return code_; }

    private:
        std::string name_;
        std::vector<ProvidedParameter> params_;
        TypeId result_;
        bool is_static_;
        InvokeCode code_;
    };

    // Handle to a provided type registered in a Metadata arena.
    class ProvidedTypeDefinition
    {
    public:
        ProvidedTypeDefinition(Metadata &md, TypeId id) : md_(&md), id_(id) {}
        TypeId id() const { return id_; }
        const std::string &name() const { return md_->type(id_).full_name; }
        TypeId base_type() const { return md_->type(id_).base; }
        bool hide_object_methods() const { return md_->type(id_).hide_object_methods; }
        bool non_nullable() const { return md_->type(id_).non_nullable; }

        MemberId add_member(const ProvidedProperty &p);
        MemberId add_member(const ProvidedMethod &m);
        MemberId add_member(const ProvidedConstructor &c);
        void add_nested_type(const ProvidedTypeDefinition &nested);

    private:
        Metadata *md_;
        TypeId id_;
    };

    // True for a call, property read or construction whose member carries invoke code.
    bool is_provided_invocation(const Metadata &md, const ExprPtr &e);

    // Runs the invoke code of a provided member and returns the expression to splice in.
    // The receiver, if any, is passed as the first argument.
    ExprPtr expand_provided(const Metadata &md, const ExprPtr &e);

} // namespace retarget
