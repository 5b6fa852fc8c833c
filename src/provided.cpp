#include "retarget/provided.hpp"

#include <stdexcept>

namespace retarget
{

    namespace
    {
        std::vector<TypeId> types_of(const std::vector<ProvidedParameter> &ps)
        {
            std::vector<TypeId> out;
            for (auto &p : ps)
                out.push_back(p.type);
            return out;
        }

        const InvokeCode *code_of(const Metadata &md, MemberId m)
        {
            const Member &mm = md.member(m);
            return (mm.host_defined && mm.invoke_code) ? &mm.invoke_code : nullptr;
        }
    }

    MemberId ProvidedTypeDefinition::add_member(const ProvidedProperty &p)
    {
        Member m;
        m.kind = Member::Kind::Property;
        m.name = p.name();
        m.type = p.type();
        m.is_static = p.is_static();
        m.invoke_code = p.getter_code();
        return md_->define_provided_member(id_, std::move(m));
    }

    MemberId ProvidedTypeDefinition::add_member(const ProvidedMethod &pm)
    {
        Member m;
        m.kind = Member::Kind::Method;
        m.name = pm.name();
        m.params = types_of(pm.parameters());
        m.type = pm.result_type();
        m.is_static = pm.is_static();
        m.invoke_code = pm.invoke_code();
        return md_->define_provided_member(id_, std::move(m));
    }

    MemberId ProvidedTypeDefinition::add_member(const ProvidedConstructor &c)
    {
        Member m;
        m.kind = Member::Kind::Constructor;
        m.name = ".ctor";
        m.params = types_of(c.parameters());
        m.invoke_code = c.invoke_code();
        return md_->define_provided_member(id_, std::move(m));
    }

    void ProvidedTypeDefinition::add_nested_type(const ProvidedTypeDefinition &nested)
    {
        md_->add_nested_type(id_, nested.id());
    }

    bool is_provided_invocation(const Metadata &md, const ExprPtr &e)
    {
        if (!e)
            return false;
        if (auto c = std::get_if<expr::Call>(&e->data))
            return code_of(md, c->method) != nullptr;
        if (auto p = std::get_if<expr::PropertyGet>(&e->data))
            return code_of(md, p->property) != nullptr;
        if (auto n = std::get_if<expr::NewObject>(&e->data))
            return code_of(md, n->ctor) != nullptr;
        return false;
    }

    ExprPtr expand_provided(const Metadata &md, const ExprPtr &e)
    {
        if (!is_provided_invocation(md, e))
            throw std::invalid_argument("expand_provided: expression does not invoke a provided member");
        std::vector<ExprPtr> args;
        const InvokeCode *code = nullptr;
        auto with_receiver = [&](const ExprPtr &obj, const std::vector<ExprPtr> &rest) {
            if (obj)
                args.push_back(obj);
            args.insert(args.end(), rest.begin(), rest.end());
        };
        if (auto c = std::get_if<expr::Call>(&e->data))
        {
            code = code_of(md, c->method);
            with_receiver(c->object, c->args);
        }
        else if (auto p = std::get_if<expr::PropertyGet>(&e->data))
        {
            code = code_of(md, p->property);
            with_receiver(p->object, p->index_args);
        }
        else if (auto n = std::get_if<expr::NewObject>(&e->data))
        {
            code = code_of(md, n->ctor);
            args = n->args;
        }
        // copy: the body may grow the member arena while it runs
        InvokeCode fn = *code;
        return fn(args);
    }

} // namespace retarget
