#include "retarget/replacer.hpp"

#include <cstdio>
#include <exception>
#include <stdexcept>

namespace retarget
{

    Replacer::Replacer(Metadata &md, VarPool &vars, const TypeLookup &lookup, Universe origin, Universe target, ReplacerOptions opts)
        : md_(md), vars_(vars), opts_(std::move(opts)),
          types_(md, lookup, std::move(origin), std::move(target), opts_),
          members_(md, types_, opts_),
          table_(md, vars, types_, opts_),
          rewriter_(md, vars, types_, members_, table_, opts_) {}

    ExprPtr Replacer::try_rewrite(Direction d, const ExprPtr &e, std::vector<Diagnostic> &errors)
    {
        try
        {
            return rewrite(d, e);
        }
        catch (const RetargetError &err)
        {
            errors.push_back(err.diagnostic());
        }
        catch (const std::exception &err)
        {
            errors.push_back(Diagnostic{"E9001", std::string("internal error: ") + err.what(), "", -1, -1, {}});
        }
        return nullptr;
    }

    InvokeCode Replacer::wrap(InvokeCode body)
    {
        if (!body)
            throw std::invalid_argument("provided member needs a body");
        return [this, body = std::move(body)](const std::vector<ExprPtr> &args) -> ExprPtr {
            std::vector<ExprPtr> origin_args;
            origin_args.reserve(args.size());
            for (auto &a : args)
                origin_args.push_back(rewrite(Direction::Backward, a));
            ExprPtr result = body(origin_args);
            if (!result)
                throw std::invalid_argument("provided member body returned no expression");
            return rewrite(Direction::Forward, result);
        };
    }

    ProvidedParameter Replacer::provided_parameter(std::string name, TypeId type)
    {
        return ProvidedParameter{std::move(name), type_to_target(type)};
    }

    ProvidedProperty Replacer::provided_property(std::string name, TypeId type, InvokeCode getter, bool is_static)
    {
        TypeId t = type_to_target(type);
        return ProvidedProperty(std::move(name), t, wrap(std::move(getter)), is_static);
    }

    ProvidedConstructor Replacer::provided_constructor(std::vector<ProvidedParameter> params, InvokeCode code)
    {
        return ProvidedConstructor(std::move(params), wrap(std::move(code)));
    }

    ProvidedMethod Replacer::provided_method(std::string name, std::vector<ProvidedParameter> params, TypeId result, bool is_static, InvokeCode code)
    {
        TypeId r = type_to_target(result);
        return ProvidedMethod(std::move(name), std::move(params), r, is_static, wrap(std::move(code)));
    }

    ProvidedTypeDefinition Replacer::provided_type_definition(std::string name, TypeId base, bool hide_object_methods, bool non_nullable)
    {
        TypeId b = base_to_target(base);
        TypeId id = md_.define_provided_type(kNone, std::move(name), b, hide_object_methods, non_nullable);
        return ProvidedTypeDefinition(md_, id);
    }

    ProvidedTypeDefinition Replacer::provided_type_definition(ModuleId module, const std::string &ns, const std::string &name, TypeId base,
                                                              bool hide_object_methods, bool non_nullable)
    {
        TypeId b = base_to_target(base);
        std::string full = ns.empty() ? name : ns + "." + name;
        TypeId id = md_.define_provided_type(module, full, b, hide_object_methods, non_nullable);
        if (opts_.debugRewrite)
            std::fprintf(stderr, "[dbg][provided] type %s in %s\n", full.c_str(), md_.module(module).name.c_str());
        return ProvidedTypeDefinition(md_, id);
    }

} // namespace retarget
