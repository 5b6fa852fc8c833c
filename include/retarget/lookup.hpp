// Query surface the resolver uses to find types by name inside a module.
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "retarget/metadata.hpp"

namespace retarget
{

    class TypeLookup
    {
    public:
        virtual ~TypeLookup() = default;
        virtual std::string module_name(ModuleId m) const = 0;
        virtual std::vector<TypeId> types_in_module(ModuleId m) const = 0;
        virtual std::optional<TypeId> type_in_module(ModuleId m, std::string_view full_name) const = 0;
        // Full name used for name fix-up and ordering of candidates.
        virtual std::string type_name(TypeId t) const = 0;
    };

    // Lookup over an in-memory Metadata arena.
    class MetadataTypeLookup : public TypeLookup
    {
    public:
        explicit MetadataTypeLookup(const Metadata &md) : md_(md) {}
        std::string module_name(ModuleId m) const override { return md_.module(m).name; }
        std::vector<TypeId> types_in_module(ModuleId m) const override { return md_.module(m).types; }
        std::optional<TypeId> type_in_module(ModuleId m, std::string_view full_name) const override
        {
            return md_.find_type_in_module(m, full_name);
        }
        std::string type_name(TypeId t) const override { return md_.type(t).full_name; }

    private:
        const Metadata &md_;
    };

} // namespace retarget
