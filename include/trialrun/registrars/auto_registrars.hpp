#pragma once

#include <trialrun/api/metadata.hpp>
#include <trialrun/api/unit_base.hpp>
#include <trialrun/registrars/global_registrar.hpp>

#include <concepts>
#include <memory>
#include <string_view>

namespace trialrun {

/// Helper class that, when constructed, automatically constructs and registers a unit
template <typename UnitClass>
    requires(std::derived_from<UnitClass, UnitBase>)
class UnitAutoRegistrar
{
public:
    template <typename... MetadataAttrs>
    UnitAutoRegistrar(std::string_view name, std::string_view source_file,
                      metadata::Metadata<MetadataAttrs...> metadata = metadata::Metadata<MetadataAttrs...>{}) {
        GlobalRegistrar::get().add_unit(std::make_unique<UnitClass>(name, source_file, metadata));
    }
};

} // namespace trialrun
