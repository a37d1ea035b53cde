#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>

namespace trialrun {

/// Explicit per-unit configuration, resolved once per Run by the mode dispatcher
/// and passed to every unit. Units never consult process-wide toggles.
struct UnitConfig
{
    bool do_plot = false;
    bool verbose = false;

    /// Rendering backend; only set when plotting is enabled
    std::optional<std::string> plot_backend;

    /// Parameter overrides (``-D name=value``), applied to every unit declaring ``name``
    std::map<std::string, std::string, std::less<>> overrides;
};

} // namespace trialrun
