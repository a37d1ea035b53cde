#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace trialrun {

/// Process environment relevant to a Run, captured once at startup
struct Environment
{
    /// ``CI`` is set to something other than "", "0" or "false"
    bool ci = false;

    /// ``TRIALRUN_PLOT_BACKEND``; only consulted when plotting is enabled
    std::optional<std::string> plot_backend;

    std::size_t hardware_threads = 1;

    static constexpr const char* CI_VAR = "CI";
    static constexpr const char* PLOT_BACKEND_VAR = "TRIALRUN_PLOT_BACKEND";

    static Environment from_process();
};

} // namespace trialrun
