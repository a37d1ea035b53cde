#pragma once

#include "dispatch/environment.hpp"
#include "registry/unit_registry.hpp"
#include "user/program_options.hpp"

#include <trialrun/api/unit_base.hpp>
#include <trialrun/api/unit_config.hpp>
#include <trialrun/common/expected.hpp>
#include <trialrun/common/formatters/debug.hpp>
#include <trialrun/coverage/coverage.hpp>
#include <trialrun/run_session.hpp>

#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trialrun {

/// Everything a Run needs, decided before any unit executes
struct RunConfig
{
    RunMode mode = RunMode::Discovery;

    std::vector<DiscoveredUnit> units; ///< registry order
    std::vector<StructuralViolation> violations;

    std::size_t worker_count = 1;
    UnitConfig unit_config;

    std::optional<std::chrono::milliseconds> default_timeout;
    std::optional<std::chrono::milliseconds> budget; ///< automated mode only
    std::chrono::milliseconds grace = ProgramOptions::DEFAULT_GRACE;

    bool strict_structure = false;
    bool strict_coverage = false;
    CoverageGate gate;

    std::filesystem::path artifact_root;
    std::filesystem::path coverage_report;
};

struct DispatchError
{
    enum Kind {
        NoSuchUnit,          ///< an exact unit name was requested that is not registered
        InvalidOption,       ///< option values are inconsistent with each other or the mode
        StructuralViolation, ///< strict mode and the registry has violations
    } kind;

    std::string message;
};

/// Selector containing fnmatch(3) wildcards, as opposed to an exact unit name
bool is_glob(std::string_view selector);

/// Mode used when none was requested explicitly:
/// the CI environment selects automated; a single exact unit name selects standalone;
/// anything else is a discovery run
RunMode infer_mode(const ProgramOptions& opts, const Environment& env);

/// Resolve program options and environment into a RunConfig.
/// Fails before any unit runs; an unknown exact name is an error, never an empty selection.
Expected<RunConfig, DispatchError> resolve(const ProgramOptions& opts, const Environment& env,
                                           const UnitRegistry& registry);

} // namespace trialrun

FMT_SERIALIZE_ENUM(::trialrun::DispatchError::Kind, NoSuchUnit, InvalidOption, StructuralViolation);

template <>
struct fmt::formatter<::trialrun::DispatchError> : ::trialrun::DebugFormatter
{
    auto format(const ::trialrun::DispatchError& from, format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}: {}", from.kind, from.message);
    }
};
