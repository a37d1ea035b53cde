#pragma once

#include "output/verbosity.hpp"

#include <trialrun/common/error_types.hpp>
#include <trialrun/common/expected.hpp>
#include <trialrun/common/extra_formatters.hpp>
#include <trialrun/common/formatters/debug.hpp>
#include <trialrun/run_session.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trialrun {

struct ProgramOptions
{
    // ###### Argument fields

    /// Level of verbosity for cli output
    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    /// Unit names or name globs (fnmatch syntax). Empty selects every unit.
    std::vector<std::string> selectors;
    std::vector<std::string> tags;

    /// Inferred from the environment and selectors when not given
    std::optional<RunMode> mode;

    /// Defaults to the number of available cores, except in standalone mode
    std::optional<std::size_t> workers;

    /// Unset: the mode's default
    std::optional<bool> verbose;
    std::optional<bool> plot;

    /// For units that do not declare a ``Timeout``. Unset: such units are bounded only by the run budget
    std::optional<std::chrono::milliseconds> timeout;
    std::chrono::milliseconds budget = DEFAULT_BUDGET; ///< automated mode only
    std::chrono::milliseconds grace = DEFAULT_GRACE;

    bool strict = false;
    bool strict_coverage = false;
    double coverage_min = DEFAULT_COVERAGE_MIN;
    double coverage_target = DEFAULT_COVERAGE_TARGET;

    std::filesystem::path artifact_root = DEFAULT_ARTIFACT_ROOT;
    std::filesystem::path coverage_report = DEFAULT_COVERAGE_REPORT;

    /// ``-D name=value``
    std::map<std::string, std::string, std::less<>> overrides;

    /// Print the selected units instead of running them
    bool list_only = false;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    // ###### Argument defaults

    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;
    static constexpr std::chrono::milliseconds DEFAULT_BUDGET = std::chrono::seconds{600};
    static constexpr std::chrono::milliseconds DEFAULT_GRACE = std::chrono::seconds{5};
    static constexpr double DEFAULT_COVERAGE_MIN = 0.80;
    static constexpr double DEFAULT_COVERAGE_TARGET = 0.90;
    static constexpr std::string_view DEFAULT_ARTIFACT_ROOT = ".trialrun/artifacts";
    static constexpr std::string_view DEFAULT_COVERAGE_REPORT = ".trialrun/coverage.json";

    static Expected<void, std::string> ensure_ratio(double value, std::string_view name) {
        if (!(value >= 0.0 && value <= 1.0)) {
            return fmt::format("{} must be within [0, 1] (got {})", name, value);
        }

        return {};
    }

    static Expected<void, std::string> ensure_positive(std::chrono::milliseconds value, std::string_view name) {
        if (value <= std::chrono::milliseconds::zero()) {
            return fmt::format("{} must be positive (got {})", name, value);
        }

        return {};
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() {
        // Assume that all enumerators have valid values except for verbosity
        // which we will just clamp to [MIN, MAX]
        constexpr auto MAX_VERBOSITY = VerbosityLevel::Max;
        constexpr auto MIN_VERBOSITY = VerbosityLevel{};

        verbosity = std::clamp(verbosity, MIN_VERBOSITY, MAX_VERBOSITY);

        if (workers && *workers == 0) {
            return std::string{"Worker count must be at least 1"};
        }

        if (timeout) {
            TRY(ensure_positive(*timeout, "Unit timeout"));
        }
        TRY(ensure_positive(budget, "Run budget"));

        if (grace < std::chrono::milliseconds::zero()) {
            return fmt::format("Grace period must not be negative (got {})", grace);
        }

        TRY(ensure_ratio(coverage_min, "Minimum coverage"));
        TRY(ensure_ratio(coverage_target, "Target coverage"));

        if (coverage_target < coverage_min) {
            return fmt::format("Target coverage ({}) is below the minimum ({})", coverage_target, coverage_min);
        }

        if (artifact_root.empty()) {
            return std::string{"Artifact directory must not be empty"};
        }

        return {};
    }
};

} // namespace trialrun

FMT_SERIALIZE_ENUM(::trialrun::ProgramOptions::ColorizeOpt, Auto, Always, Never);

template <>
struct fmt::formatter<::trialrun::ProgramOptions> : ::trialrun::DebugFormatter
{
    auto format(const ::trialrun::ProgramOptions& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "{{verbosity={}, selectors={}, tags={}, mode={}, workers={}, verbose={}, plot={}, "
                              "timeout={}, budget={}, grace={}, strict={}, strict_coverage={}, coverage=[{}, {}], "
                              "artifacts={}, coverage_report={}, overrides={}, list={}, color={}}}",
                              from.verbosity, from.selectors, from.tags, from.mode, from.workers, from.verbose,
                              from.plot, from.timeout, from.budget, from.grace, from.strict, from.strict_coverage,
                              from.coverage_min, from.coverage_target, from.artifact_root, from.coverage_report,
                              from.overrides, from.list_only, from.colorize_option);
    }
};
