#pragma once

#include <trialrun/run_session.hpp>

namespace trialrun {

/// `Max` is just used as a sentinal
enum class VerbosityLevel {
    Silent,  ///< nothing but the exit code
    Quiet,   ///< failures and the final summary line
    Summary, ///< failures, non-passing outcomes and the suite summary
    All,     ///< every outcome, including passing units
    Extra,   ///< every outcome with inspection values and per-module coverage
    Max
};

constexpr bool should_output_outcome(VerbosityLevel level, UnitStatus status) {
    using enum VerbosityLevel;

    return level >= All || (level >= Summary && status != UnitStatus::Passed);
}

constexpr bool should_output_failure_details(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Quiet;
}

/// Inspection values are shown for verbose runs even at the default level
constexpr bool should_output_inspection(VerbosityLevel level, bool verbose_run) {
    using enum VerbosityLevel;

    return level >= Extra || (verbose_run && level >= Summary);
}

constexpr bool should_output_suite_summary(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Quiet;
}

constexpr bool should_output_module_coverage(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Extra;
}

constexpr bool should_output_run_metadata(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Summary;
}

} // namespace trialrun

FMT_SERIALIZE_ENUM(::trialrun::VerbosityLevel, Silent, Quiet, Summary, All, Extra, Max);
