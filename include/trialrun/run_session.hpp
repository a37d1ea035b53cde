/// \file
/// Defines data classes to store result data for the current run session
#pragma once

#include <trialrun/coverage/coverage.hpp>
#include <trialrun/common/extra_formatters.hpp>
#include <trialrun/common/formatters/macros.hpp>
#include <trialrun/version.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <range/v3/algorithm/count_if.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trialrun {

enum class RunMode { Standalone, Discovery, Automated };

enum class UnitStatus { Passed, Failed, Skipped, Errored, TimedOut };

/// Whether a status counts against the run
constexpr bool is_failure(UnitStatus status) {
    return status == UnitStatus::Failed || status == UnitStatus::Errored || status == UnitStatus::TimedOut;
}

struct RunMetadata
{
    int version = get_version();
    std::string_view version_string = TRIALRUN_VERSION_STRING;
    std::string_view git_hash = TRIALRUN_VERSION_GIT_HASH;

    std::chrono::time_point<std::chrono::system_clock> start_time = std::chrono::system_clock::now();
};

/// Why a unit did not pass. Every field is filled in for rendering;
/// ``expected``/``actual`` are empty when the producer had nothing to report.
struct FailureDetail
{
    std::string summary;
    std::string expected;
    std::string actual;
    std::vector<std::string> context;
    std::string location; ///< "file:line", if known
};

struct Outcome
{
    std::string unit_name;
    UnitStatus status = UnitStatus::Errored;
    std::chrono::milliseconds duration{};

    std::optional<FailureDetail> failure;
    std::optional<std::string> skip_reason;

    /// The most relevant object produced by the unit; shown in verbose output
    std::optional<std::string> inspection;

    int num_checks{};
    int num_failed_checks{};

    /// Index into the run's coverage samples, if the unit produced one
    std::optional<std::size_t> coverage_sample;

    bool failed() const { return is_failure(status); }
};

struct StructuralViolation
{
    enum Kind { MissingDiscriminator, TopicMismatch, DuplicateName } kind;

    std::string unit_name;
    std::string source_file;
    std::string message;
};

struct StatusCounts
{
    int passed{};
    int failed{};
    int skipped{};
    int errored{};
    int timed_out{};

    int total() const { return passed + failed + skipped + errored + timed_out; }

    static StatusCounts count(const std::vector<Outcome>& outcomes) {
        auto num = [&outcomes](UnitStatus status) {
            return gsl::narrow_cast<int>(
                ranges::count_if(outcomes, [status](const Outcome& outcome) { return outcome.status == status; }));
        };

        return {.passed = num(UnitStatus::Passed),
                .failed = num(UnitStatus::Failed),
                .skipped = num(UnitStatus::Skipped),
                .errored = num(UnitStatus::Errored),
                .timed_out = num(UnitStatus::TimedOut)};
    }
};

enum class ExitCode : int { Success = 0, TestFailures = 1, InfrastructureFailure = 2, BudgetExceeded = 3 };

struct RunReport
{
    RunMode mode = RunMode::Discovery;
    RunMetadata metadata;

    std::vector<Outcome> outcomes; ///< registry order
    std::vector<std::string> failure_messages;
    StatusCounts counts;
    std::chrono::milliseconds total_duration{};

    CoverageReport coverage;
    CoverageGate coverage_gate;
    GateResult gate{.passed = true, .target_met = true, .branch_ratio = 1.0};
    bool strict_coverage = false;

    std::vector<StructuralViolation> violations;

    bool budget_exceeded = false;

    bool coverage_failed() const { return strict_coverage && !gate.passed; }

    bool failed() const {
        return budget_exceeded || coverage_failed() || counts.failed + counts.errored + counts.timed_out > 0;
    }

    /// Budget overrun takes priority, then unit failures, then the coverage gate
    ExitCode exit_code() const {
        if (budget_exceeded) {
            return ExitCode::BudgetExceeded;
        }
        if (counts.failed + counts.errored + counts.timed_out > 0) {
            return ExitCode::TestFailures;
        }
        if (coverage_failed()) {
            return ExitCode::InfrastructureFailure;
        }
        return ExitCode::Success;
    }
};

} // namespace trialrun

FMT_SERIALIZE_ENUM(::trialrun::RunMode, Standalone, Discovery, Automated);
FMT_SERIALIZE_ENUM(::trialrun::UnitStatus, Passed, Failed, Skipped, Errored, TimedOut);
FMT_SERIALIZE_ENUM(::trialrun::StructuralViolation::Kind, MissingDiscriminator, TopicMismatch, DuplicateName);
FMT_SERIALIZE_ENUM(::trialrun::ExitCode, Success, TestFailures, InfrastructureFailure, BudgetExceeded);
