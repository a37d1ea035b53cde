#pragma once

#include <trialrun/coverage/coverage.hpp>
#include <trialrun/run_session.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace trialrun {

/// Shown in place of an expected or actual value that the producer of an Outcome did not supply
inline constexpr std::string_view NOT_REPORTED = "<not reported>";

/// Run-level facts the report needs besides the outcomes themselves
struct ReportInputs
{
    RunMode mode = RunMode::Discovery;
    RunMetadata metadata;
    std::chrono::milliseconds total_duration{};

    CoverageGate gate;
    bool strict_coverage = false;

    std::vector<StructuralViolation> violations;
    bool budget_exceeded = false;
};

/// Fill in missing failure fields of a non-passing outcome with ``NOT_REPORTED``.
/// Each missing field is logged as an error.
void normalize_failure(Outcome& outcome);

/// Multi-line message naming the unit, its summary, expected and actual values and context
std::string render_failure(const Outcome& outcome);

/// Assemble the final report. Every failing outcome gets a rendered failure message.
RunReport build_report(std::vector<Outcome> outcomes, CoverageReport coverage, ReportInputs inputs);

} // namespace trialrun
