#include "report/report_builder.hpp"

#include <trialrun/coverage/coverage.hpp>
#include <trialrun/logging.hpp>
#include <trialrun/run_session.hpp>

#include <fmt/format.h>

#include <string>
#include <utility>
#include <vector>

namespace trialrun {

void normalize_failure(Outcome& outcome) {
    if (!outcome.failed()) {
        return;
    }

    if (!outcome.failure) {
        LOG_ERROR("Unit {:?} is {} without any failure detail", outcome.unit_name, outcome.status);
        outcome.failure = FailureDetail{.summary = fmt::format("unit {} without a reported reason", outcome.status),
                                        .expected = {},
                                        .actual = {},
                                        .context = {},
                                        .location = {}};
    }

    auto& detail = *outcome.failure;

    if (detail.summary.empty()) {
        LOG_ERROR("Unit {:?} did not summarize its failure", outcome.unit_name);
        detail.summary = NOT_REPORTED;
    }

    if (detail.expected.empty()) {
        LOG_ERROR("Unit {:?} did not report an expected value for its failure", outcome.unit_name);
        detail.expected = NOT_REPORTED;
    }

    if (detail.actual.empty()) {
        LOG_ERROR("Unit {:?} did not report an actual value for its failure", outcome.unit_name);
        detail.actual = NOT_REPORTED;
    }
}

std::string render_failure(const Outcome& outcome) {
    std::string out = fmt::format("{} [{}]", outcome.unit_name, outcome.status);

    if (!outcome.failure) {
        return out;
    }

    const auto& detail = *outcome.failure;

    out += fmt::format(": {}\n", detail.summary);
    out += fmt::format("  expected: {}\n", detail.expected);
    out += fmt::format("  actual:   {}\n", detail.actual);

    if (detail.context.empty()) {
        out += "  context:  <none>\n";
    } else {
        for (bool first = true; const auto& line : detail.context) {
            out += fmt::format("  {:<10}{}\n", first ? "context:" : "", line);
            first = false;
        }
    }

    if (!detail.location.empty()) {
        out += fmt::format("  at {}\n", detail.location);
    }

    return out;
}

RunReport build_report(std::vector<Outcome> outcomes, CoverageReport coverage, ReportInputs inputs) {
    RunReport report;

    report.mode = inputs.mode;
    report.metadata = inputs.metadata;
    report.total_duration = inputs.total_duration;
    report.violations = std::move(inputs.violations);
    report.budget_exceeded = inputs.budget_exceeded;

    for (auto& outcome : outcomes) {
        if (outcome.failed()) {
            normalize_failure(outcome);
            report.failure_messages.push_back(render_failure(outcome));
        }
    }

    report.counts = StatusCounts::count(outcomes);
    report.outcomes = std::move(outcomes);

    report.coverage_gate = inputs.gate;
    report.gate = inputs.gate.check(coverage);
    report.strict_coverage = inputs.strict_coverage;
    report.coverage = std::move(coverage);

    if (!report.gate.passed) {
        LOG_WARN("Branch coverage {:.1f}% is below the minimum of {:.1f}%{}", report.gate.branch_ratio * 100,
                 inputs.gate.minimum * 100, report.strict_coverage ? "" : " (not enforced)");
    }

    LOG_DEBUG("Run report: {} passed, {} failed, {} skipped, {} errored, {} timed out -> {}", report.counts.passed,
              report.counts.failed, report.counts.skipped, report.counts.errored, report.counts.timed_out,
              report.exit_code());

    return report;
}

} // namespace trialrun
