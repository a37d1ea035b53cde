#include "catch2_custom.hpp"

#include "report/report_builder.hpp"

#include <trialrun/coverage/coverage.hpp>
#include <trialrun/run_session.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <vector>

using namespace trialrun;
using Catch::Matchers::ContainsSubstring;

namespace {

Outcome passed(std::string name) {
    return {.unit_name = std::move(name), .status = UnitStatus::Passed};
}

Outcome failed(std::string name) {
    return {.unit_name = std::move(name),
            .status = UnitStatus::Failed,
            .failure = FailureDetail{.summary = "values differ",
                                     .expected = "2.0",
                                     .actual = "2.5",
                                     .context = {"seed = 42", "steps = 100"},
                                     .location = "tests/test_solver.cpp:12"}};
}

/// Branch coverage of ``hit`` out of 10 directions
CoverageReport coverage_of(std::size_t hit) {
    CoverageSample sample;
    sample.declare("solver", 1, 5);
    for (std::size_t i = 0; i < hit; ++i) {
        sample.branch("solver", 1, i / 2, i % 2 == 0);
    }
    return CoverageReport::from_sample(sample);
}

} // namespace

TEST_CASE("Failure messages name the unit, expected and actual values and context") {
    const auto message = render_failure(failed("test_solver"));

    REQUIRE_THAT(message, ContainsSubstring("test_solver [Failed]: values differ"));
    REQUIRE_THAT(message, ContainsSubstring("expected: 2.0"));
    REQUIRE_THAT(message, ContainsSubstring("actual:   2.5"));
    REQUIRE_THAT(message, ContainsSubstring("context:  seed = 42"));
    REQUIRE_THAT(message, ContainsSubstring("steps = 100"));
    REQUIRE_THAT(message, ContainsSubstring("at tests/test_solver.cpp:12"));
}

TEST_CASE("Missing failure fields are marked, never left blank") {
    Outcome outcome{.unit_name = "test_blank", .status = UnitStatus::Errored};
    outcome.failure = FailureDetail{.summary = "crashed", .expected = "", .actual = "", .context = {}, .location = ""};

    normalize_failure(outcome);

    REQUIRE(outcome.failure->expected == NOT_REPORTED);
    REQUIRE(outcome.failure->actual == NOT_REPORTED);
    REQUIRE(outcome.failure->summary == "crashed");

    const auto message = render_failure(outcome);
    REQUIRE_THAT(message, ContainsSubstring("expected: <not reported>"));
    REQUIRE_THAT(message, ContainsSubstring("context:  <none>"));

    SECTION("An outcome without any detail still gets one") {
        Outcome bare{.unit_name = "test_bare", .status = UnitStatus::TimedOut};
        normalize_failure(bare);

        REQUIRE(bare.failure);
        REQUIRE_FALSE(bare.failure->summary.empty());
        REQUIRE(bare.failure->actual == NOT_REPORTED);
    }

    SECTION("Passing outcomes are left alone") {
        Outcome fine = passed("test_fine");
        normalize_failure(fine);
        REQUIRE_FALSE(fine.failure);
    }
}

TEST_CASE("Counts and exit codes") {
    const ReportInputs inputs{.mode = RunMode::Discovery, .total_duration = std::chrono::milliseconds{1234}};

    SECTION("All passing") {
        auto report = build_report({passed("test_a"), passed("test_b")}, coverage_of(10), inputs);

        REQUIRE(report.counts.passed == 2);
        REQUIRE(report.counts.total() == 2);
        REQUIRE(report.failure_messages.empty());
        REQUIRE_FALSE(report.failed());
        REQUIRE(report.exit_code() == ExitCode::Success);
        REQUIRE(report.total_duration == std::chrono::milliseconds{1234});
    }

    SECTION("Failures") {
        Outcome skipped{.unit_name = "test_skip", .status = UnitStatus::Skipped, .skip_reason = "later"};
        auto report = build_report({passed("test_a"), failed("test_b"), skipped}, coverage_of(10), inputs);

        REQUIRE(report.counts.failed == 1);
        REQUIRE(report.counts.skipped == 1);
        REQUIRE(report.failure_messages.size() == 1);
        REQUIRE(report.outcomes[1].unit_name == "test_b");
        REQUIRE(report.exit_code() == ExitCode::TestFailures);
    }

    SECTION("Budget overrun takes priority over failures") {
        auto budget_inputs = inputs;
        budget_inputs.budget_exceeded = true;

        auto report = build_report({failed("test_b")}, coverage_of(10), budget_inputs);

        REQUIRE(report.exit_code() == ExitCode::BudgetExceeded);
        REQUIRE(static_cast<int>(report.exit_code()) == 3);
    }
}

TEST_CASE("The coverage gate") {
    ReportInputs inputs{.mode = RunMode::Automated};

    SECTION("Below the minimum is only reported unless strict") {
        auto report = build_report({passed("test_a")}, coverage_of(7), inputs);

        REQUIRE_FALSE(report.gate.passed);
        REQUIRE_FALSE(report.coverage_failed());
        REQUIRE(report.exit_code() == ExitCode::Success);
    }

    SECTION("Strict coverage fails the run") {
        inputs.strict_coverage = true;
        auto report = build_report({passed("test_a")}, coverage_of(7), inputs);

        REQUIRE(report.coverage_failed());
        REQUIRE(report.failed());
        REQUIRE(report.exit_code() == ExitCode::InfrastructureFailure);

        // Test failures take priority over the gate
        auto failing = build_report({failed("test_b")}, coverage_of(7), inputs);
        REQUIRE(failing.exit_code() == ExitCode::TestFailures);
    }

    SECTION("Between minimum and target passes without meeting the target") {
        inputs.strict_coverage = true;
        auto report = build_report({passed("test_a")}, coverage_of(8), inputs);

        REQUIRE(report.gate.passed);
        REQUIRE_FALSE(report.gate.target_met);
        REQUIRE(report.exit_code() == ExitCode::Success);
    }

    SECTION("Custom thresholds") {
        inputs.gate = CoverageGate{.minimum = 0.5, .target = 0.7};
        auto report = build_report({passed("test_a")}, coverage_of(7), inputs);

        REQUIRE(report.gate.passed);
        REQUIRE(report.gate.target_met);
        REQUIRE(report.coverage_gate.minimum == 0.5);
    }
}
