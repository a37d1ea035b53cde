#include "catch2_custom.hpp"

#include "scheduler/unit_executor.hpp"
#include "unit_fixtures.hpp"

#include <trialrun/api/unit_config.hpp>
#include <trialrun/api/unit_context.hpp>
#include <trialrun/artifacts/artifact_store.hpp>
#include <trialrun/common/error_types.hpp>
#include <trialrun/exceptions.hpp>
#include <trialrun/run_session.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

using namespace trialrun;
using namespace trialrun::metadata;

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file{path};
    return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

} // namespace

TEST_CASE("Passing, failing and errored bodies") {
    TempDir dir;
    const ArtifactStore store{dir.path()};
    const UnitConfig config;

    SECTION("All checks pass") {
        const LambdaUnit unit{"test_pass", [](UnitContext& ctx) {
                                  ctx.expect(true);
                                  ctx.expect_eq(3, 3);
                                  ctx.expect_near(1.0, 1.05, 0.1);
                              }};

        auto [outcome, coverage] = execute_unit(unit, config, store);

        REQUIRE(outcome.status == UnitStatus::Passed);
        REQUIRE(outcome.num_checks == 3);
        REQUIRE(outcome.num_failed_checks == 0);
        REQUIRE_FALSE(outcome.failure);
        REQUIRE(coverage.empty());
    }

    SECTION("The first failing check is reported") {
        const LambdaUnit unit{"test_fail", [](UnitContext& ctx) {
                                  ctx.note("seeded with 42");
                                  ctx.expect_eq(2 + 2, 5, "sum");
                                  ctx.expect(false, "second");
                              }};

        auto [outcome, coverage] = execute_unit(unit, config, store);

        REQUIRE(outcome.status == UnitStatus::Failed);
        REQUIRE(outcome.num_failed_checks == 2);
        REQUIRE(outcome.failure);
        REQUIRE(outcome.failure->summary == "sum");
        REQUIRE(outcome.failure->expected == "5");
        REQUIRE(outcome.failure->actual == "4");
        REQUIRE(outcome.failure->context.size() == 2);
        REQUIRE(outcome.failure->context[0] == "seeded with 42");
    }

    SECTION("Near comparisons render their tolerance") {
        const LambdaUnit unit{"test_near", [](UnitContext& ctx) { ctx.expect_near(1.5, 1.0, 0.25); }};

        auto [outcome, coverage] = execute_unit(unit, config, store);

        REQUIRE(outcome.status == UnitStatus::Failed);
        REQUIRE(outcome.failure->expected == "1 +/- 0.25");
        REQUIRE(outcome.failure->actual == "1.5");
    }

    SECTION("Exceptions become Errored outcomes") {
        const LambdaUnit unit{"test_throws", [](UnitContext& /*unused*/) { throw std::runtime_error{"boom"}; }};

        auto [outcome, coverage] = execute_unit(unit, config, store);

        REQUIRE(outcome.status == UnitStatus::Errored);
        REQUIRE_THAT(outcome.failure->summary, Catch::Matchers::ContainsSubstring("boom"));
        REQUIRE(outcome.failure->expected == "unit body completes without throwing");
        REQUIRE_THAT(outcome.failure->actual, Catch::Matchers::ContainsSubstring("std::runtime_error") &&
                                                  Catch::Matchers::ContainsSubstring("boom"));
    }

    SECTION("Non-standard exceptions are reported too") {
        const LambdaUnit unit{"test_throws_int", [](UnitContext& /*unused*/) { throw 42; }};

        auto [outcome, coverage] = execute_unit(unit, config, store);

        REQUIRE(outcome.status == UnitStatus::Errored);
        REQUIRE(outcome.failure);
        REQUIRE_FALSE(outcome.failure->expected.empty());
        REQUIRE_FALSE(outcome.failure->actual.empty());
    }

    SECTION("Skipping from the body") {
        const LambdaUnit unit{"test_skips", [](UnitContext& ctx) {
                                  ctx.expect(false);
                                  ctx.skip("hardware not present");
                              }};

        auto [outcome, coverage] = execute_unit(unit, config, store);

        REQUIRE(outcome.status == UnitStatus::Skipped);
        REQUIRE(outcome.skip_reason == "hardware not present");
    }
}

TEST_CASE("Parameter resolution") {
    TempDir dir;
    const ArtifactStore store{dir.path()};
    UnitConfig config;

    const LambdaUnit unit{"test_params", [](UnitContext& /*unused*/) {},
                          Metadata{Params{{"steps", "1000"}, {"do_plot", "true"}, {"ratio", "0.5"}}}};

    SECTION("Declared defaults") {
        UnitContext ctx{unit, config, store};

        REQUIRE(ctx.param<int>("steps") == 1000);
        REQUIRE(ctx.param<double>("ratio") == 0.5);
        REQUIRE(ctx.param<std::string>("steps") == "1000");
    }

    SECTION("Overrides replace declared defaults") {
        config.overrides["steps"] = "10";
        UnitContext ctx{unit, config, store};

        REQUIRE(ctx.param<int>("steps") == 10);
    }

    SECTION("Overrides of undeclared parameters are ignored") {
        config.overrides["undeclared"] = "1";
        UnitContext ctx{unit, config, store};

        REQUIRE_THROWS_AS(ctx.param<int>("undeclared"), ContextInternalError);
    }

    SECTION("Run-level toggles win over declared defaults") {
        config.do_plot = false;
        config.verbose = true;
        UnitContext ctx{unit, config, store};

        REQUIRE_FALSE(ctx.param<bool>("do_plot"));
        REQUIRE(ctx.param<bool>("verbose"));
        REQUIRE_FALSE(ctx.do_plot());
    }

    SECTION("Unparsable values") {
        config.overrides["steps"] = "many";
        UnitContext ctx{unit, config, store};

        REQUIRE_THROWS_AS(ctx.param<int>("steps"), ContextInternalError);
    }
}

TEST_CASE("Artifacts are closed before the outcome is produced") {
    TempDir dir;
    const ArtifactStore store{dir.path()};
    const UnitConfig config;

    const LambdaUnit unit{"test_writes", [](UnitContext& ctx) {
                              auto& handle = ctx.artifact("samples.csv");
                              ctx.expect(handle.write("1,2\n").has_value(), "artifact write");
                              ctx.inspect(3.5);
                          }};

    auto [outcome, coverage] = execute_unit(unit, config, store);

    REQUIRE(outcome.status == UnitStatus::Passed);
    REQUIRE(outcome.inspection == "3.5");

    const auto path = dir.path() / "test_writes" / "samples.csv";
    REQUIRE(std::filesystem::exists(path));
    REQUIRE_FALSE(std::filesystem::exists(ArtifactHandle::partial_path_for(path)));
    REQUIRE(read_file(path) == "1,2\n");
}

TEST_CASE("Invalid artifact names error the unit") {
    TempDir dir;
    const ArtifactStore store{dir.path()};
    const UnitConfig config;

    const LambdaUnit unit{"test_escapes", [](UnitContext& ctx) { ctx.artifact("../outside.txt"); }};

    auto [outcome, coverage] = execute_unit(unit, config, store);

    REQUIRE(outcome.status == UnitStatus::Errored);
    REQUIRE_THAT(outcome.failure->actual, Catch::Matchers::ContainsSubstring("ContextInternalError"));
    REQUIRE_FALSE(outcome.failure->expected.empty());
    REQUIRE_FALSE(std::filesystem::exists(dir.path() / "outside.txt"));
}

TEST_CASE("Coverage recorded by the body is returned with the outcome") {
    TempDir dir;
    const ArtifactStore store{dir.path()};
    const UnitConfig config;

    const LambdaUnit unit{"test_covers", [](UnitContext& ctx) {
                              ctx.coverage().declare("solver", 1, 1);
                              ctx.coverage().hit("solver", 1);
                              ctx.coverage().branch("solver", 1, 0, true);
                          }};

    auto [outcome, coverage] = execute_unit(unit, config, store);

    REQUIRE_FALSE(coverage.empty());
    REQUIRE(coverage.regions().size() == 1);
    REQUIRE(coverage.regions().begin()->second.hits == 1);
    REQUIRE(coverage.regions().begin()->second.branches.at(0).taken);
    REQUIRE_FALSE(coverage.regions().begin()->second.branches.at(0).not_taken);
}
