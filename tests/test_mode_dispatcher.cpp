#include "catch2_custom.hpp"

#include "dispatch/environment.hpp"
#include "dispatch/mode_dispatcher.hpp"
#include "registry/unit_registry.hpp"
#include "unit_fixtures.hpp"
#include "user/program_options.hpp"

#include <trialrun/run_session.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <vector>

using namespace trialrun;
using namespace trialrun::metadata;
using namespace std::chrono_literals;

namespace {

void noop(UnitContext& /*unused*/) {}

struct DispatchFixture
{
    LambdaUnit integrate{"test_integrate", noop, Metadata{Params{{"steps", "100"}}}, "tests/test_solver.cpp"};
    LambdaUnit converge{"test_converge", noop, Metadata{Tags{"slow"}}, "tests/test_solver.cpp"};
    LambdaUnit parse{"test_parse", noop, Metadata{}, "tests/test_io.cpp"};
    LambdaUnit broken{"check_parse", noop, Metadata{}, "tests/test_io.cpp"};

    UnitRegistry registry{{&integrate, &converge, &parse}};
    UnitRegistry registry_with_violation{{&integrate, &converge, &parse, &broken}};

    ProgramOptions opts;
    Environment env{.ci = false, .plot_backend = "svg", .hardware_threads = 8};
};

} // namespace

TEST_CASE("Glob detection") {
    REQUIRE(is_glob("test_*"));
    REQUIRE(is_glob("test_?"));
    REQUIRE(is_glob("test_[ab]"));
    REQUIRE_FALSE(is_glob("test_integrate"));
}

TEST_CASE_METHOD(DispatchFixture, "Mode inference") {
    SECTION("An explicit mode always wins") {
        opts.mode = RunMode::Discovery;
        env.ci = true;
        opts.selectors = {"test_parse"};
        REQUIRE(infer_mode(opts, env) == RunMode::Discovery);
    }

    SECTION("CI selects automated") {
        env.ci = true;
        opts.selectors = {"test_parse"};
        REQUIRE(infer_mode(opts, env) == RunMode::Automated);
    }

    SECTION("A single exact name selects standalone") {
        opts.selectors = {"test_parse"};
        REQUIRE(infer_mode(opts, env) == RunMode::Standalone);
    }

    SECTION("Anything else is a discovery run") {
        REQUIRE(infer_mode(opts, env) == RunMode::Discovery);

        opts.selectors = {"test_*"};
        REQUIRE(infer_mode(opts, env) == RunMode::Discovery);

        opts.selectors = {"test_parse", "test_converge"};
        REQUIRE(infer_mode(opts, env) == RunMode::Discovery);

        opts.selectors = {"test_parse"};
        opts.tags = {"io"};
        REQUIRE(infer_mode(opts, env) == RunMode::Discovery);
    }
}

TEST_CASE_METHOD(DispatchFixture, "Standalone runs") {
    opts.selectors = {"test_integrate"};
    opts.workers = 4;

    auto config = resolve(opts, env, registry);
    REQUIRE(config.has_value());

    REQUIRE(config->mode == RunMode::Standalone);
    REQUIRE(config->units.size() == 1);
    REQUIRE(config->units.front().unit == &integrate);

    // Forced to a single worker, with plots and verbose output on
    REQUIRE(config->worker_count == 1);
    REQUIRE(config->unit_config.do_plot);
    REQUIRE(config->unit_config.verbose);
    REQUIRE(config->unit_config.plot_backend == "svg");
    REQUIRE_FALSE(config->budget);

    SECTION("Toggles can still be turned off") {
        opts.plot = false;
        opts.verbose = false;

        auto quiet = resolve(opts, env, registry);
        REQUIRE(quiet.has_value());
        REQUIRE_FALSE(quiet->unit_config.do_plot);
        REQUIRE_FALSE(quiet->unit_config.verbose);
        REQUIRE_FALSE(quiet->unit_config.plot_backend);
    }
}

TEST_CASE_METHOD(DispatchFixture, "Standalone mode requires exact names") {
    opts.mode = RunMode::Standalone;

    SECTION("No names") {
        auto config = resolve(opts, env, registry);
        REQUIRE(config.has_error());
        REQUIRE(config.error().kind == DispatchError::InvalidOption);
    }

    SECTION("Patterns") {
        opts.selectors = {"test_*"};
        auto config = resolve(opts, env, registry);
        REQUIRE(config.has_error());
        REQUIRE(config.error().kind == DispatchError::InvalidOption);
    }
}

TEST_CASE_METHOD(DispatchFixture, "Unknown unit names are an error before anything runs") {
    opts.selectors = {"test_missing"};

    auto config = resolve(opts, env, registry);
    REQUIRE(config.has_error());
    REQUIRE(config.error().kind == DispatchError::NoSuchUnit);
    REQUIRE_THAT(config.error().message, Catch::Matchers::ContainsSubstring("test_missing"));

    SECTION("Also in discovery runs") {
        opts.selectors = {"test_parse", "test_missing"};
        auto discovery = resolve(opts, env, registry);
        REQUIRE(discovery.has_error());
        REQUIRE(discovery.error().kind == DispatchError::NoSuchUnit);
    }

    SECTION("Names of structurally invalid units say why") {
        opts.selectors = {"check_parse"};
        auto invalid = resolve(opts, env, registry_with_violation);
        REQUIRE(invalid.has_error());
        REQUIRE(invalid.error().kind == DispatchError::NoSuchUnit);
        REQUIRE_THAT(invalid.error().message, Catch::Matchers::ContainsSubstring("does not begin with"));
    }
}

TEST_CASE_METHOD(DispatchFixture, "Discovery runs") {
    opts.selectors = {"test_*e"};

    auto config = resolve(opts, env, registry);
    REQUIRE(config.has_value());

    REQUIRE(config->mode == RunMode::Discovery);
    REQUIRE(config->units.size() == 3);
    REQUIRE(config->worker_count == 8);
    REQUIRE_FALSE(config->unit_config.do_plot);
    REQUIRE_FALSE(config->unit_config.verbose);
    REQUIRE_FALSE(config->unit_config.plot_backend);
    REQUIRE_FALSE(config->budget);

    SECTION("Tags narrow the selection") {
        opts.tags = {"slow"};
        auto tagged = resolve(opts, env, registry);
        REQUIRE(tagged.has_value());
        REQUIRE(tagged->units.size() == 1);
        REQUIRE(tagged->units.front().unit == &converge);
    }

    SECTION("A pattern matching nothing is not an error") {
        opts.selectors = {"nothing_*"};
        auto empty = resolve(opts, env, registry);
        REQUIRE(empty.has_value());
        REQUIRE(empty->units.empty());
    }

    SECTION("Explicit worker count") {
        opts.workers = 3;
        auto workers = resolve(opts, env, registry);
        REQUIRE(workers.has_value());
        REQUIRE(workers->worker_count == 3);
    }
}

TEST_CASE_METHOD(DispatchFixture, "Automated runs carry the budget") {
    env.ci = true;
    opts.budget = 90s;
    opts.grace = 2s;
    opts.timeout = 10s;

    auto config = resolve(opts, env, registry);
    REQUIRE(config.has_value());

    REQUIRE(config->mode == RunMode::Automated);
    REQUIRE(config->budget == std::chrono::milliseconds{90s});
    REQUIRE(config->grace == 2s);
    REQUIRE(config->default_timeout == 10s);
    REQUIRE_FALSE(config->unit_config.do_plot);
}

TEST_CASE_METHOD(DispatchFixture, "Automated runs have no per-unit timeout unless one is given") {
    env.ci = true;

    auto config = resolve(opts, env, registry);
    REQUIRE(config.has_value());

    REQUIRE(config->budget == ProgramOptions::DEFAULT_BUDGET);
    REQUIRE_FALSE(config->default_timeout.has_value());
}

TEST_CASE_METHOD(DispatchFixture, "Strict structure") {
    SECTION("Violations are reported, not fatal, by default") {
        auto config = resolve(opts, env, registry_with_violation);
        REQUIRE(config.has_value());
        REQUIRE(config->violations.size() == 1);
        REQUIRE(config->units.size() == 3);
    }

    SECTION("Strict runs refuse to start") {
        opts.strict = true;
        auto config = resolve(opts, env, registry_with_violation);
        REQUIRE(config.has_error());
        REQUIRE(config.error().kind == DispatchError::StructuralViolation);
    }

    SECTION("Strict runs without violations are fine") {
        opts.strict = true;
        REQUIRE(resolve(opts, env, registry).has_value());
    }
}

TEST_CASE_METHOD(DispatchFixture, "Everything else is carried into the run configuration") {
    opts.overrides["steps"] = "5";
    opts.strict_coverage = true;
    opts.coverage_min = 0.5;
    opts.coverage_target = 0.6;
    opts.artifact_root = "/tmp/arts";

    auto config = resolve(opts, env, registry);
    REQUIRE(config.has_value());

    REQUIRE(config->unit_config.overrides.at("steps") == "5");
    REQUIRE(config->strict_coverage);
    REQUIRE(config->gate.minimum == 0.5);
    REQUIRE(config->gate.target == 0.6);
    REQUIRE(config->artifact_root == "/tmp/arts");
}

TEST_CASE("Program option validation") {
    ProgramOptions opts;
    REQUIRE(opts.validate().has_value());

    SECTION("Zero workers") {
        opts.workers = 0;
        REQUIRE(opts.validate().has_error());
    }

    SECTION("Ratios outside [0, 1]") {
        opts.coverage_min = 1.5;
        REQUIRE(opts.validate().has_error());
    }

    SECTION("Target below minimum") {
        opts.coverage_min = 0.9;
        opts.coverage_target = 0.8;
        REQUIRE(opts.validate().has_error());
    }

    SECTION("Non-positive timeout") {
        opts.timeout = 0ms;
        REQUIRE(opts.validate().has_error());
    }
}

TEST_CASE("Environment defaults") {
    const Environment env;

    REQUIRE_FALSE(env.ci);
    REQUIRE_FALSE(env.plot_backend);
    REQUIRE(env.hardware_threads == 1);
}
