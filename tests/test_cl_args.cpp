#include "catch2_custom.hpp"

#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <trialrun/common/expected.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <vector>

using namespace trialrun;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

namespace {

Expected<ProgramOptions, std::string> parse(std::vector<const char*> args) {
    args.insert(args.begin(), "trialrun");
    CommandLineArgs cl_args{args};
    return cl_args.parse();
}

} // namespace

TEST_CASE("Durations are given in seconds") {
    auto opts = parse({"--timeout", "2.5", "--budget", "180", "--grace", "0"});
    REQUIRE(opts.has_value());

    REQUIRE(opts->timeout == 2500ms);
    REQUIRE(opts->budget == 180s);
    REQUIRE(opts->grace == 0ms);
}

TEST_CASE("There is no per-unit timeout unless one is given") {
    auto opts = parse({});
    REQUIRE(opts.has_value());

    REQUIRE_FALSE(opts->timeout.has_value());
    REQUIRE(opts->budget == ProgramOptions::DEFAULT_BUDGET);
}

TEST_CASE("Unusable durations are rejected") {
    SECTION("Far too long") {
        auto opts = parse({"--timeout", "1e300"});
        REQUIRE(opts.has_error());
        REQUIRE_THAT(opts.error(), ContainsSubstring("at most"));
    }

    SECTION("Just past the limit") {
        REQUIRE(parse({"--budget", "2592001"}).has_error());
        REQUIRE(parse({"--budget", "2592000"}).has_value());
    }

    SECTION("Negative") {
        REQUIRE(parse({"--grace", "-1"}).has_error());
    }

    SECTION("Not a number") {
        REQUIRE(parse({"--timeout", "soon"}).has_error());
        REQUIRE(parse({"--timeout", "inf"}).has_error());
    }
}

TEST_CASE("Parameter overrides") {
    auto opts = parse({"-D", "steps=5", "--set", "tolerance=1e-3"});
    REQUIRE(opts.has_value());
    REQUIRE(opts->overrides.at("steps") == "5");
    REQUIRE(opts->overrides.at("tolerance") == "1e-3");

    REQUIRE(parse({"-D", "steps"}).has_error());
    REQUIRE(parse({"-D", "=5"}).has_error());
}
