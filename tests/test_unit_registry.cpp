#include "catch2_custom.hpp"

#include "registry/unit_registry.hpp"
#include "unit_fixtures.hpp"

#include <trialrun/registrars/global_registrar.hpp>
#include <trialrun/run_session.hpp>

#include <catch2/catch_test_macros.hpp>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <string>
#include <string_view>
#include <vector>

using namespace trialrun;
using namespace trialrun::metadata;

namespace {

void noop(UnitContext& /*unused*/) {}

std::vector<std::string> names(const Discovery& discovery) {
    return discovery.units |
           ranges::views::transform([](const DiscoveredUnit& unit) { return std::string{unit.unit->get_name()}; }) |
           ranges::to<std::vector>();
}

bool has_violation(const Discovery& discovery, StructuralViolation::Kind kind, std::string_view name) {
    return ranges::any_of(discovery.violations, [&](const StructuralViolation& violation) {
        return violation.kind == kind && violation.unit_name == name;
    });
}

} // namespace

TEST_CASE("Canonical topics come from the file stem") {
    REQUIRE(UnitRegistry::canonical_topic("tests/test_integrator.cpp") == "integrator");
    REQUIRE(UnitRegistry::canonical_topic("/abs/path/test_random_walk.cpp") == "random_walk");
    REQUIRE(UnitRegistry::canonical_topic("helpers.cpp") == "helpers");
}

TEST_CASE("Discovery orders by topic, then registration order") {
    const LambdaUnit beta_1{"test_beta_1", noop, Metadata{}, "tests/test_beta.cpp"};
    const LambdaUnit alpha_1{"test_alpha_1", noop, Metadata{}, "tests/test_alpha.cpp"};
    const LambdaUnit beta_2{"test_beta_2", noop, Metadata{}, "tests/test_beta.cpp"};
    const LambdaUnit alpha_2{"test_alpha_2", noop, Metadata{}, "tests/test_alpha.cpp"};

    const UnitRegistry registry{{&beta_1, &alpha_1, &beta_2, &alpha_2}};
    const Discovery discovery = registry.discover();

    REQUIRE(discovery.violations.empty());
    REQUIRE(names(discovery) == std::vector<std::string>{"test_alpha_1", "test_alpha_2", "test_beta_1", "test_beta_2"});
    REQUIRE(discovery.units.front().topic == "alpha");

    // Deterministic across calls
    REQUIRE(names(registry.discover()) == names(discovery));
}

TEST_CASE("Structural violations") {
    const LambdaUnit no_prefix{"check_something", noop};
    const LambdaUnit dup_a{"test_dup", noop};
    const LambdaUnit dup_b{"test_dup", noop, Metadata{}, "tests/test_other.cpp"};
    const LambdaUnit mismatched{"test_mismatch", noop, Metadata{Topic{"elsewhere"}}, "tests/test_here.cpp"};
    const LambdaUnit fine{"test_fine", noop};

    const UnitRegistry registry{{&no_prefix, &dup_a, &dup_b, &mismatched, &fine}};
    const Discovery discovery = registry.discover();

    SECTION("Units without the discriminator are not discoverable") {
        REQUIRE(has_violation(discovery, StructuralViolation::MissingDiscriminator, "check_something"));
        REQUIRE_FALSE(ranges::any_of(names(discovery), [](const std::string& name) { return name == "check_something"; }));
    }

    SECTION("Duplicate names exclude every copy and are reported once") {
        REQUIRE(ranges::count_if(discovery.violations, [](const StructuralViolation& violation) {
                    return violation.kind == StructuralViolation::DuplicateName;
                }) == 1);
        REQUIRE_FALSE(ranges::any_of(names(discovery), [](const std::string& name) { return name == "test_dup"; }));
    }

    SECTION("Topic mismatches are reported but the unit stays selectable under its declared topic") {
        REQUIRE(has_violation(discovery, StructuralViolation::TopicMismatch, "test_mismatch"));

        auto selected = registry.discover(UnitFilter{.name_patterns = {"test_mismatch"}, .tags = {}});
        REQUIRE(selected.units.size() == 1);
        REQUIRE(selected.units.front().topic == "elsewhere");
    }

    REQUIRE(names(discovery) == std::vector<std::string>{"test_mismatch", "test_fine"});
}

TEST_CASE("Filtering by name pattern and tag") {
    const LambdaUnit fast{"test_fast", noop, Metadata{Tags{"quick"}}, "tests/test_solver.cpp"};
    const LambdaUnit slow{"test_slow", noop, Metadata{Tags{"slow", "nightly"}}, "tests/test_solver.cpp"};
    const LambdaUnit other{"test_other", noop, Metadata{}, "tests/test_io.cpp"};

    const UnitRegistry registry{{&fast, &slow, &other}};

    auto select = [&registry](UnitFilter filter) { return names(registry.discover(filter)); };

    REQUIRE(select({}).size() == 3);
    REQUIRE(select({.name_patterns = {"test_s*"}, .tags = {}}) == std::vector<std::string>{"test_slow"});
    REQUIRE(select({.name_patterns = {"test_fast", "test_other"}, .tags = {}}).size() == 2);
    REQUIRE(select({.name_patterns = {}, .tags = {"nightly"}}) == std::vector<std::string>{"test_slow"});

    // A tag also matches the unit's topic
    REQUIRE(select({.name_patterns = {}, .tags = {"solver"}}).size() == 2);

    REQUIRE(select({.name_patterns = {"test_f*"}, .tags = {"slow"}}).empty());
    REQUIRE(select({.name_patterns = {"nothing_*"}, .tags = {}}).empty());
}

TEST_CASE("Units registered through the UNIT macro are globally visible") {
    REQUIRE(GlobalRegistrar::get().get_unit("test_dumb_passes"));
    REQUIRE(GlobalRegistrar::get().get_unit("dumb_without_discriminator"));
    REQUIRE_FALSE(GlobalRegistrar::get().get_unit("test_not_registered"));

    const auto registry = UnitRegistry::from_global();
    const auto discovery = registry.discover(UnitFilter{.name_patterns = {"*dumb*"}, .tags = {}});

    REQUIRE(names(discovery) == std::vector<std::string>{"test_dumb_passes", "test_dumb_fails", "test_dumb_elsewhere"});
    REQUIRE(discovery.units.front().topic == "dumb_units");

    REQUIRE(has_violation(discovery, StructuralViolation::MissingDiscriminator, "dumb_without_discriminator"));
    REQUIRE(has_violation(discovery, StructuralViolation::TopicMismatch, "test_dumb_elsewhere"));

    // File-level tags apply to every unit declared after FILE_METADATA
    const auto& passes = GlobalRegistrar::get().get_unit("test_dumb_passes")->get();
    REQUIRE(passes.get_tags() == std::vector<std::string>{"dumb"});
}
