#include "registry/unit_registry.hpp"

#include <trialrun/api/unit_base.hpp>
#include <trialrun/logging.hpp>
#include <trialrun/registrars/global_registrar.hpp>
#include <trialrun/run_session.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/stable_sort.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/addressof.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fnmatch.h>

namespace trialrun {

bool UnitFilter::matches(const UnitBase& unit, std::string_view topic) const {
    auto name_matches = [name = std::string{unit.get_name()}](const std::string& pattern) {
        return ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
    };

    auto tag_matches = [&unit, topic](const std::string& tag) {
        return tag == topic || ranges::any_of(unit.get_tags(), [&tag](const std::string& own) { return own == tag; });
    };

    return (name_patterns.empty() || ranges::any_of(name_patterns, name_matches)) &&
           (tags.empty() || ranges::any_of(tags, tag_matches));
}

UnitRegistry::UnitRegistry(std::vector<const UnitBase*> units)
    : units_{std::move(units)} {}

UnitRegistry UnitRegistry::from_global() {
    return UnitRegistry{GlobalRegistrar::get().get_units() | ranges::views::addressof | ranges::to<std::vector>()};
}

std::string UnitRegistry::canonical_topic(std::string_view source_file) {
    std::string stem = std::filesystem::path{source_file}.stem().string();

    if (stem.starts_with(DISCRIMINATOR)) {
        stem.erase(0, DISCRIMINATOR.size());
    }

    return stem;
}

Discovery UnitRegistry::discover(const UnitFilter& filter) const {
    Discovery result;

    std::map<std::string_view, std::size_t> name_counts;
    for (const auto* unit : units_) {
        ++name_counts[unit->get_name()];
    }

    std::set<std::string_view> reported_duplicates;

    for (const auto* unit : units_) {
        const std::string name{unit->get_name()};
        const std::string source_file{unit->get_source_file()};

        if (!name.starts_with(DISCRIMINATOR)) {
            result.violations.push_back(
                {.kind = StructuralViolation::MissingDiscriminator,
                 .unit_name = name,
                 .source_file = source_file,
                 .message = fmt::format("unit name {:?} does not begin with {:?}; it is not discoverable", name,
                                        DISCRIMINATOR)});
            continue;
        }

        if (auto count = name_counts.at(unit->get_name()); count > 1) {
            if (reported_duplicates.insert(unit->get_name()).second) {
                result.violations.push_back(
                    {.kind = StructuralViolation::DuplicateName,
                     .unit_name = name,
                     .source_file = source_file,
                     .message = fmt::format("unit name {:?} is declared {} times; none of them will run", name, count)});
            }
            continue;
        }

        std::string canonical = canonical_topic(source_file);
        std::string topic = unit->get_declared_topic().value_or(canonical);

        if (topic != canonical) {
            result.violations.push_back(
                {.kind = StructuralViolation::TopicMismatch,
                 .unit_name = name,
                 .source_file = source_file,
                 .message = fmt::format("unit {:?} declares topic {:?}, but its file implies {:?}", name, topic,
                                        canonical)});
        }

        if (filter.matches(*unit, topic)) {
            result.units.push_back({.unit = unit, .topic = std::move(topic)});
        }
    }

    ranges::stable_sort(result.units, std::less<>{}, &DiscoveredUnit::topic);

    LOG_DEBUG("Discovered {} of {} registered units ({} structural violations)", result.units.size(), units_.size(),
              result.violations.size());

    return result;
}

} // namespace trialrun
