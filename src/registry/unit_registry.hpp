#pragma once

#include <trialrun/api/unit_base.hpp>
#include <trialrun/run_session.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace trialrun {

/// Selection of units by name glob (fnmatch(3) syntax) and by tag.
/// An empty list matches everything; a tag matches a unit's tags or its topic.
struct UnitFilter
{
    std::vector<std::string> name_patterns;
    std::vector<std::string> tags;

    bool matches(const UnitBase& unit, std::string_view topic) const;
};

struct DiscoveredUnit
{
    const UnitBase* unit;
    std::string topic;
};

struct Discovery
{
    std::vector<DiscoveredUnit> units; ///< ordered by topic, then registration order
    std::vector<StructuralViolation> violations;
};

/// Read-only view over registered units that decides which of them make up a Run
class UnitRegistry
{
public:
    /// Prefix every discoverable unit name starts with
    static constexpr std::string_view DISCRIMINATOR = "test_";

    /// ``units`` in registration order
    explicit UnitRegistry(std::vector<const UnitBase*> units);

    static UnitRegistry from_global();

    /// Deterministic for unchanged registrations
    Discovery discover(const UnitFilter& filter = {}) const;

    std::size_t size() const { return units_.size(); }

    /// Topic implied by a source file: its stem without the discriminator prefix
    ///   "tests/test_integrator.cpp" -> "integrator"
    static std::string canonical_topic(std::string_view source_file);

private:
    std::vector<const UnitBase*> units_;
};

} // namespace trialrun
