/// \file
/// Coverage samples recorded by units and the aggregated, threshold-checked report
#pragma once

#include <trialrun/common/formatters/debug.hpp>

#include <fmt/format.h>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace trialrun {

/// A measurable code region: one line of one module
struct RegionId
{
    std::string module;
    std::size_t line{};

    auto operator<=>(const RegionId&) const = default;
    bool operator==(const RegionId&) const = default;
};

/// Hit flags for both directions of a single branch point
struct BranchPair
{
    bool taken = false;
    bool not_taken = false;

    bool operator==(const BranchPair&) const = default;
};

struct RegionCounters
{
    std::uint64_t hits{};
    std::vector<BranchPair> branches;

    bool operator==(const RegionCounters&) const = default;
};

/// Coverage recorded by a single unit execution
///
/// Regions must be declared (with their number of branch points) to count towards totals;
/// ``hit`` and ``branch`` declare the region implicitly if needed.
class CoverageSample
{
public:
    using RegionMap = std::map<RegionId, RegionCounters>;

    CoverageSample() = default;

    void declare(std::string_view module, std::size_t line, std::size_t num_branches = 0);

    void hit(std::string_view module, std::size_t line, std::uint64_t count = 1);

    /// Record that direction ``taken`` of branch point ``branch_idx`` on a line was executed
    void branch(std::string_view module, std::size_t line, std::size_t branch_idx, bool taken);

    /// Per-region max of hit counts, union of branch flags
    void merge_from(const CoverageSample& other);

    const RegionMap& regions() const { return regions_; }

    bool empty() const { return regions_.empty(); }

    bool operator==(const CoverageSample&) const = default;

private:
    RegionCounters& region(std::string_view module, std::size_t line);

    RegionMap regions_;
};

struct ModuleCoverage
{
    std::string module;

    std::size_t lines_total{};
    std::size_t lines_hit{};
    std::size_t branches_total{}; ///< number of branch directions (2 per branch point)
    std::size_t branches_hit{};

    /// 1.0 if there is nothing to cover
    double line_ratio() const;
    double branch_ratio() const;

    bool operator==(const ModuleCoverage&) const = default;
};

struct CoverageReport
{
    ModuleCoverage totals{.module = "<total>"};
    std::vector<ModuleCoverage> modules; ///< sorted by module name

    double line_ratio() const { return totals.line_ratio(); }

    double branch_ratio() const { return totals.branch_ratio(); }

    static CoverageReport from_sample(const CoverageSample& sample);

    bool operator==(const CoverageReport&) const = default;
};

/// Merge per-unit samples into a single report. The result does not depend on sample order.
CoverageReport merge(std::span<const CoverageSample> samples);

struct GateResult
{
    bool passed;
    bool target_met;
    double branch_ratio;
};

/// Threshold check on the aggregated branch ratio
struct CoverageGate
{
    double minimum = 0.80;
    double target = 0.90;

    GateResult check(const CoverageReport& report) const;
};

} // namespace trialrun

template <>
struct fmt::formatter<::trialrun::RegionId> : ::trialrun::DebugFormatter
{
    auto format(const ::trialrun::RegionId& from, format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}:{}", from.module, from.line);
    }
};

template <>
struct fmt::formatter<::trialrun::ModuleCoverage> : ::trialrun::DebugFormatter
{
    auto format(const ::trialrun::ModuleCoverage& from, format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}: lines {}/{} ({:.1f}%), branches {}/{} ({:.1f}%)", from.module,
                              from.lines_hit, from.lines_total, from.line_ratio() * 100, from.branches_hit,
                              from.branches_total, from.branch_ratio() * 100);
    }
};
