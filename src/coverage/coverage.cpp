#include <trialrun/coverage/coverage.hpp>

#include <trialrun/logging.hpp>

#include <gsl/util>
#include <range/v3/algorithm/count_if.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>

namespace trialrun {

RegionCounters& CoverageSample::region(std::string_view module, std::size_t line) {
    return regions_[RegionId{.module = std::string{module}, .line = line}];
}

void CoverageSample::declare(std::string_view module, std::size_t line, std::size_t num_branches) {
    auto& counters = region(module, line);

    if (counters.branches.size() < num_branches) {
        counters.branches.resize(num_branches);
    }
}

void CoverageSample::hit(std::string_view module, std::size_t line, std::uint64_t count) {
    region(module, line).hits += count;
}

void CoverageSample::branch(std::string_view module, std::size_t line, std::size_t branch_idx, bool taken) {
    auto& counters = region(module, line);

    if (counters.branches.size() <= branch_idx) {
        counters.branches.resize(branch_idx + 1);
    }

    auto& pair = counters.branches[branch_idx];
    (taken ? pair.taken : pair.not_taken) = true;
}

void CoverageSample::merge_from(const CoverageSample& other) {
    for (const auto& [id, theirs] : other.regions_) {
        auto& ours = regions_[id];

        ours.hits = std::max(ours.hits, theirs.hits);

        if (ours.branches.size() < theirs.branches.size()) {
            ours.branches.resize(theirs.branches.size());
        }

        for (std::size_t i = 0; i < theirs.branches.size(); ++i) {
            ours.branches[i].taken |= theirs.branches[i].taken;
            ours.branches[i].not_taken |= theirs.branches[i].not_taken;
        }
    }
}

namespace {

double ratio(std::size_t hit, std::size_t total) {
    if (total == 0) {
        return 1.0;
    }

    return static_cast<double>(hit) / static_cast<double>(total);
}

void accumulate(ModuleCoverage& into, const RegionCounters& counters) {
    into.lines_total += 1;
    into.lines_hit += counters.hits > 0 ? 1 : 0;

    into.branches_total += 2 * counters.branches.size();
    into.branches_hit += gsl::narrow_cast<std::size_t>(
        ranges::count_if(counters.branches, [](const BranchPair& pair) { return pair.taken; }) +
        ranges::count_if(counters.branches, [](const BranchPair& pair) { return pair.not_taken; }));
}

} // namespace

double ModuleCoverage::line_ratio() const {
    return ratio(lines_hit, lines_total);
}

double ModuleCoverage::branch_ratio() const {
    return ratio(branches_hit, branches_total);
}

CoverageReport CoverageReport::from_sample(const CoverageSample& sample) {
    CoverageReport report;
    std::map<std::string_view, ModuleCoverage> by_module;

    for (const auto& [id, counters] : sample.regions()) {
        auto [iter, inserted] = by_module.try_emplace(id.module, ModuleCoverage{.module = id.module});

        accumulate(iter->second, counters);
        accumulate(report.totals, counters);
    }

    // std::map iteration is already ordered by module name
    report.modules.reserve(by_module.size());
    for (auto& [name, module] : by_module) {
        report.modules.push_back(std::move(module));
    }

    return report;
}

CoverageReport merge(std::span<const CoverageSample> samples) {
    CoverageSample merged;

    for (const auto& sample : samples) {
        merged.merge_from(sample);
    }

    auto report = CoverageReport::from_sample(merged);

    LOG_DEBUG("Merged {} coverage samples: {}", samples.size(), report.totals);

    return report;
}

GateResult CoverageGate::check(const CoverageReport& report) const {
    const double branch_ratio = report.branch_ratio();

    return {.passed = branch_ratio >= minimum, .target_met = branch_ratio >= target, .branch_ratio = branch_ratio};
}

} // namespace trialrun
