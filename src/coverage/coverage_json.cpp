#include "coverage/coverage_json.hpp"

#include <trialrun/coverage/coverage.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace trialrun {

using nlohmann::json;

void to_json(json& j, const CoverageSample& sample) {
    j = json::object();
    auto& regions = j["regions"] = json::array();

    for (const auto& [id, counters] : sample.regions()) {
        auto branches = json::array();
        for (const auto& pair : counters.branches) {
            branches.push_back({pair.taken, pair.not_taken});
        }

        regions.push_back({
            {"module", id.module},
            {"line", id.line},
            {"hits", counters.hits},
            {"branches", std::move(branches)},
        });
    }
}

void from_json(const json& j, CoverageSample& sample) {
    sample = CoverageSample{};

    for (const auto& region : j.at("regions")) {
        const auto module = region.at("module").get<std::string>();
        const auto line = region.at("line").get<std::size_t>();
        const auto& branches = region.at("branches");

        sample.declare(module, line, branches.size());
        if (auto hits = region.at("hits").get<std::uint64_t>(); hits > 0) {
            sample.hit(module, line, hits);
        }

        for (std::size_t i = 0; i < branches.size(); ++i) {
            if (branches[i].at(0).get<bool>()) {
                sample.branch(module, line, i, true);
            }
            if (branches[i].at(1).get<bool>()) {
                sample.branch(module, line, i, false);
            }
        }
    }
}

void to_json(json& j, const ModuleCoverage& module) {
    j = {
        {"module", module.module},
        {"lines_total", module.lines_total},
        {"lines_hit", module.lines_hit},
        {"line_ratio", module.line_ratio()},
        {"branches_total", module.branches_total},
        {"branches_hit", module.branches_hit},
        {"branch_ratio", module.branch_ratio()},
    };
}

void to_json(json& j, const CoverageReport& report) {
    j = {
        {"line_ratio", report.line_ratio()},
        {"branch_ratio", report.branch_ratio()},
        {"totals", report.totals},
        {"modules", report.modules},
    };
}

} // namespace trialrun
