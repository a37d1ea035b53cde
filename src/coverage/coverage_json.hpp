#pragma once

#include <trialrun/coverage/coverage.hpp>

#include <nlohmann/json_fwd.hpp>

namespace trialrun {

// nlohmann::json conversions, found through ADL

void to_json(nlohmann::json& j, const CoverageSample& sample);
void from_json(const nlohmann::json& j, CoverageSample& sample);

void to_json(nlohmann::json& j, const ModuleCoverage& module);
void to_json(nlohmann::json& j, const CoverageReport& report);

} // namespace trialrun
