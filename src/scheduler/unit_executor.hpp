#pragma once

#include <trialrun/api/unit_base.hpp>
#include <trialrun/api/unit_config.hpp>
#include <trialrun/api/unit_context.hpp>
#include <trialrun/artifacts/artifact_store.hpp>

namespace trialrun {

/// Run a single unit in the current process and turn whatever happens into an outcome.
///
/// Exceptions never escape: ``SkipUnit`` yields Skipped, anything else thrown yields Errored.
UnitExecution execute_unit(const UnitBase& unit, const UnitConfig& config, const ArtifactStore& artifacts);

} // namespace trialrun
