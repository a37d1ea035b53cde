#pragma once

#include "dispatch/mode_dispatcher.hpp"
#include "output/serializer.hpp"
#include "scheduler/scheduler.hpp"

#include <trialrun/api/unit_base.hpp>
#include <trialrun/artifacts/artifact_store.hpp>
#include <trialrun/common/error_types.hpp>
#include <trialrun/run_session.hpp>

#include <memory>
#include <span>

namespace trialrun {

/// Runs one resolved RunConfig from start to finish:
/// artifact sweep, scheduling, coverage aggregation, reporting and the final sweep
class RunOrchestrator
{
public:
    RunOrchestrator(RunConfig config, std::shared_ptr<Serializer> serializer);

    virtual ~RunOrchestrator() = default;

    RunOrchestrator(const RunOrchestrator&) = delete;
    RunOrchestrator& operator=(const RunOrchestrator&) = delete;
    RunOrchestrator(RunOrchestrator&&) = delete;
    RunOrchestrator& operator=(RunOrchestrator&&) = delete;

    /// Fails only if the artifact store cannot be prepared; unit failures are part of the report
    Result<RunReport> run();

    const RunConfig& get_config() const { return config_; }

    const ArtifactStore& get_artifacts() const { return artifacts_; }

protected:
    /// Overridable so that tests can observe or replace process creation
    virtual std::unique_ptr<Scheduler> make_scheduler(const SchedulerOptions& options);

private:
    /// Remove leftovers between runs. A no-op for verbose runs.
    Result<void> sweep(const char* when);

    RunConfig config_;
    std::shared_ptr<Serializer> serializer_;
    ArtifactStore artifacts_;
};

} // namespace trialrun
