#include "run_orchestrator.hpp"

#include "dispatch/mode_dispatcher.hpp"
#include "output/coverage_writer.hpp"
#include "output/serializer.hpp"
#include "report/report_builder.hpp"
#include "scheduler/scheduler.hpp"

#include <trialrun/api/unit_base.hpp>
#include <trialrun/artifacts/artifact_store.hpp>
#include <trialrun/common/error_types.hpp>
#include <trialrun/coverage/coverage.hpp>
#include <trialrun/logging.hpp>
#include <trialrun/run_session.hpp>

#include <fmt/format.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <memory>
#include <utility>
#include <vector>

namespace trialrun {

RunOrchestrator::RunOrchestrator(RunConfig config, std::shared_ptr<Serializer> serializer)
    : config_{std::move(config)}
    , serializer_{std::move(serializer)}
    , artifacts_{config_.artifact_root, config_.unit_config.verbose} {}

std::unique_ptr<Scheduler> RunOrchestrator::make_scheduler(const SchedulerOptions& options) {
    return std::make_unique<Scheduler>(options, config_.unit_config, artifacts_);
}

Result<void> RunOrchestrator::sweep(const char* when) {
    auto num_removed = TRY(artifacts_.sweep(/*pin_if_verbose=*/true));

    if (num_removed > 0) {
        LOG_DEBUG("Removed {} artifacts at run {}", num_removed, when);
    }

    return {};
}

Result<RunReport> RunOrchestrator::run() {
    const RunMetadata metadata;

    // No unit is active before scheduling starts, so nothing can be holding an artifact open
    TRY(artifacts_.ensure_root());
    if (auto res = sweep("start"); !res) {
        serializer_->on_error(fmt::format("Could not clear artifacts from a previous run in {}", config_.artifact_root));
        return res.error();
    }

    const auto units = config_.units | ranges::views::transform(&DiscoveredUnit::unit) | ranges::to<std::vector>();

    serializer_->on_run_begin(metadata, config_.mode, units.size(), config_.worker_count);

    const SchedulerOptions options{.worker_count = config_.worker_count,
                                   .default_timeout = config_.default_timeout,
                                   .budget = config_.budget,
                                   .grace = config_.grace,
                                   .silence_unit_output = !config_.unit_config.verbose};

    auto scheduler = make_scheduler(options);
    scheduler->set_outcome_callback([this](const Outcome& outcome) { serializer_->on_outcome(outcome); });

    ScheduleResult scheduled = scheduler->run(units);

    CoverageReport coverage = DEBUG_TIME(merge(scheduled.coverage_samples));

    RunReport report = build_report(std::move(scheduled.outcomes), std::move(coverage),
                                    ReportInputs{.mode = config_.mode,
                                                 .metadata = metadata,
                                                 .total_duration = scheduled.duration,
                                                 .gate = config_.gate,
                                                 .strict_coverage = config_.strict_coverage,
                                                 .violations = config_.violations,
                                                 .budget_exceeded = scheduled.budget_exceeded});

    if (!config_.coverage_report.empty()) {
        if (auto res = write_coverage_report(config_.coverage_report, report.coverage, config_.gate, report.gate);
            !res) {
            serializer_->on_error(
                fmt::format("Could not write coverage report to {}: {}", config_.coverage_report, res.error()));
        }
    }

    // Every unit process has been reaped; the end-of-run barrier
    if (auto res = sweep("end"); !res) {
        serializer_->on_warning(fmt::format("Artifacts in {} were not fully cleaned up", config_.artifact_root));
    }

    serializer_->on_report(report);
    serializer_->finalize();

    return report;
}

} // namespace trialrun
