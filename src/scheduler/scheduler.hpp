#pragma once

#include "scheduler/unit_process.hpp"

#include <trialrun/api/unit_base.hpp>
#include <trialrun/api/unit_config.hpp>
#include <trialrun/api/unit_context.hpp>
#include <trialrun/artifacts/artifact_store.hpp>
#include <trialrun/common/error_types.hpp>
#include <trialrun/coverage/coverage.hpp>
#include <trialrun/run_session.hpp>

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace trialrun {

struct SchedulerOptions
{
    std::size_t worker_count = 1;

    /// For units that do not declare their own ``Timeout``. Unset: no per-unit limit
    std::optional<std::chrono::milliseconds> default_timeout;

    /// Wall-clock limit for the whole run, if any
    std::optional<std::chrono::milliseconds> budget;

    /// Time running units get to finish once the budget is exceeded
    std::chrono::milliseconds grace{std::chrono::seconds{5}};

    bool silence_unit_output = true;
};

struct ScheduleResult
{
    std::vector<Outcome> outcomes; ///< same order as the requested units
    std::vector<CoverageSample> coverage_samples;
    bool budget_exceeded = false;
    std::chrono::milliseconds duration{};
};

/// Executes units across ``worker_count`` workers.
///
/// Units are partitioned round-robin in the order given; each worker runs its share sequentially,
/// one child process per unit. The calling process only supervises (single-threaded, poll(2)).
class Scheduler
{
public:
    using OutcomeCallback = std::function<void(const Outcome&)>;

    Scheduler(SchedulerOptions options, const UnitConfig& config, const ArtifactStore& artifacts);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    virtual ~Scheduler() = default;

    /// Called as each unit completes, in completion order
    void set_outcome_callback(OutcomeCallback callback) { on_outcome_ = std::move(callback); }

    /// Exactly one outcome per element of ``units``
    ScheduleResult run(std::span<const UnitBase* const> units);

    const SchedulerOptions& options() const { return options_; }

protected:
    /// Start ``unit`` in a new execution context
    virtual Result<UnitProcess> spawn(const UnitBase& unit);

private:
    struct Running
    {
        std::size_t index;
        UnitProcess process;
        std::optional<std::chrono::milliseconds> timeout;
    };

    struct Worker
    {
        std::size_t id;
        std::deque<std::size_t> queue;
        std::optional<Running> running;
    };

    using Clock = std::chrono::steady_clock;

    void complete(std::size_t index, UnitExecution execution);

    /// Start the next unit of ``worker``; skip-declared units complete without a process
    void dispatch(Worker& worker, std::span<const UnitBase* const> units);

    /// Collect the result of a unit whose process closed its pipe
    void collect(Worker& worker);

    void time_out(Worker& worker, std::string summary);

    /// Milliseconds until the nearest deadline, or -1 if there is none
    int next_wakeup(const std::vector<Worker>& workers) const;

    SchedulerOptions options_;
    const UnitConfig* config_;
    const ArtifactStore* artifacts_;
    OutcomeCallback on_outcome_;

    // per-run state
    std::vector<std::optional<UnitExecution>> results_;
    std::optional<Clock::time_point> budget_deadline_;
    std::optional<Clock::time_point> grace_deadline_;
    bool cancelled_ = false;
};

} // namespace trialrun
