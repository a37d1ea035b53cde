#include "scheduler/scheduler.hpp"

#include "scheduler/exit_status.hpp"
#include "scheduler/unit_process.hpp"
#include "scheduler/wire.hpp"

#include <trialrun/api/unit_base.hpp>
#include <trialrun/api/unit_config.hpp>
#include <trialrun/api/unit_context.hpp>
#include <trialrun/artifacts/artifact_store.hpp>
#include <trialrun/common/error_types.hpp>
#include <trialrun/common/linux.hpp>
#include <trialrun/logging.hpp>
#include <trialrun/run_session.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <gsl/util>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/any_of.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <poll.h>

namespace trialrun {

namespace {

using std::chrono::duration_cast;
using std::chrono::milliseconds;

UnitExecution abnormal_execution(const UnitBase& unit, UnitStatus status, milliseconds duration, std::string summary,
                                 std::string expected, std::string actual) {
    Outcome outcome{.unit_name = std::string{unit.get_name()},
                    .status = status,
                    .duration = duration,
                    .failure = FailureDetail{.summary = std::move(summary),
                                             .expected = std::move(expected),
                                             .actual = std::move(actual),
                                             .context = {},
                                             .location = std::string{unit.get_source_file()}},
                    .skip_reason = std::nullopt,
                    .inspection = std::nullopt,
                    .num_checks = 0,
                    .num_failed_checks = 0,
                    .coverage_sample = std::nullopt};

    return {.outcome = std::move(outcome), .coverage = {}};
}

} // namespace

Scheduler::Scheduler(SchedulerOptions options, const UnitConfig& config, const ArtifactStore& artifacts)
    : options_{options}
    , config_{&config}
    , artifacts_{&artifacts} {}

Result<UnitProcess> Scheduler::spawn(const UnitBase& unit) {
    return UnitProcess::spawn(unit, *config_, *artifacts_, options_.silence_unit_output);
}

void Scheduler::complete(std::size_t index, UnitExecution execution) {
    DEBUG_ASSERT(index < results_.size());
    ASSERT(!results_[index].has_value(), "unit completed twice", execution.outcome.unit_name);

    LOG_DEBUG("{} -> {}", execution.outcome.unit_name, execution.outcome.status);

    results_[index] = std::move(execution);

    if (on_outcome_) {
        on_outcome_(results_[index]->outcome);
    }
}

void Scheduler::dispatch(Worker& worker, std::span<const UnitBase* const> units) {
    while (!worker.running && !worker.queue.empty()) {
        const std::size_t index = worker.queue.front();
        worker.queue.pop_front();

        const UnitBase& unit = *units[index];

        if (const auto& reason = unit.get_skip_reason()) {
            UnitExecution skipped;
            skipped.outcome.unit_name = std::string{unit.get_name()};
            skipped.outcome.status = UnitStatus::Skipped;
            skipped.outcome.skip_reason = *reason;
            complete(index, std::move(skipped));
            continue;
        }

        auto process = spawn(unit);

        if (!process) {
            LOG_ERROR("Worker {} can no longer start unit processes ({}); failing its {} remaining units", worker.id,
                      process.error(), worker.queue.size() + 1);

            const auto summary = fmt::format("worker {} could not start a unit process", worker.id);
            const auto actual = fmt::format("{}", process.error());

            complete(index, abnormal_execution(unit, UnitStatus::Errored, milliseconds{0}, summary,
                                               "a unit process to be started", actual));

            for (auto remaining : worker.queue) {
                complete(remaining, abnormal_execution(*units[remaining], UnitStatus::Errored, milliseconds{0}, summary,
                                                       "a unit process to be started", actual));
            }
            worker.queue.clear();
            return;
        }

        worker.running = Running{.index = index,
                                 .process = std::move(process.value()),
                                 .timeout = unit.get_timeout() ? unit.get_timeout() : options_.default_timeout};
    }
}

void Scheduler::collect(Worker& worker) {
    ASSERT(worker.running.has_value());

    auto& running = *worker.running;
    const UnitBase& unit = running.process.unit();

    auto status = running.process.wait();
    auto elapsed = duration_cast<milliseconds>(Clock::now() - running.process.start_time());

    if (!status) {
        complete(running.index, abnormal_execution(unit, UnitStatus::Errored, elapsed,
                                                   "unit process could not be reaped", "a reapable child process",
                                                   fmt::format("{}", status.error())));
    } else if (!status->clean()) {
        complete(running.index,
                 abnormal_execution(unit, UnitStatus::Errored, elapsed,
                                    fmt::format("unit process terminated abnormally ({})", status->describe()),
                                    "process exits with code 0", status->describe()));
    } else if (auto execution = wire::decode(running.process.message()); !execution) {
        complete(running.index, abnormal_execution(unit, UnitStatus::Errored, elapsed,
                                                   "unit process sent an unreadable result", "a complete result message",
                                                   fmt::format("{} bytes, {}", running.process.message().size(),
                                                               execution.error())));
    } else if (execution->outcome.unit_name != unit.get_name()) {
        complete(running.index,
                 abnormal_execution(unit, UnitStatus::Errored, elapsed, "unit process reported for a different unit",
                                    std::string{unit.get_name()}, execution->outcome.unit_name));
    } else {
        complete(running.index, std::move(execution.value()));
    }

    worker.running.reset();
}

void Scheduler::time_out(Worker& worker, std::string summary) {
    ASSERT(worker.running.has_value());

    auto& running = *worker.running;
    const UnitBase& unit = running.process.unit();

    std::ignore = running.process.kill();
    std::ignore = running.process.wait();

    auto elapsed = duration_cast<milliseconds>(Clock::now() - running.process.start_time());

    LOG_WARN("Unit {:?} killed after {}: {}", unit.get_name(), elapsed, summary);

    complete(running.index, abnormal_execution(unit, UnitStatus::TimedOut, elapsed, std::move(summary),
                                               running.timeout
                                                   ? fmt::format("completion within {}", *running.timeout)
                                                   : std::string{"completion before the run budget ran out"},
                                               fmt::format("still running after {}", elapsed)));

    worker.running.reset();
}

int Scheduler::next_wakeup(const std::vector<Worker>& workers) const {
    std::optional<Clock::time_point> nearest;

    auto consider = [&nearest](Clock::time_point deadline) {
        if (!nearest || deadline < *nearest) {
            nearest = deadline;
        }
    };

    for (const auto& worker : workers) {
        if (worker.running && worker.running->timeout) {
            consider(worker.running->process.start_time() + *worker.running->timeout);
        }
    }

    if (budget_deadline_ && !cancelled_) {
        consider(*budget_deadline_);
    }
    if (grace_deadline_ && cancelled_) {
        consider(*grace_deadline_);
    }

    if (!nearest) {
        return -1;
    }

    auto remaining = std::chrono::ceil<milliseconds>(*nearest - Clock::now());

    // poll(2) takes an int; a later wakeup than that just polls again
    constexpr milliseconds::rep MAX_WAIT = std::numeric_limits<int>::max();

    return gsl::narrow_cast<int>(std::clamp(remaining.count(), milliseconds::rep{0}, MAX_WAIT));
}

ScheduleResult Scheduler::run(std::span<const UnitBase* const> units) {
    const auto run_start = Clock::now();

    results_.assign(units.size(), std::nullopt);
    cancelled_ = false;
    grace_deadline_.reset();
    budget_deadline_.reset();
    if (options_.budget) {
        budget_deadline_ = run_start + *options_.budget;
    }

    ScheduleResult result;

    const std::size_t num_workers = std::max<std::size_t>(1, std::min(options_.worker_count, units.size()));
    std::vector<Worker> workers(num_workers);

    for (std::size_t i = 0; i < num_workers; ++i) {
        workers[i].id = i;
    }
    for (std::size_t i = 0; i < units.size(); ++i) {
        workers[i % num_workers].queue.push_back(i);
    }

    LOG_DEBUG("Scheduling {} units over {} workers", units.size(), num_workers);

    while (true) {
        const auto now = Clock::now();

        if (budget_deadline_ && !cancelled_ && now >= *budget_deadline_) {
            cancelled_ = true;
            result.budget_exceeded = true;
            grace_deadline_ = now + options_.grace;

            LOG_ERROR("Run budget of {} exceeded; no further units will start", *options_.budget);

            for (auto& worker : workers) {
                for (auto index : worker.queue) {
                    complete(index, abnormal_execution(*units[index], UnitStatus::TimedOut, milliseconds{0},
                                                       "not started before the run budget ran out",
                                                       fmt::format("run completes within {}", *options_.budget),
                                                       "run budget exhausted"));
                }
                worker.queue.clear();
            }
        }

        if (cancelled_ && now >= *grace_deadline_) {
            for (auto& worker : workers) {
                if (worker.running) {
                    time_out(worker, "killed when the run budget and grace period ran out");
                }
            }
        }

        if (!cancelled_) {
            for (auto& worker : workers) {
                dispatch(worker, units);
            }
        }

        std::vector<pollfd> fds;
        std::vector<Worker*> owners;

        for (auto& worker : workers) {
            if (worker.running) {
                fds.push_back({.fd = worker.running->process.read_fd(), .events = POLLIN, .revents = 0});
                owners.push_back(&worker);
            }
        }

        if (fds.empty()) {
            if (ranges::all_of(workers, [](const Worker& worker) { return worker.queue.empty(); })) {
                break;
            }
            continue;
        }

        auto ready = linux::poll(fds, next_wakeup(workers));

        if (!ready) {
            LOG_ERROR("Cannot supervise unit processes: {}", ready.error());

            for (auto* worker : owners) {
                std::ignore = worker->running->process.kill();
                collect(*worker);
            }
            continue;
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].revents == 0) {
                continue;
            }

            auto eof = owners[i]->running->process.read_available();

            if (!eof) {
                LOG_ERROR("Lost the result pipe of unit {:?}: {}", owners[i]->running->process.unit().get_name(),
                          eof.error());
                std::ignore = owners[i]->running->process.kill();
                collect(*owners[i]);
            } else if (*eof) {
                collect(*owners[i]);
            }
        }

        const auto after_poll = Clock::now();

        for (auto* worker : owners) {
            if (worker->running && worker->running->timeout &&
                after_poll - worker->running->process.start_time() >= *worker->running->timeout) {
                time_out(*worker, fmt::format("exceeded its timeout of {}", *worker->running->timeout));
            }
        }
    }

    result.outcomes.reserve(units.size());

    for (auto& execution : results_) {
        ASSERT(execution.has_value(), "every scheduled unit must produce an outcome");

        if (!execution->coverage.empty()) {
            execution->outcome.coverage_sample = result.coverage_samples.size();
            result.coverage_samples.push_back(std::move(execution->coverage));
        }

        result.outcomes.push_back(std::move(execution->outcome));
    }

    results_.clear();
    result.duration = duration_cast<milliseconds>(Clock::now() - run_start);

    return result;
}

} // namespace trialrun
