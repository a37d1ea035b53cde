#pragma once

#include "scheduler/exit_status.hpp"

#include <trialrun/api/unit_base.hpp>
#include <trialrun/api/unit_config.hpp>
#include <trialrun/artifacts/artifact_store.hpp>
#include <trialrun/common/class_traits.hpp>
#include <trialrun/common/error_types.hpp>

#include <chrono>
#include <optional>
#include <string>

#include <sys/types.h>

namespace trialrun {

/// A single unit executing in a forked child process.
///
/// The child runs the unit, writes a wire message to a pipe and exits; the parent collects
/// the message with ``read_available`` and reaps the child with ``wait``.
class UnitProcess : NonCopyable
{
public:
    /// Exit code used by a child that could not deliver its result
    static constexpr int CHILD_FAILURE_EXIT_CODE = 121;

    /// Fork a child executing ``unit``. The caller's stdout is flushed first.
    /// With ``silence_stdout`` the child's stdout is redirected to /dev/null.
    static Result<UnitProcess> spawn(const UnitBase& unit, const UnitConfig& config, const ArtifactStore& artifacts,
                                     bool silence_stdout);

    UnitProcess(UnitProcess&& other) noexcept;
    UnitProcess& operator=(UnitProcess&& other) noexcept;

    /// Kills and reaps the child if it is still running
    ~UnitProcess();

    const UnitBase& unit() const { return *unit_; }

    pid_t pid() const { return pid_; }

    /// -1 once the child's end of the pipe has closed
    int read_fd() const { return read_fd_; }

    std::chrono::steady_clock::time_point start_time() const { return start_time_; }

    /// Read whatever the child has written so far, without blocking if poll(2) reported the pipe readable.
    /// Returns true once the child has closed its end of the pipe.
    Result<bool> read_available();

    Result<void> kill();

    /// Blocking; reaps the child. Valid once.
    Result<ExitStatus> wait();

    const std::string& message() const { return buffer_; }

private:
    UnitProcess(const UnitBase& unit, pid_t pid, int read_fd);

    void close_pipe();

    /// Kill and reap the child, if any
    void terminate();

    const UnitBase* unit_;
    pid_t pid_ = 0; // 0 if reaped or moved from
    int read_fd_ = -1;
    std::string buffer_;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace trialrun
