#include "scheduler/unit_process.hpp"

#include "scheduler/exit_status.hpp"
#include "scheduler/unit_executor.hpp"
#include "scheduler/wire.hpp"

#include <trialrun/api/unit_base.hpp>
#include <trialrun/api/unit_config.hpp>
#include <trialrun/artifacts/artifact_store.hpp>
#include <trialrun/common/error_types.hpp>
#include <trialrun/common/linux.hpp>
#include <trialrun/logging.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <tuple>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

namespace trialrun {

namespace {

constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;

/// Body of the forked child. Never returns into the caller's stack.
[[noreturn]] void run_child(const UnitBase& unit, const UnitConfig& config, const ArtifactStore& artifacts,
                            int write_fd, bool silence_stdout) {
    try {
        if (silence_stdout) {
            if (auto null_fd = linux::open("/dev/null", O_WRONLY | O_CLOEXEC)) {
                std::ignore = linux::dup2(*null_fd, STDOUT_FILENO);
                std::ignore = linux::close(*null_fd);
            }
        }

        auto execution = execute_unit(unit, config, artifacts);

        std::fflush(stdout);

        if (auto res = linux::write_all(write_fd, wire::encode(execution)); !res) {
            LOG_ERROR("Unit {:?} could not report its outcome: {}", unit.get_name(), res.error());
            ::_exit(UnitProcess::CHILD_FAILURE_EXIT_CODE);
        }
    } catch (const std::exception& ex) {
        LOG_ERROR("Unit process for {:?} failed outside of the unit body: {}", unit.get_name(), ex.what());
        ::_exit(UnitProcess::CHILD_FAILURE_EXIT_CODE);
    }

    std::ignore = linux::close(write_fd);

    // _exit: the parent's atexit handlers and static destructors belong to the parent
    ::_exit(0);
}

} // namespace

UnitProcess::UnitProcess(const UnitBase& unit, pid_t pid, int read_fd)
    : unit_{&unit}
    , pid_{pid}
    , read_fd_{read_fd}
    , start_time_{std::chrono::steady_clock::now()} {}

Result<UnitProcess> UnitProcess::spawn(const UnitBase& unit, const UnitConfig& config, const ArtifactStore& artifacts,
                                       bool silence_stdout) {
    auto pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);

    // Anything buffered would otherwise be written twice
    std::fflush(stdout);
    std::fflush(stderr);

    auto fork_res = linux::fork();

    if (!fork_res) {
        std::ignore = linux::close(pipe.read_fd);
        std::ignore = linux::close(pipe.write_fd);
        return ErrorKind::SyscallFailure;
    }

    if (fork_res->which == linux::Fork::Child) {
        std::ignore = linux::close(pipe.read_fd);
        run_child(unit, config, artifacts, pipe.write_fd, silence_stdout);
    }

    std::ignore = linux::close(pipe.write_fd);

    LOG_DEBUG("Started unit {:?} in pid {}", unit.get_name(), fork_res->pid);

    return UnitProcess{unit, fork_res->pid, pipe.read_fd};
}

UnitProcess::UnitProcess(UnitProcess&& other) noexcept
    : unit_{other.unit_}
    , pid_{std::exchange(other.pid_, 0)}
    , read_fd_{std::exchange(other.read_fd_, -1)}
    , buffer_{std::move(other.buffer_)}
    , start_time_{other.start_time_} {}

UnitProcess& UnitProcess::operator=(UnitProcess&& other) noexcept {
    if (this != &other) {
        terminate();
        unit_ = other.unit_;
        pid_ = std::exchange(other.pid_, 0);
        read_fd_ = std::exchange(other.read_fd_, -1);
        buffer_ = std::move(other.buffer_);
        start_time_ = other.start_time_;
    }

    return *this;
}

UnitProcess::~UnitProcess() {
    terminate();
}

void UnitProcess::terminate() {
    close_pipe();

    // if pid_ == 0, then the child was reaped, or the object was moved from
    if (pid_ == 0) {
        return;
    }

    std::ignore = kill();
    std::ignore = wait();
}

void UnitProcess::close_pipe() {
    if (read_fd_ != -1) {
        std::ignore = linux::close(std::exchange(read_fd_, -1));
    }
}

Result<bool> UnitProcess::read_available() {
    if (read_fd_ == -1) {
        return true;
    }

    std::string chunk = TRYE(linux::read(read_fd_, READ_CHUNK_SIZE), SyscallFailure);

    if (chunk.empty()) {
        close_pipe();
        return true;
    }

    buffer_ += chunk;

    return false;
}

Result<void> UnitProcess::kill() {
    if (pid_ == 0) {
        return {};
    }

    TRYE(linux::kill(pid_, SIGKILL), SyscallFailure);

    return {};
}

Result<ExitStatus> UnitProcess::wait() {
    if (pid_ == 0) {
        LOG_WARN("wait called on a unit process that was already reaped");
        return ErrorKind::BadArgument;
    }

    auto res = TRYE(linux::waitpid(pid_, 0), SyscallFailure);
    pid_ = 0;
    close_pipe();

    auto status = ExitStatus::from_wait_status(res.status);

    LOG_DEBUG("Unit process for {:?} (pid {}) {}", unit_->get_name(), res.pid, status);

    return status;
}

} // namespace trialrun
