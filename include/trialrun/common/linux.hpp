#pragma once

#include <trialrun/common/expected.hpp>
#include <trialrun/common/extra_formatters.hpp>
#include <trialrun/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace trialrun::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// writes all of ``data``, retrying on short writes and EINTR
inline Expected<> write_all(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t res = ::write(fd, data.data(), data.size());

        if (res == -1) {
            if (errno == EINTR) {
                continue;
            }

            auto err = make_error_code(errno);
            LOG_DEBUG("write_all failed: '{}'", err);
            return err;
        }

        data.remove_prefix(static_cast<std::size_t>(res));
    }

    return {};
}

/// reads fromm a file descriptor. See read(2)
/// returns success/failure; logs failure at debug level
inline Expected<std::string> read(int fd, size_t count) { // NOLINT
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("read failed: '{}'", err);
        return err;
    }

    DEBUG_ASSERT(res >= 0, "read result is negative and != -1");
    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
/// returns success/failure; logs failure at debug level
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err);
        return err;
    }

    return {};
}

/// see kill(2)
/// returns success/failure; logs failure at debug level
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill failed: '{}'", err);
        return err;
    }

    return {};
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if type == Parent
};

/// see fork(2)
/// returns result from enum; logs failure at debug level
inline Expected<Fork> fork() {
    int res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err);
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see open(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> open(const std::string& pathname, int flags, mode_t mode = 0) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::open(pathname.c_str(), flags, mode);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("open failed: '{}'", err);
        return err;
    }

    return res;
}

/// see dup(2)
/// returns success/failure; logs failure at debug level
inline Expected<> dup2(int oldfd, int newfd) {
    int res = ::dup2(oldfd, newfd);

    if (res != newfd) {
        auto err = make_error_code(errno);

        if (res == -1) {
            LOG_DEBUG("dup2 failed: '{}'", err);
        } else {
            LOG_DEBUG("dup2 failed (INVALID RETURN CODE = {}): '{}'", res, err);
        }

        return err;
    }

    return {};
}

/// see flock(2)
/// EWOULDBLOCK is returned as an error like any other; callers using LOCK_NB should check for it
inline Expected<> flock(int fd, int operation) {
    int res = ::flock(fd, operation);

    if (res == -1) {
        auto err = make_error_code(errno);

        if (err != std::errc::operation_would_block) {
            LOG_DEBUG("flock failed: '{}'", err);
        }

        return err;
    }

    return {};
}

struct WaitResult
{
    pid_t pid; // 0 if WNOHANG was given and the child has not changed state
    int status;
};

/// see waitpid(2)
/// returns success/failure; logs failure at debug level
inline Expected<WaitResult> waitpid(pid_t pid, int options = 0) {
    int status = 0;
    pid_t res{};

    do {
        res = ::waitpid(pid, &status, options);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitpid failed: '{}'", err);

        return err;
    }

    return WaitResult{.pid = res, .status = status};
}

/// see poll(2)
/// EINTR is reported as zero ready descriptors
inline Expected<int> poll(std::span<pollfd> fds, int timeout_ms) {
    int res = ::poll(fds.data(), fds.size(), timeout_ms);

    if (res == -1) {
        if (errno == EINTR) {
            return 0;
        }

        auto err = make_error_code(errno);

        LOG_DEBUG("poll failed: '{}'", err);

        return err;
    }

    return res;
}

struct Pipe
{
    int read_fd;
    int write_fd;
};

// Ensure that fds are packed so that pipe works properly
static_assert(offsetof(Pipe, read_fd) + sizeof(Pipe::read_fd) == offsetof(Pipe, write_fd));

/// see pipe2(2)
/// returns success/failure; logs failure at debug level
inline Expected<Pipe> pipe2(int flags = 0) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe failed: '{}'", err);

        return err;
    }

    return pipe;
}

/// Value type to behave as a linux signal
class Signal
{
public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    Signal(int signal_num)
        : signal_num_{signal_num} {};

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const { return signal_num_; }

    std::string to_string() const {
        const char* descr = sigdescr_np(signal_num_);
        return descr != nullptr ? descr : fmt::format("signal {}", signal_num_);
    }

    friend std::string format_as(const Signal& from) { return from.to_string(); }

private:
    int signal_num_;
};

} // namespace trialrun::linux
