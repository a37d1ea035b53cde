#include "scheduler/exit_status.hpp"

#include <trialrun/common/linux.hpp>

#include <fmt/format.h>

#include <string>

#include <sys/wait.h>

namespace trialrun {

ExitStatus ExitStatus::from_wait_status(int status) {
    if (WIFEXITED(status)) {
        return {.kind = Exited, .code = WEXITSTATUS(status)};
    }

    if (WIFSIGNALED(status)) {
        return {.kind = Signaled, .code = WTERMSIG(status)};
    }

    return {.kind = Unknown, .code = status};
}

std::string ExitStatus::describe() const {
    switch (kind) {
    case Exited:
        return fmt::format("exited with code {}", code);
    case Signaled:
        return fmt::format("killed by signal {} ({})", code, linux::Signal{code});
    case Unknown:
        break;
    }

    return fmt::format("ended with unrecognized wait status {:#x}", code);
}

} // namespace trialrun
