#pragma once

#include <trialrun/common/formatters/debug.hpp>

#include <fmt/format.h>

#include <string>

namespace trialrun {

/// How a child process ended, decoded from a waitpid(2) status
struct ExitStatus
{
    enum Kind { Exited, Signaled, Unknown } kind;

    int code; ///< exit code or signal number

    static ExitStatus from_wait_status(int status);

    bool clean() const { return kind == Exited && code == 0; }

    std::string describe() const;
};

} // namespace trialrun

template <>
struct fmt::formatter<::trialrun::ExitStatus> : ::trialrun::DebugFormatter
{
    auto format(const ::trialrun::ExitStatus& from, format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", from.describe());
    }
};
