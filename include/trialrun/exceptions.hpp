#pragma once

#include <trialrun/common/error_types.hpp>
#include <trialrun/common/formatters/debug.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace trialrun {

/// Error for any internal failure conditions of UnitContext
class ContextInternalError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;

    explicit ContextInternalError(ErrorKind error, const std::string& msg = "")
        : std::runtime_error{msg}
        , error_{error} {}

    ErrorKind get_error() const { return error_; };

private:
    ErrorKind error_ = ErrorKind::UnknownError;
};

/// Thrown by ``UnitContext::skip`` to abandon the unit with a Skipped outcome
class SkipUnit : public std::exception
{
public:
    explicit SkipUnit(std::string reason)
        : reason_{std::move(reason)} {}

    const char* what() const noexcept override { return reason_.c_str(); }

    const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

} // namespace trialrun

template <>
struct fmt::formatter<::trialrun::ContextInternalError> : ::trialrun::DebugFormatter
{
    auto format(const ::trialrun::ContextInternalError& from, format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{} : {}", from.what(), from.get_error());
    }
};
