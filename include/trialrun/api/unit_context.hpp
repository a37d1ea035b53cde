#pragma once

#include <trialrun/api/unit_base.hpp>
#include <trialrun/api/unit_config.hpp>
#include <trialrun/artifacts/artifact_store.hpp>
#include <trialrun/common/class_traits.hpp>
#include <trialrun/common/error_types.hpp>
#include <trialrun/common/formatters/unknown.hpp>
#include <trialrun/coverage/coverage.hpp>
#include <trialrun/exceptions.hpp>
#include <trialrun/run_session.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <charconv>
#include <chrono>
#include <cmath>
#include <concepts>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace trialrun {

/// Result of a single ``expect*`` call
struct CheckResult
{
    bool passed;
    std::string summary;
    std::string expected;
    std::string actual;
    std::string location;

    struct DebugInfo
    {
        std::string_view msg;     // stringified condition
        std::source_location loc; // check execution point

        static constexpr std::string_view DEFAULT_MSG = "<unknown>";

        explicit DebugInfo(std::string_view message = DEFAULT_MSG,
                           std::source_location location = std::source_location::current())
            : msg{message}
            , loc{location} {}
    };
};

/// Everything a finished unit execution produced
struct UnitExecution
{
    Outcome outcome;
    CoverageSample coverage;
};

/// User-facing API for use within a unit for:
///   Reading the resolved configuration and parameters
///   Result collection (expectations, context notes, skips)
///   Artifacts, coverage and the inspection value
class UnitContext : NonMovable
{
public:
    UnitContext(const UnitBase& unit, const UnitConfig& config, const ArtifactStore& artifacts);

    ~UnitContext();

    std::string_view get_name() const;

    const UnitConfig& config() const { return *config_; }

    bool do_plot() const { return config_->do_plot; }

    bool verbose() const { return config_->verbose; }

    /// The rendering backend; only present when plotting is enabled
    const std::optional<std::string>& plot_backend() const { return config_->plot_backend; }

    /// Value of parameter ``name``: the run's override if given, otherwise the declared default.
    /// ``do_plot`` and ``verbose`` fall back to the run's toggles when not declared.
    ///
    /// Throws ContextInternalError if the parameter is not declared or its value cannot be parsed as ``T``
    template <typename T>
    T param(std::string_view name) const;

    bool expect(bool condition, std::string_view summary = "",
                CheckResult::DebugInfo debug_info = CheckResult::DebugInfo{});

    template <typename Actual, typename Wanted>
    bool expect_eq(const Actual& actual, const Wanted& expected, std::string_view summary = "",
                   CheckResult::DebugInfo debug_info = CheckResult::DebugInfo{});

    template <typename T>
        requires(std::is_arithmetic_v<T>)
    bool expect_near(T actual, std::type_identity_t<T> expected, std::type_identity_t<T> tolerance,
                     std::string_view summary = "", CheckResult::DebugInfo debug_info = CheckResult::DebugInfo{});

    /// Attach context to any failure reported by this unit
    void note(std::string message);

    /// Abandon the unit; it is reported as Skipped
    [[noreturn]] void skip(std::string reason);

    /// Open an artifact owned by this unit. The handle stays valid until the unit finishes
    /// and is closed before the outcome is produced.
    ArtifactHandle& artifact(std::string_view file_name);

    CoverageSample& coverage() { return coverage_; }

    /// Record the most relevant object produced by the unit
    template <typename T>
    void inspect(const T& value) {
        inspection_ = format_or_unknown(value);
    }

    const std::vector<CheckResult>& get_checks() const { return checks_; }

    /// Close owned artifacts and produce the unit's outcome.
    /// An error recorded through ``set_error`` takes priority over check results.
    UnitExecution finalize(std::chrono::milliseconds duration);

    /// Record an abnormal termination of the unit body.
    /// ``expected`` describes the normal completion, ``actual`` what happened instead.
    void set_error(std::string summary, std::string expected, std::string actual);

    void set_skipped(std::string reason);

private:
    std::optional<std::string> raw_param(std::string_view name) const;

    bool record(CheckResult result);

    const UnitBase* unit_;
    const UnitConfig* config_;
    const ArtifactStore* artifacts_;

    std::vector<CheckResult> checks_;
    std::vector<std::string> notes_;
    std::vector<std::unique_ptr<ArtifactHandle>> open_artifacts_;
    CoverageSample coverage_;
    std::optional<std::string> inspection_;

    struct RecordedError
    {
        std::string summary;
        std::string expected;
        std::string actual;
    };

    std::optional<RecordedError> error_;
    std::optional<std::string> skip_reason_;
};

namespace detail {

inline std::string format_location(const std::source_location& loc) {
    return fmt::format("{}:{}", loc.file_name(), loc.line());
}

template <typename T>
std::optional<T> parse_param(std::string_view text) {
    if constexpr (std::same_as<T, std::string>) {
        return std::string{text};
    } else if constexpr (std::same_as<T, bool>) {
        if (text == "true" || text == "1" || text == "on" || text == "yes") {
            return true;
        }
        if (text == "false" || text == "0" || text == "off" || text == "no") {
            return false;
        }
        return std::nullopt;
    } else if constexpr (std::is_arithmetic_v<T>) {
        T value{};
        const auto* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, value);

        if (ec != std::errc{} || ptr != end) {
            return std::nullopt;
        }
        return value;
    } else {
        static_assert(std::is_arithmetic_v<T>, "Unsupported parameter type");
    }
}

} // namespace detail

template <typename T>
T UnitContext::param(std::string_view name) const {
    auto text = raw_param(name);

    if (!text) {
        throw ContextInternalError{ErrorKind::BadArgument, fmt::format("parameter {:?} is not declared", name)};
    }

    auto value = detail::parse_param<T>(*text);

    if (!value) {
        throw ContextInternalError{ErrorKind::BadArgument,
                                   fmt::format("parameter {:?} has invalid value {:?}", name, *text)};
    }

    return *std::move(value);
}

template <typename Actual, typename Wanted>
bool UnitContext::expect_eq(const Actual& actual, const Wanted& expected, std::string_view summary,
                            CheckResult::DebugInfo debug_info) {
    return record({.passed = static_cast<bool>(actual == expected),
                   .summary = std::string{summary.empty() ? debug_info.msg : summary},
                   .expected = format_or_unknown(expected),
                   .actual = format_or_unknown(actual),
                   .location = detail::format_location(debug_info.loc)});
}

template <typename T>
    requires(std::is_arithmetic_v<T>)
bool UnitContext::expect_near(T actual, std::type_identity_t<T> expected, std::type_identity_t<T> tolerance,
                              std::string_view summary, CheckResult::DebugInfo debug_info) {
    const auto diff = actual > expected ? actual - expected : expected - actual;

    return record({.passed = diff <= tolerance,
                   .summary = std::string{summary.empty() ? debug_info.msg : summary},
                   .expected = fmt::format("{} +/- {}", expected, tolerance),
                   .actual = fmt::format("{}", actual),
                   .location = detail::format_location(debug_info.loc)});
}

} // namespace trialrun
