#pragma once

#include <trialrun/common/formatters/debug.hpp>

#include <fmt/format.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace std {

/// Formatter for std::optional<T>
template <typename T>
inline std::string format_as(const std::optional<T>& from) {
    if (!from) {
        return "nullopt";
    }

    return fmt::format("Optional({})", from.value());
}

} // namespace std

template <>
struct fmt::formatter<std::error_code> : ::trialrun::DebugFormatter
{
    auto format(const std::error_code& from, format_context& ctx) const {
        if (is_debug_format) {
            return fmt::format_to(ctx.out(), "error_code{{{}:{} ({})}}", from.category().name(), from.value(),
                                  from.message());
        }

        return fmt::format_to(ctx.out(), "{}", from.message());
    }
};

template <>
struct fmt::formatter<std::filesystem::path> : ::trialrun::DebugFormatter
{
    auto format(const std::filesystem::path& from, format_context& ctx) const {
        if (is_debug_format) {
            return fmt::format_to(ctx.out(), "{:?}", from.string());
        }

        return fmt::format_to(ctx.out(), "{}", from.string());
    }
};
