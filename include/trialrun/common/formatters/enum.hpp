#pragma once

#include <trialrun/common/formatters/debug.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/find_if.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace trialrun::detail {

/// Formatter for an enum with a fixed table of (name, enumerator) pairs.
/// Very annoying to declare manually, so use FMT_SERIALIZE_ENUM instead!
///
/// `{}`  -> "Enumerator"
/// `{?}` -> "EnumName{Enumerator}"
template <typename Enum, std::size_t NumEnumerators>
    requires(std::is_enum_v<Enum>)
struct EnumFormatter : DebugFormatter
{
    using Entry = std::pair<std::string_view, Enum>;

    constexpr EnumFormatter(std::string_view enum_name, std::array<Entry, NumEnumerators> enumerators)
        : name{enum_name}
        , entries{enumerators} {}

    constexpr std::optional<std::string_view> name_of(Enum from) const {
        auto iter = ranges::find_if(entries, [from](const Entry& entry) { return entry.second == from; });

        if (iter == entries.end()) {
            return std::nullopt;
        }

        return iter->first;
    }

    auto format(const Enum& from, fmt::format_context& ctx) const {
        auto enumerator = name_of(from);

        if (!enumerator.has_value()) {
            return fmt::format_to(ctx.out(), "<unknown ({})>", fmt::underlying(from));
        }

        if (is_debug_format) {
            return fmt::format_to(ctx.out(), "{}{{{}}}", name, *enumerator);
        }

        return fmt::format_to(ctx.out(), "{}", *enumerator);
    }

    std::string_view name;
    std::array<Entry, NumEnumerators> entries;
};

} // namespace trialrun::detail
