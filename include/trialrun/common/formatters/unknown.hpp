#pragma once

#include <fmt/format.h>

#include <string>
#include <type_traits>
#include <utility>

namespace trialrun {

/// Format ``value`` if fmt knows how to, otherwise "<unknown>"
template <typename T>
inline std::string format_or_unknown(T&& value) {
    if constexpr (fmt::is_formattable<std::remove_cvref_t<T>>::value) {
        return fmt::format("{}", std::forward<T>(value));
    } else {
        return "<unknown>";
    }
}

} // namespace trialrun
