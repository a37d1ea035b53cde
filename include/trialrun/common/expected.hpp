#pragma once

#include <trialrun/common/formatters/debug.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace trialrun {

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant wrapper for a partial implementation of C++23's expected type
 *
 * @tparam T The expected value type
 * @tparam E The error type
 *
 * Note: types T and E must not be convertible between one another.
 */
class [[nodiscard]] Expected
{
public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        : data_{} {}

    template <typename... Args>
    explicit constexpr Expected(std::in_place_t /*unused*/, Args&&... args)
        requires(!std::is_void_v<T> && std::constructible_from<ExpectedT, Args...>)
        : data_{std::in_place_type<ExpectedT>, std::forward<Args>(args)...} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T> && !std::same_as<std::decay_t<Tu>, Expected>)
        : data_{std::in_place_type<ExpectedT>, std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(std::convertible_to<Eu, E> && (std::is_void_v<T> || !std::is_convertible_v<Eu, T>) &&
                 !std::same_as<std::decay_t<Eu>, Expected>)
        : data_{std::in_place_type<ErrT>, std::forward<Eu>(error)} {}

    constexpr bool has_value() const { return data_.index() == 0; }

    constexpr bool has_error() const { return !has_value(); }

    constexpr explicit operator bool() const { return has_value(); }

    template <typename U = T>
    constexpr U& value()
        requires(!std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value());
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr const U& value() const
        requires(!std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value());
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr void value() const
        requires(std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value());
    }

    template <typename U = T>
    constexpr U& operator*()
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    constexpr const U& operator*() const
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    constexpr U* operator->()
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename U = T>
    constexpr const U* operator->() const
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename Tu>
    constexpr T value_or(Tu&& default_value) const
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
    {
        if (!has_value()) {
            return static_cast<T>(std::forward<Tu>(default_value));
        }
        return std::get<0>(data_);
    }

    constexpr const E& error() const {
        DEBUG_ASSERT(!has_value());
        return std::get<1>(data_);
    }

    template <typename Eu>
    constexpr E error_or(Eu&& default_value) const {
        if (has_value()) {
            return static_cast<E>(std::forward<Eu>(default_value));
        }
        return std::get<1>(data_);
    }

    template <typename Func>
    constexpr auto transform(const Func& func) const -> Expected<std::invoke_result_t<Func, const T&>, E>
        requires(!std::is_void_v<T>)
    {
        if (!has_value()) {
            return error();
        }

        return func(value());
    }

    constexpr bool operator==(const Expected& rhs) const
        requires(std::equality_comparable<E> && (std::is_void_v<T> || std::equality_comparable<T>))
    {
        return data_ == rhs.data_;
    }

private:
    using ValueStorageT = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    std::variant<ValueStorageT, E> data_;
};

} // namespace trialrun

template <typename T, typename E>
struct fmt::formatter<::trialrun::Expected<T, E>> : ::trialrun::DebugFormatter
{
    auto format(const ::trialrun::Expected<T, E>& from, fmt::format_context& ctx) const {
        if (!from) {
            return fmt::format_to(ctx.out(), "Error({})", from.error());
        }

        if constexpr (std::is_void_v<T>) {
            return fmt::format_to(ctx.out(), "Expected(void)");
        } else {
            return fmt::format_to(ctx.out(), "Expected({})", from.value());
        }
    }
};
