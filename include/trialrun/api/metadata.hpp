#pragma once

#include <boost/mp11/algorithm.hpp>
#include <boost/mp11/list.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <span>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

/// Compile-time attributes attached to a unit through ``UNIT(name, attrs...)`` or ``FILE_METADATA(attrs...)``
namespace trialrun::metadata {

/// Topic the unit belongs to. Units are ordered by topic.
/// If absent, the topic is derived from the declaring file's name.
struct Topic
{
    std::string_view name;

    constexpr bool operator==(const Topic&) const = default;
};

struct Tags
{
    static constexpr std::size_t MAX_TAGS = 8;

    consteval Tags(std::initializer_list<std::string_view> tags) {
        if (tags.size() > MAX_TAGS) {
            throw "too many tags on a single unit"; // compile-time error
        }
        std::copy(tags.begin(), tags.end(), values.begin());
        count = tags.size();
    }

    constexpr std::span<const std::string_view> get() const { return {values.data(), count}; }

    constexpr bool operator==(const Tags&) const = default;

    std::array<std::string_view, MAX_TAGS> values{};
    std::size_t count = 0;
};

/// Wall-clock limit for a single execution of the unit
struct Timeout
{
    std::chrono::milliseconds duration;

    constexpr bool operator==(const Timeout&) const = default;
};

/// Unit is declared as skipped; it produces a Skipped outcome without executing
struct Skip
{
    std::string_view reason;

    constexpr bool operator==(const Skip&) const = default;
};

struct ParamDecl
{
    std::string_view name;
    std::string_view default_value;

    constexpr bool operator==(const ParamDecl&) const = default;
};

/// Declared unit parameters and their default values, in declaration order.
///   Params{{"do_plot", "false"}, {"steps", "1000"}}
struct Params
{
    static constexpr std::size_t MAX_PARAMS = 16;

    consteval Params(std::initializer_list<ParamDecl> params) {
        if (params.size() > MAX_PARAMS) {
            throw "too many parameters on a single unit"; // compile-time error
        }
        std::copy(params.begin(), params.end(), values.begin());
        count = params.size();
    }

    constexpr std::span<const ParamDecl> get() const { return {values.data(), count}; }

    constexpr bool operator==(const Params&) const = default;

    std::array<ParamDecl, MAX_PARAMS> values{};
    std::size_t count = 0;
};

namespace detail::meta {

using namespace boost::mp11;

template <typename T>
using NormalizedT = std::decay_t<T>;

template <typename T>
consteval bool is_normalized() {
    return std::same_as<NormalizedT<T>, T>;
}

using MetadataAttrTs = mp_list<Topic, Tags, Timeout, Skip, Params>;

template <typename T>
concept MetadataAttr = mp_contains<MetadataAttrTs, NormalizedT<T>>::value;

template <std::size_t I, typename... Ts>
using Get = mp_at<mp_list<Ts...>, mp_size_t<I>>;

} // namespace detail::meta

/// A compile-time set of attributes, at most one of each attribute type.
///
/// Attributes are combined with ``operator|``; an attribute already present is replaced.
template <typename... MetadataTypes>
class Metadata
{
public:
    static_assert(
        (detail::meta::is_normalized<MetadataTypes>() && ...),
        "To prevent dangling references and other issues, all type parameters of Metadata should be normalized."
        "Use the provided deduction guide.");

    static_assert((detail::meta::MetadataAttr<MetadataTypes> && ...), "Unknown metadata attribute type");

    template <typename... Args>
    // prevent this from becoming move/copy constructor
        requires(sizeof...(Args) != 1 ||
                 !(std::same_as<detail::meta::NormalizedT<detail::meta::Get<0, Args...>>, Metadata<MetadataTypes...>>))
    explicit consteval Metadata(Args&&... args)
        : data_{std::forward<Args>(args)...} {}

    template <typename OtherMetadataType>
        requires(detail::meta::MetadataAttr<OtherMetadataType>)
    consteval auto operator|(OtherMetadataType&& attr) const;

    template <typename... OtherMetadataTypes>
    consteval auto operator|(const Metadata<OtherMetadataTypes...>& other) const {
        return (*this | ... | std::get<OtherMetadataTypes>(other.data_));
    }

    template <typename MetadataType>
    constexpr std::optional<MetadataType> get() const {
        if constexpr (has<MetadataType>()) {
            return std::get<MetadataType>(data_);
        } else {
            return std::nullopt;
        }
    }

    template <typename T>
    static consteval bool has() {
        return boost::mp11::mp_contains<boost::mp11::mp_list<MetadataTypes...>, T>::value;
    }

private:
    template <typename... Ts>
    explicit consteval Metadata(std::tuple<Ts...> data)
        : data_{data} {}

    std::tuple<MetadataTypes...> data_;

    template <typename... Ts>
    friend class Metadata;
};

// Deduction guides
template <typename... Args>
Metadata(Args&&...) -> Metadata<detail::meta::NormalizedT<Args>...>;

template <typename... MetadataTypes>
template <typename OtherMetadataType>
    requires(detail::meta::MetadataAttr<OtherMetadataType>)
consteval auto Metadata<MetadataTypes...>::operator|(OtherMetadataType&& attr) const {
    using R = detail::meta::NormalizedT<OtherMetadataType>;

    if constexpr (has<R>()) {
        // already present; replace
        auto copy = data_;
        std::get<R>(copy) = std::forward<OtherMetadataType>(attr);
        return Metadata<MetadataTypes...>{copy};
    } else {
        return Metadata<MetadataTypes..., R>{std::tuple_cat(data_, std::tuple<R>{std::forward<OtherMetadataType>(attr)})};
    }
}

/// Combine any mix of attributes and ``Metadata`` sets, left to right
template <typename... Args>
consteval auto create(Args&&... args) {
    return (Metadata<>{} | ... | std::forward<Args>(args));
}

// Each TU has its own static global definition of this free function
// Overload resolution will always prefer the non-template version of the fn,
// allowing the user to specify "file" (TU) defaults by simply overloading the fn.
template <typename T = void>
static consteval auto global_file_metadata() {
    return Metadata<>{};
}

} // namespace trialrun::metadata
