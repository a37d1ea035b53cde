#pragma once

#include <trialrun/common/formatters/enum.hpp>

#include <boost/preprocessor/punctuation/comma_if.hpp>
#include <boost/preprocessor/seq/for_each_i.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/tuple/size.hpp>
#include <boost/preprocessor/tuple/to_seq.hpp>
#include <fmt/format.h>

#include <array>
#include <string_view>
#include <utility>

#define FMT_SERIALIZE_ENUMERATOR_IMPL(r, enum_name, i, ident)                                                          \
    BOOST_PP_COMMA_IF(i) std::pair<std::string_view, enum_name> {                                                      \
        BOOST_PP_STRINGIZE(ident), enum_name::ident                                                                    \
    }

/// Defines a fmt::formatter for `enum_name` that prints enumerator names
///
/// Usage (at global scope):
///   FMT_SERIALIZE_ENUM(::trialrun::UnitStatus, Passed, Failed);
#define FMT_SERIALIZE_ENUM(enum_name, ... /*enumerators*/)                                                             \
    template <>                                                                                                        \
    struct fmt::formatter<enum_name>                                                                                   \
        : ::trialrun::detail::EnumFormatter<enum_name, BOOST_PP_TUPLE_SIZE((__VA_ARGS__))>                             \
    {                                                                                                                  \
        constexpr formatter()                                                                                          \
            : EnumFormatter{#enum_name,                                                                                \
                            {{BOOST_PP_SEQ_FOR_EACH_I(FMT_SERIALIZE_ENUMERATOR_IMPL, enum_name,                        \
                                                      BOOST_PP_TUPLE_TO_SEQ(BOOST_PP_TUPLE_SIZE((__VA_ARGS__)),        \
                                                                            (__VA_ARGS__)))}}} {}                      \
    }
