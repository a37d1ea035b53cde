#pragma once

#include <trialrun/exceptions.hpp> // IWYU pragma: export

#define CONCAT_IMPL(a, b) a##b
#define CONCAT(a, b) CONCAT_IMPL(a, b)

#define STRINGIFY_IMPL(a) #a
#define STRINGIFY(a) STRINGIFY_IMPL(a)

/// Unwrap an Expected, or throw ContextInternalError out of the running unit
#define TRY_OR_THROW(expr, ...)                                                                                        \
    __extension__({                                                                                                    \
        auto res__ref = (expr);                                                                                        \
        if (!res__ref) {                                                                                               \
            throw ::trialrun::ContextInternalError{res__ref.error() __VA_OPT__(, ) __VA_ARGS__};                       \
        }                                                                                                              \
        std::move(res__ref).value();                                                                                   \
    })
