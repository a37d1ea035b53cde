#pragma once

#include <trialrun/common/expected.hpp>
#include <trialrun/common/formatters/macros.hpp>

#include <boost/preprocessor/cat.hpp>

namespace trialrun {

// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,       ///< Operation surpassed its allotted time
    SyscallFailure, ///< A Linux syscall failed
    BadArgument,    ///< Caller supplied an invalid name, path or value
    ProtocolError,  ///< A unit process reported something that could not be decoded
    IoError,        ///< Reading or writing a file failed
    UnknownError,   ///< As named; use this as little as possible
};

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace trialrun

FMT_SERIALIZE_ENUM(::trialrun::ErrorKind, TimedOut, SyscallFailure, BadArgument, ProtocolError, IoError,
                   UnknownError);

/// If the supplied argument is an error (unexpected) type, then propagate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        auto ident = val;                                                                                              \
        if (!ident.has_value()) {                                                                                      \
            using enum ::trialrun::ErrorKind;                                                                          \
            return e;                                                                                                  \
        }                                                                                                              \
        std::move(ident).value();                                                                                      \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propagate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
