#pragma once

#include <dockgrader/common/expected.hpp>
#include <dockgrader/common/formatters/macros.hpp>

#include <boost/preprocessor/cat.hpp>

namespace dockgrader {

// NOLINTNEXTLINE
enum class ErrorKind {
    SyscallFailure, ///< A Linux syscall failed
    EngineFailure,  ///< The container engine rejected a request (non-zero exit of the engine CLI)
    BadArgument,    ///< Invalid input to an operation, detected before any work was done
    UnknownError,   ///< As named; use this as little as possible

    MaxErrorNum // Not a proper error; used to determine the number of errors
};

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace dockgrader

FMT_SERIALIZE_ENUM(::dockgrader::ErrorKind, SyscallFailure, EngineFailure, BadArgument, UnknownError, MaxErrorNum);

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        auto ident = val;                                                                                              \
        if (!ident.has_value()) {                                                                                      \
            using enum ::dockgrader::ErrorKind;                                                                        \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
