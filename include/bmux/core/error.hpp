#pragma once
/**
 * @file error.hpp
 * @brief Error taxonomy shared by every bmux layer.
 * @details Errors travel as values (Result<T>), never as exceptions on the
 *          connection path. The kind decides how far an error propagates:
 *          Framing/Decode/Schema end one connection, DispatchMiss is logged,
 *          Configuration stops startup, ShutdownTimeout goes to the caller.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "bmux/compat/expected.hpp"

namespace bmux {

/** @enum ErrorKind
 *  @brief Classification of failures.
 */
enum class ErrorKind : std::uint8_t {
    Framing = 1,      ///< Short read, closed stream or oversized frame
    Decode,           ///< Unsupported field kind, malformed payload, id out of range
    Schema,           ///< No resolvable message-id field
    DispatchMiss,     ///< Valid frame without a registered handler
    Configuration,    ///< Invalid construction input; server does not start
    ShutdownTimeout,  ///< Drain exceeded the caller's deadline
    Io                ///< Socket-level failure (bind, listen, epoll)
};

/// Stable lowercase label for logs and test output.
constexpr std::string_view to_string(ErrorKind k) noexcept {
    switch (k) {
        case ErrorKind::Framing:         return "framing";
        case ErrorKind::Decode:          return "decode";
        case ErrorKind::Schema:          return "schema";
        case ErrorKind::DispatchMiss:    return "dispatch_miss";
        case ErrorKind::Configuration:   return "configuration";
        case ErrorKind::ShutdownTimeout: return "shutdown_timeout";
        case ErrorKind::Io:              return "io";
    }
    return "unknown";
}

/** @struct Error
 *  @brief Kind plus a human-readable message.
 */
struct Error {
    ErrorKind   kind{ErrorKind::Io};
    std::string message;
};

template <class T>
using Result = bmux_detail::expected<T, Error>;

/// Build the unexpected side of a Result.
inline bmux_detail::unexpected<Error> make_error(ErrorKind kind, std::string message) {
    return bmux_detail::unexpected<Error>(Error{kind, std::move(message)});
}

} // namespace bmux
