#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the server and wire layers.
 * @details These values eliminate magic numbers from the codebase. Embedding
 *          applications override them by filling a ServerConfig.
 */

#include <cstddef>
#include <cstdint>

namespace bmux::config::constants {

// =====================
// Wire format
// byte 0: header length, bytes 1-2: body length (big-endian)
// =====================
inline constexpr std::size_t   WIRE_PREFIX_SIZE   = 3;      ///< Fixed envelope prefix
inline constexpr std::size_t   WIRE_MAX_HEAD_LEN  = 255;    ///< One length byte
inline constexpr std::size_t   WIRE_MAX_BODY_LEN  = 65535;  ///< 16-bit length field

// =====================
// Listener defaults
// =====================
inline constexpr std::uint16_t SERVER_PORT             = 30000;
inline constexpr const char*   SERVER_ADDRESS          = "0.0.0.0";
inline constexpr const char*   SERVER_PROTOCOL         = "tcp";
inline constexpr int           SERVER_LISTEN_BACKLOG   = 512;
inline constexpr std::size_t   SERVER_MAX_CONNECTIONS  = 1024;
inline constexpr bool          SERVER_KEEP_ALIVE       = true;
inline constexpr bool          SERVER_MULTICORE        = true;
inline constexpr bool          SERVER_EXPERIMENTAL     = false;
inline constexpr bool          SERVER_PACKET_LOGGING   = false;
inline constexpr const char*   SERVER_LOG_LEVEL        = "info";

// =====================
// Timeouts (milliseconds, 0 disables)
// =====================
inline constexpr std::uint32_t TIMEOUT_READ_MS      = 15000;  ///< 15 s
inline constexpr std::uint32_t TIMEOUT_WRITE_MS     = 0;
inline constexpr std::uint32_t TIMEOUT_IDLE_MS      = 0;
inline constexpr std::uint32_t TIMEOUT_SHUTDOWN_MS  = 15000;  ///< 15 s

// =====================
// Engine internals
// =====================
inline constexpr std::uint32_t ACCEPT_POLL_TICK_MS   = 100;   ///< Acceptor re-checks stop flag
inline constexpr std::uint32_t REACTOR_TICK_MS       = 250;   ///< Timeout sweep granularity
inline constexpr std::size_t   REACTOR_MAX_LOOPS     = 8;     ///< Cap for multicore mode
inline constexpr std::size_t   REACTOR_MAX_EVENTS    = 128;   ///< epoll_wait batch
inline constexpr std::size_t   REACTOR_READ_CHUNK    = 16 * 1024;

} // namespace bmux::config::constants
