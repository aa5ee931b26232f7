#pragma once
/**
 * @file connection.hpp
 * @brief Connection handle handed to handlers.
 * @details Both engines implement it: the threaded engine writes synchronously
 *          on the worker thread, the reactor buffers output on its loop.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "bmux/core/error.hpp"

namespace bmux::net {

    /** @class Connection
     *  @brief One live TCP stream. Only used from the thread dispatching its messages.
     */
    class Connection {
    public:
        virtual ~Connection() = default;

        /// Server-unique, monotonically assigned id.
        virtual std::uint64_t id() const noexcept = 0;

        /// Peer "ip:port".
        virtual const std::string& remote_address() const noexcept = 0;

        /**
         * @brief Send one framed envelope to the peer.
         * @return Framing error for oversized parts (nothing sent), Io error otherwise.
         */
        virtual Result<void> send(std::span<const std::byte> head, std::span<const std::byte> body) = 0;

        /// Close once the current message returns (same effect as Action::Close).
        virtual void close() noexcept = 0;
    };

} // namespace bmux::net
