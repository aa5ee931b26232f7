#pragma once
/**
 * @file socket.hpp
 * @brief POSIX TCP helpers: listener setup, deadlines, exact reads/writes.
 * @note Linux/POSIX only. A read deadline bounds one whole read_full() call;
 *       write deadlines use SO_SNDTIMEO.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "bmux/config/config_loader.hpp"
#include "bmux/core/error.hpp"

namespace bmux::net {

    /** @class UniqueFd
     *  @brief Owning file descriptor; closes on destruction.
     */
    class UniqueFd {
    public:
        UniqueFd() noexcept = default;
        explicit UniqueFd(int fd) noexcept : fd_(fd) {}
        ~UniqueFd() { reset(); }

        UniqueFd(const UniqueFd&)            = delete;
        UniqueFd& operator=(const UniqueFd&) = delete;
        UniqueFd(UniqueFd&& o) noexcept : fd_(o.release()) {}
        UniqueFd& operator=(UniqueFd&& o) noexcept {
            if (this != &o) reset(o.release());
            return *this;
        }

        int  get() const noexcept { return fd_; }
        bool valid() const noexcept { return fd_ >= 0; }
        int  release() noexcept { int f = fd_; fd_ = -1; return f; }
        void reset(int fd = -1) noexcept;

    private:
        int fd_{-1};
    };

    /// Resolve cfg.address/cfg.protocol, bind cfg.port and listen. Io error on failure.
    Result<UniqueFd> open_listener(const config::ServerConfig& cfg);

    /// Port the socket is bound to (resolves port 0 binds).
    Result<std::uint16_t> local_port(int fd);

    /// Apply a send deadline for the next blocking writes; zero clears it.
    Result<void> set_write_timeout(int fd, std::chrono::milliseconds timeout);

    Result<void> set_keep_alive(int fd, bool enabled);
    Result<void> set_nonblocking(int fd);

    /**
     * @brief Read exactly out.size() bytes within @p timeout of the call.
     *
     * The deadline is fixed when the call starts, so a peer that trickles
     * bytes cannot extend it. Zero waits without limit. Closed stream or
     * expired deadline is a Framing error.
     * @param transferred If set, receives the bytes read, also on failure.
     */
    Result<void> read_full(int fd, std::span<std::byte> out, std::chrono::milliseconds timeout,
                           std::size_t* transferred = nullptr);

    /// Write every byte (MSG_NOSIGNAL). Expired deadline or reset is an Io error.
    Result<void> write_full(int fd, std::span<const std::byte> data);

    /// "ip:port" of the peer, or "unknown".
    std::string format_peer(int fd);

    /// Client-side helper used by tools and tests: blocking connect to host:port.
    Result<UniqueFd> connect_to(const std::string& host, std::uint16_t port);

} // namespace bmux::net
