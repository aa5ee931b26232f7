#include "bmux/net/socket.hpp"

#include <cerrno>
#include <cstring>

// Platform headers
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include "bmux/config/constants.hpp"

namespace bmux::net {

void UniqueFd::reset(int fd) noexcept {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
}

static std::string errno_text(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

Result<UniqueFd> open_listener(const config::ServerConfig& cfg) {
    addrinfo hints{};
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags    = AI_PASSIVE;
    if (cfg.protocol == "tcp4")      hints.ai_family = AF_INET;
    else if (cfg.protocol == "tcp6") hints.ai_family = AF_INET6;
    else                             hints.ai_family = AF_UNSPEC;

    const std::string port = std::to_string(cfg.port);
    addrinfo* res = nullptr;
    if (int rc = ::getaddrinfo(cfg.address.c_str(), port.c_str(), &hints, &res); rc != 0) {
        return make_error(ErrorKind::Io, "resolve " + cfg.address + ": " + ::gai_strerror(rc));
    }

    std::string last_error = "no usable address";
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        UniqueFd fd(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
        if (!fd.valid()) { last_error = errno_text("socket"); continue; }

        // Allow address reuse
        int opt = 1;
        if (::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
            last_error = errno_text("setsockopt(SO_REUSEADDR)");
            continue;
        }
        if (::bind(fd.get(), ai->ai_addr, ai->ai_addrlen) < 0) {
            last_error = errno_text("bind");
            continue;
        }
        if (::listen(fd.get(), config::constants::SERVER_LISTEN_BACKLOG) < 0) {
            last_error = errno_text("listen");
            continue;
        }
        ::freeaddrinfo(res);
        return fd;
    }
    ::freeaddrinfo(res);
    return make_error(ErrorKind::Io, cfg.protocol + "://" + cfg.address + ":" + port + ": " + last_error);
}

Result<std::uint16_t> local_port(int fd) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return make_error(ErrorKind::Io, errno_text("getsockname"));
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
    }
    return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
}

Result<void> set_write_timeout(int fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    if (timeout.count() > 0) {
        tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    }
    if (::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        return make_error(ErrorKind::Io, errno_text("setsockopt(SO_SNDTIMEO)"));
    }
    return {};
}

Result<void> set_keep_alive(int fd, bool enabled) {
    int opt = enabled ? 1 : 0;
    if (::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt)) < 0) {
        return make_error(ErrorKind::Io, errno_text("setsockopt(SO_KEEPALIVE)"));
    }
    return {};
}

Result<void> set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return make_error(ErrorKind::Io, errno_text("fcntl(O_NONBLOCK)"));
    }
    return {};
}

Result<void> read_full(int fd, std::span<std::byte> out, std::chrono::milliseconds timeout,
                       std::size_t* transferred) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + timeout;
    std::size_t got = 0;

    auto fail = [&](std::string what) {
        if (transferred != nullptr) *transferred = got;
        return make_error(ErrorKind::Framing, std::move(what) + " after " + std::to_string(got) +
                                              " of " + std::to_string(out.size()) + " bytes");
    };

    while (got < out.size()) {
        // The budget covers the whole call, not each recv().
        if (timeout.count() > 0) {
            const auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - Clock::now());
            if (left.count() <= 0) return fail("read deadline exceeded");
            pollfd p{fd, POLLIN, 0};
            const int rc = ::poll(&p, 1, static_cast<int>(left.count()));
            if (rc == 0) return fail("read deadline exceeded");
            if (rc < 0) {
                if (errno == EINTR) continue;
                return fail(errno_text("poll"));
            }
        }
        ssize_t n = ::recv(fd, out.data() + got, out.size() - got, 0);
        if (n > 0) {
            got += static_cast<std::size_t>(n);
            continue;
        }
        if (n == 0) return fail("stream closed");
        if (errno == EINTR) continue;
        if ((errno == EAGAIN || errno == EWOULDBLOCK) && timeout.count() > 0) continue;
        return fail(errno_text("recv"));
    }
    if (transferred != nullptr) *transferred = got;
    return {};
}

Result<void> write_full(int fd, std::span<const std::byte> data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n >= 0) {
            sent += static_cast<std::size_t>(n);
            continue;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return make_error(ErrorKind::Io, "write deadline exceeded");
        }
        return make_error(ErrorKind::Io, errno_text("send"));
    }
    return {};
}

std::string format_peer(int fd) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) return "unknown";

    char host[INET6_ADDRSTRLEN] = {0};
    std::uint16_t port = 0;
    if (addr.ss_family == AF_INET6) {
        const auto* a = reinterpret_cast<const sockaddr_in6*>(&addr);
        ::inet_ntop(AF_INET6, &a->sin6_addr, host, sizeof(host));
        port = ntohs(a->sin6_port);
        return std::string("[") + host + "]:" + std::to_string(port);
    }
    const auto* a = reinterpret_cast<const sockaddr_in*>(&addr);
    ::inet_ntop(AF_INET, &a->sin_addr, host, sizeof(host));
    port = ntohs(a->sin_port);
    return std::string(host) + ":" + std::to_string(port);
}

Result<UniqueFd> connect_to(const std::string& host, std::uint16_t port) {
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    const std::string service = std::to_string(port);
    addrinfo* res = nullptr;
    if (int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res); rc != 0) {
        return make_error(ErrorKind::Io, "resolve " + host + ": " + ::gai_strerror(rc));
    }
    std::string last_error = "no usable address";
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        UniqueFd fd(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
        if (!fd.valid()) { last_error = errno_text("socket"); continue; }
        if (::connect(fd.get(), ai->ai_addr, ai->ai_addrlen) < 0) {
            last_error = errno_text("connect");
            continue;
        }
        ::freeaddrinfo(res);
        return fd;
    }
    ::freeaddrinfo(res);
    return make_error(ErrorKind::Io, host + ":" + service + ": " + last_error);
}

} // namespace bmux::net
