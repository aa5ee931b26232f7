// Threaded engine (Model A)
// Concurrency model: one blocking worker thread per live connection.
//   • The acceptor takes a slot from a counting semaphore before accept(), so
//     connection N+1 waits in the kernel backlog until a worker exits.
//   • Workers run read -> decode -> dispatch strictly in arrival order.
//   • Shutdown cancels each lifetime and shutdown(SHUT_RD)s each socket so a
//     worker blocked in recv() wakes; a worker inside a handler finishes it first.
//   • Workers are detached and co-own the engine state, so an abandoned
//     worker stays valid after a timed-out drain.

#include "bmux/server/engine.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <semaphore>
#include <string>
#include <system_error>
#include <thread>

#include <poll.h>
#include <sys/socket.h>

#include "bmux/config/constants.hpp"
#include "bmux/core/sync.hpp"
#include "bmux/server/connection_registry.hpp"

namespace bmux::server {

namespace {

using Clock = std::chrono::steady_clock;

struct ThreadedState {
    explicit ThreadedState(std::shared_ptr<const EngineContext> c)
        : ctx(std::move(c)),
          slots(static_cast<std::ptrdiff_t>(ctx->cfg.max_connections)) {}

    std::shared_ptr<const EngineContext> ctx;
    std::counting_semaphore<>            slots;      ///< Free connection slots
    ConnectionRegistry                   registry;
    std::atomic<bool>                    stopping{false};

    std::mutex   listener_mu;
    int          listener_fd{-1};  ///< Guarded by listener_mu; owned by run()
    OneShotEvent listener_closed;
};

/** Connection handle for a blocking socket; writes happen on the caller's thread. */
class TcpConnection final : public net::Connection {
public:
    TcpConnection(int fd, std::uint64_t id, std::string peer, std::chrono::milliseconds write_timeout)
        : fd_(fd), id_(id), peer_(std::move(peer)), write_timeout_(write_timeout) {}

    std::uint64_t id() const noexcept override { return id_; }
    const std::string& remote_address() const noexcept override { return peer_; }

    Result<void> send(std::span<const std::byte> head, std::span<const std::byte> body) override {
        std::lock_guard<std::mutex> lk(write_mu_);
        return wire::write_envelope(fd_, head, body, write_timeout_);
    }

    void close() noexcept override { close_requested_.store(true, std::memory_order_relaxed); }

    bool close_requested() const noexcept { return close_requested_.load(std::memory_order_relaxed); }

private:
    int                       fd_;
    std::uint64_t             id_;
    std::string               peer_;
    std::chrono::milliseconds write_timeout_;
    std::mutex                write_mu_;
    std::atomic<bool>         close_requested_{false};
};

void serve_connection(std::shared_ptr<ThreadedState> st, net::UniqueFd fd, std::uint64_t id) {
    const EngineContext& ctx = *st->ctx;
    const int raw = fd.get();
    TcpConnection conn(raw, id, net::format_peer(raw), ctx.cfg.write_timeout);

    if (ctx.cfg.keep_alive) {
        if (auto r = net::set_keep_alive(raw, true); !r) {
            ctx.log->debug("keep-alive not enabled", {obs::kv("remote", conn.remote_address()),
                                                      obs::kv("error", r.error().message)});
        }
    }

    std::stop_source lifetime;
    st->registry.add(id, lifetime, [raw] { ::shutdown(raw, SHUT_RD); });
    ctx.log->debug("connection opened", {obs::kv("remote", conn.remote_address()), obs::kv("conn", id)});

    // Between envelopes the connection is idle; mid-envelope the read timeout applies.
    const wire::ReadDeadlines deadlines{
        .prefix  = ctx.cfg.idle_timeout.count() > 0 ? ctx.cfg.idle_timeout : ctx.cfg.read_timeout,
        .payload = ctx.cfg.read_timeout,
    };

    auto state = make_connection_state(ctx);
    if (!state) {
        ctx.log->error("closing connection", {obs::kv("remote", conn.remote_address()),
                                              obs::kv("error", state.error().message)});
    }

    while (state && !lifetime.stop_requested()) {
        std::size_t consumed = 0;
        auto env = wire::read_envelope(raw, deadlines, &consumed);
        if (!env) {
            if (!lifetime.stop_requested()) {
                // A close or idle expiry on an envelope boundary is not a framing failure.
                if (consumed > 0) obs::LiveCounters::bump(ctx.counters->framing_failures);
                ctx.log->debug("closing connection",
                               {obs::kv("remote", conn.remote_address()),
                                obs::kv("reason", env.error().message)});
            }
            break;
        }
        obs::LiveCounters::bump(ctx.counters->frames);

        auto action = handle_envelope(ctx, conn, lifetime.get_token(), *state, std::move(*env));
        if (!action) {
            ctx.log->warn("failed to decode header, closing connection",
                          {obs::kv("remote", conn.remote_address()),
                           obs::kv("kind", to_string(action.error().kind)),
                           obs::kv("error", action.error().message)});
            break;
        }
        if (*action == routing::Action::Close || conn.close_requested()) break;
    }

    // Deregister before the fd is released so cancel_all() never touches a reused fd.
    st->registry.remove(id);
    lifetime.request_stop();
    fd.reset();
    obs::LiveCounters::bump(ctx.counters->closed);
    st->slots.release();
    ctx.log->debug("connection closed", {obs::kv("conn", id)});
}

class ThreadedEngine final : public Engine {
public:
    explicit ThreadedEngine(std::shared_ptr<const EngineContext> ctx)
        : st_(std::make_shared<ThreadedState>(std::move(ctx))) {}

    Result<void> run(net::UniqueFd listener) override {
        const EngineContext& ctx = *st_->ctx;
        {
            std::lock_guard<std::mutex> lk(st_->listener_mu);
            if (st_->stopping.load(std::memory_order_acquire)) {
                listener.reset();
                st_->listener_closed.set();
                return {};
            }
            if (auto r = net::set_nonblocking(listener.get()); !r) {
                listener.reset();
                st_->listener_closed.set();
                return r;
            }
            st_->listener_fd = listener.get();
        }

        const auto tick = std::chrono::milliseconds(config::constants::ACCEPT_POLL_TICK_MS);
        while (!st_->stopping.load(std::memory_order_acquire)) {
            // At capacity: hold off accept() until a worker frees its slot.
            if (!st_->slots.try_acquire_for(tick)) continue;

            pollfd p{listener.get(), POLLIN, 0};
            const int rc = ::poll(&p, 1, static_cast<int>(tick.count()));
            if (rc <= 0 || st_->stopping.load(std::memory_order_acquire)) {
                st_->slots.release();
                if (rc < 0 && errno != EINTR) {
                    ctx.log->error("poll on listener failed", {obs::kv("error", std::strerror(errno))});
                }
                continue;
            }

            const int cfd = ::accept4(listener.get(), nullptr, nullptr, SOCK_CLOEXEC);
            if (cfd < 0) {
                const int err = errno;
                st_->slots.release();
                if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR || err == ECONNABORTED) continue;
                if (st_->stopping.load(std::memory_order_acquire)) break;
                ctx.log->warn("accept failed", {obs::kv("error", std::strerror(err))});
                continue;
            }

            net::UniqueFd conn_fd(cfd);
            obs::LiveCounters::bump(ctx.counters->accepted);
            const std::uint64_t id = st_->registry.next_id();
            try {
                std::thread(serve_connection, st_, std::move(conn_fd), id).detach();
            } catch (const std::system_error& e) {
                st_->slots.release();
                ctx.log->error("failed to start connection worker", {obs::kv("error", e.what())});
            }
        }

        {
            std::lock_guard<std::mutex> lk(st_->listener_mu);
            st_->listener_fd = -1;
            listener.reset();
        }
        st_->listener_closed.set();
        return {};
    }

    Result<void> shutdown(Clock::time_point deadline) override {
        st_->stopping.store(true, std::memory_order_release);
        {
            // Stops the kernel accepting and wakes the acceptor's poll().
            std::lock_guard<std::mutex> lk(st_->listener_mu);
            if (st_->listener_fd >= 0) ::shutdown(st_->listener_fd, SHUT_RDWR);
        }
        st_->registry.cancel_all();

        const bool closed  = st_->listener_closed.wait_until(deadline);
        const bool drained = st_->registry.wait_empty_until(deadline);
        if (!closed || !drained) {
            return make_error(ErrorKind::ShutdownTimeout,
                              std::to_string(st_->registry.size()) + " connection worker(s) still busy");
        }
        return {};
    }

    std::size_t active_connections() const noexcept override {
        return st_->registry.size();
    }

private:
    std::shared_ptr<ThreadedState> st_;
};

} // namespace

std::unique_ptr<Engine> make_threaded_engine(std::shared_ptr<const EngineContext> ctx) {
    return std::make_unique<ThreadedEngine>(std::move(ctx));
}

} // namespace bmux::server
