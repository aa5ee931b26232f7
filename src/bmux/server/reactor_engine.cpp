// Reactor engine (Model B)
// Concurrency model: a fixed set of epoll loops, each owning its connections.
//   • Loop 0 also owns the listener. It accepts until EAGAIN and hands each
//     socket round-robin to a loop through a locked inbox plus an eventfd wake.
//   • Over the connection limit a new socket is closed on open, not queued.
//   • Partial frames stay in a per-connection FrameDecoder; messages of one
//     connection are dispatched in order on its loop thread.
//   • Timeouts (idle, read, write) are swept every REACTOR_TICK_MS. A read
//     deadline runs from the start of the prefix, header or body stage the
//     connection is in, so trickled bytes do not extend it.
//   • Loop threads are detached and co-own the engine state, so an abandoned
//     loop stays valid after a timed-out drain.

#include "bmux/server/engine.hpp"

#include <algorithm>
#include <any>
#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include "bmux/config/constants.hpp"
#include "bmux/core/sync.hpp"
#include "bmux/os/affinity.hpp"
#include "bmux/server/connection_registry.hpp"

namespace bmux::server {

namespace {

using Clock = std::chrono::steady_clock;
using Stage = wire::FrameDecoder::Stage;
namespace K = config::constants;

constexpr std::uint64_t kWakeTag   = ~std::uint64_t{0};
constexpr std::uint64_t kListenTag = ~std::uint64_t{0} - 1;

constexpr std::uint32_t kReadEvents  = EPOLLIN | EPOLLRDHUP;
constexpr std::uint32_t kWriteEvents = EPOLLIN | EPOLLRDHUP | EPOLLOUT;

/** Connection handle for a non-blocking socket; output is buffered on its loop. */
class ReactorConnection final : public net::Connection {
public:
    ReactorConnection(net::UniqueFd fd, std::uint64_t id, std::string peer, int epfd)
        : fd_(std::move(fd)), id_(id), peer_(std::move(peer)), epfd_(epfd),
          stage_since_(Clock::now()) {}

    std::uint64_t id() const noexcept override { return id_; }
    const std::string& remote_address() const noexcept override { return peer_; }

    Result<void> send(std::span<const std::byte> head, std::span<const std::byte> body) override {
        if (broken_) return make_error(ErrorKind::Io, "connection " + std::to_string(id_) + " is broken");
        auto frame = wire::encode_envelope(head, body);
        if (!frame) return bmux_detail::unexpected(frame.error());
        out_.insert(out_.end(), frame->begin(), frame->end());
        return flush();
    }

    void close() noexcept override { close_requested_ = true; }

    /// Write as much buffered output as the socket takes; arms EPOLLOUT for the rest.
    Result<void> flush() {
        while (out_pos_ < out_.size()) {
            const ssize_t n = ::send(fd_.get(), out_.data() + out_pos_, out_.size() - out_pos_, MSG_NOSIGNAL);
            if (n > 0) {
                out_pos_ += static_cast<std::size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                if (!want_write_) {
                    want_write_    = true;
                    pending_since_ = Clock::now();
                    if (auto r = set_interest(kWriteEvents); !r) return r;
                }
                return {};
            }
            broken_ = true;
            return make_error(ErrorKind::Io, std::string("send failed: ") + std::strerror(errno));
        }
        out_.clear();
        out_pos_ = 0;
        if (want_write_) {
            want_write_ = false;
            return set_interest(kReadEvents);
        }
        return {};
    }

    int fd() const noexcept { return fd_.get(); }
    bool close_requested() const noexcept { return close_requested_; }
    bool has_pending_output() const noexcept { return out_pos_ < out_.size(); }

    wire::FrameDecoder decoder;
    std::stop_source   lifetime;
    std::any           state;

    Stage             stage() const noexcept { return stage_; }
    Clock::time_point stage_since() const noexcept { return stage_since_; }
    Clock::time_point pending_since() const noexcept { return pending_since_; }

    /// A frame was handled: the wait for the next prefix starts now.
    void frame_done(Clock::time_point now) noexcept {
        stage_       = Stage::Prefix;
        stage_since_ = now;
    }

    /// Restart the stage clock when the decoder moved past a prefix or header.
    void track_stage(Clock::time_point now) noexcept {
        const Stage s = decoder.stage();
        if (s == stage_) return;
        stage_       = s;
        stage_since_ = now;
    }

private:
    Result<void> set_interest(std::uint32_t events) {
        epoll_event ev{};
        ev.events   = events;
        ev.data.u64 = static_cast<std::uint64_t>(fd_.get());
        if (::epoll_ctl(epfd_, EPOLL_CTL_MOD, fd_.get(), &ev) != 0) {
            broken_ = true;
            return make_error(ErrorKind::Io, std::string("epoll_ctl(MOD) failed: ") + std::strerror(errno));
        }
        return {};
    }

    net::UniqueFd          fd_;
    std::uint64_t          id_;
    std::string            peer_;
    int                    epfd_;
    std::vector<std::byte> out_;
    std::size_t            out_pos_{0};
    bool                   want_write_{false};
    bool                   broken_{false};
    bool                   close_requested_{false};
    Stage                  stage_{Stage::Prefix};
    Clock::time_point      stage_since_;
    Clock::time_point      pending_since_{};
};

struct PendingConn {
    net::UniqueFd fd;
    std::uint64_t id{0};
};

/** One epoll loop. Everything but the inbox is touched only by its own thread. */
struct ReactorLoop {
    std::size_t   index{0};
    net::UniqueFd epfd;
    net::UniqueFd wakefd;

    std::mutex               inbox_mu;
    std::vector<PendingConn> inbox;

    std::unordered_map<int, std::unique_ptr<ReactorConnection>> conns;

    void wake() noexcept {
        const std::uint64_t one = 1;
        // A full counter already guarantees a pending wake-up.
        [[maybe_unused]] const ssize_t n = ::write(wakefd.get(), &one, sizeof(one));
    }
};

struct ReactorState {
    explicit ReactorState(std::shared_ptr<const EngineContext> c) : ctx(std::move(c)) {}

    std::shared_ptr<const EngineContext>      ctx;
    std::vector<std::unique_ptr<ReactorLoop>> loops;     ///< Fixed once run() starts the threads
    std::atomic<bool>                         stopping{false};
    std::atomic<std::size_t>                  active{0};
    std::size_t                               next_loop{0};  ///< Loop 0 only

    /// Lifetimes by connection id, so shutdown() can cancel handlers that block a loop.
    ConnectionRegistry lifetimes;

    std::mutex    listener_mu;   ///< Guards listener and loops during setup/teardown
    net::UniqueFd listener;
    OneShotEvent  listener_closed;
    OneShotEvent  stop_requested;
    WaitGroup     running;
};

void close_connection(ReactorState& st, ReactorLoop& loop, int fd, const char* reason) {
    auto it = loop.conns.find(fd);
    if (it == loop.conns.end()) return;
    std::unique_ptr<ReactorConnection> conn = std::move(it->second);
    loop.conns.erase(it);

    const EngineContext& ctx = *st.ctx;
    if (conn->has_pending_output()) {
        if (auto r = conn->flush(); !r) {
            ctx.log->debug("dropping unsent output", {obs::kv("conn", conn->id()),
                                                      obs::kv("error", r.error().message)});
        }
    }
    if (::epoll_ctl(loop.epfd.get(), EPOLL_CTL_DEL, fd, nullptr) != 0) {
        ctx.log->debug("epoll_ctl(DEL) failed", {obs::kv("conn", conn->id()),
                                                 obs::kv("error", std::strerror(errno))});
    }
    st.lifetimes.remove(conn->id());
    conn->lifetime.request_stop();
    ctx.log->debug("connection closed", {obs::kv("conn", conn->id()),
                                         obs::kv("remote", conn->remote_address()),
                                         obs::kv("reason", reason)});
    conn.reset();

    st.active.fetch_sub(1, std::memory_order_acq_rel);
    obs::LiveCounters::bump(ctx.counters->closed);
}

/// Move handed-over sockets into this loop's epoll set.
void adopt_pending(ReactorState& st, ReactorLoop& loop) {
    std::vector<PendingConn> batch;
    {
        std::lock_guard<std::mutex> lk(loop.inbox_mu);
        batch.swap(loop.inbox);
    }

    const EngineContext& ctx = *st.ctx;
    for (auto& p : batch) {
        if (st.stopping.load(std::memory_order_acquire)) {
            p.fd.reset();
            st.active.fetch_sub(1, std::memory_order_acq_rel);
            obs::LiveCounters::bump(ctx.counters->closed);
            continue;
        }

        const int fd = p.fd.get();
        if (ctx.cfg.keep_alive) {
            if (auto r = net::set_keep_alive(fd, true); !r) {
                ctx.log->debug("keep-alive not enabled", {obs::kv("error", r.error().message)});
            }
        }
        std::string peer = net::format_peer(fd);
        auto conn = std::make_unique<ReactorConnection>(std::move(p.fd), p.id, peer, loop.epfd.get());

        auto state = make_connection_state(ctx);
        if (!state) {
            ctx.log->error("closing connection", {obs::kv("remote", peer),
                                                  obs::kv("error", state.error().message)});
            conn.reset();
            st.active.fetch_sub(1, std::memory_order_acq_rel);
            obs::LiveCounters::bump(ctx.counters->closed);
            continue;
        }
        conn->state = std::move(*state);

        epoll_event ev{};
        ev.events   = kReadEvents;
        ev.data.u64 = static_cast<std::uint64_t>(fd);
        if (::epoll_ctl(loop.epfd.get(), EPOLL_CTL_ADD, fd, &ev) != 0) {
            ctx.log->warn("epoll_ctl(ADD) failed, dropping connection",
                          {obs::kv("remote", peer), obs::kv("error", std::strerror(errno))});
            conn.reset();
            st.active.fetch_sub(1, std::memory_order_acq_rel);
            obs::LiveCounters::bump(ctx.counters->closed);
            continue;
        }
        st.lifetimes.add(p.id, conn->lifetime, {});
        ctx.log->debug("connection opened", {obs::kv("remote", peer), obs::kv("conn", p.id),
                                             obs::kv("loop", loop.index)});
        loop.conns.emplace(fd, std::move(conn));
    }
}

/// Loop 0: accept until EAGAIN, closing on open anything over the limit.
void accept_ready(ReactorState& st) {
    const EngineContext& ctx = *st.ctx;
    const int lfd = st.listener.get();
    while (!st.stopping.load(std::memory_order_acquire)) {
        const int cfd = ::accept4(lfd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (cfd < 0) {
            if (errno == EINTR || errno == ECONNABORTED) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                ctx.log->warn("accept failed", {obs::kv("error", std::strerror(errno))});
            }
            return;
        }
        net::UniqueFd fd(cfd);

        // Only this thread increments, so check-then-add cannot overshoot.
        if (st.active.load(std::memory_order_acquire) >= ctx.cfg.max_connections) {
            obs::LiveCounters::bump(ctx.counters->rejected);
            ctx.log->warn("connection limit reached, closing new connection",
                          {obs::kv("remote", net::format_peer(cfd)),
                           obs::kv("max_connections", ctx.cfg.max_connections)});
            continue;
        }
        st.active.fetch_add(1, std::memory_order_acq_rel);
        obs::LiveCounters::bump(ctx.counters->accepted);

        ReactorLoop& target = *st.loops[st.next_loop++ % st.loops.size()];
        {
            std::lock_guard<std::mutex> lk(target.inbox_mu);
            target.inbox.push_back(PendingConn{std::move(fd), st.lifetimes.next_id()});
        }
        target.wake();
    }
}

/// Feed completed frames of @p c to the dispatcher. @return false to close.
bool drain_frames(ReactorState& st, ReactorConnection& c) {
    const EngineContext& ctx = *st.ctx;
    while (auto env = c.decoder.next()) {
        obs::LiveCounters::bump(ctx.counters->frames);
        auto action = handle_envelope(ctx, c, c.lifetime.get_token(), c.state, std::move(*env));
        if (!action) {
            ctx.log->warn("failed to decode header, closing connection",
                          {obs::kv("remote", c.remote_address()),
                           obs::kv("kind", to_string(action.error().kind)),
                           obs::kv("error", action.error().message)});
            return false;
        }
        if (*action == routing::Action::Close || c.close_requested()) return false;
        if (st.stopping.load(std::memory_order_acquire)) return false;
        c.frame_done(Clock::now());
    }
    return true;
}

/// Read until EAGAIN. @return false to close.
bool on_readable(ReactorState& st, ReactorConnection& c, std::span<std::byte> scratch) {
    while (true) {
        const ssize_t n = ::recv(c.fd(), scratch.data(), scratch.size(), 0);
        if (n > 0) {
            c.decoder.feed(scratch.first(static_cast<std::size_t>(n)));
            if (!drain_frames(st, c)) return false;
            c.track_stage(Clock::now());
            continue;
        }
        if (n == 0) {
            if (c.decoder.mid_frame()) {
                obs::LiveCounters::bump(st.ctx->counters->framing_failures);
                st.ctx->log->debug("stream closed mid-frame",
                                   {obs::kv("remote", c.remote_address()),
                                    obs::kv("buffered", c.decoder.buffered())});
            }
            return false;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        st.ctx->log->debug("recv failed", {obs::kv("remote", c.remote_address()),
                                           obs::kv("error", std::strerror(errno))});
        return false;
    }
}

void on_conn_event(ReactorState& st, ReactorLoop& loop, int fd, std::uint32_t events,
                   std::span<std::byte> scratch) {
    auto it = loop.conns.find(fd);
    if (it == loop.conns.end()) return;
    ReactorConnection& c = *it->second;

    bool keep = (events & EPOLLERR) == 0;
    if (keep && (events & (EPOLLIN | EPOLLRDHUP | EPOLLHUP))) keep = on_readable(st, c, scratch);
    if (keep && (events & EPOLLOUT)) {
        if (auto r = c.flush(); !r) {
            st.ctx->log->debug("flush failed", {obs::kv("remote", c.remote_address()),
                                                obs::kv("error", r.error().message)});
            keep = false;
        }
    }
    if (!keep || c.close_requested()) close_connection(st, loop, fd, keep ? "closed by handler" : "read side done");
}

/// Close connections past their idle, read or write deadline.
void sweep_timeouts(ReactorState& st, ReactorLoop& loop, Clock::time_point now) {
    const auto& cfg = st.ctx->cfg;
    const auto wait_next = cfg.idle_timeout.count() > 0 ? cfg.idle_timeout : cfg.read_timeout;

    std::vector<std::pair<int, const char*>> expired;
    for (const auto& [fd, c] : loop.conns) {
        const auto waited = now - c->stage_since();
        if (c->stage() != Stage::Prefix) {
            if (cfg.read_timeout.count() > 0 && waited >= cfg.read_timeout) {
                obs::LiveCounters::bump(st.ctx->counters->framing_failures);
                expired.emplace_back(fd, "read deadline exceeded mid-frame");
                continue;
            }
        } else if (c->decoder.mid_frame()) {
            if (wait_next.count() > 0 && waited >= wait_next) {
                obs::LiveCounters::bump(st.ctx->counters->framing_failures);
                expired.emplace_back(fd, "read deadline exceeded mid-prefix");
                continue;
            }
        } else if (wait_next.count() > 0 && waited >= wait_next && !c->has_pending_output()) {
            expired.emplace_back(fd, "idle timeout");
            continue;
        }
        if (cfg.write_timeout.count() > 0 && c->has_pending_output() &&
            now - c->pending_since() >= cfg.write_timeout) {
            expired.emplace_back(fd, "write deadline exceeded");
        }
    }
    for (const auto& [fd, reason] : expired) close_connection(st, loop, fd, reason);
}

void run_loop(std::shared_ptr<ReactorState> sp, std::size_t index) {
    ReactorState& st = *sp;
    ReactorLoop& loop = *st.loops[index];
    const EngineContext& ctx = *st.ctx;

    if (ctx.cfg.multicore) {
        const int cpu = os::nth_usable_cpu(static_cast<unsigned>(index));
        if (cpu < 0 || !os::pin_current_thread(cpu)) {
            ctx.log->debug("loop not pinned", {obs::kv("loop", index), obs::kv("cpu", cpu)});
        }
    }

    std::vector<epoll_event> events(K::REACTOR_MAX_EVENTS);
    std::vector<std::byte>   scratch(K::REACTOR_READ_CHUNK);

    while (!st.stopping.load(std::memory_order_acquire)) {
        const int n = ::epoll_wait(loop.epfd.get(), events.data(), static_cast<int>(events.size()),
                                   static_cast<int>(K::REACTOR_TICK_MS));
        if (n < 0) {
            if (errno == EINTR) continue;
            ctx.log->error("epoll_wait failed, stopping loop",
                           {obs::kv("loop", index), obs::kv("error", std::strerror(errno))});
            break;
        }
        for (int i = 0; i < n; ++i) {
            const std::uint64_t tag = events[i].data.u64;
            if (tag == kWakeTag) {
                std::uint64_t drained = 0;
                [[maybe_unused]] const ssize_t r = ::read(loop.wakefd.get(), &drained, sizeof(drained));
                adopt_pending(st, loop);
            } else if (tag == kListenTag) {
                accept_ready(st);
            } else {
                on_conn_event(st, loop, static_cast<int>(tag), events[i].events, scratch);
            }
            if (st.stopping.load(std::memory_order_acquire)) break;
        }
        sweep_timeouts(st, loop, Clock::now());
    }

    // Teardown: connections handed over but never adopted, then live ones.
    adopt_pending(st, loop);
    std::vector<int> fds;
    fds.reserve(loop.conns.size());
    for (const auto& [fd, c] : loop.conns) fds.push_back(fd);
    for (int fd : fds) close_connection(st, loop, fd, "server shutting down");

    if (index == 0) {
        std::lock_guard<std::mutex> lk(st.listener_mu);
        st.listener.reset();
        st.listener_closed.set();
    }
    ctx.log->debug("loop stopped", {obs::kv("loop", index)});
    st.running.done();
}

Result<std::unique_ptr<ReactorLoop>> make_loop(std::size_t index) {
    auto loop = std::make_unique<ReactorLoop>();
    loop->index = index;
    loop->epfd.reset(::epoll_create1(EPOLL_CLOEXEC));
    if (!loop->epfd.valid()) {
        return make_error(ErrorKind::Io, std::string("epoll_create1 failed: ") + std::strerror(errno));
    }
    loop->wakefd.reset(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC));
    if (!loop->wakefd.valid()) {
        return make_error(ErrorKind::Io, std::string("eventfd failed: ") + std::strerror(errno));
    }
    epoll_event ev{};
    ev.events   = EPOLLIN;
    ev.data.u64 = kWakeTag;
    if (::epoll_ctl(loop->epfd.get(), EPOLL_CTL_ADD, loop->wakefd.get(), &ev) != 0) {
        return make_error(ErrorKind::Io, std::string("epoll_ctl(wake) failed: ") + std::strerror(errno));
    }
    return loop;
}

class ReactorEngine final : public Engine {
public:
    explicit ReactorEngine(std::shared_ptr<const EngineContext> ctx)
        : st_(std::make_shared<ReactorState>(std::move(ctx))) {}

    Result<void> run(net::UniqueFd listener) override {
        if (auto r = start_loops(std::move(listener)); !r) {
            st_->stopping.store(true, std::memory_order_release);
            wake_all();
            return r;
        }
        // The loops do the work; the caller blocks until shutdown() is requested.
        st_->stop_requested.wait();
        return {};
    }

    Result<void> shutdown(Clock::time_point deadline) override {
        st_->stopping.store(true, std::memory_order_release);
        {
            std::lock_guard<std::mutex> lk(st_->listener_mu);
            if (st_->listener.valid()) ::shutdown(st_->listener.get(), SHUT_RDWR);
        }
        st_->lifetimes.cancel_all();
        wake_all();
        st_->stop_requested.set();

        const bool closed  = st_->listener_closed.wait_until(deadline);
        const bool drained = st_->running.wait_until(deadline);
        if (!closed || !drained) {
            return make_error(ErrorKind::ShutdownTimeout,
                              std::to_string(st_->running.count()) + " event loop(s) still busy");
        }
        return {};
    }

    std::size_t active_connections() const noexcept override {
        return st_->active.load(std::memory_order_acquire);
    }

private:
    Result<void> start_loops(net::UniqueFd listener) {
        const EngineContext& ctx = *st_->ctx;
        std::lock_guard<std::mutex> lk(st_->listener_mu);

        // Closes the listener (once) on every early exit.
        auto fail = [&](Error e) -> Result<void> {
            listener.reset();
            st_->listener_closed.set();
            return bmux_detail::unexpected(std::move(e));
        };

        if (st_->stopping.load(std::memory_order_acquire)) {
            listener.reset();
            st_->listener_closed.set();
            st_->stop_requested.set();
            return {};
        }
        if (auto r = net::set_nonblocking(listener.get()); !r) return fail(r.error());

        const std::size_t n = ctx.cfg.multicore
            ? std::min<std::size_t>(os::usable_cpus(), K::REACTOR_MAX_LOOPS)
            : 1;
        for (std::size_t i = 0; i < n; ++i) {
            auto loop = make_loop(i);
            if (!loop) return fail(loop.error());
            st_->loops.push_back(std::move(*loop));
        }

        epoll_event ev{};
        ev.events   = EPOLLIN;
        ev.data.u64 = kListenTag;
        if (::epoll_ctl(st_->loops[0]->epfd.get(), EPOLL_CTL_ADD, listener.get(), &ev) != 0) {
            return fail(Error{ErrorKind::Io, std::string("epoll_ctl(listener) failed: ") + std::strerror(errno)});
        }
        st_->listener = std::move(listener);

        ctx.log->info("reactor started", {obs::kv("loops", n)});
        for (std::size_t i = 0; i < n; ++i) {
            st_->running.add();
            try {
                std::thread(run_loop, st_, i).detach();
            } catch (const std::system_error& e) {
                st_->running.done();
                if (i == 0) {
                    st_->listener.reset();
                    st_->listener_closed.set();
                }
                return make_error(ErrorKind::Io, std::string("failed to start event loop: ") + e.what());
            }
        }
        return {};
    }

    void wake_all() {
        std::lock_guard<std::mutex> lk(st_->listener_mu);
        for (auto& loop : st_->loops) loop->wake();
    }

    std::shared_ptr<ReactorState> st_;
};

} // namespace

std::unique_ptr<Engine> make_reactor_engine(std::shared_ptr<const EngineContext> ctx) {
    return std::make_unique<ReactorEngine>(std::move(ctx));
}

} // namespace bmux::server
