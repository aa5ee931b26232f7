#pragma once
/**
 * @file connection_registry.hpp
 * @brief Live-connection set with cancel-all and drain wait.
 *
 * Thread safety: all members are safe to call concurrently (one mutex).
 * Interrupt callbacks run under the registry lock, so an entry's resources
 * stay valid while it is being interrupted as long as the owner calls
 * remove() before releasing them.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <unordered_map>

namespace bmux::server {

class ConnectionRegistry {
public:
    /// Unblocks whatever the connection is waiting on (e.g. shutdown(SHUT_RD)).
    using Interrupt = std::function<void()>;

    /// Next connection id (starts at 1).
    std::uint64_t next_id() noexcept { return next_id_.fetch_add(1, std::memory_order_relaxed); }

    /// Track a live connection. If cancel_all() already ran, it is cancelled immediately.
    void add(std::uint64_t id, std::stop_source lifetime, Interrupt interrupt);

    /// Forget a connection and wake drain waiters when the set empties.
    void remove(std::uint64_t id);

    /// Cancel every lifetime and run every interrupt; later add() calls are cancelled too.
    void cancel_all();

    /// @return true once empty, false if @p deadline passed first.
    bool wait_empty_until(std::chrono::steady_clock::time_point deadline);

    std::size_t size() const;

private:
    struct Entry {
        std::stop_source lifetime;
        Interrupt        interrupt;
    };

    mutable std::mutex                          mu_;
    std::condition_variable                     cv_;
    std::unordered_map<std::uint64_t, Entry>    entries_;
    bool                                        cancelled_{false};
    std::atomic<std::uint64_t>                  next_id_{1};
};

} // namespace bmux::server
