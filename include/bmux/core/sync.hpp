#pragma once
/**
 * @file sync.hpp
 * @brief Small blocking primitives used by the shutdown drain.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace bmux {

/** @class WaitGroup
 *  @brief Counts live workers; wait_until() returns when the count hits zero.
 */
class WaitGroup {
public:
    void add(std::size_t n = 1) {
        std::lock_guard<std::mutex> lk(mu_);
        count_ += n;
    }

    void done() {
        std::lock_guard<std::mutex> lk(mu_);
        if (count_ > 0 && --count_ == 0) cv_.notify_all();
    }

    std::size_t count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return count_;
    }

    /// @return false if the deadline passed with workers still live.
    bool wait_until(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lk(mu_);
        return cv_.wait_until(lk, deadline, [&] { return count_ == 0; });
    }

private:
    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::size_t             count_{0};
};

/** @class OneShotEvent
 *  @brief Latched flag: set() once, waiters wake and stay released.
 */
class OneShotEvent {
public:
    void set() {
        std::lock_guard<std::mutex> lk(mu_);
        set_ = true;
        cv_.notify_all();
    }

    bool is_set() const {
        std::lock_guard<std::mutex> lk(mu_);
        return set_;
    }

    void wait() {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&] { return set_; });
    }

    bool wait_until(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lk(mu_);
        return cv_.wait_until(lk, deadline, [&] { return set_; });
    }

private:
    mutable std::mutex      mu_;
    std::condition_variable cv_;
    bool                    set_{false};
};

} // namespace bmux
