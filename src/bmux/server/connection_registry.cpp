#include "bmux/server/connection_registry.hpp"

namespace bmux::server {

void ConnectionRegistry::add(std::uint64_t id, std::stop_source lifetime, Interrupt interrupt) {
    std::lock_guard<std::mutex> lk(mu_);
    if (cancelled_) {
        lifetime.request_stop();
        if (interrupt) interrupt();
    }
    entries_.insert_or_assign(id, Entry{std::move(lifetime), std::move(interrupt)});
}

void ConnectionRegistry::remove(std::uint64_t id) {
    std::lock_guard<std::mutex> lk(mu_);
    entries_.erase(id);
    if (entries_.empty()) cv_.notify_all();
}

void ConnectionRegistry::cancel_all() {
    std::lock_guard<std::mutex> lk(mu_);
    cancelled_ = true;
    for (auto& [id, e] : entries_) {
        e.lifetime.request_stop();
        if (e.interrupt) e.interrupt();
    }
}

bool ConnectionRegistry::wait_empty_until(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lk(mu_);
    return cv_.wait_until(lk, deadline, [&] { return entries_.empty(); });
}

std::size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.size();
}

} // namespace bmux::server
