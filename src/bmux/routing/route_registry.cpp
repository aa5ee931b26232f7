// RouteRegistry: compile-once implementation notes
// The table is published like an RCU snapshot:
//   • compile(): build a private map, then atomic_store (RELEASE).
//   • snapshot(): atomic_load (ACQUIRE) → consistent, lock-free view.
// Nothing mutates the table after publication, so engine threads share it freely.

#include "bmux/routing/route_registry.hpp"

#include <algorithm>
#include <string>

namespace bmux::routing {

std::vector<std::int32_t> DispatchTable::ids() const {
    std::vector<std::int32_t> out;
    out.reserve(handlers_.size());
    for (const auto& kv : handlers_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

RouteRegistry::RouteRegistry(std::shared_ptr<obs::Logger> logger)
    : log_(logger ? std::move(logger) : obs::make_null_logger()) {}

Result<void> RouteRegistry::load_routers(std::vector<Router> routers) {
    std::lock_guard<std::mutex> lk(mu_);
    if (compiled()) {
        return make_error(ErrorKind::Configuration, "routers must be loaded before start");
    }
    for (auto& r : routers) routers_.push_back(std::move(r));
    return {};
}

Result<void> RouteRegistry::load_middleware(std::vector<Middleware> middleware) {
    std::lock_guard<std::mutex> lk(mu_);
    if (compiled()) {
        return make_error(ErrorKind::Configuration, "middleware must be loaded before start");
    }
    for (auto& m : middleware) middleware_.push_back(std::move(m));
    return {};
}

Result<void> RouteRegistry::install_outermost(Middleware m) {
    std::lock_guard<std::mutex> lk(mu_);
    if (compiled()) {
        return make_error(ErrorKind::Configuration, "middleware must be loaded before start");
    }
    middleware_.insert(middleware_.begin(), std::move(m));
    return {};
}

std::size_t RouteRegistry::router_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return routers_.size();
}

std::size_t RouteRegistry::middleware_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return middleware_.size();
}

Result<Handler> RouteRegistry::wrap(Handler h, const std::vector<Middleware>& chain, bool experimental) {
    // Reverse walk: the first registered entry ends up outermost and runs first.
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if (!it->active(experimental)) continue;
        if (!it->transform()) {
            return make_error(ErrorKind::Configuration, "middleware '" + it->name() + "' has no transform");
        }
        h = it->transform()(std::move(h));
        if (!h) {
            return make_error(ErrorKind::Configuration, "middleware '" + it->name() + "' returned an empty handler");
        }
    }
    return h;
}

Result<std::shared_ptr<const DispatchTable>> RouteRegistry::compile(bool experimental) {
    std::lock_guard<std::mutex> lk(mu_);
    if (compiled()) {
        return make_error(ErrorKind::Configuration, "routes already compiled");
    }

    DispatchTable::Map handlers;
    for (const auto& rtr : routers_) {
        if (!rtr.enabled()) {
            log_->debug("Skipping disabled router", {obs::kv("Router", rtr.name())});
            continue;
        }

        for (const auto& rt : rtr.routes()) {
            if (!rt.enabled()) continue;
            if (rt.experimental() && !experimental) continue;

            if (!rt.handler()) {
                return make_error(ErrorKind::Configuration,
                                  "route '" + rt.name() + "' (" + std::to_string(rt.id()) + ") has no handler");
            }

            // Route-level middleware (innermost)
            auto h = wrap(rt.handler(), rt.middleware(), experimental);
            if (!h) return bmux_detail::unexpected(h.error());
            // Router-level middleware
            h = wrap(std::move(*h), rtr.middleware(), experimental);
            if (!h) return bmux_detail::unexpected(h.error());
            // Global middleware (outermost)
            h = wrap(std::move(*h), middleware_, experimental);
            if (!h) return bmux_detail::unexpected(h.error());

            if (handlers.count(rt.id()) != 0) {
                log_->warn("Route id registered twice, later route wins",
                           {obs::kv("Name", rt.name()), obs::kv("RouteID", rt.id())});
            }
            log_->debug("Registering route",
                        {obs::kv("Name", rt.name()), obs::kv("RouteID", rt.id()),
                         obs::kv("Router", rtr.name()), obs::kv("Experimental", rt.experimental()),
                         obs::kv("Status", rt.enabled())});

            handlers.insert_or_assign(rt.id(), std::move(*h));
        }
    }

    auto table = std::make_shared<const DispatchTable>(std::move(handlers));
    // Publish: RELEASE pairs with the ACQUIRE in snapshot().
    std::atomic_store_explicit(&table_, table, std::memory_order_release);
    compiled_.store(true, std::memory_order_release);
    return table;
}

std::shared_ptr<const DispatchTable> RouteRegistry::snapshot() const noexcept {
    return std::atomic_load_explicit(&table_, std::memory_order_acquire);
}

} // namespace bmux::routing
