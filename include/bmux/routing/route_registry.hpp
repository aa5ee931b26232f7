#pragma once
// bmux: RouteRegistry
// Lifecycle: append routers/middleware, compile once, then read-only.
//   • Loading appends (no dedup) and is rejected after compilation.
//   • compile() folds every middleware chain once and publishes an immutable
//     DispatchTable snapshot (shared_ptr, RELEASE); readers load it with ACQUIRE
//     and never lock.
//   • Duplicate ids: the later-registered route overwrites the earlier entry.


#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "bmux/core/error.hpp"
#include "bmux/obs/logger.hpp"
#include "bmux/routing/route.hpp"

namespace bmux::routing {

// -----------------------------------------------------------------------------
// DispatchTable: msg id -> fully wrapped handler. Immutable once built.
// -----------------------------------------------------------------------------
class DispatchTable final {
public:
    using Map = std::unordered_map<std::int32_t, Handler>;

    explicit DispatchTable(Map handlers) noexcept : handlers_(std::move(handlers)) {}

    /// Composed handler for @p id, or nullptr.
    [[nodiscard]] const Handler* find(std::int32_t id) const noexcept {
        auto it = handlers_.find(id);
        return it == handlers_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool contains(std::int32_t id) const noexcept { return handlers_.count(id) != 0; }
    [[nodiscard]] std::size_t size() const noexcept { return handlers_.size(); }

    /// Registered ids, ascending.
    [[nodiscard]] std::vector<std::int32_t> ids() const;

private:
    Map handlers_;
};

// -----------------------------------------------------------------------------
// RouteRegistry
// -----------------------------------------------------------------------------
class RouteRegistry final {
public:
    explicit RouteRegistry(std::shared_ptr<obs::Logger> logger);

    // --------------------------- Loading -------------------------------------
    /// Append routers. Configuration error once compiled.
    Result<void> load_routers(std::vector<Router> routers);

    /// Append global middleware. Configuration error once compiled.
    Result<void> load_middleware(std::vector<Middleware> middleware);

    /// Insert @p m ahead of every global middleware so it runs first.
    Result<void> install_outermost(Middleware m);

    // --------------------------- Compilation ---------------------------------
    /**
     * @brief Build and publish the dispatch table (runs once).
     *
     * Disabled routers and routes are skipped, experimental ones too unless
     * @p experimental. Each handler is wrapped route middleware first, then
     * router middleware, then global middleware, so on dispatch the order is
     * global -> router -> route -> handler, first registered outermost.
     *
     * @return Configuration error on a second call, an empty handler, or an
     *         empty middleware transform.
     */
    Result<std::shared_ptr<const DispatchTable>> compile(bool experimental);

    // --------------------------- Reads ---------------------------------------
    /// Published table, or nullptr before compile().
    [[nodiscard]] std::shared_ptr<const DispatchTable> snapshot() const noexcept;

    [[nodiscard]] bool compiled() const noexcept { return compiled_.load(std::memory_order_acquire); }
    [[nodiscard]] std::size_t router_count() const;
    [[nodiscard]] std::size_t middleware_count() const;

private:
    /// Wrap @p h with every active entry of @p chain, last registered innermost.
    static Result<Handler> wrap(Handler h, const std::vector<Middleware>& chain, bool experimental);

    std::shared_ptr<obs::Logger> log_;

    mutable std::mutex       mu_;          ///< Guards routers_/middleware_ during loading
    std::vector<Router>      routers_;
    std::vector<Middleware>  middleware_;

    std::atomic<bool>                    compiled_{false};
    std::shared_ptr<const DispatchTable> table_;
};

} // namespace bmux::routing
