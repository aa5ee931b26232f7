#pragma once
/**
 * @file server.hpp
 * @brief Public entry point: registration, start, shutdown.
 *
 * Lifecycle:
 *  1. Server::create(config, schema, logger, make_state) validates everything
 *     it can before a socket exists.
 *  2. load_routers()/load_middleware() append registrations.
 *  3. start() compiles the dispatch table once, opens the listener and blocks
 *     in the configured engine until shutdown().
 *  4. shutdown(timeout) stops accepting, cancels every connection and drains.
 *
 * Example:
 * @code
 *   auto srv = bmux::server::Server::create(cfg, schema, logger);
 *   if (!srv) return 1;
 *   (*srv)->load_routers({bmux::routing::make_router("game", true, {echo_route})});
 *   std::jthread t([&] { (void)(*srv)->start(); });
 *   ...
 *   auto r = (*srv)->shutdown(std::chrono::seconds(5));
 * @endcode
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <vector>

#include "bmux/config/config_loader.hpp"
#include "bmux/core/error.hpp"
#include "bmux/core/sync.hpp"
#include "bmux/header/header_schema.hpp"
#include "bmux/obs/logger.hpp"
#include "bmux/obs/observability.hpp"
#include "bmux/routing/context.hpp"
#include "bmux/routing/route.hpp"
#include "bmux/routing/route_registry.hpp"

namespace bmux::server {

class Engine;

/** @class Server
 *  @brief Owns the registry, the engine and the shutdown signal.
 *  @note Thread-safe: shutdown() may be called from any thread while start() blocks.
 */
class Server {
public:
    /**
     * @brief Validate inputs and build a server. Opens nothing.
     * @param logger Sink for every server line; a console logger at
     *        cfg.log_level is created when null.
     * @param make_state Called once per accepted connection; handlers reach
     *        the result through Context::state<T>(). May be empty.
     * @return Configuration error for a null schema or an invalid config.
     */
    static Result<std::unique_ptr<Server>> create(config::ServerConfig cfg, header::SchemaPtr schema,
                                                  std::shared_ptr<obs::Logger> logger = nullptr,
                                                  routing::ConnectionStateFactory make_state = nullptr);

    ~Server();

    Server(const Server&)            = delete;
    Server& operator=(const Server&) = delete;

    /// Append routers (no dedup). Configuration error once started.
    Result<void> load_routers(std::vector<routing::Router> routers);

    /// Append global middleware (no dedup). Configuration error once started.
    Result<void> load_middleware(std::vector<routing::Middleware> middleware);

    /**
     * @brief Compile routes, open the listener and serve until shutdown().
     *
     * Blocks the caller.
     * @return Configuration error from compilation (no socket opened),
     *         Io error if the listener or engine cannot be set up.
     */
    Result<void> start();

    /**
     * @brief start() with an external stop trigger (signal thread, jthread).
     *
     * A stop request on @p trigger calls shutdown(cfg.shutdown_timeout); its
     * result is logged.
     */
    Result<void> start(std::stop_token trigger);

    /**
     * @brief Stop accepting, cancel every connection and wait for the drain.
     * @return ShutdownTimeout if connections are still busy after @p timeout.
     *         The listener is closed either way.
     */
    Result<void> shutdown(std::chrono::milliseconds timeout);

    /// Bound port once listening (0 before).
    [[nodiscard]] std::uint16_t port() const noexcept { return port_.load(std::memory_order_acquire); }

    /// Wait until the listener is bound. @return false on timeout or failed start.
    bool wait_until_listening(std::chrono::milliseconds timeout);

    [[nodiscard]] obs::Counters counters() const noexcept { return counters_->snapshot(); }
    [[nodiscard]] std::size_t active_connections() const noexcept;

    /// Compiled table, or nullptr before start().
    [[nodiscard]] std::shared_ptr<const routing::DispatchTable> dispatch_table() const noexcept {
        return registry_.snapshot();
    }

    [[nodiscard]] const config::ServerConfig& config() const noexcept { return cfg_; }

private:
    Server(config::ServerConfig cfg, header::SchemaPtr schema, std::shared_ptr<obs::Logger> logger,
           routing::ConnectionStateFactory make_state);

    config::ServerConfig                cfg_;
    header::SchemaPtr                   schema_;
    std::shared_ptr<obs::Logger>        log_;
    routing::ConnectionStateFactory     make_state_;
    std::shared_ptr<obs::LiveCounters>  counters_;
    routing::RouteRegistry              registry_;

    mutable std::mutex       mu_;          ///< Guards engine_ and the flags below
    std::shared_ptr<Engine>  engine_;
    bool                     started_{false};
    bool                     stop_requested_{false};

    std::atomic<std::uint16_t> port_{0};
    OneShotEvent               ready_;      ///< Set once listening or once start() failed
    std::atomic<bool>          listening_{false};
};

} // namespace bmux::server
