#pragma once
/**
 * @file engine.hpp
 * @brief Connection engines: the seam between the server and its concurrency model.
 *
 * Two implementations honor the same framing and dispatch contract:
 *  - threaded: blocking worker per connection, accept waits for a free slot
 *  - reactor:  fixed set of epoll loops, over-limit connections closed on open
 */

#include <any>
#include <chrono>
#include <cstddef>
#include <memory>
#include <stop_token>

#include "bmux/config/config_loader.hpp"
#include "bmux/core/error.hpp"
#include "bmux/header/header_schema.hpp"
#include "bmux/net/connection.hpp"
#include "bmux/net/socket.hpp"
#include "bmux/obs/logger.hpp"
#include "bmux/obs/observability.hpp"
#include "bmux/routing/context.hpp"
#include "bmux/routing/dispatcher.hpp"
#include "bmux/wire/envelope.hpp"

namespace bmux::server {

/** @struct EngineContext
 *  @brief Read-only state shared by every connection of an engine.
 */
struct EngineContext {
    config::ServerConfig                  cfg;
    header::SchemaPtr                     schema;
    std::shared_ptr<routing::Dispatcher>  dispatcher;
    std::shared_ptr<obs::Logger>          log;
    std::shared_ptr<obs::LiveCounters>    counters;
    routing::ConnectionStateFactory       make_state;  ///< May be empty
};

/** @class Engine
 *  @brief Owns connections between run() and shutdown().
 */
class Engine {
public:
    virtual ~Engine() = default;

    /**
     * @brief Serve @p listener until shutdown() is called. Blocks the caller.
     * @return Io error if the engine could not be set up.
     */
    virtual Result<void> run(net::UniqueFd listener) = 0;

    /**
     * @brief Stop accepting, cancel every connection, then drain.
     * @return ShutdownTimeout if workers are still busy at @p deadline; the
     *         listener is closed either way and busy workers are abandoned.
     */
    virtual Result<void> shutdown(std::chrono::steady_clock::time_point deadline) = 0;

    /// Live connections right now.
    virtual std::size_t active_connections() const noexcept = 0;
};

/// Model A: blocking thread per connection.
std::unique_ptr<Engine> make_threaded_engine(std::shared_ptr<const EngineContext> ctx);

/// Model B: epoll reactor loops.
std::unique_ptr<Engine> make_reactor_engine(std::shared_ptr<const EngineContext> ctx);

/**
 * @brief Build the state of a connection that just opened.
 * @return Empty state without a factory; Configuration error if the factory threw.
 */
Result<std::any> make_connection_state(const EngineContext& ctx);

/**
 * @brief Decode the header of one envelope and dispatch it.
 *
 * Shared by both engines so they cannot drift apart.
 * @param state Connection state from make_connection_state().
 * @return Action from the handler (Continue on a dispatch miss), or the
 *         Decode/Schema error that must end the connection.
 */
Result<routing::Action> handle_envelope(const EngineContext& ctx, net::Connection& conn,
                                        const std::stop_token& lifetime, std::any& state,
                                        wire::PacketEnvelope&& env);

} // namespace bmux::server
