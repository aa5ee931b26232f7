#pragma once
/**
 * @file context.hpp
 * @brief Per-message context and the handler/middleware function types.
 */

#include <any>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <stop_token>
#include <utility>
#include <vector>

#include "bmux/header/header_schema.hpp"
#include "bmux/net/connection.hpp"
#include "bmux/obs/logger.hpp"

namespace bmux::routing {

/// What the transport does after a handler returns.
enum class Action : std::uint8_t {
    Continue,  ///< Keep reading from the connection
    Close      ///< Close the connection after this message
};

/** @class Context
 *  @brief Everything a handler sees for one dispatched message.
 *
 * The lifetime token belongs to the connection: it is cancelled when the
 * connection closes or the server shuts down. Handlers should check it in
 * long work; they are never preempted.
 *
 * The connection state is built once per connection by the server's
 * ConnectionStateFactory and is the same object for every message of that
 * connection. Only the connection's own worker or loop touches it.
 */
class Context {
public:
    Context(std::stop_token lifetime, net::Connection& conn, header::DecodedHeader header,
            std::vector<std::byte> body, std::any* state = nullptr)
        : lifetime_(std::move(lifetime)),
          conn_(&conn),
          header_(std::move(header)),
          body_(std::move(body)),
          state_(state) {}

    const std::stop_token& lifetime() const noexcept { return lifetime_; }
    bool cancelled() const noexcept { return lifetime_.stop_requested(); }

    net::Connection& conn() const noexcept { return *conn_; }

    std::int32_t msg_id() const noexcept { return header_.msg_id; }

    /// Typed view of the decoded header; nullptr if H is not the schema's type.
    template <class H>
    const H* header() const noexcept { return std::any_cast<H>(&header_.value); }

    std::span<const std::byte> body() const noexcept { return body_; }

    /// Size of the raw header on the wire.
    std::size_t head_len() const noexcept { return header_.head_len; }

    /// Connection state; nullptr without a factory or if T is not the state's type.
    template <class T>
    T* state() const noexcept { return state_ ? std::any_cast<T>(state_) : nullptr; }

    /// Logger attached by middleware (may be null).
    obs::Logger* logger() const noexcept { return logger_.get(); }
    void set_logger(std::shared_ptr<obs::Logger> l) noexcept { logger_ = std::move(l); }

private:
    std::stop_token               lifetime_;
    net::Connection*              conn_;
    header::DecodedHeader         header_;
    std::vector<std::byte>        body_;
    std::shared_ptr<obs::Logger>  logger_;
    std::any*                     state_;
};

/// Builds the application state of one connection; called once as it opens.
using ConnectionStateFactory = std::function<std::any()>;

/// Route handler. Runs synchronously on the connection's worker or loop.
using Handler = std::function<Action(Context&)>;

/// Handler transform: receives the next link, returns the wrapped handler.
using MiddlewareFn = std::function<Handler(Handler)>;

} // namespace bmux::routing
