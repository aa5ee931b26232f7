#pragma once
/**
 * @file route.hpp
 * @brief Immutable registration values: Middleware, Route, Router.
 *
 * Values are built once (optionally decorated by option wrappers applied in
 * order) and never change after registration.
 */

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include "bmux/routing/context.hpp"

namespace bmux::routing {

/** @class Middleware
 *  @brief Named handler transform with enable/experimental flags.
 */
class Middleware {
public:
    Middleware(std::string name, bool enabled, bool experimental, MiddlewareFn transform)
        : name_(std::move(name)), enabled_(enabled), experimental_(experimental),
          transform_(std::move(transform)) {}

    const std::string&  name() const noexcept { return name_; }
    bool                enabled() const noexcept { return enabled_; }
    bool                experimental() const noexcept { return experimental_; }
    const MiddlewareFn& transform() const noexcept { return transform_; }

    /// True if this entry takes part in a chain compiled with @p experimental_on.
    bool active(bool experimental_on) const noexcept {
        return enabled_ && (!experimental_ || experimental_on);
    }

private:
    std::string  name_;
    bool         enabled_;
    bool         experimental_;
    MiddlewareFn transform_;
};

/** @class Route
 *  @brief Message id -> handler plus route-level middleware.
 */
class Route {
public:
    Route(std::string name, std::int32_t id, bool enabled, bool experimental, Handler handler,
          std::vector<Middleware> middleware = {})
        : name_(std::move(name)), id_(id), enabled_(enabled), experimental_(experimental),
          handler_(std::move(handler)), middleware_(std::move(middleware)) {}

    const std::string&             name() const noexcept { return name_; }
    std::int32_t                   id() const noexcept { return id_; }
    bool                           enabled() const noexcept { return enabled_; }
    bool                           experimental() const noexcept { return experimental_; }
    const Handler&                 handler() const noexcept { return handler_; }
    const std::vector<Middleware>& middleware() const noexcept { return middleware_; }

private:
    std::string             name_;
    std::int32_t            id_;
    bool                    enabled_;
    bool                    experimental_;
    Handler                 handler_;
    std::vector<Middleware> middleware_;
};

/** @class Router
 *  @brief Enable-able group of routes sharing router-level middleware.
 */
class Router {
public:
    Router(std::string name, bool enabled, std::vector<Route> routes, std::vector<Middleware> middleware = {})
        : name_(std::move(name)), enabled_(enabled), routes_(std::move(routes)),
          middleware_(std::move(middleware)) {}

    const std::string&             name() const noexcept { return name_; }
    bool                           enabled() const noexcept { return enabled_; }
    const std::vector<Route>&      routes() const noexcept { return routes_; }
    const std::vector<Middleware>& middleware() const noexcept { return middleware_; }

private:
    std::string             name_;
    bool                    enabled_;
    std::vector<Route>      routes_;
    std::vector<Middleware> middleware_;
};

// Option wrappers: applied in order by the make_* helpers.
using MiddlewareOption = std::function<Middleware(Middleware)>;
using RouteOption      = std::function<Route(Route)>;
using RouterOption     = std::function<Router(Router)>;

Middleware make_middleware(std::string name, bool enabled, bool experimental, MiddlewareFn transform,
                           std::initializer_list<MiddlewareOption> opts = {});

Route make_route(std::string name, std::int32_t id, bool enabled, bool experimental, Handler handler,
                 std::vector<Middleware> middleware = {}, std::initializer_list<RouteOption> opts = {});

Router make_router(std::string name, bool enabled, std::vector<Route> routes,
                   std::vector<Middleware> middleware = {}, std::initializer_list<RouterOption> opts = {});

} // namespace bmux::routing
