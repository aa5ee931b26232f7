#include "bmux/routing/route.hpp"

namespace bmux::routing {

Middleware make_middleware(std::string name, bool enabled, bool experimental, MiddlewareFn transform,
                           std::initializer_list<MiddlewareOption> opts) {
    Middleware m(std::move(name), enabled, experimental, std::move(transform));
    for (const auto& o : opts) m = o(std::move(m));
    return m;
}

Route make_route(std::string name, std::int32_t id, bool enabled, bool experimental, Handler handler,
                 std::vector<Middleware> middleware, std::initializer_list<RouteOption> opts) {
    Route r(std::move(name), id, enabled, experimental, std::move(handler), std::move(middleware));
    for (const auto& o : opts) r = o(std::move(r));
    return r;
}

Router make_router(std::string name, bool enabled, std::vector<Route> routes,
                   std::vector<Middleware> middleware, std::initializer_list<RouterOption> opts) {
    Router r(std::move(name), enabled, std::move(routes), std::move(middleware));
    for (const auto& o : opts) r = o(std::move(r));
    return r;
}

} // namespace bmux::routing
