#include "bmux/server/engine.hpp"

#include <exception>
#include <string>

namespace bmux::server {

Result<std::any> make_connection_state(const EngineContext& ctx) {
    if (!ctx.make_state) return std::any{};
    try {
        return ctx.make_state();
    } catch (const std::exception& e) {
        return make_error(ErrorKind::Configuration, std::string("connection state factory threw: ") + e.what());
    } catch (...) {
        return make_error(ErrorKind::Configuration, "connection state factory threw a non-standard exception");
    }
}

Result<routing::Action> handle_envelope(const EngineContext& ctx, net::Connection& conn,
                                        const std::stop_token& lifetime, std::any& state,
                                        wire::PacketEnvelope&& env) {
    auto decoded = ctx.schema->decode(env.head);
    if (!decoded) {
        obs::LiveCounters::bump(ctx.counters->decode_failures);
        return bmux_detail::unexpected(decoded.error());
    }
    decoded->head_len = env.head.size();

    routing::Context mctx(lifetime, conn, std::move(*decoded), std::move(env.body), &state);
    return ctx.dispatcher->dispatch(mctx).action;
}

} // namespace bmux::server
