#include "bmux/routing/builtin_middleware.hpp"

namespace bmux::routing {

    Middleware make_packet_logging_middleware(std::shared_ptr<obs::Logger> logger) {
        return make_middleware("packet_logging", true, false,
            [logger = std::move(logger)](Handler next) -> Handler {
                return [logger, next = std::move(next)](Context& ctx) {
                    if (logger->enabled(obs::Level::Debug)) {
                        logger->debug("packet",
                                      {obs::kv("remote", ctx.conn().remote_address()),
                                       obs::kv("msg_id", ctx.msg_id()),
                                       obs::kv("head_len", ctx.head_len()),
                                       obs::kv("body_len", ctx.body().size())});
                    }
                    return next(ctx);
                };
            });
    }

    Middleware make_logger_injection_middleware(std::shared_ptr<obs::Logger> logger, bool experimental) {
        return make_middleware("inject_logger", true, experimental,
            [logger = std::move(logger)](Handler next) -> Handler {
                return [logger, next = std::move(next)](Context& ctx) {
                    ctx.set_logger(logger);
                    return next(ctx);
                };
            });
    }

} // namespace bmux::routing
