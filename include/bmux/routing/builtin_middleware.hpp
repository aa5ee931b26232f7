#pragma once
/**
 * @file builtin_middleware.hpp
 * @brief Middleware shipped with bmux.
 */

#include <memory>

#include "bmux/obs/logger.hpp"
#include "bmux/routing/route.hpp"

namespace bmux::routing {

    /// Logs msg id, body size and peer at Debug before calling the next link.
    /// Installed outermost by the server when packet logging is enabled.
    Middleware make_packet_logging_middleware(std::shared_ptr<obs::Logger> logger);

    /// Attaches @p logger to every Context (Context::logger()).
    Middleware make_logger_injection_middleware(std::shared_ptr<obs::Logger> logger,
                                                bool experimental = false);

} // namespace bmux::routing
