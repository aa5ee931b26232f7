#pragma once
/**
 * @file dispatcher.hpp
 * @brief Table lookup + synchronous handler invocation.
 */

#include <memory>

#include "bmux/obs/logger.hpp"
#include "bmux/obs/observability.hpp"
#include "bmux/routing/route_registry.hpp"

namespace bmux::routing {

/** @struct DispatchOutcome
 *  @brief hit=false means DispatchMiss (logged, connection continues).
 */
struct DispatchOutcome {
    bool   hit{false};
    Action action{Action::Continue};
};

/** @class Dispatcher
 *  @brief Stateless apart from shared read-only pointers; safe from any thread.
 */
class Dispatcher {
public:
    Dispatcher(std::shared_ptr<const DispatchTable> table,
               std::shared_ptr<obs::Logger> logger,
               std::shared_ptr<obs::LiveCounters> counters);

    /**
     * @brief Run the composed handler for ctx.msg_id().
     *
     * A miss logs a warning and returns {false, Continue}. A handler that
     * throws is logged and its connection is closed.
     */
    DispatchOutcome dispatch(Context& ctx) const;

    const DispatchTable& table() const noexcept { return *table_; }

private:
    std::shared_ptr<const DispatchTable> table_;
    std::shared_ptr<obs::Logger>         log_;
    std::shared_ptr<obs::LiveCounters>   counters_;
};

} // namespace bmux::routing
