#include "bmux/routing/dispatcher.hpp"

#include <exception>

namespace bmux::routing {

Dispatcher::Dispatcher(std::shared_ptr<const DispatchTable> table,
                       std::shared_ptr<obs::Logger> logger,
                       std::shared_ptr<obs::LiveCounters> counters)
    : table_(table ? std::move(table) : std::make_shared<const DispatchTable>(DispatchTable::Map{})),
      log_(logger ? std::move(logger) : obs::make_null_logger()),
      counters_(counters ? std::move(counters) : std::make_shared<obs::LiveCounters>()) {}

DispatchOutcome Dispatcher::dispatch(Context& ctx) const {
    const Handler* h = table_->find(ctx.msg_id());
    if (h == nullptr) {
        obs::LiveCounters::bump(counters_->dispatch_misses);
        log_->warn("no handler registered for message",
                   {obs::kv("remote", ctx.conn().remote_address()), obs::kv("msg_id", ctx.msg_id())});
        return DispatchOutcome{false, Action::Continue};
    }

    obs::LiveCounters::bump(counters_->dispatched);
    try {
        return DispatchOutcome{true, (*h)(ctx)};
    } catch (const std::exception& e) {
        log_->error("handler threw, closing connection",
                    {obs::kv("remote", ctx.conn().remote_address()), obs::kv("msg_id", ctx.msg_id()),
                     obs::kv("what", e.what())});
        return DispatchOutcome{true, Action::Close};
    } catch (...) {
        log_->error("handler threw a non-standard exception, closing connection",
                    {obs::kv("remote", ctx.conn().remote_address()), obs::kv("msg_id", ctx.msg_id())});
        return DispatchOutcome{true, Action::Close};
    }
}

} // namespace bmux::routing
