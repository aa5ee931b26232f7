#include "bmux/server/server.hpp"

#include <string>
#include <utility>

#include "bmux/net/socket.hpp"
#include "bmux/routing/builtin_middleware.hpp"
#include "bmux/routing/dispatcher.hpp"
#include "bmux/server/engine.hpp"

namespace bmux::server {

Result<std::unique_ptr<Server>> Server::create(config::ServerConfig cfg, header::SchemaPtr schema,
                                               std::shared_ptr<obs::Logger> logger,
                                               routing::ConnectionStateFactory make_state) {
    if (!schema) {
        return make_error(ErrorKind::Configuration, "a header schema is required");
    }
    if (auto r = config::validate(cfg); !r) {
        return bmux_detail::unexpected(r.error());
    }
    if (!logger) {
        logger = obs::make_console_logger("bmux", obs::parse_level(cfg.log_level));
    }
    return std::unique_ptr<Server>(
        new Server(std::move(cfg), std::move(schema), std::move(logger), std::move(make_state)));
}

Server::Server(config::ServerConfig cfg, header::SchemaPtr schema, std::shared_ptr<obs::Logger> logger,
               routing::ConnectionStateFactory make_state)
    : cfg_(std::move(cfg)),
      schema_(std::move(schema)),
      log_(std::move(logger)),
      make_state_(std::move(make_state)),
      counters_(std::make_shared<obs::LiveCounters>()),
      registry_(log_) {}

Server::~Server() {
    bool running = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        running = engine_ && !stop_requested_;
    }
    if (running) {
        if (auto r = shutdown(cfg_.shutdown_timeout); !r) {
            log_->error("shutdown on destruction did not drain", {obs::kv("error", r.error().message)});
        }
    }
}

Result<void> Server::load_routers(std::vector<routing::Router> routers) {
    return registry_.load_routers(std::move(routers));
}

Result<void> Server::load_middleware(std::vector<routing::Middleware> middleware) {
    return registry_.load_middleware(std::move(middleware));
}

Result<void> Server::start() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (started_) return make_error(ErrorKind::Configuration, "server already started");
        started_ = true;
        if (stop_requested_) {
            ready_.set();
            return {};
        }
    }

    // Releases wait_until_listening() callers on every failed start.
    auto fail = [this](Error e) -> Result<void> {
        log_->error("server failed to start", {obs::kv("kind", to_string(e.kind)), obs::kv("error", e.message)});
        ready_.set();
        return bmux_detail::unexpected(std::move(e));
    };

    if (cfg_.packet_logging) {
        if (auto r = registry_.install_outermost(routing::make_packet_logging_middleware(log_)); !r) {
            return fail(r.error());
        }
    }

    // Compile before any socket exists so misconfiguration never binds a port.
    auto table = registry_.compile(cfg_.experimental);
    if (!table) return fail(table.error());
    log_->info("routes compiled", {obs::kv("routes", (*table)->size()),
                                   obs::kv("experimental", cfg_.experimental)});

    auto listener = net::open_listener(cfg_);
    if (!listener) return fail(listener.error());
    auto bound = net::local_port(listener->get());
    if (!bound) return fail(bound.error());

    auto ctx        = std::make_shared<EngineContext>();
    ctx->cfg        = cfg_;
    ctx->schema     = schema_;
    ctx->dispatcher = std::make_shared<routing::Dispatcher>(*table, log_, counters_);
    ctx->log        = log_;
    ctx->counters   = counters_;
    ctx->make_state = make_state_;

    std::shared_ptr<Engine> engine = cfg_.model == config::ConcurrencyModel::Reactor
        ? std::shared_ptr<Engine>(make_reactor_engine(ctx))
        : std::shared_ptr<Engine>(make_threaded_engine(ctx));
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stop_requested_) {
            // shutdown() raced ahead of us; the listener closes on return.
            ready_.set();
            return {};
        }
        engine_ = engine;
    }

    port_.store(*bound, std::memory_order_release);
    listening_.store(true, std::memory_order_release);
    ready_.set();
    log_->info("listening", {obs::kv("address", cfg_.address), obs::kv("port", *bound),
                             obs::kv("protocol", cfg_.protocol),
                             obs::kv("model", config::to_string(cfg_.model)),
                             obs::kv("max_connections", cfg_.max_connections)});

    auto r = engine->run(std::move(*listener));
    listening_.store(false, std::memory_order_release);
    if (!r) {
        log_->error("engine stopped with error", {obs::kv("error", r.error().message)});
        return r;
    }
    log_->info("server stopped");
    return {};
}

Result<void> Server::start(std::stop_token trigger) {
    std::stop_callback on_stop(trigger, [this] {
        if (auto r = shutdown(cfg_.shutdown_timeout); !r) {
            log_->error("shutdown timed out", {obs::kv("error", r.error().message)});
        }
    });
    return start();
}

Result<void> Server::shutdown(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::shared_ptr<Engine> engine;
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_requested_ = true;
        engine = engine_;
    }
    if (!engine) return {};

    log_->info("shutting down", {obs::kv("active", engine->active_connections()),
                                 obs::kv("timeout_ms", timeout.count())});
    auto r = engine->shutdown(deadline);
    if (!r) {
        log_->warn("drain incomplete, abandoning busy connections", {obs::kv("error", r.error().message)});
        return r;
    }
    log_->info("drained");
    return {};
}

bool Server::wait_until_listening(std::chrono::milliseconds timeout) {
    if (!ready_.wait_until(std::chrono::steady_clock::now() + timeout)) return false;
    return listening_.load(std::memory_order_acquire);
}

std::size_t Server::active_connections() const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    return engine_ ? engine_->active_connections() : 0;
}

} // namespace bmux::server
