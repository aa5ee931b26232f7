// apps/echo_server/src/main.cpp
// bmux: echo_server
// Purpose: reference server wiring a fixed-layout header, a few routes and
// signal-driven shutdown.
//
// Usage:
//   ./bmux_echo_server [--port N] [--reactor] [--experimental] [--packet-logging] [--log-level L]
//
// Header layout (7 bytes, big-endian):
//   u8 version | u16 msg_id | u32 seq
//
// Routes:
//   1  echo   replies with the same header and body
//   2  ping   replies "pong"
//   3  stats  (experimental) replies with the server counters and the
//            number of messages seen on this connection
//   9  quit   replies "bye" and closes the connection
//   99 admin  registered disabled; always a dispatch miss

#include <any>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>
#include <span>
#include <thread>
#include <vector>

#include <pthread.h>

#include "bmux/config/config_loader.hpp"
#include "bmux/header/fixed_layout.hpp"
#include "bmux/routing/builtin_middleware.hpp"
#include "bmux/routing/route.hpp"
#include "bmux/server/server.hpp"
#include "bmux/version.hpp"

namespace {

struct EchoHeader {
    std::uint8_t  version{0};
    std::uint16_t msg_id{0};
    std::uint32_t seq{0};
};

/// Per-connection state built by the server for every accepted client.
struct EchoSession {
    std::uint64_t messages{0};
};

std::vector<std::byte> to_bytes(const std::string& s) {
    std::vector<std::byte> out(s.size());
    std::memcpy(out.data(), s.data(), s.size());
    return out;
}

bmux::routing::Action reply(bmux::routing::Context& ctx, std::span<const std::byte> body) {
    std::vector<std::byte> head;
    if (const auto* h = ctx.header<EchoHeader>()) {
        // Echo the request header so clients can match replies by seq.
        head = {std::byte{h->version},
                std::byte(h->msg_id >> 8), std::byte(h->msg_id & 0xFF),
                std::byte(h->seq >> 24), std::byte((h->seq >> 16) & 0xFF),
                std::byte((h->seq >> 8) & 0xFF), std::byte(h->seq & 0xFF)};
    }
    if (auto r = ctx.conn().send(head, body); !r) {
        if (auto* log = ctx.logger()) {
            log->warn("reply failed", {bmux::obs::kv("error", r.error().message)});
        }
        return bmux::routing::Action::Close;
    }
    return bmux::routing::Action::Continue;
}

void print_usage(const char* argv0) {
    std::cout << "usage: " << argv0
              << " [--port N] [--reactor] [--experimental] [--packet-logging] [--log-level L]\n";
}

} // namespace

int main(int argc, char** argv) {
    using namespace bmux;

    config::ServerConfig cfg = config::Loader::defaults();
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--port" && i + 1 < argc) {
            cfg.port = static_cast<std::uint16_t>(std::stoul(argv[++i]));
        } else if (arg == "--reactor") {
            cfg.model = config::ConcurrencyModel::Reactor;
        } else if (arg == "--experimental") {
            cfg.experimental = true;
        } else if (arg == "--packet-logging") {
            cfg.packet_logging = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            cfg.log_level = argv[++i];
        } else {
            print_usage(argv[0]);
            return arg == "--help" ? 0 : 2;
        }
    }

    // Block the stop signals before any thread starts so only sigwait() sees them.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    auto logger = obs::make_console_logger("bmux", obs::parse_level(cfg.log_level));
    logger->info("bmux_echo_server starting", {obs::kv("version", version_string)});

    auto layout = header::FixedLayout<EchoHeader>::builder()
                      .field("version", &EchoHeader::version)
                      .field("msg_id", &EchoHeader::msg_id, header::FieldRole::MessageId)
                      .field("seq", &EchoHeader::seq)
                      .build();
    if (!layout) {
        logger->error("invalid header layout", {obs::kv("error", layout.error().message)});
        return 1;
    }

    auto created = server::Server::create(cfg, header::make_fixed_layout_schema(std::move(*layout)), logger,
                                          [] { return std::any(EchoSession{}); });
    if (!created) {
        logger->error("invalid configuration", {obs::kv("error", created.error().message)});
        return 1;
    }
    server::Server& srv = **created;

    using routing::Action;
    using routing::Context;
    std::vector<routing::Route> routes;
    routes.push_back(routing::make_route("echo", 1, true, false,
                                         [](Context& ctx) { return reply(ctx, ctx.body()); }));
    routes.push_back(routing::make_route("ping", 2, true, false,
                                         [](Context& ctx) { return reply(ctx, to_bytes("pong")); }));
    routes.push_back(routing::make_route("stats", 3, true, true, [&srv](Context& ctx) {
        const auto c = srv.counters();
        const auto* session = ctx.state<EchoSession>();
        return reply(ctx, to_bytes("accepted=" + std::to_string(c.accepted) +
                                   " dispatched=" + std::to_string(c.dispatched) +
                                   " misses=" + std::to_string(c.dispatch_misses) +
                                   " session=" + std::to_string(session ? session->messages : 0)));
    }));
    routes.push_back(routing::make_route("quit", 9, true, false, [](Context& ctx) {
        reply(ctx, to_bytes("bye"));
        return Action::Close;
    }));
    routes.push_back(routing::make_route("admin", 99, false, false,
                                         [](Context&) { return Action::Continue; }));

    if (auto r = srv.load_routers({routing::make_router("echo", true, std::move(routes))}); !r) {
        logger->error("router registration failed", {obs::kv("error", r.error().message)});
        return 1;
    }
    auto count_messages = routing::make_middleware("session_counter", true, false, [](routing::Handler next) {
        return routing::Handler([next = std::move(next)](Context& ctx) {
            if (auto* session = ctx.state<EchoSession>()) ++session->messages;
            return next(ctx);
        });
    });
    if (auto r = srv.load_middleware({routing::make_logger_injection_middleware(logger),
                                      std::move(count_messages)}); !r) {
        logger->error("middleware registration failed", {obs::kv("error", r.error().message)});
        return 1;
    }

    std::stop_source stop;
    std::thread signal_thread([&stop, &stop_signals, logger] {
        int sig = 0;
        if (sigwait(&stop_signals, &sig) == 0 && !stop.stop_requested()) {
            logger->info("signal received", {obs::kv("signal", sig)});
            stop.request_stop();
        }
    });

    auto result = srv.start(stop.get_token());

    // Release the signal thread if the server stopped on its own.
    if (!stop.stop_requested()) {
        stop.request_stop();
        pthread_kill(signal_thread.native_handle(), SIGTERM);
    }
    signal_thread.join();

    if (!result) {
        logger->error("server exited with error", {obs::kv("kind", to_string(result.error().kind)),
                                                   obs::kv("error", result.error().message)});
        return 1;
    }
    return 0;
}
