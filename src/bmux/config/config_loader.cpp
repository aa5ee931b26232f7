/**
 * @file config_loader.cpp
 * @brief Named defaults and startup validation for ServerConfig.
 */
#include "bmux/config/config_loader.hpp"

namespace bmux::config {

    ServerConfig Loader::defaults() {
        return ServerConfig{};
    }

    static bool known_protocol(const std::string& p) {
        return p == "tcp" || p == "tcp4" || p == "tcp6";
    }

    Result<void> validate(const ServerConfig& cfg) {
        if (cfg.address.empty()) {
            return make_error(ErrorKind::Configuration, "address must not be empty");
        }
        if (!known_protocol(cfg.protocol)) {
            return make_error(ErrorKind::Configuration,
                              "unsupported protocol '" + cfg.protocol + "' (expected tcp, tcp4 or tcp6)");
        }
        if (cfg.head_size != constants::WIRE_PREFIX_SIZE) {
            return make_error(ErrorKind::Configuration,
                              "head_size must be " + std::to_string(constants::WIRE_PREFIX_SIZE) +
                              ", got " + std::to_string(cfg.head_size));
        }
        if (cfg.max_connections == 0) {
            return make_error(ErrorKind::Configuration, "max_connections must be at least 1");
        }
        using std::chrono::milliseconds;
        if (cfg.read_timeout < milliseconds::zero() || cfg.write_timeout < milliseconds::zero() ||
            cfg.idle_timeout < milliseconds::zero() || cfg.shutdown_timeout < milliseconds::zero()) {
            return make_error(ErrorKind::Configuration, "timeouts must not be negative");
        }
        return {};
    }

    const char* to_string(ConcurrencyModel m) noexcept {
        return m == ConcurrencyModel::Reactor ? "reactor" : "threaded";
    }

} // namespace bmux::config
