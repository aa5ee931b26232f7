#pragma once
/**
 * @file config_loader.hpp
 * @brief Resolved server configuration plus the defaults/validation facade.
 * @details All defaults reference named constants to avoid magic numbers.
 *          Reading files is the embedding application's job; bmux consumes
 *          only the resolved value.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "bmux/config/constants.hpp"
#include "bmux/core/error.hpp"

namespace bmux::config {

    /** @enum ConcurrencyModel
     *  @brief Which connection engine serves the listener.
     */
    enum class ConcurrencyModel : std::uint8_t {
        Threaded,  ///< One blocking worker per connection, counting limiter on accept
        Reactor    ///< Fixed set of epoll loops, over-limit connections closed on open
    };

    /** @struct ServerConfig
     *  @brief Aggregate of settings the server and engines read.
     */
    struct ServerConfig {
        std::string   address{constants::SERVER_ADDRESS};    ///< Bind address (IPv4/IPv6 literal or host)
        std::uint16_t port{constants::SERVER_PORT};          ///< Bind port, 0 picks an ephemeral port
        std::string   protocol{constants::SERVER_PROTOCOL};  ///< tcp, tcp4 or tcp6
        std::size_t   head_size{constants::WIRE_PREFIX_SIZE}; ///< Envelope prefix width
        std::size_t   max_connections{constants::SERVER_MAX_CONNECTIONS};

        std::chrono::milliseconds read_timeout{constants::TIMEOUT_READ_MS};
        std::chrono::milliseconds write_timeout{constants::TIMEOUT_WRITE_MS};
        std::chrono::milliseconds idle_timeout{constants::TIMEOUT_IDLE_MS};
        std::chrono::milliseconds shutdown_timeout{constants::TIMEOUT_SHUTDOWN_MS};

        bool keep_alive{constants::SERVER_KEEP_ALIVE};
        bool multicore{constants::SERVER_MULTICORE};          ///< Reactor: one loop per core
        bool experimental{constants::SERVER_EXPERIMENTAL};    ///< Register experimental routes/middleware
        bool packet_logging{constants::SERVER_PACKET_LOGGING};
        std::string log_level{constants::SERVER_LOG_LEVEL};

        ConcurrencyModel model{ConcurrencyModel::Threaded};
    };

    /** @class Loader
     *  @brief Source of server configuration.
     */
    class Loader {
    public:
        /// @return ServerConfig populated from constants.hpp.
        static ServerConfig defaults();
    };

    /**
     * @brief Check a configuration before anything is opened.
     * @return Configuration error naming the first offending field.
     */
    Result<void> validate(const ServerConfig& cfg);

    /// Label for logs ("threaded" / "reactor").
    const char* to_string(ConcurrencyModel m) noexcept;

} // namespace bmux::config
