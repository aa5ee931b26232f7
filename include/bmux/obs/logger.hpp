#pragma once
/**
 * @file logger.hpp
 * @brief Injected, leveled, structured logging sink.
 * @details The server and engines receive a Logger at construction; nothing
 *          in bmux writes to a global logger. The console implementation is
 *          backed by spdlog.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace bmux::obs {

    /// Severity, lowest first.
    enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

    /** @struct Field
     *  @brief One key/value pair attached to a log line.
     */
    struct Field {
        std::string key;
        std::string value;
    };

    using Fields = std::vector<Field>;

    /// Build a Field from strings or arithmetic values.
    template <class T>
    Field kv(std::string key, const T& value) {
        if constexpr (std::is_same_v<T, bool>) {
            return Field{std::move(key), value ? "true" : "false"};
        } else if constexpr (std::is_arithmetic_v<T>) {
            return Field{std::move(key), std::to_string(value)};
        } else {
            return Field{std::move(key), std::string(value)};
        }
    }

    /** @class Logger
     *  @brief Logging sink interface.
     */
    class Logger {
    public:
        virtual ~Logger() = default;

        /// Emit one line. Implementations must be safe to call from many threads.
        virtual void log(Level level, std::string_view message, const Fields& fields) = 0;

        /// Cheap check so callers can skip building fields.
        virtual bool enabled(Level level) const noexcept = 0;

        void trace(std::string_view m, const Fields& f = {}) { log(Level::Trace, m, f); }
        void debug(std::string_view m, const Fields& f = {}) { log(Level::Debug, m, f); }
        void info (std::string_view m, const Fields& f = {}) { log(Level::Info,  m, f); }
        void warn (std::string_view m, const Fields& f = {}) { log(Level::Warn,  m, f); }
        void error(std::string_view m, const Fields& f = {}) { log(Level::Error, m, f); }
    };

    /// Console sink (spdlog, stdout, colored). @p group tags every line.
    std::shared_ptr<Logger> make_console_logger(std::string group, Level level = Level::Info);

    /// Sink that drops everything.
    std::shared_ptr<Logger> make_null_logger();

    /// "trace|debug|info|warn|error" (case-insensitive); anything else is Info.
    Level parse_level(std::string_view name) noexcept;

} // namespace bmux::obs
