/**
 * @file logger.cpp
 * @brief spdlog-backed console sink and the null sink.
 */
#include "bmux/obs/logger.hpp"

#include <cctype>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace bmux::obs {

    static spdlog::level::level_enum to_spdlog(Level l) noexcept {
        switch (l) {
            case Level::Trace: return spdlog::level::trace;
            case Level::Debug: return spdlog::level::debug;
            case Level::Info:  return spdlog::level::info;
            case Level::Warn:  return spdlog::level::warn;
            case Level::Error: return spdlog::level::err;
        }
        return spdlog::level::info;
    }

    class ConsoleLogger final : public Logger {
    public:
        ConsoleLogger(std::string group, Level level)
            : level_(level),
              impl_(std::make_shared<spdlog::logger>(
                  std::move(group), std::make_shared<spdlog::sinks::stdout_color_sink_mt>())) {
            impl_->set_pattern("%Y-%m-%dT%H:%M:%S %^%-5l%$ [%n] %v");
            impl_->set_level(to_spdlog(level));
        }

        void log(Level level, std::string_view message, const Fields& fields) override {
            if (!enabled(level)) return;
            if (fields.empty()) {
                impl_->log(to_spdlog(level), "{}", message);
                return;
            }
            std::string line(message);
            for (const auto& f : fields) {
                line += ' ';
                line += f.key;
                line += '=';
                line += f.value;
            }
            impl_->log(to_spdlog(level), "{}", line);
        }

        bool enabled(Level level) const noexcept override { return level >= level_; }

    private:
        Level level_;
        std::shared_ptr<spdlog::logger> impl_;
    };

    class NullLogger final : public Logger {
    public:
        void log(Level, std::string_view, const Fields&) override {}
        bool enabled(Level) const noexcept override { return false; }
    };

    std::shared_ptr<Logger> make_console_logger(std::string group, Level level) {
        return std::make_shared<ConsoleLogger>(std::move(group), level);
    }

    std::shared_ptr<Logger> make_null_logger() {
        return std::make_shared<NullLogger>();
    }

    Level parse_level(std::string_view name) noexcept {
        std::string lower;
        lower.reserve(name.size());
        for (char c : name) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        if (lower == "trace") return Level::Trace;
        if (lower == "debug") return Level::Debug;
        if (lower == "warn" || lower == "warning") return Level::Warn;
        if (lower == "error") return Level::Error;
        return Level::Info;
    }

} // namespace bmux::obs
