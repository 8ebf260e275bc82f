#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace cfpp {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name ("trace", "WARN", "warning", "off", ...), case-insensitive.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────
// `component` names the emitter, e.g. "cfpp:Retry". Empty for records
// written straight through ILogger.

struct LogRecord {
    LogLevel level;
    std::string component;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}

    LogRecord(
        LogLevel lvl,
        std::string comp,
        std::string msg,
        std::source_location loc
    )
        : level(lvl)
        , component(std::move(comp))
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    /// Cheap pre-check so callers can skip formatting
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(LogLevel level, std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Trace, msg, loc);
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, msg, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, msg, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, msg, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, msg, loc);
    }

    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Fatal, msg, loc);
    }

    template<typename... Args>
    void info_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Info)) {
            log(LogRecord(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Warn)) {
            log(LogRecord(LogLevel::Warn, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void error_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Error)) {
            log(LogRecord(LogLevel::Error, std::format(fmt, std::forward<Args>(args)...)));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────
// Defaults to NullLogger. set_logger(nullptr) restores the default.

[[nodiscard]] ILogger& get_logger() noexcept;

void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// ComponentLogger
// ─────────────────────────────────────────────────────────────────────────────
// Named handle onto the global logger. Every record carries the component
// name so output from different pipeline stages can be told apart:
//
//   ComponentLogger log{"cfpp:Retry"};
//   log.warn("Attempt {} failed, retrying in {}ms", attempt, delay.count());

class ComponentLogger {
public:
    explicit ComponentLogger(std::string component)
        : component_(std::move(component))
    {}

    [[nodiscard]] const std::string& component() const noexcept { return component_; }

    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        return get_logger().should_log(level);
    }

    template<typename... Args>
    void trace(std::format_string<Args...> fmt, Args&&... args) const {
        emit(LogLevel::Trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) const {
        emit(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) const {
        emit(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args) const {
        emit(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) const {
        emit(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

private:
    template<typename... Args>
    void emit(LogLevel level, std::format_string<Args...> fmt, Args&&... args) const {
        auto& logger = get_logger();
        if (logger.should_log(level) == false) {
            return;
        }
        logger.log(LogRecord(
            level,
            component_,
            std::format(fmt, std::forward<Args>(args)...),
            std::source_location::current()
        ));
    }

    std::string component_;
};

// Macros check should_log() before evaluating the message expression

#define CFPP_LOG_TRACE(msg) \
    do { if (::cfpp::get_logger().should_log(::cfpp::LogLevel::Trace)) \
         ::cfpp::get_logger().trace(msg); } while(false)

#define CFPP_LOG_DEBUG(msg) \
    do { if (::cfpp::get_logger().should_log(::cfpp::LogLevel::Debug)) \
         ::cfpp::get_logger().debug(msg); } while(false)

#define CFPP_LOG_INFO(msg) \
    do { if (::cfpp::get_logger().should_log(::cfpp::LogLevel::Info)) \
         ::cfpp::get_logger().info(msg); } while(false)

#define CFPP_LOG_WARN(msg) \
    do { if (::cfpp::get_logger().should_log(::cfpp::LogLevel::Warn)) \
         ::cfpp::get_logger().warn(msg); } while(false)

#define CFPP_LOG_ERROR(msg) \
    do { if (::cfpp::get_logger().should_log(::cfpp::LogLevel::Error)) \
         ::cfpp::get_logger().error(msg); } while(false)

}  // namespace cfpp
