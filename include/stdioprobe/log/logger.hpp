#pragma once

#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace stdioprobe {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Wire-level detail (raw lines, poll results)
    Debug = 1,  // Step and state transitions
    Info  = 2,  // Process lifecycle
    Warn  = 3,  // Recoverable probe failures
    Error = 4,  // Launch failures
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

/// Parse a level name ("debug", "WARN", ...). Returns nullopt for unknown names.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record - One log event and its call site
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface - Swappable logging backend
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    // Check if a level would be logged (for avoiding expensive formatting)
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Trace)) {
            log(LogRecord(LogLevel::Trace, std::string(msg), loc));
        }
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Debug)) {
            log(LogRecord(LogLevel::Debug, std::string(msg), loc));
        }
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Info)) {
            log(LogRecord(LogLevel::Info, std::string(msg), loc));
        }
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Warn)) {
            log(LogRecord(LogLevel::Warn, std::string(msg), loc));
        }
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Error)) {
            log(LogRecord(LogLevel::Error, std::string(msg), loc));
        }
    }

    // Templated formatting helpers (C++20 std::format)
    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Debug)) {
            log(LogRecord(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...)));
        }
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
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - Discards all logs
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

// Get the global logger instance (defaults to NullLogger)
[[nodiscard]] ILogger& get_logger() noexcept;

// Set a new global logger (takes ownership). nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

#define STDIOPROBE_LOG_TRACE(msg) \
    do { if (::stdioprobe::get_logger().should_log(::stdioprobe::LogLevel::Trace)) \
         ::stdioprobe::get_logger().trace(msg); } while(false)

#define STDIOPROBE_LOG_DEBUG(msg) \
    do { if (::stdioprobe::get_logger().should_log(::stdioprobe::LogLevel::Debug)) \
         ::stdioprobe::get_logger().debug(msg); } while(false)

#define STDIOPROBE_LOG_INFO(msg) \
    do { if (::stdioprobe::get_logger().should_log(::stdioprobe::LogLevel::Info)) \
         ::stdioprobe::get_logger().info(msg); } while(false)

#define STDIOPROBE_LOG_WARN(msg) \
    do { if (::stdioprobe::get_logger().should_log(::stdioprobe::LogLevel::Warn)) \
         ::stdioprobe::get_logger().warn(msg); } while(false)

#define STDIOPROBE_LOG_ERROR(msg) \
    do { if (::stdioprobe::get_logger().should_log(::stdioprobe::LogLevel::Error)) \
         ::stdioprobe::get_logger().error(msg); } while(false)

}  // namespace stdioprobe
