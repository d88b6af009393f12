#pragma once

#include "stdioprobe/log/logger.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace stdioprobe {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog
// ─────────────────────────────────────────────────────────────────────────────
// The probe's stdout carries the report, so every sink created here writes
// to stderr or to a file.

class SpdlogLogger final : public ILogger {
public:
    /// Create logger with a colored stderr sink
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Info);

    /// Wrap an existing spdlog logger
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    /// Create logger with multiple sinks
    SpdlogLogger(
        std::vector<spdlog::sink_ptr> sinks,
        LogLevel min_level = LogLevel::Info
    );

    ~SpdlogLogger() override = default;

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;
    SpdlogLogger(SpdlogLogger&&) noexcept = default;
    SpdlogLogger& operator=(SpdlogLogger&&) noexcept = default;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;

    /// Set pattern format (spdlog pattern syntax)
    void set_pattern(const std::string& pattern);

    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

/// Colored stderr logger
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

/// stderr plus file logger; the file sink always records at Debug or finer
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_file_logger(
    const std::string& filename,
    LogLevel console_level = LogLevel::Warn
);

}  // namespace stdioprobe
