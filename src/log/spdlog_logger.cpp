#include "stdioprobe/log/spdlog_logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <atomic>
#include <stdexcept>

namespace stdioprobe {

namespace {

constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

// Unique names keep spdlog's global registry free of conflicts
std::string generate_unique_logger_name(const std::string& base_name) {
    static std::atomic<uint64_t> counter{0};
    return base_name + "_" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Level Conversion
// ─────────────────────────────────────────────────────────────────────────────

spdlog::level::level_enum SpdlogLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Fatal: return spdlog::level::critical;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel SpdlogLogger::from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warn;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Fatal;
        case spdlog::level::off:      return LogLevel::Off;
        default:                      return LogLevel::Info;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

SpdlogLogger::SpdlogLogger(LogLevel min_level)
    : logger_(std::make_shared<spdlog::logger>(
          generate_unique_logger_name("stdioprobe"),
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>()
      ))
    , min_level_(min_level)
{
    logger_->set_level(to_spdlog_level(min_level));
    logger_->set_pattern(kDefaultPattern);
}

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
    , min_level_(LogLevel::Info)
{
    if (!logger_) {
        throw std::invalid_argument("SpdlogLogger: logger cannot be null");
    }
    min_level_ = from_spdlog_level(logger_->level());
}

SpdlogLogger::SpdlogLogger(
    std::vector<spdlog::sink_ptr> sinks,
    LogLevel min_level
)
    : logger_(std::make_shared<spdlog::logger>(
          generate_unique_logger_name("stdioprobe_multi"),
          sinks.begin(),
          sinks.end()
      ))
    , min_level_(min_level)
{
    logger_->set_level(to_spdlog_level(min_level));
    logger_->set_pattern(kDefaultPattern);
}

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Implementation
// ─────────────────────────────────────────────────────────────────────────────

void SpdlogLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }

    logger_->log(
        spdlog::source_loc{
            record.location.file_name(),
            static_cast<int>(record.location.line()),
            record.location.function_name()
        },
        to_spdlog_level(record.level),
        "{}",
        record.message
    );
}

bool SpdlogLogger::should_log(LogLevel level) const noexcept {
    return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
}

void SpdlogLogger::set_level(LogLevel level) noexcept {
    min_level_ = level;
    logger_->set_level(to_spdlog_level(level));
}

void SpdlogLogger::set_pattern(const std::string& pattern) {
    logger_->set_pattern(pattern);
}

void SpdlogLogger::flush() {
    logger_->flush();
}

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(LogLevel min_level) {
    return std::make_unique<SpdlogLogger>(min_level);
}

std::unique_ptr<SpdlogLogger> make_spdlog_console_file_logger(
    const std::string& filename,
    LogLevel console_level
) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(SpdlogLogger::to_spdlog_level(console_level));

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename);
    const LogLevel file_level = std::min(console_level, LogLevel::Debug);
    file_sink->set_level(SpdlogLogger::to_spdlog_level(file_level));

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    auto logger = std::make_unique<SpdlogLogger>(std::move(sinks), file_level);
    // Every record reaches the file immediately
    logger->get_spdlog_logger()->flush_on(spdlog::level::debug);
    return logger;
}

}  // namespace stdioprobe
