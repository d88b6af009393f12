#include <catch2/catch_test_macros.hpp>

#include "stdioprobe/log/logger.hpp"

#include <vector>

using namespace stdioprobe;

// ─────────────────────────────────────────────────────────────────────────────
// Capturing Logger
// ─────────────────────────────────────────────────────────────────────────────

class CapturingLogger final : public ILogger {
public:
    explicit CapturingLogger(LogLevel min_level = LogLevel::Trace)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override {
        records_.push_back(record);
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    [[nodiscard]] const std::vector<LogRecord>& records() const noexcept {
        return records_;
    }

private:
    LogLevel min_level_;
    std::vector<LogRecord> records_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Tests
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("parse_log_level accepts names in any case", "[log]") {
    REQUIRE(parse_log_level("trace") == LogLevel::Trace);
    REQUIRE(parse_log_level("DEBUG") == LogLevel::Debug);
    REQUIRE(parse_log_level("Info") == LogLevel::Info);
    REQUIRE(parse_log_level("warn") == LogLevel::Warn);
    REQUIRE(parse_log_level("warning") == LogLevel::Warn);
    REQUIRE(parse_log_level("error") == LogLevel::Error);
    REQUIRE(parse_log_level("off") == LogLevel::Off);
    REQUIRE_FALSE(parse_log_level("loud").has_value());
}

TEST_CASE("Formatting helpers respect the minimum level", "[log]") {
    CapturingLogger logger(LogLevel::Info);

    logger.debug_fmt("step {} of {}", 1, 2);
    logger.info_fmt("pid {}", 4242);
    logger.warn_fmt("exit status {}", -15);

    REQUIRE(logger.records().size() == 2);
    REQUIRE(logger.records()[0].message == "pid 4242");
    REQUIRE(logger.records()[1].level == LogLevel::Warn);
    REQUIRE(logger.records()[1].message == "exit status -15");
}

TEST_CASE("LogRecord captures the call site", "[log]") {
    CapturingLogger logger;
    logger.info("launched");

    REQUIRE(logger.records().size() == 1);
    std::string_view filename(logger.records()[0].location.file_name());
    REQUIRE(filename.find("logger_test") != std::string_view::npos);
}

TEST_CASE("Global logger defaults to NullLogger", "[log]") {
    set_logger(nullptr);
    REQUIRE_FALSE(get_logger().should_log(LogLevel::Fatal));
}

TEST_CASE("STDIOPROBE_LOG macros route to the global logger", "[log]") {
    auto capturing = std::make_unique<CapturingLogger>(LogLevel::Debug);
    auto* raw_ptr = capturing.get();
    set_logger(std::move(capturing));

    STDIOPROBE_LOG_TRACE("trace");  // filtered
    STDIOPROBE_LOG_DEBUG("debug");
    STDIOPROBE_LOG_INFO("info");
    STDIOPROBE_LOG_WARN("warn");
    STDIOPROBE_LOG_ERROR("error");

    REQUIRE(raw_ptr->records().size() == 4);
    REQUIRE(raw_ptr->records()[0].level == LogLevel::Debug);
    REQUIRE(raw_ptr->records()[3].level == LogLevel::Error);

    set_logger(nullptr);
}
