// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "stdioprobe/log/spdlog_logger.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

#include <spdlog/sinks/ostream_sink.h>

using namespace stdioprobe;

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

}  // namespace

TEST_CASE("SpdlogLogger console logger respects minimum level", "[log][spdlog]") {
    auto logger = make_spdlog_console_logger(LogLevel::Warn);

    REQUIRE_FALSE(logger->should_log(LogLevel::Info));
    REQUIRE(logger->should_log(LogLevel::Warn));
    REQUIRE(logger->should_log(LogLevel::Error));

    logger->set_level(LogLevel::Debug);
    REQUIRE(logger->should_log(LogLevel::Debug));
}

TEST_CASE("SpdlogLogger level conversion round-trips", "[log][spdlog]") {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                       LogLevel::Warn, LogLevel::Error, LogLevel::Fatal, LogLevel::Off}) {
        REQUIRE(SpdlogLogger::from_spdlog_level(SpdlogLogger::to_spdlog_level(level)) == level);
    }
}

TEST_CASE("SpdlogLogger writes through custom sinks", "[log][spdlog]") {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);

    SpdlogLogger logger({sink}, LogLevel::Info);
    logger.set_pattern("%l %v");

    logger.debug("hidden");
    logger.info_fmt("Started server pid {}", 1234);
    logger.flush();

    REQUIRE(out.str().find("hidden") == std::string::npos);
    REQUIRE(out.str().find("info Started server pid 1234") != std::string::npos);
}

TEST_CASE("Console plus file logger records debug detail in the file", "[log][spdlog][file]") {
    const auto path = std::filesystem::temp_directory_path() / "stdioprobe_spdlog_test.log";
    std::filesystem::remove(path);

    {
        auto logger = make_spdlog_console_file_logger(path.string(), LogLevel::Error);
        REQUIRE(logger->should_log(LogLevel::Debug));
        REQUIRE_FALSE(logger->should_log(LogLevel::Trace));

        logger->debug("probe state Launched -> StepPending");
        logger->trace("stdin: not recorded");
    }

    const std::string content = read_file(path);
    REQUIRE(content.find("probe state Launched -> StepPending") != std::string::npos);
    REQUIRE(content.find("not recorded") == std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("SpdlogLogger can be installed as the global logger", "[log][spdlog]") {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_unique<SpdlogLogger>(std::vector<spdlog::sink_ptr>{sink}, LogLevel::Info);
    logger->set_pattern("%v");
    auto* raw_ptr = logger.get();

    set_logger(std::move(logger));
    STDIOPROBE_LOG_INFO("via global logger");
    raw_ptr->flush();
    REQUIRE(out.str().find("via global logger") != std::string::npos);

    set_logger(nullptr);
}
