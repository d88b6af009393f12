#include <catch2/catch_test_macros.hpp>

#include "stdioprobe/config/probe_config.hpp"

#include <filesystem>
#include <fstream>

using namespace stdioprobe;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════════════
// Defaults
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ProbeConfig defaults", "[config]") {
    ProbeConfig config;

    REQUIRE(config.launch.command == "python3");
    REQUIRE(config.launch.args == std::vector<std::string>{"-m", "main", "--transport", "stdio"});
    REQUIRE(config.launch.working_directory.empty());
    REQUIRE(config.launch.inherit_environment);
    REQUIRE(config.probe.response_timeout == 10s);
    REQUIRE(config.probe.grace_period == 2s);
    REQUIRE(config.scripts.size() == 2);
    REQUIRE(config.protocol_version == "2024-11-05");
    REQUIRE(config.log_level == LogLevel::Warn);
}

TEST_CASE("validate requires a working directory", "[config]") {
    ProbeConfig config;

    auto missing = validate(config);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == ConfigError::Code::MissingValue);

    config.launch.working_directory = "/srv/server";
    REQUIRE(validate(config).has_value());
}

TEST_CASE("validate rejects a zero timeout", "[config]") {
    ProbeConfig config;
    config.launch.working_directory = ".";
    config.probe.response_timeout = 0ms;

    auto result = validate(config);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ConfigError::Code::InvalidValue);
}

TEST_CASE("validate rejects waits longer than one day", "[config]") {
    ProbeConfig config;
    config.launch.working_directory = ".";

    SECTION("timeout") {
        config.probe.response_timeout = std::chrono::hours(25);
    }
    SECTION("settle") {
        config.probe.settle_timeout = kMaxDuration + 1ms;
    }
    SECTION("grace period") {
        config.probe.grace_period = std::chrono::hours(24 * 30);
    }
    SECTION("drain") {
        config.probe.drain_timeout = std::chrono::hours(48);
    }

    auto result = validate(config);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ConfigError::Code::InvalidValue);
}

TEST_CASE("build_scripts follows the selection order", "[config]") {
    ProbeConfig config;
    config.scripts = {ScriptKind::HandshakeOmitted};
    config.client = ClientInfo{"custom", "2.0"};

    auto scripts = config.build_scripts();
    REQUIRE(scripts.size() == 1);
    REQUIRE(scripts[0].name == "handshake-omitted");

    config.scripts = {ScriptKind::HandshakeFirst};
    config.protocol_version = "2025-03-26";
    scripts = config.build_scripts();
    REQUIRE(scripts[0].steps[0].params()["protocolVersion"] == "2025-03-26");
    REQUIRE(scripts[0].steps[0].params()["clientInfo"]["name"] == "custom");
}

// ═══════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("parse_env_assignment splits on the first equals sign", "[config]") {
    auto simple = parse_env_assignment("API_KEY=abc");
    REQUIRE(simple.has_value());
    REQUIRE(simple->first == "API_KEY");
    REQUIRE(simple->second == "abc");

    auto nested = parse_env_assignment("OPTS=a=b");
    REQUIRE(nested->second == "a=b");

    auto empty_value = parse_env_assignment("EMPTY=");
    REQUIRE(empty_value.has_value());
    REQUIRE(empty_value->second.empty());

    REQUIRE_FALSE(parse_env_assignment("NOVALUE").has_value());
    REQUIRE_FALSE(parse_env_assignment("=value").has_value());
}

TEST_CASE("seconds_to_duration converts fractional seconds", "[config]") {
    REQUIRE(*seconds_to_duration(1.5, "timeout") == 1500ms);
    REQUIRE(*seconds_to_duration(0, "settle") == 0ms);
    REQUIRE_FALSE(seconds_to_duration(-1, "grace").has_value());
}

TEST_CASE("seconds_to_duration caps waits at one day", "[config]") {
    REQUIRE(*seconds_to_duration(86400, "timeout") == kMaxDuration);

    auto too_long = seconds_to_duration(86400.5, "timeout");
    REQUIRE_FALSE(too_long.has_value());
    REQUIRE(too_long.error().code == ConfigError::Code::InvalidValue);

    REQUIRE_FALSE(seconds_to_duration(1e12, "timeout").has_value());
    REQUIRE_FALSE(seconds_to_duration(1e300, "grace").has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// JSON config
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("apply_config_json overrides the given fields only", "[config][json]") {
    ProbeConfig config;
    const Json document = {
        {"command", "node"},
        {"args", {"build/index.js"}},
        {"cwd", "/srv/server"},
        {"env", {{"DEBUG", "1"}}},
        {"inherit_env", false},
        {"scripts", "handshake-first"},
        {"timeout", 2.5},
        {"client", {{"name", "ci-probe"}}},
        {"send_initialized", true},
        {"log_level", "debug"}
    };

    auto applied = apply_config_json(config, document);
    REQUIRE(applied.has_value());

    REQUIRE(config.launch.command == "node");
    REQUIRE(config.launch.args == std::vector<std::string>{"build/index.js"});
    REQUIRE(config.launch.working_directory == "/srv/server");
    REQUIRE(config.launch.environment.at("DEBUG") == "1");
    REQUIRE_FALSE(config.launch.inherit_environment);
    REQUIRE(config.scripts == std::vector<ScriptKind>{ScriptKind::HandshakeFirst});
    REQUIRE(config.probe.response_timeout == 2500ms);
    REQUIRE(config.probe.grace_period == 2s);
    REQUIRE(config.client.name == "ci-probe");
    REQUIRE(config.client.version == "1.0.0");
    REQUIRE(config.probe.send_initialized_notification);
    REQUIRE(config.log_level == LogLevel::Debug);
}

TEST_CASE("apply_config_json reports type errors", "[config][json]") {
    ProbeConfig config;

    SECTION("args must be strings") {
        auto result = apply_config_json(config, Json{{"args", {1, 2}}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ConfigError::Code::InvalidValue);
    }

    SECTION("unknown script") {
        auto result = apply_config_json(config, Json{{"scripts", {"handshake-first", "fuzz"}}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().message.find("fuzz") != std::string::npos);
    }

    SECTION("negative timeout") {
        auto result = apply_config_json(config, Json{{"timeout", -3}});
        REQUIRE_FALSE(result.has_value());
    }

    SECTION("timeout beyond one day") {
        auto result = apply_config_json(config, Json{{"timeout", 3e6}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(config.probe.response_timeout == 10s);
    }

    SECTION("document must be an object") {
        auto result = apply_config_json(config, Json::array());
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ConfigError::Code::ParseError);
    }
}

TEST_CASE("load_config_file reads a file on top of a base", "[config][json]") {
    const auto path = std::filesystem::temp_directory_path() / "stdioprobe_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"cwd": "/tmp", "scripts": ["handshake-omitted"], "grace": 0.25})";
    }

    ProbeConfig base;
    base.launch.command = "uv";
    auto loaded = load_config_file(path.string(), base);
    std::filesystem::remove(path);

    REQUIRE(loaded.has_value());
    REQUIRE(loaded->launch.command == "uv");
    REQUIRE(loaded->launch.working_directory == "/tmp");
    REQUIRE(loaded->scripts == std::vector<ScriptKind>{ScriptKind::HandshakeOmitted});
    REQUIRE(loaded->probe.grace_period == 250ms);
}

TEST_CASE("load_config_file reports missing and invalid files", "[config][json]") {
    auto missing = load_config_file("/nonexistent/stdioprobe.json");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == ConfigError::Code::FileNotFound);

    const auto path = std::filesystem::temp_directory_path() / "stdioprobe_bad_config.json";
    {
        std::ofstream file(path);
        file << "{ not json";
    }
    auto invalid = load_config_file(path.string());
    std::filesystem::remove(path);

    REQUIRE_FALSE(invalid.has_value());
    REQUIRE(invalid.error().code == ConfigError::Code::ParseError);
}
