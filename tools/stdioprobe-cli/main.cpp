// ─────────────────────────────────────────────────────────────────────────────
// stdioprobe-cli - stdio JSON-RPC server diagnostic
// ─────────────────────────────────────────────────────────────────────────────
// Launches a server that speaks newline-delimited JSON-RPC on stdin/stdout and
// reports whether it starts, answers initialize, handles requests sent before
// initialize, and lists its tools.
//
// Usage:
//   stdioprobe-cli --cwd /path/to/server                      # python3 -m main --transport stdio
//   stdioprobe-cli -c node -a server.js -a --stdio --cwd . --script handshake-first
//   stdioprobe-cli --config probe.json --json
//
// Exit status: 0 when every step got a response, 1 when any step failed,
// 2 for configuration or launch errors.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "stdioprobe/config/probe_config.hpp"
#include "stdioprobe/log/spdlog_logger.hpp"
#include "stdioprobe/probe/probe_orchestrator.hpp"
#include "stdioprobe/report/report_printer.hpp"

#include <unistd.h>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

using namespace stdioprobe;

namespace {

constexpr const char* kVersion = "1.0.0";

constexpr int kExitPassed = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

void print_error(const std::string& message) {
    std::cerr << "stdioprobe: " << message << "\n";
}

cxxopts::Options build_options() {
    cxxopts::Options options("stdioprobe-cli", "Diagnose a JSON-RPC server on the stdio transport");

    options.add_options("Server")
        ("c,command", "Server executable (default: python3)", cxxopts::value<std::string>())
        ("a,args", "Server argument, repeatable (default: -m main --transport stdio)",
            cxxopts::value<std::vector<std::string>>())
        ("C,cwd", "Working directory for the server (required)", cxxopts::value<std::string>())
        ("e,env", "Environment override NAME=VALUE, repeatable", cxxopts::value<std::vector<std::string>>())
        ("clean-env", "Do not inherit this process's environment")
        ("config", "JSON config file applied before the flags", cxxopts::value<std::string>());

    options.add_options("Probe")
        ("s,script", "handshake-first, handshake-omitted or all", cxxopts::value<std::string>())
        ("timeout", "Seconds to wait for each response", cxxopts::value<double>())
        ("settle", "Seconds to watch for a crash right after launch", cxxopts::value<double>())
        ("grace", "Seconds to wait for the server to stop before SIGKILL", cxxopts::value<double>())
        ("protocol-version", "protocolVersion sent in initialize", cxxopts::value<std::string>())
        ("client-name", "clientInfo.name sent in initialize", cxxopts::value<std::string>())
        ("client-version", "clientInfo.version sent in initialize", cxxopts::value<std::string>())
        ("send-initialized", "Send notifications/initialized after a successful initialize")
        ("keep-notifications", "Treat server notifications as undecodable responses");

    options.add_options("Output")
        ("j,json", "Print the report as JSON")
        ("no-color", "Disable colored output")
        ("v,verbose", "Debug logging on stderr")
        ("log-level", "trace, debug, info, warn, error or off", cxxopts::value<std::string>())
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("version", "Print version")
        ("h,help", "Print usage");

    return options;
}

ConfigResult<std::chrono::milliseconds> seconds_option(const cxxopts::ParseResult& result,
                                                       const char* name) {
    return seconds_to_duration(result[name].as<double>(), std::string("--") + name);
}

ConfigResult<ProbeConfig> config_from_args(const cxxopts::ParseResult& result) {
    ProbeConfig config;

    if (result.count("config")) {
        auto loaded = load_config_file(result["config"].as<std::string>(), config);
        if (!loaded) {
            return tl::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    if (result.count("command")) {
        config.launch.command = result["command"].as<std::string>();
    }
    if (result.count("args")) {
        config.launch.args = result["args"].as<std::vector<std::string>>();
    }
    if (result.count("cwd")) {
        config.launch.working_directory = result["cwd"].as<std::string>();
    }
    if (result.count("env")) {
        for (const auto& entry : result["env"].as<std::vector<std::string>>()) {
            auto assignment = parse_env_assignment(entry);
            if (!assignment) {
                return tl::unexpected(assignment.error());
            }
            config.launch.environment[assignment->first] = assignment->second;
        }
    }
    if (result.count("clean-env")) {
        config.launch.inherit_environment = false;
    }

    if (result.count("script")) {
        const auto name = result["script"].as<std::string>();
        auto selection = parse_script_selection(name);
        if (!selection) {
            return tl::unexpected(ConfigError{
                ConfigError::Code::InvalidValue, "unknown script '" + name + "'"});
        }
        config.scripts = std::move(*selection);
    }

    const std::pair<const char*, std::chrono::milliseconds*> durations[] = {
        {"timeout", &config.probe.response_timeout},
        {"settle", &config.probe.settle_timeout},
        {"grace", &config.probe.grace_period},
    };
    for (const auto& [name, target] : durations) {
        if (result.count(name)) {
            auto value = seconds_option(result, name);
            if (!value) {
                return tl::unexpected(value.error());
            }
            *target = *value;
        }
    }

    if (result.count("protocol-version")) {
        config.protocol_version = result["protocol-version"].as<std::string>();
    }
    if (result.count("client-name")) {
        config.client.name = result["client-name"].as<std::string>();
    }
    if (result.count("client-version")) {
        config.client.version = result["client-version"].as<std::string>();
    }
    if (result.count("send-initialized")) {
        config.probe.send_initialized_notification = true;
    }
    if (result.count("keep-notifications")) {
        config.probe.skip_notifications = false;
    }

    config.json_output = result.count("json") > 0;
    config.colors = (result.count("no-color") == 0) && (::isatty(STDOUT_FILENO) == 1);
    if (result.count("verbose")) {
        config.log_level = LogLevel::Debug;
    }
    if (result.count("log-level")) {
        const auto name = result["log-level"].as<std::string>();
        auto level = parse_log_level(name);
        if (!level) {
            return tl::unexpected(ConfigError{
                ConfigError::Code::InvalidValue, "unknown log level '" + name + "'"});
        }
        config.log_level = *level;
    }
    if (result.count("log-file")) {
        config.log_file = result["log-file"].as<std::string>();
    }

    auto valid = validate(config);
    if (!valid) {
        return tl::unexpected(valid.error());
    }
    return config;
}

void install_logger(const ProbeConfig& config) {
    if (config.log_file.empty()) {
        set_logger(make_spdlog_console_logger(config.log_level));
    } else {
        set_logger(make_spdlog_console_file_logger(config.log_file, config.log_level));
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto options = build_options();

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help({"Server", "Probe", "Output"}) << "\n";
            std::cout << "Examples:\n"
                      << "  stdioprobe-cli --cwd ~/src/my-server\n"
                      << "  stdioprobe-cli -c node -a dist/index.js --cwd . -s handshake-omitted\n"
                      << "  stdioprobe-cli -c uv -a run -a server.py --cwd . -e API_KEY=test --json\n";
            return kExitPassed;
        }
        if (result.count("version")) {
            std::cout << "stdioprobe-cli " << kVersion << "\n";
            return kExitPassed;
        }

        auto config = config_from_args(result);
        if (!config) {
            print_error(config.error().message);
            return kExitUsage;
        }

        try {
            install_logger(*config);
        } catch (const spdlog::spdlog_ex& e) {
            print_error(std::string("cannot set up logging: ") + e.what());
            return kExitUsage;
        }

        ProbeOrchestrator orchestrator(config->probe);
        const auto reports = orchestrator.run_all(config->launch, config->build_scripts());

        if (config->json_output) {
            std::cout << dump_reports(reports) << "\n";
        } else {
            ReportPrinter printer(ReportStyle{config->colors});
            printer.print(std::cout, reports);
        }

        const bool launch_failed = std::any_of(reports.begin(), reports.end(),
            [](const ProbeReport& report) { return report.launch_error.has_value(); });
        if (launch_failed) {
            return kExitUsage;
        }
        const bool all_passed = std::all_of(reports.begin(), reports.end(),
            [](const ProbeReport& report) { return report.passed(); });
        return all_passed ? kExitPassed : kExitFailed;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return kExitUsage;
    }
}
