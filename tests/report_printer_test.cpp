#include <catch2/catch_test_macros.hpp>

#include "stdioprobe/report/report_printer.hpp"

#include <sstream>

using namespace stdioprobe;
using namespace std::chrono_literals;

namespace {

ProbeReport sample_report() {
    ProbeReport report;
    report.script_name = "handshake-first";
    report.command = "python3 -m main --transport stdio";

    JsonRpcResponse init;
    init.id = 1;
    init.result = Json{{"protocolVersion", "2024-11-05"},
                       {"serverInfo", {{"name", "demo"}, {"version", "0.3"}}}};
    report.steps.push_back(StepResult{"initialize", 1, Success{init, "{...}"}, 12ms});

    report.steps.push_back(StepResult{
        "tools/list", 2,
        ProcessExited{1, "", "Traceback (most recent call last):\nKeyError: 'tools'\n"},
        30ms});

    report.exit_code = 1;
    report.stderr_text = "Traceback (most recent call last):\nKeyError: 'tools'\n";
    return report;
}

}  // namespace

TEST_CASE("describe_exit_code distinguishes signals", "[report]") {
    REQUIRE(describe_exit_code(0) == "0");
    REQUIRE(describe_exit_code(3) == "3");
    REQUIRE(describe_exit_code(-9) == "signal 9");
    REQUIRE(describe_exit_code(std::nullopt) == "unknown");
}

TEST_CASE("ReportPrinter describes each outcome kind", "[report]") {
    ReportPrinter printer(ReportStyle{false});

    JsonRpcResponse tools;
    tools.id = 2;
    tools.result = Json{{"tools", {{{"name", "add"}}, {{"name", "echo"}}}}};
    REQUIRE(printer.describe(StepResult{"tools/list", 2, Success{tools, ""}, 0ms})
            == "Success: 2 tools: add, echo");

    JsonRpcResponse rejected;
    rejected.id = 1;
    rejected.error = Json{{"code", -32002}, {"message", "Server not initialized"}};
    REQUIRE(printer.describe(StepResult{"tools/list", 1, Success{rejected, ""}, 0ms})
            == "Success (RPC error: Server not initialized)");

    REQUIRE(printer.describe(StepResult{"tools/list", 1, Timeout{1500ms}, 0ms})
            == "Timeout after 1500 ms");

    REQUIRE(printer.describe(StepResult{"tools/list", 1, ProcessExited{std::nullopt, "", ""}, 0ms})
            .find("still running") != std::string::npos);

    const auto decode = printer.describe(
        StepResult{"initialize", 1, DecodeError{"Starting...", "not JSON"}, 0ms});
    REQUIRE(decode.find("DecodeError") == 0);
    REQUIRE(decode.find("'Starting...'") != std::string::npos);

    REQUIRE(printer.describe(StepResult{"initialize", 1, WriteError{"Timed out"}, 0ms})
            == "WriteError: Timed out");
}

TEST_CASE("ReportPrinter prints steps, exit code and stderr", "[report]") {
    std::ostringstream out;
    ReportPrinter(ReportStyle{false}).print(out, sample_report());
    const std::string text = out.str();

    REQUIRE(text.find("== handshake-first ==") != std::string::npos);
    REQUIRE(text.find("1. initialize (id 1)  Success: server demo 0.3, protocol 2024-11-05")
            != std::string::npos);
    REQUIRE(text.find("2. tools/list (id 2)  ProcessExited (exit code 1)") != std::string::npos);
    REQUIRE(text.find("exit code: 1") != std::string::npos);
    REQUIRE(text.find("    | KeyError: 'tools'") != std::string::npos);
    REQUIRE(text.find("FAILED") != std::string::npos);
    REQUIRE(text.find('\033') == std::string::npos);
}

TEST_CASE("ReportPrinter elides long payloads", "[report]") {
    ReportStyle style{false, 20};
    ReportPrinter printer(style);

    JsonRpcResponse response;
    response.id = 1;
    response.result = Json{{"data", std::string(200, 'x')}};

    const auto line = printer.describe(StepResult{"custom", 1, Success{response, ""}, 0ms});
    REQUIRE(line.size() < 60);
    REQUIRE(line.find("...") != std::string::npos);
}

TEST_CASE("report_to_json carries every outcome field", "[report][json]") {
    const Json payload = report_to_json(sample_report());

    REQUIRE(payload["script"] == "handshake-first");
    REQUIRE(payload["passed"] == false);
    REQUIRE(payload["exit_code"] == 1);
    REQUIRE(payload["steps"].size() == 2);

    const Json& first = payload["steps"][0];
    REQUIRE(first["kind"] == "Success");
    REQUIRE(first["method"] == "initialize");
    REQUIRE(first["response"]["result"]["serverInfo"]["name"] == "demo");

    const Json& second = payload["steps"][1];
    REQUIRE(second["kind"] == "ProcessExited");
    REQUIRE(second["exit_code"] == 1);
    REQUIRE(second["stderr"].get<std::string>().find("KeyError") != std::string::npos);

    REQUIRE_FALSE(payload.contains("launch_error"));
}

TEST_CASE("report_to_json includes launch errors", "[report][json]") {
    ProbeReport report;
    report.script_name = "handshake-omitted";
    report.launch_error = LaunchError{LaunchError::Stage::Exec, 2, "Cannot execute 'srv'"};

    const Json payload = reports_to_json({report});
    REQUIRE(payload.is_array());
    REQUIRE(payload[0]["launch_error"]["stage"] == "exec");
    REQUIRE(payload[0]["launch_error"]["errno"] == 2);
    REQUIRE(payload[0]["steps"].empty());
    REQUIRE(payload[0]["exit_code"].is_null());
}

TEST_CASE("dump_reports replaces invalid UTF-8 from the server", "[report][json]") {
    ProbeReport report;
    report.script_name = "handshake-first";
    report.exit_code = 1;
    report.stderr_text = "caf\xe9 crashed\n";
    report.steps.push_back(StepResult{
        "initialize", 1, DecodeError{"\xff{\"jsonrpc\"", "invalid UTF-8"}, 5ms});
    report.steps.push_back(StepResult{
        "tools/list", 2, ProcessExited{1, "", "caf\xe9 crashed\n"}, 5ms});

    std::string text;
    REQUIRE_NOTHROW(text = dump_reports({report}));
    REQUIRE(text.find("caf\xEF\xBF\xBD crashed") != std::string::npos);
    REQUIRE(text.find("\xEF\xBF\xBD{") != std::string::npos);

    const Json parsed = Json::parse(text);
    REQUIRE(parsed[0]["steps"].size() == 2);
    REQUIRE(parsed[0]["steps"][0]["kind"] == "DecodeError");
}
