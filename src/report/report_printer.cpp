#include "stdioprobe/report/report_printer.hpp"

#include <ostream>
#include <sstream>
#include <type_traits>

namespace stdioprobe {

namespace color {
constexpr const char* reset  = "\033[0m";
constexpr const char* bold   = "\033[1m";
constexpr const char* dim    = "\033[2m";
constexpr const char* red    = "\033[31m";
constexpr const char* green  = "\033[32m";
constexpr const char* yellow = "\033[33m";
}  // namespace color

namespace {

const char* kind_color(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Success:       return color::green;
        case OutcomeKind::Timeout:       return color::yellow;
        case OutcomeKind::ProcessExited: return color::red;
        case OutcomeKind::DecodeError:   return color::yellow;
        case OutcomeKind::WriteError:    return color::red;
    }
    return color::reset;
}

void print_block(std::ostream& out, const std::string& text) {
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        out << "    | " << line << "\n";
    }
}

std::string summarize_result(const Json& result) {
    if (const auto tools = result.find("tools"); tools != result.end() && tools->is_array()) {
        std::string summary = std::to_string(tools->size()) + " tool";
        if (tools->size() != 1) {
            summary += "s";
        }
        std::string names;
        for (const auto& tool : *tools) {
            if (tool.is_object() && tool.contains("name") && tool["name"].is_string()) {
                names += names.empty() ? "" : ", ";
                names += tool["name"].get<std::string>();
            }
        }
        if (!names.empty()) {
            summary += ": " + names;
        }
        return summary;
    }

    if (const auto info = result.find("serverInfo"); info != result.end() && info->is_object()) {
        std::string summary = "server " + info->value("name", std::string("?"));
        if (info->contains("version")) {
            summary += " " + info->value("version", std::string());
        }
        if (result.contains("protocolVersion") && result["protocolVersion"].is_string()) {
            summary += ", protocol " + result["protocolVersion"].get<std::string>();
        }
        return summary;
    }

    return "result " + result.dump();
}

}  // namespace

std::string describe_exit_code(const std::optional<int>& exit_code) {
    if (!exit_code.has_value()) {
        return "unknown";
    }
    if (*exit_code < 0) {
        return "signal " + std::to_string(-*exit_code);
    }
    return std::to_string(*exit_code);
}

// ─────────────────────────────────────────────────────────────────────────────
// Text
// ─────────────────────────────────────────────────────────────────────────────

ReportPrinter::ReportPrinter(ReportStyle style)
    : style_(style)
{}

std::string ReportPrinter::paint(const char* code, const std::string& text) const {
    if (!style_.colors) {
        return text;
    }
    return std::string(code) + text + color::reset;
}

std::string ReportPrinter::elide(std::string text) const {
    if (text.size() > style_.max_payload_chars) {
        text.resize(style_.max_payload_chars);
        text += "...";
    }
    return text;
}

std::string ReportPrinter::describe(const StepResult& step) const {
    const std::string kind(to_string(step.kind()));

    return std::visit([&](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;

        if constexpr (std::is_same_v<T, Success>) {
            if (value.response.is_error()) {
                return kind + " (RPC error: " + value.response.error_message() + ")";
            }
            return kind + ": " + elide(summarize_result(value.response.result.value_or(Json::object())));
        } else if constexpr (std::is_same_v<T, Timeout>) {
            return kind + " after " + std::to_string(value.waited.count()) + " ms";
        } else if constexpr (std::is_same_v<T, ProcessExited>) {
            if (!value.exit_code.has_value()) {
                return kind + " (stdout closed, process still running)";
            }
            return kind + " (exit code " + describe_exit_code(value.exit_code) + ")";
        } else if constexpr (std::is_same_v<T, DecodeError>) {
            return kind + ": " + value.cause + "; raw line: '" + elide(value.raw_line) + "'";
        } else {
            return kind + ": " + value.cause;
        }
    }, step.outcome);
}

void ReportPrinter::print(std::ostream& out, const ProbeReport& report) const {
    out << paint(color::bold, "== " + report.script_name + " ==");
    if (!report.command.empty()) {
        out << "  " << paint(color::dim, report.command);
    }
    out << "\n";

    if (report.launch_error.has_value()) {
        const auto& error = *report.launch_error;
        out << "  " << paint(color::red, "Launch failed")
            << " (" << to_string(error.stage) << "): " << error.message << "\n";
        out << "  " << paint(color::red, "FAILED") << "\n\n";
        return;
    }

    std::size_t index = 1;
    for (const auto& step : report.steps) {
        out << "  " << index++ << ". " << step.method << " (id " << step.id << ")  "
            << paint(kind_color(step.kind()), describe(step))
            << paint(color::dim, "  [" + std::to_string(step.elapsed.count()) + " ms]")
            << "\n";

        if (const auto* exited = std::get_if<ProcessExited>(&step.outcome)) {
            if (!exited->captured_stdout.empty()) {
                out << "    captured stdout:\n";
                print_block(out, exited->captured_stdout);
            }
        }
    }

    if (!report.notifications.empty()) {
        out << "  notifications skipped: " << report.notifications.size() << "\n";
    }
    out << "  exit code: " << describe_exit_code(report.exit_code) << "\n";

    if (!report.residual_stdout.empty()) {
        out << "  unconsumed stdout:\n";
        print_block(out, report.residual_stdout);
    }
    if (report.stderr_text.empty()) {
        out << "  stderr: " << paint(color::dim, "(empty)") << "\n";
    } else {
        out << "  stderr:\n";
        print_block(out, report.stderr_text);
    }

    out << "  " << (report.passed() ? paint(color::green, "PASSED") : paint(color::red, "FAILED"))
        << paint(color::dim, "  (" + std::to_string(report.elapsed.count()) + " ms)") << "\n\n";
}

void ReportPrinter::print(std::ostream& out, const std::vector<ProbeReport>& reports) const {
    for (const auto& report : reports) {
        print(out, report);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// JSON
// ─────────────────────────────────────────────────────────────────────────────

nlohmann::json outcome_to_json(const ProbeOutcome& outcome) {
    Json payload = {{"kind", std::string(to_string(kind_of(outcome)))}};

    std::visit([&](const auto& value) {
        using T = std::decay_t<decltype(value)>;

        if constexpr (std::is_same_v<T, Success>) {
            payload["response"] = value.response.to_json();
            payload["raw_line"] = value.raw_line;
        } else if constexpr (std::is_same_v<T, Timeout>) {
            payload["waited_ms"] = value.waited.count();
        } else if constexpr (std::is_same_v<T, ProcessExited>) {
            payload["exit_code"] = value.exit_code.has_value() ? Json(*value.exit_code) : Json(nullptr);
            payload["stdout"] = value.captured_stdout;
            payload["stderr"] = value.captured_stderr;
        } else if constexpr (std::is_same_v<T, DecodeError>) {
            payload["raw_line"] = value.raw_line;
            payload["cause"] = value.cause;
        } else {
            payload["cause"] = value.cause;
        }
    }, outcome);

    return payload;
}

nlohmann::json report_to_json(const ProbeReport& report) {
    Json payload = {
        {"script", report.script_name},
        {"command", report.command},
        {"passed", report.passed()},
        {"elapsed_ms", report.elapsed.count()}
    };

    if (report.launch_error.has_value()) {
        payload["launch_error"] = {
            {"stage", std::string(to_string(report.launch_error->stage))},
            {"errno", report.launch_error->os_error},
            {"message", report.launch_error->message}
        };
    }

    Json steps = Json::array();
    for (const auto& step : report.steps) {
        Json entry = outcome_to_json(step.outcome);
        entry["method"] = step.method;
        entry["id"] = step.id;
        entry["elapsed_ms"] = step.elapsed.count();
        steps.push_back(std::move(entry));
    }
    payload["steps"] = std::move(steps);
    payload["notifications"] = report.notifications;
    payload["exit_code"] = report.exit_code.has_value() ? Json(*report.exit_code) : Json(nullptr);
    payload["stderr"] = report.stderr_text;
    payload["unconsumed_stdout"] = report.residual_stdout;
    return payload;
}

nlohmann::json reports_to_json(const std::vector<ProbeReport>& reports) {
    Json payload = Json::array();
    for (const auto& report : reports) {
        payload.push_back(report_to_json(report));
    }
    return payload;
}

std::string dump_reports(const std::vector<ProbeReport>& reports, int indent) {
    return reports_to_json(reports).dump(indent, ' ', false, Json::error_handler_t::replace);
}

}  // namespace stdioprobe
