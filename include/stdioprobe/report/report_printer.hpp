#pragma once

#include "stdioprobe/probe/probe_outcome.hpp"

#include <iosfwd>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace stdioprobe {

struct ReportStyle {
    bool colors{true};
    std::size_t max_payload_chars{400};  // Longer result payloads are elided in text output
};

/// Human-readable report for terminals
class ReportPrinter {
public:
    explicit ReportPrinter(ReportStyle style = {});

    void print(std::ostream& out, const ProbeReport& report) const;
    void print(std::ostream& out, const std::vector<ProbeReport>& reports) const;

    /// One-line description of a step outcome ("Success: 3 tools: a, b, c")
    [[nodiscard]] std::string describe(const StepResult& step) const;

private:
    [[nodiscard]] std::string paint(const char* code, const std::string& text) const;
    [[nodiscard]] std::string elide(std::string text) const;

    ReportStyle style_;
};

/// "0", "1", "signal 15", or "unknown"
[[nodiscard]] std::string describe_exit_code(const std::optional<int>& exit_code);

[[nodiscard]] nlohmann::json outcome_to_json(const ProbeOutcome& outcome);
[[nodiscard]] nlohmann::json report_to_json(const ProbeReport& report);
[[nodiscard]] nlohmann::json reports_to_json(const std::vector<ProbeReport>& reports);

/// Serialize the reports as JSON text. Server bytes that are not valid
/// UTF-8 are replaced with U+FFFD instead of failing the dump.
[[nodiscard]] std::string dump_reports(const std::vector<ProbeReport>& reports, int indent = 2);

}  // namespace stdioprobe
