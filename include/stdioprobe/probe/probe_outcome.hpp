#pragma once

#include "stdioprobe/process/process_handle.hpp"
#include "stdioprobe/protocol/json_rpc.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace stdioprobe {

// ─────────────────────────────────────────────────────────────────────────────
// Step outcomes
// ─────────────────────────────────────────────────────────────────────────────

/// A response arrived. An RPC-level error response is still a Success.
struct Success {
    JsonRpcResponse response;
    std::string raw_line;
};

struct Timeout {
    std::chrono::milliseconds waited{0};
};

/// The server is gone. exit_code is empty when the server closed its stdout
/// but had not exited by the time the probe looked.
struct ProcessExited {
    std::optional<int> exit_code;
    std::string captured_stdout;
    std::string captured_stderr;
};

struct DecodeError {
    std::string raw_line;
    std::string cause;
};

struct WriteError {
    std::string cause;
};

using ProbeOutcome = std::variant<Success, Timeout, ProcessExited, DecodeError, WriteError>;

enum class OutcomeKind {
    Success,
    Timeout,
    ProcessExited,
    DecodeError,
    WriteError
};

[[nodiscard]] OutcomeKind kind_of(const ProbeOutcome& outcome) noexcept;
[[nodiscard]] std::string_view to_string(OutcomeKind kind) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Report
// ─────────────────────────────────────────────────────────────────────────────

struct StepResult {
    std::string method;
    std::int64_t id{0};
    ProbeOutcome outcome;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] OutcomeKind kind() const noexcept { return kind_of(outcome); }
};

struct ProbeReport {
    std::string script_name;
    std::string command;
    std::vector<StepResult> steps;
    std::vector<Json> notifications;       // Skipped server notifications, in arrival order
    std::optional<int> exit_code;          // Final status after teardown
    std::string stderr_text;               // Everything the server wrote to stderr
    std::string residual_stdout;           // stdout never consumed as a response
    std::optional<LaunchError> launch_error;
    std::chrono::milliseconds elapsed{0};

    /// Launched, and every step produced a response
    [[nodiscard]] bool passed() const noexcept;
};

}  // namespace stdioprobe
