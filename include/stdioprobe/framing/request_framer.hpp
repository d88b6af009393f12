#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Request Framer
// ═══════════════════════════════════════════════════════════════════════════
// Newline-delimited JSON-RPC over a child's stdin/stdout: one JSON object per
// line, terminated by a single '\n'.

#include "stdioprobe/process/process.hpp"
#include "stdioprobe/protocol/json_rpc.hpp"

#include <chrono>
#include <string>
#include <variant>

namespace stdioprobe {

// ─────────────────────────────────────────────────────────────────────────────
// Read results
// ─────────────────────────────────────────────────────────────────────────────

struct ReceivedResponse {
    JsonRpcResponse response;
    std::string raw_line;
};

/// A line that is not a valid JSON-RPC response; raw_line is kept verbatim
struct MalformedLine {
    std::string raw_line;
    std::string cause;
};

/// A server-initiated message (method, no id)
struct ReceivedNotification {
    Json message;
    std::string raw_line;
};

/// stdout reached end-of-file before a full line arrived
struct StreamClosed {
    std::string partial;
};

struct ReadTimedOut {};

using ReadResponse = std::variant<
    ReceivedResponse,
    MalformedLine,
    ReceivedNotification,
    StreamClosed,
    ReadTimedOut
>;

struct FramerOptions {
    std::chrono::milliseconds write_timeout{std::chrono::seconds(10)};
};

/// Serialize to a single line plus exactly one '\n'
[[nodiscard]] std::string encode_line(const Json& message);
[[nodiscard]] std::string encode_request(const JsonRpcRequest& request);

/// Classify one line of server output
[[nodiscard]] ReadResponse decode_line(std::string line);

class RequestFramer {
public:
    explicit RequestFramer(IProcess& process, FramerOptions options = {});

    [[nodiscard]] ProcessResult<void> write_request(const JsonRpcRequest& request);
    [[nodiscard]] ProcessResult<void> write_notification(const JsonRpcNotification& notification);

    /// Read the next non-blank line within `timeout` and classify it
    [[nodiscard]] ReadResponse read_response(std::chrono::milliseconds timeout);

private:
    [[nodiscard]] ProcessResult<void> write_line(const std::string& line);

    IProcess& process_;
    FramerOptions options_;
};

}  // namespace stdioprobe
