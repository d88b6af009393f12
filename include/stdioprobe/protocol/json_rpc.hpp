#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace stdioprobe {

using Json = nlohmann::json;

inline constexpr std::string_view kJsonRpcVersion{"2.0"};
inline constexpr std::string_view kDefaultMcpProtocolVersion{"2024-11-05"};

struct JsonError {
    enum class Code {
        ParseError,      // Not valid JSON text
        NotAnObject,
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidResult,
        InvalidError,
        Internal
    };

    Code code{Code::Internal};
    std::string message;
};

[[nodiscard]] std::string_view to_string(JsonError::Code code) noexcept;

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

// ─────────────────────────────────────────────────────────────────────────────
// Request
// ─────────────────────────────────────────────────────────────────────────────

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, std::int64_t id, Json params = Json::object());

    [[nodiscard]] const std::string& protocol_version() const noexcept;
    [[nodiscard]] std::int64_t id() const noexcept;
    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const Json& params() const noexcept;

    [[nodiscard]] Json to_json() const;

private:
    std::string protocol_version_;
    std::int64_t id_;
    std::string method_;
    Json params_;
};

class JsonRpcNotification {
public:
    explicit JsonRpcNotification(std::string method, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;

private:
    std::string method_;
    std::optional<Json> params_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Response
// ─────────────────────────────────────────────────────────────────────────────
// Exactly one of result/error is set. id is empty only for error responses
// that carry "id": null (the server could not parse the request).

struct JsonRpcResponse {
    std::optional<std::int64_t> id;
    std::optional<Json> result;
    std::optional<Json> error;

    [[nodiscard]] bool is_error() const noexcept { return error.has_value(); }

    /// error.message, or an empty string
    [[nodiscard]] std::string error_message() const;

    [[nodiscard]] Json to_json() const;

    static JsonResult<JsonRpcResponse> from_json(const Json& payload);
};

/// Parse one line of text into a response
[[nodiscard]] JsonResult<JsonRpcResponse> parse_response(std::string_view text);

/// A server-to-client message with a method and no id
[[nodiscard]] bool is_notification(const Json& payload) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// MCP request builders
// ─────────────────────────────────────────────────────────────────────────────

struct ClientInfo {
    std::string name{"stdioprobe"};
    std::string version{"1.0.0"};
};

[[nodiscard]] JsonRpcRequest make_initialize_request(
    std::int64_t id,
    const ClientInfo& client,
    std::string_view protocol_version = kDefaultMcpProtocolVersion
);

[[nodiscard]] JsonRpcRequest make_list_tools_request(std::int64_t id);

[[nodiscard]] JsonRpcNotification make_initialized_notification();

}  // namespace stdioprobe
