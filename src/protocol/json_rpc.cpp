#include "stdioprobe/protocol/json_rpc.hpp"

namespace stdioprobe {

namespace {

JsonResult<std::optional<std::int64_t>> parse_id_field(const Json& payload, bool is_error) {
    if (payload.contains("id") == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing id field"});
    }

    const Json& id_node = payload.at("id");
    if (id_node.is_number_integer() == true) {
        return std::optional<std::int64_t>{id_node.get<std::int64_t>()};
    }
    if ((id_node.is_null() == true) && (is_error == true)) {
        return std::optional<std::int64_t>{};
    }

    return tl::unexpected(JsonError{
        JsonError::Code::InvalidId,
        "id must be an integer"});
}

}  // namespace

std::string_view to_string(JsonError::Code code) noexcept {
    switch (code) {
        case JsonError::Code::ParseError:     return "parse error";
        case JsonError::Code::NotAnObject:    return "not an object";
        case JsonError::Code::InvalidVersion: return "invalid version";
        case JsonError::Code::MissingField:   return "missing field";
        case JsonError::Code::InvalidId:      return "invalid id";
        case JsonError::Code::InvalidResult:  return "invalid result";
        case JsonError::Code::InvalidError:   return "invalid error";
        case JsonError::Code::Internal:       return "internal";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method, std::int64_t id, Json params)
    : protocol_version_(kJsonRpcVersion),
      id_(id),
      method_(std::move(method)),
      params_(std::move(params)) {}

const std::string& JsonRpcRequest::protocol_version() const noexcept {
    return protocol_version_;
}

std::int64_t JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const Json& JsonRpcRequest::params() const noexcept {
    return params_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = protocol_version_;
    payload["id"] = id_;
    payload["method"] = method_;
    payload["params"] = params_;
    return payload;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcNotification
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcNotification::JsonRpcNotification(std::string method,
                                         std::optional<Json> params)
    : method_(std::move(method)),
      params_(std::move(params)) {}

const std::string& JsonRpcNotification::method() const noexcept {
    return method_;
}

const std::optional<Json>& JsonRpcNotification::params() const noexcept {
    return params_;
}

Json JsonRpcNotification::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcResponse
// ─────────────────────────────────────────────────────────────────────────────

std::string JsonRpcResponse::error_message() const {
    if (error.has_value() == false) {
        return {};
    }
    const auto it = error->find("message");
    if ((it == error->end()) || (it->is_string() == false)) {
        return {};
    }
    return it->get<std::string>();
}

Json JsonRpcResponse::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    if (id.has_value()) {
        payload["id"] = *id;
    } else {
        payload["id"] = nullptr;
    }
    if (result.has_value()) {
        payload["result"] = *result;
    }
    if (error.has_value()) {
        payload["error"] = *error;
    }
    return payload;
}

JsonResult<JsonRpcResponse> JsonRpcResponse::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::NotAnObject,
            "payload must be a JSON object"});
    }

    // Servers in the wild often omit "jsonrpc"; only a wrong value is rejected
    const auto version_it = payload.find("jsonrpc");
    if (version_it != payload.end()) {
        if ((version_it->is_string() == false) || (*version_it != kJsonRpcVersion)) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidVersion,
                "jsonrpc must equal \"2.0\""});
        }
    }

    const bool has_result = payload.contains("result");
    const bool has_error = payload.contains("error");
    if ((has_result == false) && (has_error == false)) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "response has neither result nor error"});
    }
    if ((has_result == true) && (has_error == true)) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidResult,
            "response has both result and error"});
    }

    auto parsed_id = parse_id_field(payload, has_error);
    if (parsed_id.has_value() == false) {
        return tl::unexpected(parsed_id.error());
    }

    JsonRpcResponse response;
    response.id = *parsed_id;

    if (has_result == true) {
        const Json& result_node = payload.at("result");
        if (result_node.is_object() == false) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidResult,
                "result must be an object"});
        }
        response.result = result_node;
    } else {
        const Json& error_node = payload.at("error");
        if (error_node.is_object() == false) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidError,
                "error must be an object"});
        }
        const auto message_it = error_node.find("message");
        if ((message_it == error_node.end()) || (message_it->is_string() == false)) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidError,
                "error.message must be a string"});
        }
        response.error = error_node;
    }

    return response;
}

JsonResult<JsonRpcResponse> parse_response(std::string_view text) {
    Json payload;
    try {
        payload = Json::parse(text);
    } catch (const Json::parse_error& e) {
        return tl::unexpected(JsonError{
            JsonError::Code::ParseError,
            std::string("Failed to parse JSON: ") + e.what()});
    }
    return JsonRpcResponse::from_json(payload);
}

bool is_notification(const Json& payload) noexcept {
    return payload.is_object() && payload.contains("method") && !payload.contains("id");
}

// ─────────────────────────────────────────────────────────────────────────────
// MCP request builders
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest make_initialize_request(std::int64_t id,
                                       const ClientInfo& client,
                                       std::string_view protocol_version) {
    Json params = {
        {"protocolVersion", std::string(protocol_version)},
        {"capabilities", Json::object()},
        {"clientInfo", {{"name", client.name}, {"version", client.version}}}
    };
    return JsonRpcRequest("initialize", id, std::move(params));
}

JsonRpcRequest make_list_tools_request(std::int64_t id) {
    return JsonRpcRequest("tools/list", id, Json::object());
}

JsonRpcNotification make_initialized_notification() {
    return JsonRpcNotification("notifications/initialized");
}

}  // namespace stdioprobe
