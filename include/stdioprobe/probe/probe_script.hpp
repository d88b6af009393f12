#pragma once

#include "stdioprobe/protocol/json_rpc.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stdioprobe {

/// An ordered list of requests sent one at a time, one read per write
struct ProbeScript {
    std::string name;
    bool expects_handshake{true};
    std::vector<JsonRpcRequest> steps;
};

enum class ScriptKind {
    HandshakeFirst,   // initialize, then tools/list
    HandshakeOmitted  // tools/list with no initialize
};

[[nodiscard]] std::string_view to_string(ScriptKind kind) noexcept;

/// Accepts "handshake-first", "handshake-omitted" or "all"
[[nodiscard]] std::optional<std::vector<ScriptKind>> parse_script_selection(std::string_view name);

[[nodiscard]] ProbeScript make_handshake_first_script(
    const ClientInfo& client,
    std::string_view protocol_version = kDefaultMcpProtocolVersion
);

[[nodiscard]] ProbeScript make_handshake_omitted_script();

[[nodiscard]] ProbeScript make_script(
    ScriptKind kind,
    const ClientInfo& client,
    std::string_view protocol_version = kDefaultMcpProtocolVersion
);

}  // namespace stdioprobe
