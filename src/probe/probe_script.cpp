#include "stdioprobe/probe/probe_script.hpp"

namespace stdioprobe {

std::string_view to_string(ScriptKind kind) noexcept {
    switch (kind) {
        case ScriptKind::HandshakeFirst:   return "handshake-first";
        case ScriptKind::HandshakeOmitted: return "handshake-omitted";
    }
    return "unknown";
}

std::optional<std::vector<ScriptKind>> parse_script_selection(std::string_view name) {
    if (name == "all") {
        return std::vector<ScriptKind>{ScriptKind::HandshakeFirst, ScriptKind::HandshakeOmitted};
    }
    if (name == to_string(ScriptKind::HandshakeFirst)) {
        return std::vector<ScriptKind>{ScriptKind::HandshakeFirst};
    }
    if (name == to_string(ScriptKind::HandshakeOmitted)) {
        return std::vector<ScriptKind>{ScriptKind::HandshakeOmitted};
    }
    return std::nullopt;
}

ProbeScript make_handshake_first_script(const ClientInfo& client,
                                        std::string_view protocol_version) {
    ProbeScript script;
    script.name = std::string(to_string(ScriptKind::HandshakeFirst));
    script.expects_handshake = true;
    script.steps.push_back(make_initialize_request(1, client, protocol_version));
    script.steps.push_back(make_list_tools_request(2));
    return script;
}

ProbeScript make_handshake_omitted_script() {
    ProbeScript script;
    script.name = std::string(to_string(ScriptKind::HandshakeOmitted));
    script.expects_handshake = false;
    script.steps.push_back(make_list_tools_request(1));
    return script;
}

ProbeScript make_script(ScriptKind kind,
                        const ClientInfo& client,
                        std::string_view protocol_version) {
    switch (kind) {
        case ScriptKind::HandshakeFirst:
            return make_handshake_first_script(client, protocol_version);
        case ScriptKind::HandshakeOmitted:
            return make_handshake_omitted_script();
    }
    return make_handshake_first_script(client, protocol_version);
}

}  // namespace stdioprobe
