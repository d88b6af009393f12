#pragma once

#include "stdioprobe/log/logger.hpp"
#include "stdioprobe/probe/probe_orchestrator.hpp"
#include "stdioprobe/probe/probe_script.hpp"
#include "stdioprobe/process/process_handle.hpp"
#include "stdioprobe/protocol/json_rpc.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

namespace stdioprobe {

// ═══════════════════════════════════════════════════════════════════════════
// Probe Configuration
// ═══════════════════════════════════════════════════════════════════════════
// Defaults, then an optional JSON file, then command-line flags. The working
// directory has no default.
//
// Config file keys (all optional):
//   command, args[], cwd, env{}, inherit_env,
//   scripts ("all" | "handshake-first" | "handshake-omitted" | [...]),
//   timeout, settle, grace (seconds, may be fractional),
//   protocol_version, client{name, version},
//   send_initialized, skip_notifications, log_level, log_file

struct ConfigError {
    enum class Code {
        FileNotFound,
        ParseError,
        InvalidValue,
        MissingValue
    };

    Code code{Code::InvalidValue};
    std::string message;
};

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

struct ProbeConfig {
    LaunchConfig launch{
        .command = "python3",
        .args = {"-m", "main", "--transport", "stdio"},
    };
    ProbeOptions probe;
    std::vector<ScriptKind> scripts{ScriptKind::HandshakeFirst, ScriptKind::HandshakeOmitted};
    ClientInfo client;
    std::string protocol_version{kDefaultMcpProtocolVersion};

    bool json_output{false};
    bool colors{true};
    LogLevel log_level{LogLevel::Warn};
    std::string log_file;

    /// Scripts built from `scripts`, `client` and `protocol_version`
    [[nodiscard]] std::vector<ProbeScript> build_scripts() const;
};

/// Read a JSON config file and apply it on top of `base`
[[nodiscard]] ConfigResult<ProbeConfig> load_config_file(const std::string& path,
                                                        ProbeConfig base = {});

/// Apply an already parsed JSON object on top of `config`
[[nodiscard]] ConfigResult<void> apply_config_json(ProbeConfig& config, const Json& document);

/// Upper bound for every configured wait (timeout, settle, grace, drain)
inline constexpr std::chrono::milliseconds kMaxDuration = std::chrono::hours(24);

/// Check the invariants a run needs (command, working directory, timeouts)
[[nodiscard]] ConfigResult<void> validate(const ProbeConfig& config);

/// Split "NAME=VALUE"; the value may be empty, the name may not
[[nodiscard]] ConfigResult<std::pair<std::string, std::string>> parse_env_assignment(
    std::string_view assignment);

/// Seconds (fractional allowed) to milliseconds; rejects negative or non-finite
/// values and anything above kMaxDuration
[[nodiscard]] ConfigResult<std::chrono::milliseconds> seconds_to_duration(double seconds,
                                                                          std::string_view what);

}  // namespace stdioprobe
