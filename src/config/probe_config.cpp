#include "stdioprobe/config/probe_config.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>

namespace stdioprobe {

namespace {

ConfigError invalid(std::string message) {
    return ConfigError{ConfigError::Code::InvalidValue, std::move(message)};
}

ConfigResult<std::string> string_field(const Json& document, const char* key) {
    const Json& node = document.at(key);
    if (!node.is_string()) {
        return tl::unexpected(invalid(std::string("'") + key + "' must be a string"));
    }
    return node.get<std::string>();
}

ConfigResult<bool> bool_field(const Json& document, const char* key) {
    const Json& node = document.at(key);
    if (!node.is_boolean()) {
        return tl::unexpected(invalid(std::string("'") + key + "' must be true or false"));
    }
    return node.get<bool>();
}

ConfigResult<std::chrono::milliseconds> seconds_field(const Json& document, const char* key) {
    const Json& node = document.at(key);
    if (!node.is_number()) {
        return tl::unexpected(invalid(std::string("'") + key + "' must be a number of seconds"));
    }
    return seconds_to_duration(node.get<double>(), key);
}

ConfigResult<std::vector<ScriptKind>> scripts_field(const Json& document) {
    const Json& node = document.at("scripts");
    std::vector<std::string> names;

    if (node.is_string()) {
        names.push_back(node.get<std::string>());
    } else if (node.is_array()) {
        for (const auto& entry : node) {
            if (!entry.is_string()) {
                return tl::unexpected(invalid("'scripts' entries must be strings"));
            }
            names.push_back(entry.get<std::string>());
        }
    } else {
        return tl::unexpected(invalid("'scripts' must be a string or an array of strings"));
    }

    std::vector<ScriptKind> kinds;
    for (const auto& name : names) {
        auto selection = parse_script_selection(name);
        if (!selection) {
            return tl::unexpected(invalid("unknown script '" + name + "'"));
        }
        for (ScriptKind kind : *selection) {
            if (std::find(kinds.begin(), kinds.end(), kind) == kinds.end()) {
                kinds.push_back(kind);
            }
        }
    }
    return kinds;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

ConfigResult<std::chrono::milliseconds> seconds_to_duration(double seconds, std::string_view what) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        return tl::unexpected(invalid(std::string(what) + " must be a non-negative number of seconds"));
    }
    if (seconds > std::chrono::duration<double>(kMaxDuration).count()) {
        return tl::unexpected(invalid(std::string(what) + " must not exceed 24 hours"));
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

ConfigResult<std::pair<std::string, std::string>> parse_env_assignment(std::string_view assignment) {
    const auto equals = assignment.find('=');
    if (equals == std::string_view::npos) {
        return tl::unexpected(invalid("environment entry '" + std::string(assignment) +
                                      "' must look like NAME=VALUE"));
    }
    if (equals == 0) {
        return tl::unexpected(invalid("environment entry '" + std::string(assignment) +
                                      "' has an empty name"));
    }
    return std::make_pair(std::string(assignment.substr(0, equals)),
                          std::string(assignment.substr(equals + 1)));
}

std::vector<ProbeScript> ProbeConfig::build_scripts() const {
    std::vector<ProbeScript> built;
    built.reserve(scripts.size());
    for (ScriptKind kind : scripts) {
        built.push_back(make_script(kind, client, protocol_version));
    }
    return built;
}

// ─────────────────────────────────────────────────────────────────────────────
// JSON file
// ─────────────────────────────────────────────────────────────────────────────

ConfigResult<void> apply_config_json(ProbeConfig& config, const Json& document) {
    if (!document.is_object()) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::ParseError, "config file must contain a JSON object"});
    }

    if (document.contains("command")) {
        auto value = string_field(document, "command");
        if (!value) return tl::unexpected(value.error());
        config.launch.command = std::move(*value);
    }

    if (document.contains("args")) {
        const Json& node = document.at("args");
        if (!node.is_array()) {
            return tl::unexpected(invalid("'args' must be an array of strings"));
        }
        std::vector<std::string> args;
        for (const auto& entry : node) {
            if (!entry.is_string()) {
                return tl::unexpected(invalid("'args' entries must be strings"));
            }
            args.push_back(entry.get<std::string>());
        }
        config.launch.args = std::move(args);
    }

    if (document.contains("cwd")) {
        auto value = string_field(document, "cwd");
        if (!value) return tl::unexpected(value.error());
        config.launch.working_directory = std::move(*value);
    }

    if (document.contains("env")) {
        const Json& node = document.at("env");
        if (!node.is_object()) {
            return tl::unexpected(invalid("'env' must be an object of strings"));
        }
        for (const auto& [name, value] : node.items()) {
            if (!value.is_string()) {
                return tl::unexpected(invalid("'env." + name + "' must be a string"));
            }
            config.launch.environment[name] = value.get<std::string>();
        }
    }

    if (document.contains("inherit_env")) {
        auto value = bool_field(document, "inherit_env");
        if (!value) return tl::unexpected(value.error());
        config.launch.inherit_environment = *value;
    }

    if (document.contains("scripts")) {
        auto value = scripts_field(document);
        if (!value) return tl::unexpected(value.error());
        config.scripts = std::move(*value);
    }

    const std::pair<const char*, std::chrono::milliseconds*> durations[] = {
        {"timeout", &config.probe.response_timeout},
        {"settle", &config.probe.settle_timeout},
        {"grace", &config.probe.grace_period},
    };
    for (const auto& [key, target] : durations) {
        if (document.contains(key)) {
            auto value = seconds_field(document, key);
            if (!value) return tl::unexpected(value.error());
            *target = *value;
        }
    }

    if (document.contains("protocol_version")) {
        auto value = string_field(document, "protocol_version");
        if (!value) return tl::unexpected(value.error());
        config.protocol_version = std::move(*value);
    }

    if (document.contains("client")) {
        const Json& node = document.at("client");
        if (!node.is_object()) {
            return tl::unexpected(invalid("'client' must be an object with name and version"));
        }
        if (node.contains("name")) {
            auto value = string_field(node, "name");
            if (!value) return tl::unexpected(value.error());
            config.client.name = std::move(*value);
        }
        if (node.contains("version")) {
            auto value = string_field(node, "version");
            if (!value) return tl::unexpected(value.error());
            config.client.version = std::move(*value);
        }
    }

    if (document.contains("send_initialized")) {
        auto value = bool_field(document, "send_initialized");
        if (!value) return tl::unexpected(value.error());
        config.probe.send_initialized_notification = *value;
    }

    if (document.contains("skip_notifications")) {
        auto value = bool_field(document, "skip_notifications");
        if (!value) return tl::unexpected(value.error());
        config.probe.skip_notifications = *value;
    }

    if (document.contains("log_level")) {
        auto value = string_field(document, "log_level");
        if (!value) return tl::unexpected(value.error());
        auto level = parse_log_level(*value);
        if (!level) {
            return tl::unexpected(invalid("unknown log level '" + *value + "'"));
        }
        config.log_level = *level;
    }

    if (document.contains("log_file")) {
        auto value = string_field(document, "log_file");
        if (!value) return tl::unexpected(value.error());
        config.log_file = std::move(*value);
    }

    return {};
}

ConfigResult<ProbeConfig> load_config_file(const std::string& path, ProbeConfig base) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::FileNotFound, "cannot open config file '" + path + "'"});
    }

    Json document;
    try {
        document = Json::parse(file);
    } catch (const Json::parse_error& e) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::ParseError,
            "invalid JSON in '" + path + "': " + e.what()});
    }

    auto applied = apply_config_json(base, document);
    if (!applied) {
        return tl::unexpected(applied.error());
    }
    return base;
}

ConfigResult<void> validate(const ProbeConfig& config) {
    if (config.launch.command.empty()) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::MissingValue, "a server command is required (--command)"});
    }
    if (config.launch.working_directory.empty()) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::MissingValue,
            "a working directory is required (--cwd or \"cwd\" in the config file)"});
    }
    if (config.scripts.empty()) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::MissingValue, "no scripts selected"});
    }
    if (config.probe.response_timeout.count() <= 0) {
        return tl::unexpected(invalid("timeout must be greater than zero"));
    }
    if (config.probe.grace_period.count() <= 0) {
        return tl::unexpected(invalid("grace period must be greater than zero"));
    }
    const std::pair<std::string_view, std::chrono::milliseconds> waits[] = {
        {"timeout", config.probe.response_timeout},
        {"settle", config.probe.settle_timeout},
        {"grace period", config.probe.grace_period},
        {"drain", config.probe.drain_timeout},
    };
    for (const auto& [name, wait] : waits) {
        if (wait > kMaxDuration) {
            return tl::unexpected(invalid(std::string(name) + " must not exceed 24 hours"));
        }
    }
    if (config.protocol_version.empty()) {
        return tl::unexpected(invalid("protocol version must not be empty"));
    }
    return {};
}

}  // namespace stdioprobe
