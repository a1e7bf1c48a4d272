#include "app_config.h"
#include "fs.h"
#include "gateway_txt.h"
#include "logger.h"
#include "os.h"

#define LOG_CONFIG_DEBUG(message) LOG_DEBUG("config", message)
#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_WARN(message)  LOG_WARN("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

namespace bridgelink {

namespace {

std::optional<std::string> non_blank(const std::string& value) {
    std::string trimmed = trim_whitespace(value);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

std::optional<std::string> env_value(const std::string& name) {
    return non_blank(get_environment_variable(name));
}

const nlohmann::json* child_object(const nlohmann::json& parent, const char* key) {
    auto it = parent.find(key);
    if (it == parent.end() || !it->is_object()) {
        return nullptr;
    }
    return &(*it);
}

std::optional<std::string> string_field(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        LOG_CONFIG_WARN("Ignoring non-string value for \"" << key << "\"");
        return std::nullopt;
    }
    return it->get<std::string>();
}

// Positive integer given as a JSON number or a numeric string
std::optional<int> port_field(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }

    int value = 0;
    if (it->is_number_integer()) {
        long long raw = it->get<long long>();
        if (raw <= 0 || raw > 65535) {
            return std::nullopt;
        }
        value = static_cast<int>(raw);
    } else if (it->is_string()) {
        if (!parse_int_strict(trim_whitespace(it->get<std::string>()), value) || value <= 0) {
            return std::nullopt;
        }
    } else {
        LOG_CONFIG_WARN("Ignoring non-numeric value for \"" << key << "\"");
        return std::nullopt;
    }
    return value;
}

} // namespace

EnvironmentOverrides read_environment_overrides() {
    EnvironmentOverrides env;
    env.gateway_port = env_value(ENV_GATEWAY_PORT);
    env.gateway_token = env_value(ENV_GATEWAY_TOKEN);
    env.gateway_password = env_value(ENV_GATEWAY_PASSWORD);
    return env;
}

std::string default_config_path() {
    std::optional<std::string> overridden = env_value(ENV_CONFIG_PATH);
    if (overridden) {
        return *overridden;
    }
    return combine_paths(combine_paths(get_home_directory(), ".clawdis"), "clawdis.json");
}

std::string default_state_directory() {
    std::optional<std::string> overridden = env_value(ENV_STATE_DIR);
    if (overridden) {
        return *overridden;
    }
    return combine_paths(combine_paths(get_home_directory(), ".clawdis"), "node");
}

bool parse_app_config(const std::string& content, AppConfig& config, std::string* error) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(content);
    } catch (const nlohmann::json::exception& e) {
        if (error) *error = std::string("invalid JSON: ") + e.what();
        return false;
    }
    if (!root.is_object()) {
        if (error) *error = "config root is not an object";
        return false;
    }

    try {
        if (const nlohmann::json* gateway = child_object(root, "gateway")) {
            config.gateway_port = port_field(*gateway, "port");

            if (const nlohmann::json* auth = child_object(*gateway, "auth")) {
                config.auth_password = string_field(*auth, "password");
            }

            if (const nlohmann::json* remote = child_object(*gateway, "remote")) {
                config.remote.password = string_field(*remote, "password");
                config.remote.ssh_target = trim_whitespace(string_field(*remote, "sshTarget").value_or(""));
                config.remote.identity_file = trim_whitespace(string_field(*remote, "identityFile").value_or(""));
                config.remote.remote_port = port_field(*remote, "remotePort").value_or(DEFAULT_GATEWAY_PORT);
                config.remote.local_port = port_field(*remote, "localPort").value_or(0);
            }
        }

        if (const nlohmann::json* discovery = child_object(root, "discovery")) {
            config.service_type = trim_whitespace(string_field(*discovery, "serviceType").value_or(""));
            config.wide_area_domain = trim_whitespace(string_field(*discovery, "wideAreaDomain").value_or(""));
            config.nameserver = trim_whitespace(string_field(*discovery, "nameserver").value_or(""));
        }

        if (const nlohmann::json* node = child_object(root, "node")) {
            config.display_name = trim_whitespace(string_field(*node, "displayName").value_or(""));
        }

        if (const nlohmann::json* logging = child_object(root, "logging")) {
            config.log_level = trim_whitespace(string_field(*logging, "level").value_or(""));
        }
    } catch (const nlohmann::json::exception& e) {
        if (error) *error = std::string("invalid config: ") + e.what();
        return false;
    }

    return true;
}

bool load_app_config(const std::string& path, AppConfig& config, std::string* error) {
    if (!file_exists(path)) {
        LOG_CONFIG_DEBUG("No config file at " << path << ", using defaults");
        return true;
    }

    std::string content = read_file_text_cpp(path);
    if (trim_whitespace(content).empty()) {
        LOG_CONFIG_WARN("Config file " << path << " is empty");
        return true;
    }

    std::string parse_error;
    if (!parse_app_config(content, config, &parse_error)) {
        LOG_CONFIG_ERROR("Failed to load config " << path << ": " << parse_error);
        if (error) *error = parse_error;
        return false;
    }

    LOG_CONFIG_INFO("Loaded config from " << path);
    return true;
}

int resolve_gateway_port(const AppConfig& config, const EnvironmentOverrides& env) {
    if (env.gateway_port) {
        int value = 0;
        if (parse_int_strict(trim_whitespace(*env.gateway_port), value) && value > 0) {
            return value;
        }
        LOG_CONFIG_WARN("Ignoring invalid " << ENV_GATEWAY_PORT << " value");
    }
    if (config.gateway_port && *config.gateway_port > 0) {
        return *config.gateway_port;
    }
    return DEFAULT_GATEWAY_PORT;
}

std::optional<std::string> resolve_gateway_password(bool is_remote, const AppConfig& config,
                                                    const EnvironmentOverrides& env) {
    if (env.gateway_password) {
        std::optional<std::string> overridden = non_blank(*env.gateway_password);
        if (overridden) {
            return overridden;
        }
    }

    const std::optional<std::string>& configured = is_remote ? config.remote.password : config.auth_password;
    if (!configured) {
        return std::nullopt;
    }
    return non_blank(*configured);
}

std::optional<std::string> resolve_gateway_token(const EnvironmentOverrides& env) {
    if (!env.gateway_token) {
        return std::nullopt;
    }
    return non_blank(*env.gateway_token);
}

} // namespace bridgelink
