#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace bridgelink {

const int DEFAULT_GATEWAY_PORT = 18789;

// Environment variables read by the node
const std::string ENV_CONFIG_PATH = "CLAWDIS_CONFIG_PATH";
const std::string ENV_STATE_DIR = "CLAWDIS_STATE_DIR";
const std::string ENV_GATEWAY_PORT = "CLAWDIS_GATEWAY_PORT";
const std::string ENV_GATEWAY_TOKEN = "CLAWDIS_GATEWAY_TOKEN";
const std::string ENV_GATEWAY_PASSWORD = "CLAWDIS_GATEWAY_PASSWORD";
const std::string ENV_LOG_LEVEL = "BRIDGELINK_LOG_LEVEL";

/**
 * Where the remote gateway is and how to tunnel to it.
 */
struct RemoteGatewayConfig {
    std::string ssh_target;                 // "user@host" or "user@host:port"
    int remote_port = DEFAULT_GATEWAY_PORT; // gateway port on the remote host
    int local_port = 0;                     // forwarded local port, 0 picks a free one
    std::string identity_file;
    std::optional<std::string> password;
};

struct AppConfig {
    std::optional<int> gateway_port;
    std::optional<std::string> auth_password;
    RemoteGatewayConfig remote;

    std::string service_type;     // empty means the default bridge service type
    std::string wide_area_domain; // extra unicast DNS-SD domain, e.g. a tailnet domain
    std::string nameserver;       // for the wide-area domain, empty uses the system resolver

    std::string display_name;
    std::string log_level;
};

/**
 * Values the environment may override. Blank variables count as unset.
 */
struct EnvironmentOverrides {
    std::optional<std::string> gateway_port;
    std::optional<std::string> gateway_token;
    std::optional<std::string> gateway_password;
};

EnvironmentOverrides read_environment_overrides();

/**
 * $CLAWDIS_CONFIG_PATH, or ~/.clawdis/clawdis.json
 */
std::string default_config_path();

/**
 * $CLAWDIS_STATE_DIR, or ~/.clawdis/node
 */
std::string default_state_directory();

/**
 * Parse the JSON configuration. Unknown keys are ignored; keys of the wrong type are
 * skipped with a warning.
 * @return false if the text is not a JSON object
 */
bool parse_app_config(const std::string& content, AppConfig& config, std::string* error = nullptr);

/**
 * Load the configuration file. A missing file leaves the defaults in place.
 */
bool load_app_config(const std::string& path, AppConfig& config, std::string* error = nullptr);

/**
 * Environment override, then gateway.port, then 18789. Values must be positive.
 */
int resolve_gateway_port(const AppConfig& config, const EnvironmentOverrides& env);

/**
 * Trimmed environment override, else gateway.remote.password in remote mode or
 * gateway.auth.password otherwise. Blank values count as absent.
 */
std::optional<std::string> resolve_gateway_password(bool is_remote, const AppConfig& config,
                                                    const EnvironmentOverrides& env);

std::optional<std::string> resolve_gateway_token(const EnvironmentOverrides& env);

} // namespace bridgelink
