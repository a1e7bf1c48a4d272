#pragma once

#include "app_config.h"
#include "bridge_settings_store.h"
#include "latest_value_channel.h"
#include "tunnel_provider.h"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace bridgelink {

enum class ConnectionMode {
    LOCAL,
    REMOTE,
    UNCONFIGURED
};

const char* connection_mode_to_string(ConnectionMode mode);

/**
 * Parse "local", "remote" or "unconfigured".
 * @return false for anything else, leaving mode untouched
 */
bool parse_connection_mode(const std::string& value, ConnectionMode& mode);

/**
 * Mode at startup: the persisted value (unknown values mean local), else local when
 * onboarding was seen, else unconfigured.
 */
ConnectionMode initial_connection_mode(const std::optional<std::string>& persisted_mode, bool onboarding_seen);

const std::string REASON_NO_CONTROL_TUNNEL = "Remote mode enabled but no active control tunnel";
const std::string REASON_NOT_CONFIGURED = "Gateway not configured";
const std::string REASON_REMOTE_NOT_ENABLED = "Remote mode is not enabled";

/**
 * The effective gateway control endpoint: ready to connect, or unavailable with a reason.
 */
struct GatewayEndpointState {
    bool ready = false;
    ConnectionMode mode = ConnectionMode::UNCONFIGURED;
    std::string url;                      // ready only
    std::optional<std::string> token;     // ready only
    std::optional<std::string> password;  // ready only
    std::string reason;                   // unavailable only

    static GatewayEndpointState make_ready(ConnectionMode mode, const std::string& url,
                                           const std::optional<std::string>& token,
                                           const std::optional<std::string>& password);
    static GatewayEndpointState make_unavailable(ConnectionMode mode, const std::string& reason);

    bool operator==(const GatewayEndpointState& other) const;
    bool operator!=(const GatewayEndpointState& other) const { return !(*this == other); }
};

// Loggable description; never includes the token or password
std::string describe_endpoint_state(const GatewayEndpointState& state);

std::string local_gateway_url(int port);

struct GatewayConfig {
    std::string url;
    std::optional<std::string> token;
    std::optional<std::string> password;
};

/**
 * EndpointResolver owns the single GatewayEndpointState of the process.
 *
 * Everything it needs from the outside world comes through Deps, so tests can drive it
 * with plain lambdas. Deps are invoked without the state lock held.
 */
class EndpointResolver {
public:
    struct Deps {
        std::function<ConnectionMode()> mode;
        std::function<std::optional<std::string>()> token;
        std::function<std::optional<std::string>(bool is_remote)> password;
        std::function<int()> local_port;
        std::function<std::optional<int>()> remote_port_if_running;
        std::function<std::optional<int>(std::string* error)> ensure_remote_tunnel;
    };

    using Subscription = LatestValueChannel<GatewayEndpointState>::Subscription;

    EndpointResolver(Deps deps, ConnectionMode initial_mode);
    ~EndpointResolver();

    GatewayEndpointState state() const;

    /**
     * Subscribe to state changes; the current state is delivered immediately.
     */
    std::unique_ptr<Subscription> subscribe();

    /**
     * Re-read the mode and resolve it.
     */
    void refresh();

    /**
     * Resolve the endpoint for a mode and publish it if it changed.
     */
    void set_mode(ConnectionMode mode);

    /**
     * Bring up the remote control tunnel and publish the remote endpoint.
     * @param error "Remote mode is not enabled" or the tunnel failure
     * @return Forwarded local port
     */
    std::optional<int> ensure_remote_control_tunnel(std::string* error = nullptr);

    /**
     * Refresh and return the connection parameters. In remote mode an unavailable
     * endpoint gets one attempt to bring the tunnel back.
     * @param error Reason the endpoint is unavailable
     */
    std::optional<GatewayConfig> require_config(std::string* error = nullptr);

private:
    GatewayEndpointState resolve(ConnectionMode mode);
    void set_state(const GatewayEndpointState& next);

    Deps deps_;
    mutable std::mutex mutex_;
    GatewayEndpointState state_;
    LatestValueChannel<GatewayEndpointState> channel_;
};

/**
 * Deps backed by the persisted settings, the config file, the environment and a tunnel
 * provider. Without a provider remote mode never becomes ready.
 * @param config Config used when config_path is empty or cannot be reloaded
 * @param config_path When set, password and port lookups reload this file each time
 */
EndpointResolver::Deps make_endpoint_deps(BridgeSettingsStore& settings, const AppConfig& config,
                                          const EnvironmentOverrides& env, TunnelProvider* tunnel,
                                          const std::string& config_path = std::string());

} // namespace bridgelink
