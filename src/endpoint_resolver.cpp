#include "endpoint_resolver.h"
#include "bridgelink_log_macros.h"
#include "gateway_txt.h"

namespace bridgelink {

const char* connection_mode_to_string(ConnectionMode mode) {
    switch (mode) {
        case ConnectionMode::LOCAL: return "local";
        case ConnectionMode::REMOTE: return "remote";
        case ConnectionMode::UNCONFIGURED: return "unconfigured";
    }
    return "unknown";
}

bool parse_connection_mode(const std::string& value, ConnectionMode& mode) {
    std::string normalized = to_lower_ascii(trim_whitespace(value));
    if (normalized == "local") {
        mode = ConnectionMode::LOCAL;
    } else if (normalized == "remote") {
        mode = ConnectionMode::REMOTE;
    } else if (normalized == "unconfigured") {
        mode = ConnectionMode::UNCONFIGURED;
    } else {
        return false;
    }
    return true;
}

ConnectionMode initial_connection_mode(const std::optional<std::string>& persisted_mode, bool onboarding_seen) {
    if (persisted_mode) {
        ConnectionMode mode = ConnectionMode::LOCAL;
        parse_connection_mode(*persisted_mode, mode);
        return mode;
    }
    return onboarding_seen ? ConnectionMode::LOCAL : ConnectionMode::UNCONFIGURED;
}

GatewayEndpointState GatewayEndpointState::make_ready(ConnectionMode mode, const std::string& url,
                                                      const std::optional<std::string>& token,
                                                      const std::optional<std::string>& password) {
    GatewayEndpointState state;
    state.ready = true;
    state.mode = mode;
    state.url = url;
    state.token = token;
    state.password = password;
    return state;
}

GatewayEndpointState GatewayEndpointState::make_unavailable(ConnectionMode mode, const std::string& reason) {
    GatewayEndpointState state;
    state.ready = false;
    state.mode = mode;
    state.reason = reason;
    return state;
}

bool GatewayEndpointState::operator==(const GatewayEndpointState& other) const {
    return ready == other.ready && mode == other.mode && url == other.url && token == other.token &&
           password == other.password && reason == other.reason;
}

std::string describe_endpoint_state(const GatewayEndpointState& state) {
    std::string mode = connection_mode_to_string(state.mode);
    if (state.ready) {
        return "ready mode=" + mode + " url=" + state.url;
    }
    return "unavailable mode=" + mode + " reason=" + state.reason;
}

std::string local_gateway_url(int port) {
    return "ws://127.0.0.1:" + std::to_string(port);
}

//=============================================================================
// EndpointResolver
//=============================================================================

EndpointResolver::EndpointResolver(Deps deps, ConnectionMode initial_mode) : deps_(std::move(deps)) {
    switch (initial_mode) {
        case ConnectionMode::LOCAL:
            state_ = GatewayEndpointState::make_ready(ConnectionMode::LOCAL, local_gateway_url(deps_.local_port()),
                                                      deps_.token(), deps_.password(false));
            break;
        case ConnectionMode::REMOTE:
            state_ = GatewayEndpointState::make_unavailable(ConnectionMode::REMOTE, REASON_NO_CONTROL_TUNNEL);
            break;
        case ConnectionMode::UNCONFIGURED:
            state_ = GatewayEndpointState::make_unavailable(ConnectionMode::UNCONFIGURED, REASON_NOT_CONFIGURED);
            break;
    }
    LOG_ENDPOINT_DEBUG("Initial endpoint: " << describe_endpoint_state(state_));
}

EndpointResolver::~EndpointResolver() {
    channel_.close();
}

GatewayEndpointState EndpointResolver::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::unique_ptr<EndpointResolver::Subscription> EndpointResolver::subscribe() {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_.subscribe(state_);
}

void EndpointResolver::refresh() {
    set_mode(deps_.mode());
}

void EndpointResolver::set_mode(ConnectionMode mode) {
    set_state(resolve(mode));
}

GatewayEndpointState EndpointResolver::resolve(ConnectionMode mode) {
    switch (mode) {
        case ConnectionMode::LOCAL:
            return GatewayEndpointState::make_ready(ConnectionMode::LOCAL, local_gateway_url(deps_.local_port()),
                                                    deps_.token(), deps_.password(false));
        case ConnectionMode::REMOTE: {
            std::optional<int> port = deps_.remote_port_if_running();
            if (!port) {
                return GatewayEndpointState::make_unavailable(ConnectionMode::REMOTE, REASON_NO_CONTROL_TUNNEL);
            }
            return GatewayEndpointState::make_ready(ConnectionMode::REMOTE, local_gateway_url(*port),
                                                    deps_.token(), deps_.password(true));
        }
        case ConnectionMode::UNCONFIGURED:
            break;
    }
    return GatewayEndpointState::make_unavailable(ConnectionMode::UNCONFIGURED, REASON_NOT_CONFIGURED);
}

std::optional<int> EndpointResolver::ensure_remote_control_tunnel(std::string* error) {
    if (deps_.mode() != ConnectionMode::REMOTE) {
        if (error) *error = REASON_REMOTE_NOT_ENABLED;
        return std::nullopt;
    }

    std::string tunnel_error;
    std::optional<int> port = deps_.ensure_remote_tunnel(&tunnel_error);
    if (!port) {
        LOG_ENDPOINT_ERROR("Remote control tunnel failed: " << tunnel_error);
        if (error) *error = tunnel_error;
        return std::nullopt;
    }

    set_mode(ConnectionMode::REMOTE);
    return port;
}

std::optional<GatewayConfig> EndpointResolver::require_config(std::string* error) {
    refresh();

    GatewayEndpointState current = state();
    if (current.ready) {
        GatewayConfig config;
        config.url = current.url;
        config.token = current.token;
        config.password = current.password;
        return config;
    }

    if (current.mode != ConnectionMode::REMOTE) {
        if (error) *error = current.reason;
        return std::nullopt;
    }

    // Remote mode: the tunnel may have died or never been started; try once to bring it back
    LOG_ENDPOINT_INFO("Endpoint unavailable, ensuring remote control tunnel (reason: " << current.reason << ")");
    std::string tunnel_error;
    std::optional<int> forwarded = deps_.ensure_remote_tunnel(&tunnel_error);
    if (!forwarded) {
        std::string message = current.reason + " (" + tunnel_error + ")";
        set_state(GatewayEndpointState::make_unavailable(ConnectionMode::REMOTE, message));
        LOG_ENDPOINT_ERROR("Remote control tunnel ensure failed: " << message);
        if (error) *error = message;
        return std::nullopt;
    }

    GatewayConfig config;
    config.url = local_gateway_url(*forwarded);
    config.token = deps_.token();
    config.password = deps_.password(true);
    set_state(GatewayEndpointState::make_ready(ConnectionMode::REMOTE, config.url, config.token, config.password));
    return config;
}

void EndpointResolver::set_state(const GatewayEndpointState& next) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (next == state_) {
        return;
    }
    state_ = next;
    LOG_ENDPOINT_DEBUG("Endpoint changed: " << describe_endpoint_state(next));
    channel_.publish(next);
}

//=============================================================================
// Live dependencies
//=============================================================================

EndpointResolver::Deps make_endpoint_deps(BridgeSettingsStore& settings, const AppConfig& config,
                                          const EnvironmentOverrides& env, TunnelProvider* tunnel,
                                          const std::string& config_path) {
    // Re-read the config file on every lookup so password and port edits apply without a restart
    auto current_config = [config, config_path]() {
        if (config_path.empty()) {
            return config;
        }
        AppConfig fresh;
        std::string error;
        if (!load_app_config(config_path, fresh, &error)) {
            LOG_WARN("endpoint", "Keeping previous config, reload of " << config_path << " failed: " << error);
            return config;
        }
        return fresh;
    };

    EndpointResolver::Deps deps;
    deps.mode = [&settings]() {
        return initial_connection_mode(settings.connection_mode(), settings.onboarding_seen());
    };
    deps.token = [env]() {
        return resolve_gateway_token(env);
    };
    deps.password = [current_config, env](bool is_remote) {
        return resolve_gateway_password(is_remote, current_config(), env);
    };
    deps.local_port = [current_config, env]() {
        return resolve_gateway_port(current_config(), env);
    };
    deps.remote_port_if_running = [tunnel]() -> std::optional<int> {
        if (!tunnel) {
            return std::nullopt;
        }
        return tunnel->control_tunnel_port_if_running();
    };
    deps.ensure_remote_tunnel = [tunnel](std::string* error) -> std::optional<int> {
        if (!tunnel) {
            if (error) *error = "no tunnel provider configured";
            return std::nullopt;
        }
        return tunnel->ensure_control_tunnel(error);
    };
    return deps;
}

} // namespace bridgelink
