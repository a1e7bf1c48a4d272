#pragma once

#include "gateway_txt.h"
#include <string>
#include <optional>

namespace bridgelink {

/**
 * Identity and reachability of one bridge.
 *
 * stable_id is derived from the advertised service instance (name, type, domain) and
 * never from display fields, so renaming a bridge keeps its identity.
 */
struct BridgeEndpoint {
    std::string stable_id;
    std::string display_name;
    std::string host;
    int port = 0;

    std::optional<std::string> lan_host;
    std::optional<std::string> tailnet_dns;
    std::optional<int> gateway_port;
    std::optional<int> bridge_port;
    std::optional<int> canvas_port;
    std::optional<std::string> cli_path;
    int ssh_port = DEFAULT_SSH_PORT;

    // Human readable service description for logs, e.g. "Studio Bridge._clawdis-bridge._tcp.local"
    std::string debug_id;

    /**
     * Endpoint for a hand-entered address: stable id "manual|host|port", name "host:port".
     */
    static BridgeEndpoint manual(const std::string& host, int port);

    bool operator==(const BridgeEndpoint& other) const;
    bool operator!=(const BridgeEndpoint& other) const { return !(*this == other); }
};

/**
 * Stable id of an advertised service instance. The instance name is kept exactly as
 * advertised (escaped form); type and domain are lowercased and the domain loses its
 * trailing dot, so "local." and "local" browse the same ids.
 */
std::string make_stable_id(const std::string& instance_name, const std::string& service_type,
                           const std::string& domain);

} // namespace bridgelink
