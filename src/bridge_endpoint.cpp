#include "bridge_endpoint.h"

namespace bridgelink {

BridgeEndpoint BridgeEndpoint::manual(const std::string& host, int port) {
    BridgeEndpoint endpoint;
    endpoint.stable_id = "manual|" + host + "|" + std::to_string(port);
    endpoint.display_name = host + ":" + std::to_string(port);
    endpoint.host = host;
    endpoint.port = port;
    endpoint.debug_id = endpoint.stable_id;
    return endpoint;
}

bool BridgeEndpoint::operator==(const BridgeEndpoint& other) const {
    return stable_id == other.stable_id &&
           display_name == other.display_name &&
           host == other.host &&
           port == other.port &&
           lan_host == other.lan_host &&
           tailnet_dns == other.tailnet_dns &&
           gateway_port == other.gateway_port &&
           bridge_port == other.bridge_port &&
           canvas_port == other.canvas_port &&
           cli_path == other.cli_path &&
           ssh_port == other.ssh_port &&
           debug_id == other.debug_id;
}

std::string make_stable_id(const std::string& instance_name, const std::string& service_type,
                           const std::string& domain) {
    std::string normalized_domain = to_lower_ascii(trim_whitespace(domain));
    while (!normalized_domain.empty() && normalized_domain.back() == '.') {
        normalized_domain.pop_back();
    }

    std::string id = instance_name + "." + to_lower_ascii(service_type);
    if (!normalized_domain.empty()) {
        id += "." + normalized_domain;
    }
    return id;
}

} // namespace bridgelink
