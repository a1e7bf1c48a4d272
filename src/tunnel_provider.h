#pragma once

#include <optional>
#include <string>

namespace bridgelink {

/**
 * Owns the forwarded connection to a remote gateway's control port.
 */
class TunnelProvider {
public:
    virtual ~TunnelProvider() = default;

    /**
     * Local port of the control tunnel if it is up, nullopt otherwise.
     */
    virtual std::optional<int> control_tunnel_port_if_running() = 0;

    /**
     * Bring the control tunnel up (or confirm it is up).
     * @param error Failure reason
     * @return Local forwarded port, nullopt on failure
     */
    virtual std::optional<int> ensure_control_tunnel(std::string* error) = 0;
};

} // namespace bridgelink
