#pragma once

#include "bridge_endpoint.h"
#include "bridge_protocol.h"
#include "os.h"
#include <optional>
#include <string>

namespace bridgelink {

enum class PairFailure {
    NONE,
    CONNECT_ERROR,       // TCP connect or socket IO failed
    PROTOCOL_ERROR,      // first reply missing, unparsable or of an unexpected type
    PAIRING_REJECTED,    // bridge answered with an error
    PAIRING_INCOMPLETE   // stream ended before pair-ok, or pair-ok without a token
};

const char* pair_failure_to_string(PairFailure failure);

/**
 * Hello describing this node. Platform is "<os> <version>", the model identifier is the
 * CPU architecture, and the display name falls back to the hostname. Fields the system
 * could not report ("Unknown" or empty) are left out.
 */
BridgeHello build_node_hello(const std::string& node_id,
                             const std::string& display_name,
                             const std::optional<std::string>& token,
                             const SystemInfo& system);

struct PairResult {
    bool ok = false;
    std::optional<std::string> token;
    std::optional<std::string> error;
    PairFailure failure = PairFailure::NONE;
};

struct PairingOptions {
    int connect_timeout_ms = 8000;
    int io_timeout_ms = 60000;
};

/**
 * Runs the hello / pair-request handshake with a bridge over a fresh TCP connection.
 *
 * A hello carrying a token the bridge accepts succeeds immediately with that token.
 * NOT_PAIRED and UNAUTHORIZED errors lead to a pair-request, after which the client
 * waits (up to the IO timeout per line) for the bridge operator to approve.
 */
class BridgePairingClient {
public:
    explicit BridgePairingClient(const PairingOptions& options = PairingOptions());

    /**
     * Blocking. The connection is always closed before returning.
     */
    PairResult pair_and_hello(const BridgeEndpoint& endpoint, const BridgeHello& hello) const;

private:
    PairingOptions options_;
};

} // namespace bridgelink
