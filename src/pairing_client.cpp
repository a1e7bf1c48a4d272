#include "pairing_client.h"
#include "logger.h"
#include "socket.h"

#define LOG_PAIRING_DEBUG(message) LOG_DEBUG("pairing", message)
#define LOG_PAIRING_INFO(message)  LOG_INFO("pairing", message)
#define LOG_PAIRING_WARN(message)  LOG_WARN("pairing", message)
#define LOG_PAIRING_ERROR(message) LOG_ERROR("pairing", message)

namespace bridgelink {

namespace {

PairResult failed(PairFailure failure, const std::optional<std::string>& error) {
    PairResult result;
    result.ok = false;
    result.failure = failure;
    result.error = error;
    return result;
}

bool is_blank(const std::string& value) {
    return trim_whitespace(value).empty();
}

std::optional<std::string> known(const std::string& value) {
    if (value.empty() || value == "Unknown") {
        return std::nullopt;
    }
    return value;
}

} // namespace

BridgeHello build_node_hello(const std::string& node_id,
                             const std::string& display_name,
                             const std::optional<std::string>& token,
                             const SystemInfo& system) {
    BridgeHello hello;
    hello.node_id = node_id;
    hello.display_name = display_name.empty() ? known(system.hostname) : std::optional<std::string>(display_name);
    hello.token = token;

    std::optional<std::string> platform = known(system.os_name);
    std::optional<std::string> os_version = known(system.os_version);
    if (platform && os_version) {
        *platform += " " + *os_version;
    }
    hello.platform = platform;
    hello.device_family = known(system.device_family);
    hello.model_identifier = known(system.architecture);
    return hello;
}

const char* pair_failure_to_string(PairFailure failure) {
    switch (failure) {
        case PairFailure::NONE: return "none";
        case PairFailure::CONNECT_ERROR: return "connect error";
        case PairFailure::PROTOCOL_ERROR: return "protocol error";
        case PairFailure::PAIRING_REJECTED: return "pairing rejected";
        case PairFailure::PAIRING_INCOMPLETE: return "pairing incomplete";
    }
    return "unknown";
}

BridgePairingClient::BridgePairingClient(const PairingOptions& options) : options_(options) {}

PairResult BridgePairingClient::pair_and_hello(const BridgeEndpoint& endpoint, const BridgeHello& hello) const {
    LOG_PAIRING_INFO("Connecting to bridge " << endpoint.display_name << " at " << endpoint.host << ":" << endpoint.port);

    std::string connect_error;
    ScopedSocket socket(create_tcp_client(endpoint.host, endpoint.port, options_.connect_timeout_ms, &connect_error));
    if (!socket.valid()) {
        LOG_PAIRING_ERROR("Cannot connect to " << endpoint.host << ":" << endpoint.port << ": " << connect_error);
        return failed(PairFailure::CONNECT_ERROR, "connect failed: " + connect_error);
    }

    set_tcp_nodelay(socket.get());
    set_socket_timeouts(socket.get(), options_.io_timeout_ms);

    if (!send_tcp_line(socket.get(), hello_to_json(hello).dump())) {
        LOG_PAIRING_ERROR("Failed to send hello");
        return failed(PairFailure::CONNECT_ERROR, std::string("connection lost"));
    }
    LOG_PAIRING_DEBUG("Sent hello for node " << hello.node_id << (hello.token ? " with token" : " without token"));

    LineReader reader(socket.get());
    std::string line;
    nlohmann::json first;
    if (!reader.read_line(line) || !parse_bridge_message(line, first)) {
        LOG_PAIRING_WARN("Bridge sent no usable reply to hello");
        return failed(PairFailure::PROTOCOL_ERROR, std::string("unexpected bridge response"));
    }

    std::string type = message_type(first);
    if (type == BRIDGE_MSG_HELLO_OK) {
        LOG_PAIRING_INFO("Bridge accepted hello");
        PairResult result;
        result.ok = true;
        result.token = hello.token;
        return result;
    }

    if (type != BRIDGE_MSG_ERROR) {
        LOG_PAIRING_WARN("Unexpected reply to hello: " << type);
        return failed(PairFailure::PROTOCOL_ERROR, std::string("unexpected bridge response"));
    }

    std::string code = message_string(first, "code").value_or(BRIDGE_ERROR_UNAVAILABLE);
    if (code != BRIDGE_ERROR_NOT_PAIRED && code != BRIDGE_ERROR_UNAUTHORIZED) {
        std::string error = describe_bridge_error(first, "pairing required");
        LOG_PAIRING_WARN("Bridge rejected hello: " << error);
        return failed(PairFailure::PAIRING_REJECTED, error);
    }

    LOG_PAIRING_INFO("Node is not paired (" << code << "), sending pair-request");
    if (!send_tcp_line(socket.get(), pair_request_to_json(hello).dump())) {
        LOG_PAIRING_ERROR("Failed to send pair-request");
        return failed(PairFailure::CONNECT_ERROR, std::string("connection lost"));
    }

    while (reader.read_line(line)) {
        nlohmann::json next;
        if (!parse_bridge_message(line, next)) {
            LOG_PAIRING_DEBUG("Skipping unparsable line while waiting for approval");
            continue;
        }

        std::string next_type = message_type(next);
        if (next_type == BRIDGE_MSG_PAIR_OK) {
            PairResult result;
            result.token = message_string(next, "token");
            result.ok = result.token.has_value() && !is_blank(*result.token);
            if (!result.ok) {
                result.failure = PairFailure::PAIRING_INCOMPLETE;
                result.error = std::string("pair-ok without token");
                LOG_PAIRING_WARN("Bridge approved pairing without a token");
            } else {
                LOG_PAIRING_INFO("Pairing approved");
            }
            return result;
        }
        if (next_type == BRIDGE_MSG_ERROR) {
            std::string error = describe_bridge_error(next, "pairing failed");
            LOG_PAIRING_WARN("Pairing failed: " << error);
            return failed(PairFailure::PAIRING_REJECTED, error);
        }
        LOG_PAIRING_DEBUG("Ignoring " << next_type << " while waiting for approval");
    }

    LOG_PAIRING_WARN("Connection closed before pairing completed");
    return failed(PairFailure::PAIRING_INCOMPLETE, std::string("pairing failed"));
}

} // namespace bridgelink
