#include "bridge_protocol.h"

namespace bridgelink {

namespace {

void put_node_fields(nlohmann::json& message, const BridgeHello& hello, bool include_token) {
    message["nodeId"] = hello.node_id;
    if (hello.display_name) message["displayName"] = *hello.display_name;
    if (include_token && hello.token) message["token"] = *hello.token;
    if (hello.platform) message["platform"] = *hello.platform;
    if (hello.version) message["version"] = *hello.version;
    if (hello.device_family) message["deviceFamily"] = *hello.device_family;
    if (hello.model_identifier) message["modelIdentifier"] = *hello.model_identifier;
    if (hello.caps) message["caps"] = *hello.caps;
    if (hello.commands) message["commands"] = *hello.commands;
}

} // namespace

nlohmann::json hello_to_json(const BridgeHello& hello) {
    nlohmann::json message;
    message["type"] = BRIDGE_MSG_HELLO;
    put_node_fields(message, hello, true);
    return message;
}

nlohmann::json pair_request_to_json(const BridgeHello& hello) {
    nlohmann::json message;
    message["type"] = BRIDGE_MSG_PAIR_REQUEST;
    put_node_fields(message, hello, false);
    return message;
}

bool parse_bridge_message(const std::string& line, nlohmann::json& message) {
    try {
        nlohmann::json parsed = nlohmann::json::parse(line);
        if (!parsed.is_object()) {
            return false;
        }
        message = std::move(parsed);
        return true;
    } catch (const nlohmann::json::exception&) {
        return false;
    }
}

std::optional<std::string> message_string(const nlohmann::json& message, const std::string& key) {
    auto it = message.find(key);
    if (it == message.end()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number() || it->is_boolean()) {
        return it->dump();
    }
    return std::nullopt;
}

std::string message_type(const nlohmann::json& message) {
    return message_string(message, "type").value_or("");
}

std::string describe_bridge_error(const nlohmann::json& message, const std::string& default_message) {
    std::string code = message_string(message, "code").value_or(BRIDGE_ERROR_UNAVAILABLE);
    std::string text = message_string(message, "message").value_or(default_message);
    return code + ": " + text;
}

} // namespace bridgelink
