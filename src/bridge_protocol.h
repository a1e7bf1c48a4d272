#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace bridgelink {

// Message types of the bridge handshake (one JSON object per line)
const std::string BRIDGE_MSG_HELLO = "hello";
const std::string BRIDGE_MSG_HELLO_OK = "hello-ok";
const std::string BRIDGE_MSG_ERROR = "error";
const std::string BRIDGE_MSG_PAIR_REQUEST = "pair-request";
const std::string BRIDGE_MSG_PAIR_OK = "pair-ok";

// Error codes that mean "pair first"
const std::string BRIDGE_ERROR_NOT_PAIRED = "NOT_PAIRED";
const std::string BRIDGE_ERROR_UNAUTHORIZED = "UNAUTHORIZED";
const std::string BRIDGE_ERROR_UNAVAILABLE = "UNAVAILABLE";

/**
 * What a node tells the bridge about itself. Absent optionals are left out of the
 * message entirely.
 */
struct BridgeHello {
    std::string node_id;
    std::optional<std::string> display_name;
    std::optional<std::string> token;
    std::optional<std::string> platform;
    std::optional<std::string> version;
    std::optional<std::string> device_family;
    std::optional<std::string> model_identifier;
    std::optional<std::vector<std::string>> caps;
    std::optional<std::vector<std::string>> commands;
};

nlohmann::json hello_to_json(const BridgeHello& hello);

/**
 * Same fields as the hello, minus the token.
 */
nlohmann::json pair_request_to_json(const BridgeHello& hello);

/**
 * Parse one protocol line.
 * @return false if the line is not valid JSON or not an object
 */
bool parse_bridge_message(const std::string& line, nlohmann::json& message);

/**
 * Content of a primitive field: strings as-is, numbers and booleans in their JSON
 * spelling. Missing, null, arrays and objects give nullopt.
 */
std::optional<std::string> message_string(const nlohmann::json& message, const std::string& key);

/**
 * The "type" field, empty when missing or not a primitive.
 */
std::string message_type(const nlohmann::json& message);

/**
 * "<code>: <message>" for an error message, with defaults for missing fields.
 */
std::string describe_bridge_error(const nlohmann::json& message, const std::string& default_message);

} // namespace bridgelink
