#pragma once

#include <map>
#include <string>
#include <optional>

namespace bridgelink {

// TXT keys advertised by a bridge
const std::string TXT_DISPLAY_NAME = "displayName";
const std::string TXT_LAN_HOST = "lanHost";
const std::string TXT_TAILNET_DNS = "tailnetDns";
const std::string TXT_GATEWAY_PORT = "gatewayPort";
const std::string TXT_BRIDGE_PORT = "bridgePort";
const std::string TXT_CANVAS_PORT = "canvasPort";
const std::string TXT_CLI_PATH = "cliPath";
const std::string TXT_SSH_PORT = "sshPort";

const int DEFAULT_SSH_PORT = 22;

using TxtRecord = std::map<std::string, std::string>;

/**
 * Typed view of a bridge advertisement's TXT record.
 * String values are trimmed; blank values count as absent.
 */
struct GatewayTxt {
    std::optional<std::string> display_name;
    std::optional<std::string> lan_host;
    std::optional<std::string> tailnet_dns;
    std::optional<std::string> cli_path;
    std::optional<int> gateway_port;
    std::optional<int> bridge_port;
    std::optional<int> canvas_port;
    int ssh_port = DEFAULT_SSH_PORT;  // absent, unparsable or <= 0 keeps the default
};

GatewayTxt parse_gateway_txt(const TxtRecord& txt);

/**
 * Merge TXT from inline browse metadata with TXT obtained by explicit resolution.
 * Resolved values win on conflicting keys.
 */
TxtRecord merge_txt(const TxtRecord& inline_txt, const TxtRecord& resolved_txt);

/**
 * Collapse whitespace, drop the " (Clawdis)" product suffix and a trailing " (N)"
 * disambiguator, trim.
 */
std::string prettify_instance_name(const std::string& decoded_name);

/**
 * prettify_instance_name() plus: strip a trailing "-bridge"/" bridge", turn '_' and '-'
 * into spaces and title-case the words. Falls back to the prettified instance name
 * when nothing is left.
 */
std::string prettify_service_name(const std::string& decoded_name);

/**
 * "user@host", with ":port" appended when port is not 22.
 */
std::string build_ssh_target(const std::string& user, const std::string& host, int port);

// Whitespace helpers shared with the identity and config code
std::string trim_whitespace(const std::string& value);
std::string to_lower_ascii(const std::string& value);

/**
 * Parse a whole string as a decimal integer (optional sign, no trailing garbage).
 */
bool parse_int_strict(const std::string& value, int& out);

} // namespace bridgelink
