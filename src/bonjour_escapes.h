#pragma once

#include <string>

namespace bridgelink {
namespace bonjour_escapes {

/**
 * Decode the escapes DNS-SD uses in service instance names.
 * "\DDD" is one byte given in decimal (multi-byte UTF-8 characters arrive as
 * consecutive escapes), "\x" is the literal character x.
 *
 * Example usage:
 *   bonjour_escapes::decode("Clawdis\\032Gateway");          // "Clawdis Gateway"
 *   bonjour_escapes::decode("Peter\\226\\128\\153s Mac");    // "Peter’s Mac"
 */
std::string decode(const std::string& input);

} // namespace bonjour_escapes
} // namespace bridgelink
