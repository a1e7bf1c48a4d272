#pragma once

#include <string>
#include <vector>

namespace bridgelink {
namespace network_utils {

/**
 * Resolve hostname to an IPv4 address
 * @param hostname The hostname to resolve (can be hostname or IP address)
 * @return IP address string, or empty string on error
 *
 * Example usage:
 *   std::string ip = network_utils::resolve_hostname("100.64.0.53");  // returns same IP
 */
std::string resolve_hostname(const std::string& hostname);

/**
 * Check if a string is a valid IPv4 address
 * @param ip_str The string to validate
 * @return true if valid IPv4 address, false otherwise
 */
bool is_valid_ipv4(const std::string& ip_str);

/**
 * Check if a string is a valid IPv6 address
 * @param ip_str The string to validate
 * @return true if valid IPv6 address, false otherwise
 */
bool is_valid_ipv6(const std::string& ip_str);

/**
 * Check if a string is a hostname (not an IP address)
 * @param str The string to check
 * @return true if it's a hostname, false if it's an IP address or malformed
 */
bool is_hostname(const std::string& str);

/**
 * Resolve the canonical name of a host (getaddrinfo with AI_CANONNAME).
 * This may block on DNS; callers that care run it off the main thread.
 * @param hostname Host to look up
 * @return Canonical name, or empty string if the resolver returned none
 *
 * Example usage:
 *   std::string fqdn = network_utils::resolve_canonical_hostname("studio");  // "studio.lan"
 */
std::string resolve_canonical_hostname(const std::string& hostname);

} // namespace network_utils
} // namespace bridgelink
