#ifdef _WIN32
    // Include winsock2.h first to avoid conflicts with windows.h
    #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
    #endif
    #include <winsock2.h>
    #include <ws2tcpip.h>
#else
    #include <netdb.h>
    #include <arpa/inet.h>
    #include <netinet/in.h>
#endif

#include "network_utils.h"
#include "logger.h"
#include <cstring>

// Network utilities module logging macros
#define LOG_NETUTILS_DEBUG(message) LOG_DEBUG("network_utils", message)
#define LOG_NETUTILS_WARN(message)  LOG_WARN("network_utils", message)

namespace bridgelink {
namespace network_utils {

std::string resolve_hostname(const std::string& hostname) {
    if (hostname.empty()) {
        return "";
    }

    // Check if it's already an IP address
    if (is_valid_ipv4(hostname)) {
        return hostname;
    }

    struct addrinfo hints, *result;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    int status = getaddrinfo(hostname.c_str(), nullptr, &hints, &result);
    if (status != 0) {
#ifdef _WIN32
        LOG_NETUTILS_WARN("Failed to resolve hostname " << hostname << ": " << WSAGetLastError());
#else
        LOG_NETUTILS_WARN("Failed to resolve hostname " << hostname << ": " << gai_strerror(status));
#endif
        return "";
    }

    char ip_str[INET_ADDRSTRLEN];
    struct sockaddr_in* addr_in = (struct sockaddr_in*)result->ai_addr;
    inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, INET_ADDRSTRLEN);

    freeaddrinfo(result);

    LOG_NETUTILS_DEBUG("Resolved " << hostname << " to " << ip_str);
    return std::string(ip_str);
}

bool is_valid_ipv4(const std::string& ip_str) {
    struct sockaddr_in sa;
    return inet_pton(AF_INET, ip_str.c_str(), &sa.sin_addr) == 1;
}

bool is_valid_ipv6(const std::string& ip_str) {
    struct sockaddr_in6 sa;
    return inet_pton(AF_INET6, ip_str.c_str(), &sa.sin6_addr) == 1;
}

bool is_hostname(const std::string& str) {
    if (is_valid_ipv4(str) || is_valid_ipv6(str)) {
        return false;
    }

    if (str.empty() || str.length() > 253) {
        return false;
    }

    if (str.front() == '.' || str.front() == '-' || str.back() == '-') {
        return false;
    }

    if (str.find("..") != std::string::npos) {
        return false;
    }

    for (char c : str) {
        bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                       (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_';
        if (!allowed) {
            return false;
        }
    }

    return true;
}

std::string resolve_canonical_hostname(const std::string& hostname) {
    if (hostname.empty()) {
        return "";
    }

    struct addrinfo hints, *result;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_CANONNAME;

    int status = getaddrinfo(hostname.c_str(), nullptr, &hints, &result);
    if (status != 0) {
        LOG_NETUTILS_DEBUG("No canonical name for " << hostname);
        return "";
    }

    std::string canonical;
    if (result != nullptr && result->ai_canonname != nullptr) {
        canonical = result->ai_canonname;
    }
    freeaddrinfo(result);

    LOG_NETUTILS_DEBUG("Canonical name of " << hostname << " is '" << canonical << "'");
    return canonical;
}

} // namespace network_utils
} // namespace bridgelink
