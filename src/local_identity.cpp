#include "local_identity.h"
#include "gateway_txt.h"
#include "network_utils.h"
#include "os.h"

namespace bridgelink {

namespace {

void add_token(std::set<std::string>& tokens, const std::string& token) {
    if (!token.empty()) {
        tokens.insert(token);
    }
}

} // namespace

std::string normalize_host_token(const std::string& raw) {
    std::string lower = to_lower_ascii(trim_whitespace(raw));
    if (lower.empty()) {
        return "";
    }

    if (lower.back() == '.') {
        lower.pop_back();
    }

    const std::string local_suffix = ".local";
    if (lower.size() >= local_suffix.size() &&
        lower.compare(lower.size() - local_suffix.size(), local_suffix.size(), local_suffix) == 0) {
        lower.erase(lower.size() - local_suffix.size());
    }

    // First non-empty label
    size_t start = 0;
    while (start < lower.size() && lower[start] == '.') {
        ++start;
    }
    size_t end = lower.find('.', start);
    std::string label = lower.substr(start, end == std::string::npos ? std::string::npos : end - start);
    return trim_whitespace(label);
}

std::string normalize_display_token(const std::string& raw) {
    std::string prettified = trim_whitespace(prettify_instance_name(raw));
    return to_lower_ascii(prettified);
}

std::string normalize_service_token(const std::string& raw) {
    return to_lower_ascii(trim_whitespace(raw));
}

LocalIdentity build_local_identity_fast(const std::string& display_name) {
    LocalIdentity identity;
    add_token(identity.host_tokens, normalize_host_token(get_hostname()));
    add_token(identity.display_tokens, normalize_display_token(display_name));
    return identity;
}

LocalIdentity build_local_identity_slow(const std::string& display_name) {
    LocalIdentity identity;
    std::string hostname = get_hostname();
    add_token(identity.host_tokens, normalize_host_token(network_utils::resolve_canonical_hostname(hostname)));
    add_token(identity.display_tokens, normalize_display_token(display_name));
    return identity;
}

LocalIdentity merge_local_identity(const LocalIdentity& fast, const LocalIdentity& slow) {
    LocalIdentity merged = fast;
    merged.host_tokens.insert(slow.host_tokens.begin(), slow.host_tokens.end());
    merged.display_tokens.insert(slow.display_tokens.begin(), slow.display_tokens.end());
    return merged;
}

bool is_local_gateway(const std::string& lan_host, const std::string& tailnet_dns,
                      const std::string& display_name, const std::string& service_name,
                      const LocalIdentity& local) {
    std::string host = normalize_host_token(lan_host);
    if (!host.empty() && local.host_tokens.count(host) > 0) {
        return true;
    }

    host = normalize_host_token(tailnet_dns);
    if (!host.empty() && local.host_tokens.count(host) > 0) {
        return true;
    }

    std::string name = normalize_display_token(display_name);
    if (!name.empty() && local.display_tokens.count(name) > 0) {
        return true;
    }

    // Service names often embed the hostname plus suffixes ("studio-bridge"), so this
    // one is a substring match. A short token can over-match an unrelated name.
    std::string service = normalize_service_token(service_name);
    if (!service.empty()) {
        for (const auto& token : local.host_tokens) {
            if (service.find(token) != std::string::npos) {
                return true;
            }
        }
    }
    return false;
}

} // namespace bridgelink
