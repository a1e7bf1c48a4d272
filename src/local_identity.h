#pragma once

#include <set>
#include <string>

namespace bridgelink {

/**
 * Normalized tokens naming this device. Used only to hide our own bridge from
 * discovery results.
 */
struct LocalIdentity {
    std::set<std::string> host_tokens;
    std::set<std::string> display_tokens;

    bool empty() const { return host_tokens.empty() && display_tokens.empty(); }

    bool operator==(const LocalIdentity& other) const {
        return host_tokens == other.host_tokens && display_tokens == other.display_tokens;
    }
    bool operator!=(const LocalIdentity& other) const { return !(*this == other); }
};

// Token normalization. Each returns an empty string when nothing usable is left.

// trim, lowercase, drop a trailing '.', drop ".local", keep the first DNS label
std::string normalize_host_token(const std::string& raw);
// prettified instance name, lowercased
std::string normalize_display_token(const std::string& raw);
// trimmed, lowercased
std::string normalize_service_token(const std::string& raw);

/**
 * Fast pass: the process hostname plus the configured display name. Does no I/O
 * beyond gethostname().
 */
LocalIdentity build_local_identity_fast(const std::string& display_name);

/**
 * Slow pass: the canonical name of this host as the resolver reports it, plus the
 * configured display name. May block on DNS.
 */
LocalIdentity build_local_identity_slow(const std::string& display_name);

LocalIdentity merge_local_identity(const LocalIdentity& fast, const LocalIdentity& slow);

/**
 * Whether an advertisement names this device. Host fields and the display name must
 * match a token exactly; the raw service name matches when it contains any host token.
 * Empty strings stand for absent fields.
 */
bool is_local_gateway(const std::string& lan_host, const std::string& tailnet_dns,
                      const std::string& display_name, const std::string& service_name,
                      const LocalIdentity& local);

} // namespace bridgelink
