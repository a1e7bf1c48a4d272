#pragma once

#include "key_value_store.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bridgelink {

// Keys shared by the defaults and secure stores
const std::string SETTINGS_KEY_INSTANCE_ID = "node.instanceId";
const std::string SETTINGS_KEY_PREFERRED_STABLE_ID = "bridge.preferredStableID";
const std::string SETTINGS_KEY_LAST_DISCOVERED_STABLE_ID = "bridge.lastDiscoveredStableID";
const std::string SETTINGS_KEY_CONNECTION_MODE = "clawdis.connectionMode";
const std::string SETTINGS_KEY_ONBOARDING_SEEN = "clawdis.onboardingSeen";
const std::string SETTINGS_TOKEN_KEY_PREFIX = "bridge.token.";

/**
 * Node settings on top of two stores. Identity values (instance id, preferred and last
 * discovered bridge) live in both stores and are reconciled on startup; bridge tokens
 * live only in the secure store; UI state (connection mode, onboarding) only in defaults.
 */
class BridgeSettingsStore {
public:
    BridgeSettingsStore(KeyValueStore& defaults, KeyValueStore& secure);

    static const std::vector<std::string>& bootstrap_keys();

    /**
     * Fill empty identity values in either store from the other one.
     * @return Number of values copied
     */
    size_t bootstrap_persistence();

    /**
     * The persisted node instance id, generated and saved on first use.
     */
    std::string instance_id();

    std::optional<std::string> preferred_stable_id() const;
    bool set_preferred_stable_id(const std::string& stable_id);

    std::optional<std::string> last_discovered_stable_id() const;
    bool set_last_discovered_stable_id(const std::string& stable_id);

    std::optional<std::string> token_for(const std::string& stable_id) const;
    bool save_token(const std::string& stable_id, const std::string& token);
    bool remove_token(const std::string& stable_id);

    // Raw persisted connection mode, nullopt if never saved
    std::optional<std::string> connection_mode() const;
    bool set_connection_mode(const std::string& mode);

    bool onboarding_seen() const;
    bool set_onboarding_seen(bool seen);

private:
    std::optional<std::string> load_identity_value(const std::string& key) const;
    bool save_identity_value(const std::string& key, const std::string& value);

    KeyValueStore& defaults_;
    KeyValueStore& secure_;
};

// The persistent stores of one node state directory
struct NodeStores {
    std::unique_ptr<JsonFileStore> defaults;   // defaults.json
    std::unique_ptr<JsonFileStore> secure;     // secure.json, owner-only
    std::unique_ptr<BridgeSettingsStore> settings;
    size_t reconciled_on_open = 0;
};

/**
 * Open defaults.json and secure.json under state_dir, then reconcile the identity
 * values between them once. An unreadable store file is logged and treated as empty.
 * @param state_dir Directory holding the store files, created when missing
 * @param stores Filled on success
 * @param error Receives the reason on failure
 * @return false if the state directory cannot be created
 */
bool open_node_stores(const std::string& state_dir, NodeStores& stores, std::string* error = nullptr);

/**
 * 32 lowercase hex characters from a random source.
 */
std::string generate_instance_id();

} // namespace bridgelink
