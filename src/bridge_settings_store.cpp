#include "bridge_settings_store.h"
#include "fs.h"
#include "gateway_txt.h"
#include "logger.h"
#include <iomanip>
#include <random>
#include <sstream>

#define LOG_STORE_DEBUG(message) LOG_DEBUG("store", message)
#define LOG_STORE_INFO(message)  LOG_INFO("store", message)
#define LOG_STORE_WARN(message)  LOG_WARN("store", message)
#define LOG_STORE_ERROR(message) LOG_ERROR("store", message)

namespace bridgelink {

namespace {

std::optional<std::string> non_blank(const std::optional<std::string>& value) {
    if (!value) {
        return std::nullopt;
    }
    std::string trimmed = trim_whitespace(*value);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

} // namespace

std::string generate_instance_id() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dis(0, 255);

    std::ostringstream oss;
    for (int i = 0; i < 16; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << dis(gen);
    }
    return oss.str();
}

BridgeSettingsStore::BridgeSettingsStore(KeyValueStore& defaults, KeyValueStore& secure)
    : defaults_(defaults), secure_(secure) {}

const std::vector<std::string>& BridgeSettingsStore::bootstrap_keys() {
    static const std::vector<std::string> keys = {
        SETTINGS_KEY_INSTANCE_ID,
        SETTINGS_KEY_PREFERRED_STABLE_ID,
        SETTINGS_KEY_LAST_DISCOVERED_STABLE_ID,
    };
    return keys;
}

size_t BridgeSettingsStore::bootstrap_persistence() {
    size_t copied = reconcile_stores(defaults_, secure_, bootstrap_keys());
    if (copied > 0) {
        LOG_STORE_INFO("Reconciled " << copied << " setting(s) between " << defaults_.name() << " and " << secure_.name());
    }
    return copied;
}

std::string BridgeSettingsStore::instance_id() {
    std::optional<std::string> existing = load_identity_value(SETTINGS_KEY_INSTANCE_ID);
    if (existing) {
        return *existing;
    }

    std::string generated = generate_instance_id();
    if (!save_identity_value(SETTINGS_KEY_INSTANCE_ID, generated)) {
        LOG_STORE_WARN("Generated instance id could not be persisted");
    }
    LOG_STORE_INFO("Generated new node instance id " << generated);
    return generated;
}

std::optional<std::string> BridgeSettingsStore::preferred_stable_id() const {
    return load_identity_value(SETTINGS_KEY_PREFERRED_STABLE_ID);
}

bool BridgeSettingsStore::set_preferred_stable_id(const std::string& stable_id) {
    return save_identity_value(SETTINGS_KEY_PREFERRED_STABLE_ID, stable_id);
}

std::optional<std::string> BridgeSettingsStore::last_discovered_stable_id() const {
    return load_identity_value(SETTINGS_KEY_LAST_DISCOVERED_STABLE_ID);
}

bool BridgeSettingsStore::set_last_discovered_stable_id(const std::string& stable_id) {
    return save_identity_value(SETTINGS_KEY_LAST_DISCOVERED_STABLE_ID, stable_id);
}

std::optional<std::string> BridgeSettingsStore::token_for(const std::string& stable_id) const {
    return non_blank(secure_.get(SETTINGS_TOKEN_KEY_PREFIX + stable_id));
}

bool BridgeSettingsStore::save_token(const std::string& stable_id, const std::string& token) {
    if (trim_whitespace(token).empty()) {
        LOG_STORE_WARN("Refusing to save a blank token for " << stable_id);
        return false;
    }
    LOG_STORE_DEBUG("Saving token for " << stable_id);
    return secure_.set(SETTINGS_TOKEN_KEY_PREFIX + stable_id, token);
}

bool BridgeSettingsStore::remove_token(const std::string& stable_id) {
    LOG_STORE_DEBUG("Removing token for " << stable_id);
    return secure_.remove(SETTINGS_TOKEN_KEY_PREFIX + stable_id);
}

std::optional<std::string> BridgeSettingsStore::connection_mode() const {
    return non_blank(defaults_.get(SETTINGS_KEY_CONNECTION_MODE));
}

bool BridgeSettingsStore::set_connection_mode(const std::string& mode) {
    return defaults_.set(SETTINGS_KEY_CONNECTION_MODE, mode);
}

bool BridgeSettingsStore::onboarding_seen() const {
    std::optional<std::string> value = non_blank(defaults_.get(SETTINGS_KEY_ONBOARDING_SEEN));
    if (!value) {
        return false;
    }
    std::string lower = to_lower_ascii(*value);
    return lower == "true" || lower == "1" || lower == "yes";
}

bool BridgeSettingsStore::set_onboarding_seen(bool seen) {
    return defaults_.set(SETTINGS_KEY_ONBOARDING_SEEN, seen ? "true" : "false");
}

std::optional<std::string> BridgeSettingsStore::load_identity_value(const std::string& key) const {
    std::optional<std::string> secure_value = non_blank(secure_.get(key));
    if (secure_value) {
        return secure_value;
    }
    return non_blank(defaults_.get(key));
}

bool BridgeSettingsStore::save_identity_value(const std::string& key, const std::string& value) {
    bool saved_secure = secure_.set(key, value);
    bool saved_defaults = defaults_.set(key, value);
    return saved_secure && saved_defaults;
}

//=============================================================================
// State directory
//=============================================================================

bool open_node_stores(const std::string& state_dir, NodeStores& stores, std::string* error) {
    if (!directory_exists(state_dir) && !create_directories(state_dir)) {
        if (error) {
            *error = "cannot create state directory " + state_dir;
        }
        return false;
    }

    stores.defaults = std::make_unique<JsonFileStore>(combine_paths(state_dir, "defaults.json"), 0644, "defaults");
    stores.secure = std::make_unique<JsonFileStore>(combine_paths(state_dir, "secure.json"), 0600, "secure");
    if (!stores.defaults->load()) {
        LOG_STORE_WARN("Ignoring unreadable " << stores.defaults->path());
    }
    if (!stores.secure->load()) {
        LOG_STORE_WARN("Ignoring unreadable " << stores.secure->path());
    }

    stores.settings = std::make_unique<BridgeSettingsStore>(*stores.defaults, *stores.secure);
    stores.reconciled_on_open = stores.settings->bootstrap_persistence();
    return true;
}

} // namespace bridgelink
