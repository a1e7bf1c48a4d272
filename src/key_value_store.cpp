#include "key_value_store.h"
#include "fs.h"
#include "gateway_txt.h"
#include "logger.h"

#define LOG_STORE_DEBUG(message) LOG_DEBUG("store", message)
#define LOG_STORE_INFO(message)  LOG_INFO("store", message)
#define LOG_STORE_WARN(message)  LOG_WARN("store", message)
#define LOG_STORE_ERROR(message) LOG_ERROR("store", message)

namespace bridgelink {

namespace {

bool has_value(const std::optional<std::string>& value) {
    return value.has_value() && !trim_whitespace(*value).empty();
}

} // namespace

//=============================================================================
// MemoryKeyValueStore
//=============================================================================

MemoryKeyValueStore::MemoryKeyValueStore(const std::string& name) : name_(name) {}

std::optional<std::string> MemoryKeyValueStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryKeyValueStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
    return true;
}

bool MemoryKeyValueStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.erase(key);
    return true;
}

//=============================================================================
// JsonFileStore
//=============================================================================

JsonFileStore::JsonFileStore(const std::string& path, int file_mode, const std::string& name)
    : path_(path), file_mode_(file_mode), name_(name), data_(nlohmann::json::object()) {}

bool JsonFileStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_ = nlohmann::json::object();

    if (!file_exists(path_)) {
        LOG_STORE_DEBUG("No " << name_ << " store at " << path_ << ", starting empty");
        return true;
    }

    std::string content = read_file_text_cpp(path_);
    if (content.empty()) {
        return true;
    }

    try {
        nlohmann::json parsed = nlohmann::json::parse(content);
        if (!parsed.is_object()) {
            LOG_STORE_ERROR("The " << name_ << " store at " << path_ << " is not a JSON object");
            return false;
        }
        data_ = parsed;
    } catch (const nlohmann::json::exception& e) {
        LOG_STORE_ERROR("Failed to parse " << name_ << " store " << path_ << ": " << e.what());
        return false;
    }

    LOG_STORE_DEBUG("Loaded " << data_.size() << " entries from " << name_ << " store");
    return true;
}

std::optional<std::string> JsonFileStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

bool JsonFileStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json updated = data_;
    updated[key] = value;
    return commit_locked(std::move(updated));
}

bool JsonFileStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (data_.find(key) == data_.end()) {
        return true;
    }
    nlohmann::json updated = data_;
    updated.erase(key);
    return commit_locked(std::move(updated));
}

bool JsonFileStore::commit_locked(nlohmann::json&& updated) {
    std::string parent = get_parent_directory(path_);
    if (!parent.empty() && !directory_exists(parent) && !create_directories(parent)) {
        LOG_STORE_ERROR("Cannot create directory " << parent << " for " << name_ << " store");
        return false;
    }

    if (!write_file_atomic(path_, updated.dump(4), file_mode_)) {
        LOG_STORE_ERROR("Failed to write " << name_ << " store " << path_);
        return false;
    }
    // Memory only follows the disk once the write went through
    data_ = std::move(updated);
    return true;
}

//=============================================================================
// Reconciliation
//=============================================================================

size_t reconcile_stores(KeyValueStore& a, KeyValueStore& b, const std::vector<std::string>& keys) {
    size_t copied = 0;
    for (const auto& key : keys) {
        std::optional<std::string> value_a = a.get(key);
        std::optional<std::string> value_b = b.get(key);

        if (has_value(value_a) && !has_value(value_b)) {
            if (b.set(key, *value_a)) {
                LOG_STORE_DEBUG("Copied " << key << " from " << a.name() << " to " << b.name());
                ++copied;
            }
        } else if (has_value(value_b) && !has_value(value_a)) {
            if (a.set(key, *value_b)) {
                LOG_STORE_DEBUG("Copied " << key << " from " << b.name() << " to " << a.name());
                ++copied;
            }
        } else if (has_value(value_a) && has_value(value_b) && *value_a != *value_b) {
            LOG_STORE_WARN("Stores disagree on " << key << ", keeping both values");
        }
    }
    return copied;
}

} // namespace bridgelink
