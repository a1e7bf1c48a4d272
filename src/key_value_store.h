#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bridgelink {

/**
 * Durable string-to-string storage. Two named instances back the node settings: a plain
 * "defaults" store and a "secure" store for secrets and identity.
 */
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual bool set(const std::string& key, const std::string& value) = 0;
    virtual bool remove(const std::string& key) = 0;

    virtual std::string name() const = 0;
};

class MemoryKeyValueStore : public KeyValueStore {
public:
    explicit MemoryKeyValueStore(const std::string& name = "memory");

    std::optional<std::string> get(const std::string& key) const override;
    bool set(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;
    std::string name() const override { return name_; }

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

/**
 * Flat JSON object on disk, rewritten atomically on every change. A change whose write
 * fails is not applied in memory either.
 */
class JsonFileStore : public KeyValueStore {
public:
    /**
     * @param path File to load from and save to
     * @param file_mode Permission bits for the file (0600 for secrets)
     * @param name Store name used in logs
     */
    JsonFileStore(const std::string& path, int file_mode, const std::string& name);

    /**
     * Load the file. A missing file is an empty store.
     * @return false if the file exists but is not a JSON object
     */
    bool load();

    std::optional<std::string> get(const std::string& key) const override;
    bool set(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;
    std::string name() const override { return name_; }

    const std::string& path() const { return path_; }

private:
    bool commit_locked(nlohmann::json&& updated);

    std::string path_;
    int file_mode_;
    std::string name_;
    mutable std::mutex mutex_;
    nlohmann::json data_;
};

/**
 * For each key, copy a non-empty value into the store where it is missing or empty.
 * Differing non-empty values are left alone.
 * @return Number of values copied
 */
size_t reconcile_stores(KeyValueStore& a, KeyValueStore& b, const std::vector<std::string>& keys);

} // namespace bridgelink
