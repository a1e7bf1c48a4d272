#include <gtest/gtest.h>
#include "key_value_store.h"
#include "fs.h"
#include <nlohmann/json.hpp>
#ifndef _WIN32
    #include <sys/stat.h>
#endif

using namespace bridgelink;

TEST(MemoryKeyValueStoreTest, SetGetRemove) {
    MemoryKeyValueStore store("defaults");
    EXPECT_EQ(store.name(), "defaults");
    EXPECT_FALSE(store.get("missing").has_value());

    EXPECT_TRUE(store.set("key", "value"));
    EXPECT_EQ(store.get("key"), std::optional<std::string>("value"));

    EXPECT_TRUE(store.set("key", ""));
    EXPECT_EQ(store.get("key"), std::optional<std::string>(""));

    EXPECT_TRUE(store.remove("key"));
    EXPECT_FALSE(store.get("key").has_value());
    EXPECT_TRUE(store.remove("key"));
}

class JsonFileStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = combine_paths(::testing::TempDir(), "bridgelink_store_test");
        path_ = combine_paths(dir_, "secure.json");
        cleanup();
    }

    void TearDown() override {
        cleanup();
    }

    void cleanup() {
        delete_file(path_);
        delete_file(path_ + ".tmp");
        delete_file(dir_);
    }

    std::string dir_;
    std::string path_;
};

TEST_F(JsonFileStoreTest, MissingFileIsEmptyStore) {
    JsonFileStore store(path_, 0600, "secure");
    EXPECT_TRUE(store.load());
    EXPECT_FALSE(store.get("anything").has_value());
    EXPECT_FALSE(file_exists(path_));
}

TEST_F(JsonFileStoreTest, ValuesSurviveReload) {
    {
        JsonFileStore store(path_, 0600, "secure");
        ASSERT_TRUE(store.load());
        ASSERT_TRUE(store.set("bridge.token.abc", "secret"));
        ASSERT_TRUE(store.set("node.instanceId", "0123"));
    }
    EXPECT_TRUE(file_exists(path_));

    JsonFileStore reloaded(path_, 0600, "secure");
    ASSERT_TRUE(reloaded.load());
    EXPECT_EQ(reloaded.get("bridge.token.abc"), std::optional<std::string>("secret"));
    EXPECT_EQ(reloaded.get("node.instanceId"), std::optional<std::string>("0123"));

    ASSERT_TRUE(reloaded.remove("bridge.token.abc"));
    JsonFileStore again(path_, 0600, "secure");
    ASSERT_TRUE(again.load());
    EXPECT_FALSE(again.get("bridge.token.abc").has_value());
    EXPECT_TRUE(again.get("node.instanceId").has_value());
}

TEST_F(JsonFileStoreTest, FileIsAJsonObject) {
    JsonFileStore store(path_, 0600, "secure");
    ASSERT_TRUE(store.load());
    ASSERT_TRUE(store.set("key", "value"));

    nlohmann::json content = nlohmann::json::parse(read_file_text_cpp(path_));
    ASSERT_TRUE(content.is_object());
    EXPECT_EQ(content["key"].get<std::string>(), "value");
}

#ifndef _WIN32
TEST_F(JsonFileStoreTest, SecureStoreIsOwnerOnly) {
    JsonFileStore store(path_, 0600, "secure");
    ASSERT_TRUE(store.load());
    ASSERT_TRUE(store.set("key", "value"));

    struct stat info;
    ASSERT_EQ(stat(path_.c_str(), &info), 0);
    EXPECT_EQ(info.st_mode & 0777, 0600u);
}
#endif

TEST_F(JsonFileStoreTest, NonStringValuesAreIgnored) {
    ASSERT_TRUE(create_directories(dir_));
    ASSERT_TRUE(create_file(path_, R"({"number": 5, "flag": true, "text": "ok", "nested": {"a": "b"}})"));

    JsonFileStore store(path_, 0600, "secure");
    ASSERT_TRUE(store.load());
    EXPECT_FALSE(store.get("number").has_value());
    EXPECT_FALSE(store.get("flag").has_value());
    EXPECT_FALSE(store.get("nested").has_value());
    EXPECT_EQ(store.get("text"), std::optional<std::string>("ok"));
}

TEST_F(JsonFileStoreTest, InvalidFilesFailToLoad) {
    ASSERT_TRUE(create_directories(dir_));

    ASSERT_TRUE(create_file(path_, "{ not json"));
    JsonFileStore broken(path_, 0600, "secure");
    EXPECT_FALSE(broken.load());

    ASSERT_TRUE(create_file(path_, R"(["a", "b"])"));
    JsonFileStore array(path_, 0600, "secure");
    EXPECT_FALSE(array.load());

    ASSERT_TRUE(create_file(path_, ""));
    JsonFileStore empty(path_, 0600, "secure");
    EXPECT_TRUE(empty.load());
}

TEST_F(JsonFileStoreTest, FailedWriteLeavesStoreUnchanged) {
    // A regular file where the parent directory should be makes every save fail
    ASSERT_TRUE(create_directories(dir_));
    std::string blocker = combine_paths(dir_, "blocker");
    ASSERT_TRUE(create_file(blocker, "not a directory"));

    JsonFileStore store(combine_paths(blocker, "secure.json"), 0600, "secure");
    ASSERT_TRUE(store.load());
    EXPECT_FALSE(store.set("node.instanceId", "abc"));
    EXPECT_FALSE(store.get("node.instanceId").has_value());

    MemoryKeyValueStore defaults("defaults");
    ASSERT_TRUE(defaults.set("node.instanceId", "abc"));
    EXPECT_EQ(reconcile_stores(defaults, store, {"node.instanceId"}), 0u);
    EXPECT_FALSE(store.get("node.instanceId").has_value());

    delete_file(blocker);
}

TEST_F(JsonFileStoreTest, FailedRemoveKeepsValue) {
    ASSERT_TRUE(create_directories(dir_));
    ASSERT_TRUE(create_file(path_, R"({"bridge.token.abc": "secret"})"));

    JsonFileStore store(path_, 0600, "secure");
    ASSERT_TRUE(store.load());

    // Occupy the temporary file name with a directory so the rewrite cannot start
    ASSERT_TRUE(create_directories(path_ + ".tmp"));
    EXPECT_FALSE(store.remove("bridge.token.abc"));
    EXPECT_EQ(store.get("bridge.token.abc"), std::optional<std::string>("secret"));

    delete_file(path_ + ".tmp");
}

TEST(ReconcileStoresTest, CopiesInBothDirections) {
    MemoryKeyValueStore defaults("defaults");
    MemoryKeyValueStore secure("secure");

    defaults.set("a", "from-defaults");
    secure.set("b", "from-secure");
    secure.set("a", "   ");

    size_t copied = reconcile_stores(defaults, secure, {"a", "b", "c"});
    EXPECT_EQ(copied, 2u);
    EXPECT_EQ(secure.get("a"), std::optional<std::string>("from-defaults"));
    EXPECT_EQ(defaults.get("b"), std::optional<std::string>("from-secure"));
    EXPECT_FALSE(defaults.get("c").has_value());
    EXPECT_FALSE(secure.get("c").has_value());

    // Second pass has nothing left to do
    EXPECT_EQ(reconcile_stores(defaults, secure, {"a", "b", "c"}), 0u);
}

TEST(ReconcileStoresTest, DifferingValuesAreKept) {
    MemoryKeyValueStore defaults("defaults");
    MemoryKeyValueStore secure("secure");
    defaults.set("node.instanceId", "one");
    secure.set("node.instanceId", "two");

    EXPECT_EQ(reconcile_stores(defaults, secure, {"node.instanceId"}), 0u);
    EXPECT_EQ(defaults.get("node.instanceId"), std::optional<std::string>("one"));
    EXPECT_EQ(secure.get("node.instanceId"), std::optional<std::string>("two"));
}

TEST(ReconcileStoresTest, OnlyListedKeysAreTouched) {
    MemoryKeyValueStore defaults("defaults");
    MemoryKeyValueStore secure("secure");
    defaults.set("clawdis.connectionMode", "local");

    EXPECT_EQ(reconcile_stores(defaults, secure, {"node.instanceId"}), 0u);
    EXPECT_FALSE(secure.get("clawdis.connectionMode").has_value());
}
