// tests/test_entrystore.cpp
#include <string>
#include <utility>
#include <vector>

#include "gtest/gtest.h"

#include "../src/cache/EntryStore.hpp"

namespace {
CacheEntry makeEntry(const nlohmann::json& value) {
    CacheEntry entry;
    entry.value = value;
    entry.expires_in = 60.0;
    entry.created_at = 100.0;
    return entry;
}
}

class EntryStoreTest : public ::testing::Test {
protected:
    EntryStore store;
};

TEST_F(EntryStoreTest, PutAndFind) {
    store.put("key", makeEntry("value"));

    ASSERT_NE(store.find("key"), nullptr);
    EXPECT_EQ(store.find("key")->value, "value");
    EXPECT_TRUE(store.contains("key"));
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(EntryStoreTest, FindMissingReturnsNull) {
    EXPECT_EQ(store.find("missing_key"), nullptr);
    EXPECT_FALSE(store.contains("missing_key"));
    EXPECT_TRUE(store.empty());
}

TEST_F(EntryStoreTest, KeysFollowInsertionOrder) {
    store.put("b", makeEntry(1));
    store.put("a", makeEntry(2));
    store.put("c", makeEntry(3));

    EXPECT_EQ(store.keys(), (std::vector<std::string>{"b", "a", "c"}));
}

TEST_F(EntryStoreTest, OverwriteKeepsPosition) {
    store.put("first", makeEntry(1));
    store.put("second", makeEntry(2));
    store.put("first", makeEntry("replaced"));

    EXPECT_EQ(store.keys(), (std::vector<std::string>{"first", "second"}));
    EXPECT_EQ(store.find("first")->value, "replaced");
    EXPECT_EQ(store.size(), 2u);
}

TEST_F(EntryStoreTest, EraseRemovesOnlyThatKey) {
    store.put("key1", makeEntry(1));
    store.put("key2", makeEntry(2));
    store.put("key3", makeEntry(3));

    EXPECT_TRUE(store.erase("key2"));
    EXPECT_FALSE(store.erase("key2"));
    EXPECT_EQ(store.keys(), (std::vector<std::string>{"key1", "key3"}));

    // A re-inserted key goes to the back
    store.put("key2", makeEntry(4));
    EXPECT_EQ(store.keys(), (std::vector<std::string>{"key1", "key3", "key2"}));
}

TEST_F(EntryStoreTest, ClearEmptiesStore) {
    store.put("key1", makeEntry(1));
    store.put("key2", makeEntry(2));

    store.clear();

    EXPECT_TRUE(store.empty());
    EXPECT_TRUE(store.keys().empty());
    EXPECT_EQ(store.find("key1"), nullptr);
}

TEST_F(EntryStoreTest, MovedStoreKeepsEntries) {
    store.put("key1", makeEntry(1));
    store.put("key2", makeEntry(2));

    EntryStore moved(std::move(store));
    moved.put("key1", makeEntry("updated"));
    EXPECT_TRUE(moved.erase("key2"));

    EXPECT_EQ(moved.keys(), (std::vector<std::string>{"key1"}));
    EXPECT_EQ(moved.find("key1")->value, "updated");
}

TEST(CacheEntryTest, ExpiresWhenLifetimeIsReached) {
    CacheEntry entry = makeEntry("value");

    EXPECT_FALSE(entry.isExpired(159.9));
    EXPECT_TRUE(entry.isExpired(160.0));

    entry.expires_in.reset();
    EXPECT_FALSE(entry.isExpired(1e12));
}

TEST(CacheEntryTest, MismatchRequiresBothVersions) {
    CacheEntry entry = makeEntry("value");
    EXPECT_FALSE(entry.isMismatched("1"));

    entry.version = "1";
    EXPECT_FALSE(entry.isMismatched(nullptr));
    EXPECT_FALSE(entry.isMismatched("1"));
    EXPECT_TRUE(entry.isMismatched("2"));
    EXPECT_TRUE(entry.isMismatched(1));
}
