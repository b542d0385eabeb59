// tests/test_cacheoptions.cpp
#include <map>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "../src/models/CacheOptions.hpp"

using json = nlohmann::json;

class MultiOptionTest : public ::testing::Test {
protected:
    std::vector<std::string> keys = {"key1", "key2", "key3"};
};

TEST_F(MultiOptionTest, UnsetResolvesToNothing) {
    MultiOption<double> option;

    EXPECT_FALSE(option.isSet());
    EXPECT_FALSE(option.resolve(keys, 0).has_value());
}

TEST_F(MultiOptionTest, SharedValueAppliesToEveryKey) {
    auto option = MultiOption<double>::all(30.0);

    EXPECT_TRUE(option.isSet());
    for (size_t i = 0; i < keys.size(); ++i) {
        EXPECT_EQ(option.resolve(keys, i), std::optional<double>(30.0));
    }
}

TEST_F(MultiOptionTest, OrderedValuesFollowKeyPosition) {
    auto option = MultiOption<json>::ordered({"1", "2"});

    EXPECT_EQ(option.resolve(keys, 0), std::optional<json>("1"));
    EXPECT_EQ(option.resolve(keys, 1), std::optional<json>("2"));
    EXPECT_FALSE(option.resolve(keys, 2).has_value());
}

TEST_F(MultiOptionTest, KeyedValuesFollowKeyNames) {
    auto option = MultiOption<bool>::byKey({{"key3", true}, {"unrelated", false}});

    EXPECT_FALSE(option.resolve(keys, 0).has_value());
    EXPECT_FALSE(option.resolve(keys, 1).has_value());
    EXPECT_EQ(option.resolve(keys, 2), std::optional<bool>(true));
}

TEST_F(MultiOptionTest, SharedJsonArrayIsOneValue) {
    auto option = MultiOption<json>::all(json::array({1, 2}));

    EXPECT_EQ(option.resolve(keys, 2), std::optional<json>(json::array({1, 2})));
}

TEST_F(MultiOptionTest, ForKeyBuildsSingleKeyOptions) {
    MultiCacheOptions options;
    options.force = MultiOption<bool>::ordered({true});
    options.version = MultiOption<json>::byKey({{"key2", 7}});
    options.expires_in = MultiOption<double>::all(5.0);

    CacheOptions first = options.forKey(keys, 0);
    EXPECT_TRUE(first.force);
    EXPECT_TRUE(first.version.is_null());
    EXPECT_EQ(first.expires_in, std::optional<double>(5.0));
    EXPECT_FALSE(first.skip_nil.has_value());

    CacheOptions second = options.forKey(keys, 1);
    EXPECT_FALSE(second.force);
    EXPECT_EQ(second.version, 7);
}
