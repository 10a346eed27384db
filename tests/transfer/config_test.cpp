#include "relay/transfer/config.hpp"

#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

using nlohmann::json;
using relay::transfer::config_from_json;
using relay::transfer::config_to_json;
using relay::transfer::EngineConfig;
using relay::transfer::ErrorKind;
using relay::transfer::load_config;

TEST(EngineConfigTest, DefaultsMatchDocumentedValues) {
    EngineConfig config;
    EXPECT_EQ(config.max_object_bytes, 50 * relay::transfer::kGiB);
    EXPECT_EQ(config.max_attempts, 3u);
    EXPECT_EQ(config.base_delay.count(), 2000);
    EXPECT_DOUBLE_EQ(config.shrink_factor, 0.8);
    EXPECT_EQ(config.progress_interval.count(), 2000);
    EXPECT_EQ(config.strategies.entries().size(), 4u);
    EXPECT_EQ(config.quota_markers.size(), 4u);
}

TEST(EngineConfigTest, PartialDocumentOverridesOnlyGivenKeys) {
    auto result = config_from_json(json{{"max_attempts", 5}, {"base_delay_ms", 10}, {"log_level", "debug"}});
    ASSERT_TRUE(result.is_ok());
    const auto& config = result.value();
    EXPECT_EQ(config.max_attempts, 5u);
    EXPECT_EQ(config.base_delay.count(), 10);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_DOUBLE_EQ(config.shrink_factor, 0.8);
}

TEST(EngineConfigTest, CustomStrategies) {
    json document;
    document["strategies"] = json::array({
        {{"name", "small"}, {"threshold", 100}, {"chunk_size", 10}},
        {{"name", "large"}, {"threshold", 1000}, {"chunk_size", 200}},
    });
    auto result = config_from_json(document);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().strategies.select(500).name, "large");
}

TEST(EngineConfigTest, RejectsInvalidValues) {
    EXPECT_EQ(config_from_json(json{{"max_attempts", 0}}).error().kind, ErrorKind::InvalidConfig);
    EXPECT_TRUE(config_from_json(json{{"shrink_factor", 1.5}}).is_error());
    EXPECT_TRUE(config_from_json(json{{"max_attempts", "three"}}).is_error());
    EXPECT_TRUE(config_from_json(json::array()).is_error());

    json descending;
    descending["strategies"] = json::array({
        {{"name", "a"}, {"threshold", 1000}, {"chunk_size", 10}},
        {{"name", "b"}, {"threshold", 100}, {"chunk_size", 20}},
    });
    EXPECT_TRUE(config_from_json(descending).is_error());
}

TEST(EngineConfigTest, LoadFromFileRoundTrip) {
    const auto dir = relay::test_support::create_temp_dir("config");
    EngineConfig config;
    config.max_attempts = 7;
    config.staging_root = dir / "staging";
    relay::test_support::write_file(dir / "relay.json", config_to_json(config).dump(2));

    auto loaded = load_config(dir / "relay.json");
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().max_attempts, 7u);
    EXPECT_EQ(loaded.value().staging_root, dir / "staging");

    relay::test_support::write_file(dir / "broken.json", "{ not json");
    EXPECT_TRUE(load_config(dir / "broken.json").is_error());
    EXPECT_TRUE(load_config(dir / "missing.json").is_error());

    std::filesystem::remove_all(dir);
}
