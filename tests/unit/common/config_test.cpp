/// @file config_test.cpp
/// @brief Tests for ReviewScope configuration management

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "common/config.h"
#include "common/error.h"

namespace reviewscope {
namespace {

TEST(ConfigTest, LoadFromString) {
    const std::string yaml_content = R"(
sentiment:
  positive_threshold: 0.1
topics:
  n_topics: 4
aspects:
  disabled:
    - returns
    - value
logging:
  level: debug
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok()) << result.status().message();

    Config config = std::move(*result);

    EXPECT_DOUBLE_EQ(config.GetDouble("sentiment.positive_threshold"), 0.1);
    EXPECT_EQ(config.GetInt("topics.n_topics"), 4);
    EXPECT_EQ(config.GetString("logging.level"), "debug");

    auto disabled = config.GetStringList("aspects.disabled");
    ASSERT_EQ(disabled.size(), 2u);
    EXPECT_EQ(disabled[0], "returns");
    EXPECT_EQ(disabled[1], "value");
}

TEST(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.GetString("nonexistent.key", "default"), "default");
    EXPECT_EQ(config.GetInt("nonexistent.key", 42), 42);
    EXPECT_EQ(config.GetDouble("nonexistent.key", 3.14), 3.14);
    EXPECT_EQ(config.GetBool("nonexistent.key", true), true);
    EXPECT_TRUE(config.GetStringList("nonexistent.key").empty());
}

TEST(ConfigTest, MalformedScalarFallsBackToDefault) {
    auto result = Config::LoadFromString("topics:\n  n_topics: many\n");
    ASSERT_TRUE(result.ok());

    EXPECT_EQ(result->GetInt("topics.n_topics", 6), 6);
    EXPECT_EQ(result->GetString("topics.n_topics"), "many");
}

TEST(ConfigTest, SetValues) {
    Config config;

    config.Set("test.string", std::string("value"));
    config.Set("test.int", static_cast<int64_t>(123));
    config.Set("test.bool", true);
    config.Set("test.list", std::vector<std::string>{"a", "b"});

    EXPECT_EQ(config.GetString("test.string"), "value");
    EXPECT_EQ(config.GetInt("test.int"), 123);
    EXPECT_EQ(config.GetBool("test.bool"), true);
    EXPECT_EQ(config.GetStringList("test.list").size(), 2u);
}

TEST(ConfigTest, HasKeyAndGetKeys) {
    const std::string yaml_content = R"(
sentiment:
  overrides:
    flimsy: -1.5
    sturdy: 1.3
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok());

    Config config = std::move(*result);

    EXPECT_TRUE(config.HasKey("sentiment.overrides.flimsy"));
    EXPECT_FALSE(config.HasKey("sentiment.overrides.cheap"));

    auto keys = config.GetKeys("sentiment.overrides");
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "flimsy");
    EXPECT_EQ(keys[1], "sturdy");
}

TEST(ConfigTest, LookupDoesNotModifyTree) {
    auto result = Config::LoadFromString("a:\n  b: 1\n");
    ASSERT_TRUE(result.ok());

    Config config = std::move(*result);
    EXPECT_FALSE(config.HasKey("a.missing.deeper"));
    EXPECT_EQ(config.GetInt("a.b"), 1);
    EXPECT_TRUE(config.GetKeys("a") == std::vector<std::string>{"b"});
}

TEST(ConfigTest, MergeConfigs) {
    const std::string base_yaml = R"(
key1: value1
nested:
  a: 1
  b: 2
)";

    const std::string overlay_yaml = R"(
key2: value2
nested:
  b: 20
  c: 3
)";

    auto base_result = Config::LoadFromString(base_yaml);
    auto overlay_result = Config::LoadFromString(overlay_yaml);
    ASSERT_TRUE(base_result.ok());
    ASSERT_TRUE(overlay_result.ok());

    Config base = std::move(*base_result);
    Config overlay = std::move(*overlay_result);

    base.Merge(overlay);

    EXPECT_EQ(base.GetString("key1"), "value1");
    EXPECT_EQ(base.GetString("key2"), "value2");
    EXPECT_EQ(base.GetInt("nested.a"), 1);
    EXPECT_EQ(base.GetInt("nested.b"), 20);  // Overwritten
    EXPECT_EQ(base.GetInt("nested.c"), 3);   // Added
    EXPECT_EQ(overlay.GetInt("nested.b"), 20);
}

TEST(ConfigTest, InvalidYaml) {
    auto result = Config::LoadFromString("{ invalid yaml [");
    EXPECT_FALSE(result.ok());
}

TEST(ConfigTest, LoadFromMissingFile) {
    auto result = Config::LoadFromFile("/nonexistent/reviewscope.yaml");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kNotFound);
}

TEST(ConfigTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "reviewscope_config_test.yaml";
    {
        std::ofstream out(path);
        out << "aspects:\n  industry: beauty\n";
    }

    auto result = Config::LoadFromFile(path);
    ASSERT_TRUE(result.ok()) << result.status().message();
    EXPECT_EQ(result->GetString("aspects.industry"), "beauty");

    std::filesystem::remove(path);
}

TEST(ConfigTest, LoadFromEnvironment) {
    setenv("RSTEST_INDUSTRY", "food", 1);
    setenv("RSTEST_N_TOPICS", "3", 1);
    setenv("RSTEST_LOG_LEVEL", "warn", 1);

    auto result = Config::LoadFromEnvironment("RSTEST_");
    ASSERT_TRUE(result.ok()) << result.status().message();
    EXPECT_EQ(result->GetString("aspects.industry"), "food");
    EXPECT_EQ(result->GetInt("topics.n_topics"), 3);
    EXPECT_EQ(result->GetString("logging.level"), "warn");
    EXPECT_FALSE(result->HasKey("pipeline.worker_threads"));

    unsetenv("RSTEST_INDUSTRY");
    unsetenv("RSTEST_N_TOPICS");
    unsetenv("RSTEST_LOG_LEVEL");
}

TEST(ConfigTest, LoadFromEnvironmentRejectsNonInteger) {
    setenv("RSTEST_WORKER_THREADS", "lots", 1);

    auto result = Config::LoadFromEnvironment("RSTEST_");
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(IsConfigurationError(result.status()));

    unsetenv("RSTEST_WORKER_THREADS");
}

}  // namespace
}  // namespace reviewscope
