#include <gtest/gtest.h>

#include <filesystem>
#include <algorithm>
#include <fstream>
#include <string>
#include <vector>

#include "arena/foundation/config_manager.hpp"
#include "arena/foundation/error_code.hpp"

using namespace arena::foundation;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Unique directory per test so ctest --parallel does not race.
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("arena_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGetNestedKeys) {
    auto path = writeYaml("arena.yaml", R"(
arena:
  queue:
    default_rating_range: 250
  season:
    name: "Season 4"
)");

    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto range = config.get<int>("arena.queue.default_rating_range");
    ASSERT_TRUE(range.hasValue());
    EXPECT_EQ(range.value(), 250);

    auto name = config.get<std::string>("arena.season.name");
    ASSERT_TRUE(name.hasValue());
    EXPECT_EQ(name.value(), "Season 4");
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load("/nonexistent/arena.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, MalformedYamlFails) {
    ConfigManager config;
    auto result = config.loadFromString("arena: [unclosed");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("{}").hasValue());

    auto result = config.get<int>("arena.missing");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("value: hello").hasValue());

    auto result = config.get<int>("value");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, GetOrFallsBack) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("limit: 30\nbad: text").hasValue());

    EXPECT_EQ(config.getOr<int>("limit", 5), 30);
    EXPECT_EQ(config.getOr<int>("missing", 5), 5);
    EXPECT_EQ(config.getOr<int>("bad", 5), 5);
}

TEST_F(ConfigManagerTest, ReloadReplacesEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a: 1").hasValue());
    ASSERT_TRUE(config.loadFromString("b: 2").hasValue());

    EXPECT_FALSE(config.hasKey("a"));
    EXPECT_TRUE(config.hasKey("b"));
}

TEST_F(ConfigManagerTest, KeysWithPrefix) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
arena:
  log:
    queue: debug
    match: warning
  logging_extra: 1
)").hasValue());

    auto keys = config.keysWithPrefix("arena.log");
    std::sort(keys.begin(), keys.end());
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "arena.log.match");
    EXPECT_EQ(keys[1], "arena.log.queue");
}

TEST_F(ConfigManagerTest, SetAndWatch) {
    ConfigManager config;
    std::string notifiedKey;
    config.watch("arena.queue.default_rating_range", [&](std::string_view key) {
        notifiedKey = std::string(key);
    });

    config.set<int>("arena.queue.default_rating_range", 300);

    EXPECT_EQ(notifiedKey, "arena.queue.default_rating_range");
    auto value = config.get<int>("arena.queue.default_rating_range");
    ASSERT_TRUE(value.hasValue());
    EXPECT_EQ(value.value(), 300);
}

TEST_F(ConfigManagerTest, WatcherMayReadConfig) {
    ConfigManager config;
    int observed = 0;
    config.watch("x", [&](std::string_view key) {
        observed = config.getOr<int>(key, -1);
    });

    config.set<int>("x", 11);
    EXPECT_EQ(observed, 11);
}
