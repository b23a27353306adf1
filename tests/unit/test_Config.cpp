#include <gtest/gtest.h>
#include "config/Config.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace fl::config;
using namespace std::chrono_literals;

TEST(ConfigTest, EmptyDocumentYieldsDefaults) {
    const auto cfg = loadConfigFromString("");
    EXPECT_FALSE(cfg.polling.debug);
    EXPECT_EQ(cfg.polling.refresh_interval, 3600s);
    EXPECT_EQ(cfg.polling.effectiveRefreshInterval(), 3600s);
    EXPECT_TRUE(cfg.polling.absorb_errors);
    EXPECT_EQ(cfg.join.confirm_timeout, 30s);
    EXPECT_EQ(cfg.workers.threads, 4u);
    EXPECT_TRUE(cfg.store.snapshot_path.empty());
    EXPECT_EQ(cfg.logging.console_log_level, spdlog::level::info);
}

TEST(ConfigTest, PartialDocumentOverridesGivenKeysOnly) {
    const auto cfg = loadConfigFromString(R"(
polling:
  debug: true
  background_interval_seconds: 15
  absorb_errors: false
join:
  confirm_timeout_seconds: 5
logging:
  console_level: debug
  subsystems:
    store: trace
    net: not-a-level
)");

    EXPECT_TRUE(cfg.polling.debug);
    EXPECT_EQ(cfg.polling.effectiveRefreshInterval(), 5s);
    EXPECT_EQ(cfg.polling.background_interval, 15s);
    EXPECT_FALSE(cfg.polling.absorb_errors);
    EXPECT_EQ(cfg.join.confirm_timeout, 5s);
    EXPECT_EQ(cfg.workers.threads, 4u);
    EXPECT_EQ(cfg.logging.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.subsystem_levels.store, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.subsystem_levels.net, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.subsystem_levels.join, spdlog::level::info);
}

TEST(ConfigTest, NonMappingRootIsRejected) {
    EXPECT_THROW(loadConfigFromString("- a\n- b\n"), std::runtime_error);
}

TEST(ConfigTest, MissingFileIsRejected) {
    EXPECT_THROW(loadConfig("/nonexistent/folderlink.yaml"), std::runtime_error);
}

TEST(ConfigTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "folderlink_config_test.yaml";
    {
        std::ofstream out(path);
        out << "workers:\n  threads: 9\nstore:\n  snapshot_path: /tmp/fl.json\n";
    }

    const auto cfg = loadConfig(path);
    EXPECT_EQ(cfg.workers.threads, 9u);
    EXPECT_EQ(cfg.store.snapshot_path, "/tmp/fl.json");
    std::filesystem::remove(path);
}

TEST(ConfigTest, SerializesToJson) {
    Config cfg;
    cfg.polling.refresh_interval = 120s;
    const nlohmann::json j = cfg;
    EXPECT_EQ(j.at("polling").at("refresh_interval_seconds"), 120);
    EXPECT_EQ(j.at("join").at("confirm_timeout_seconds"), 30);
    EXPECT_EQ(j.at("logging").at("subsystems").at("store"), "warning");
}
