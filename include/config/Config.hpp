#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace fl::config {

struct PollingConfig {
    bool debug = false;                                      // short refresh interval for development builds
    std::chrono::seconds refresh_interval{60 * 60};
    std::chrono::seconds debug_refresh_interval{5};
    std::chrono::seconds background_interval{60};
    bool absorb_errors = true;                               // failed polls cache an empty result

    [[nodiscard]] std::chrono::seconds effectiveRefreshInterval() const {
        return debug ? debug_refresh_interval : refresh_interval;
    }
};

struct JoinConfig {
    std::chrono::seconds confirm_timeout{30};
};

struct WorkersConfig {
    unsigned int threads = 4;
};

struct StoreConfig {
    std::filesystem::path snapshot_path{};                   // empty disables persistence
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum folderlink = spdlog::level::info;
    spdlog::level::level_enum store      = spdlog::level::warn;   // Rolled back transactions, snapshot I/O
    spdlog::level::level_enum links      = spdlog::level::info;
    spdlog::level::level_enum join       = spdlog::level::info;
    spdlog::level::level_enum updates    = spdlog::level::info;
    spdlog::level::level_enum net        = spdlog::level::warn;   // Remote failures that were not translated
};

struct LoggingConfig {
    std::filesystem::path log_dir{};                         // empty means console only
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    PollingConfig polling;
    JoinConfig join;
    WorkersConfig workers;
    StoreConfig store;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const PollingConfig& c);
void to_json(nlohmann::json& j, const JoinConfig& c);
void to_json(nlohmann::json& j, const WorkersConfig& c);
void to_json(nlohmann::json& j, const StoreConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);

}
