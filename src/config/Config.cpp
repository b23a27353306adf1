#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace fl::config {

namespace {

Config decodeRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a mapping");

    if (auto node = root["polling"]) YAML::convert<PollingConfig>::decode(node, cfg.polling);
    if (auto node = root["join"]) YAML::convert<JoinConfig>::decode(node, cfg.join);
    if (auto node = root["workers"]) YAML::convert<WorkersConfig>::decode(node, cfg.workers);
    if (auto node = root["store"]) YAML::convert<StoreConfig>::decode(node, cfg.store);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

std::string levelName(const spdlog::level::level_enum lvl) {
    return YAML::to_std_string(spdlog::level::to_string_view(lvl));
}

}

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) throw std::runtime_error("Config file not found: " + path.string());
    return decodeRoot(YAML::LoadFile(path.string()));
}

Config loadConfigFromString(const std::string& yaml) {
    return decodeRoot(YAML::Load(yaml));
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"polling", c.polling},
        {"join", c.join},
        {"workers", c.workers},
        {"store", c.store},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const PollingConfig& c) {
    j = {
        {"debug", c.debug},
        {"refresh_interval_seconds", c.refresh_interval.count()},
        {"debug_refresh_interval_seconds", c.debug_refresh_interval.count()},
        {"background_interval_seconds", c.background_interval.count()},
        {"absorb_errors", c.absorb_errors}
    };
}

void to_json(nlohmann::json& j, const JoinConfig& c) {
    j = {{"confirm_timeout_seconds", c.confirm_timeout.count()}};
}

void to_json(nlohmann::json& j, const WorkersConfig& c) {
    j = {{"threads", c.threads}};
}

void to_json(nlohmann::json& j, const StoreConfig& c) {
    j = {{"snapshot_path", c.snapshot_path.string()}};
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"folderlink", levelName(c.folderlink)},
        {"store", levelName(c.store)},
        {"links", levelName(c.links)},
        {"join", levelName(c.join)},
        {"updates", levelName(c.updates)},
        {"net", levelName(c.net)}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"console_level", levelName(c.console_log_level)},
        {"file_level", levelName(c.file_log_level)},
        {"subsystems", c.subsystem_levels}
    };
}

}
