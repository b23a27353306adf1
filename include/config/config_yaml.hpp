#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace fl::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

inline spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node || !node.IsScalar()) return def;
    const auto lvl = spdlog::level::from_str(node.as<std::string>());
    // from_str maps unknown names to "off"
    if (lvl == spdlog::level::off && node.as<std::string>() != "off") return def;
    return lvl;
}

inline std::chrono::seconds secondsOr(const Node& node, const std::chrono::seconds def) {
    if (!node) return def;
    return std::chrono::seconds(node.as<long>(def.count()));
}

template<>
struct convert<PollingConfig> {
    static Node encode(const PollingConfig& rhs) {
        Node node;
        node["debug"] = rhs.debug;
        node["refresh_interval_seconds"] = rhs.refresh_interval.count();
        node["debug_refresh_interval_seconds"] = rhs.debug_refresh_interval.count();
        node["background_interval_seconds"] = rhs.background_interval.count();
        node["absorb_errors"] = rhs.absorb_errors;
        return node;
    }

    static bool decode(const Node& node, PollingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.debug = node["debug"].as<bool>(false);
        rhs.refresh_interval = secondsOr(node["refresh_interval_seconds"], std::chrono::seconds(3600));
        rhs.debug_refresh_interval = secondsOr(node["debug_refresh_interval_seconds"], std::chrono::seconds(5));
        rhs.background_interval = secondsOr(node["background_interval_seconds"], std::chrono::seconds(60));
        rhs.absorb_errors = node["absorb_errors"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<JoinConfig> {
    static Node encode(const JoinConfig& rhs) {
        Node node;
        node["confirm_timeout_seconds"] = rhs.confirm_timeout.count();
        return node;
    }

    static bool decode(const Node& node, JoinConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.confirm_timeout = secondsOr(node["confirm_timeout_seconds"], std::chrono::seconds(30));
        return true;
    }
};

template<>
struct convert<WorkersConfig> {
    static Node encode(const WorkersConfig& rhs) {
        Node node;
        node["threads"] = rhs.threads;
        return node;
    }

    static bool decode(const Node& node, WorkersConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.threads = node["threads"].as<unsigned int>(4);
        if (rhs.threads == 0) rhs.threads = 1;
        return true;
    }
};

template<>
struct convert<StoreConfig> {
    static Node encode(const StoreConfig& rhs) {
        Node node;
        node["snapshot_path"] = rhs.snapshot_path.string();
        return node;
    }

    static bool decode(const Node& node, StoreConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.snapshot_path = node["snapshot_path"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["folderlink"] = to_std_string(spdlog::level::to_string_view(rhs.folderlink));
        node["store"]      = to_std_string(spdlog::level::to_string_view(rhs.store));
        node["links"]      = to_std_string(spdlog::level::to_string_view(rhs.links));
        node["join"]       = to_std_string(spdlog::level::to_string_view(rhs.join));
        node["updates"]    = to_std_string(spdlog::level::to_string_view(rhs.updates));
        node["net"]        = to_std_string(spdlog::level::to_string_view(rhs.net));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const SubsystemLogLevelsConfig def;
        rhs.folderlink = levelOr(node["folderlink"], def.folderlink);
        rhs.store      = levelOr(node["store"], def.store);
        rhs.links      = levelOr(node["links"], def.links);
        rhs.join       = levelOr(node["join"], def.join);
        rhs.updates    = levelOr(node["updates"], def.updates);
        rhs.net        = levelOr(node["net"], def.net);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["console_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_level"] = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystems"] = convert<SubsystemLogLevelsConfig>::encode(rhs.subsystem_levels);
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        rhs.console_log_level = levelOr(node["console_level"], spdlog::level::info);
        rhs.file_log_level = levelOr(node["file_level"], spdlog::level::warn);
        if (const auto sub = node["subsystems"]) convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

}
