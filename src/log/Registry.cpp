#include "log/Registry.hpp"
#include "config/Config.hpp"

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace fl::log {

void Registry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    // main file sink (rotating), only when a directory is configured
    if (!cnf.log_dir.empty()) {
        namespace fs = std::filesystem;
        log_dir_ = cnf.log_dir;
        main_log_path_ = log_dir_ / "folderlink.log";
        if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        if (spdlog::get(name)) spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.subsystem_levels;
    makeLogger("folderlink", sub_levels.folderlink);
    makeLogger("store",      sub_levels.store);
    makeLogger("links",      sub_levels.links);
    makeLogger("join",       sub_levels.join);
    makeLogger("updates",    sub_levels.updates);
    makeLogger("net",        sub_levels.net);

    initialized_ = true;
    folderlink()->debug("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::shutdown() {
    if (!initialized_) return;
    for (const auto* name : {"folderlink", "store", "links", "join", "updates", "net"}) spdlog::drop(name);
    console_sink_.reset();
    main_file_sink_.reset();
    initialized_ = false;
}

}
