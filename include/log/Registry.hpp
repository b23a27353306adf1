#pragma once

#include <memory>
#include <string>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace fl::config { struct LoggingConfig; }

namespace fl::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> folderlink() { return get("folderlink"); }
    static std::shared_ptr<spdlog::logger> store()      { return get("store"); }
    static std::shared_ptr<spdlog::logger> links()      { return get("links"); }
    static std::shared_ptr<spdlog::logger> join()       { return get("join"); }
    static std::shared_ptr<spdlog::logger> updates()    { return get("updates"); }
    static std::shared_ptr<spdlog::logger> net()        { return get("net"); }

    [[nodiscard]] static bool isInitialized();

    // Drops every registered logger; init() may be called again afterwards.
    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
