#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace stash::config {
struct LoggingConfig;
}

namespace stash::logging {

class LogRegistry {
public:
    // Build sinks and one logger per subsystem. A second call replaces the loggers.
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name; falls back to console-only defaults if init() was never called
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> stash()   { return get("stash"); }
    static std::shared_ptr<spdlog::logger> storage() { return get("storage"); }
    static std::shared_ptr<spdlog::logger> cache()   { return get("cache"); }
    static std::shared_ptr<spdlog::logger> codec()   { return get("codec"); }
    static std::shared_ptr<spdlog::logger> fs()      { return get("fs"); }

    [[nodiscard]] static bool isInitialized();
    [[nodiscard]] static std::filesystem::path mainLogPath();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
    static constexpr const char* SUBSYSTEMS[] = {"stash", "storage", "cache", "codec", "fs"};

    static void build_(const config::LoggingConfig& cnf);

    static inline std::mutex mutex_;
    static inline std::atomic<bool> initialized_{false};

    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
