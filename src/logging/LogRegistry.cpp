#include "logging/LogRegistry.hpp"
#include "config/Config.hpp"

#include <stdexcept>
#include <vector>

namespace stash::logging {

void LogRegistry::init(const config::LoggingConfig& cnf) {
    std::scoped_lock lock(mutex_);
    build_(cnf);
    spdlog::get("stash")->debug("[LogRegistry] Initialized");
}

void LogRegistry::build_(const config::LoggingConfig& cnf) {
    for (const auto* name : SUBSYSTEMS) spdlog::drop(name);

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    main_file_sink_.reset();
    main_log_path_.clear();
    if (!cnf.log_dir.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);

        main_log_path_ = cnf.log_dir / "stash.log";
        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.subsystem_levels;
    makeLogger("stash",   sub_levels.stash);
    makeLogger("storage", sub_levels.storage);
    makeLogger("cache",   sub_levels.cache);
    makeLogger("codec",   sub_levels.codec);
    makeLogger("fs",      sub_levels.fs);

    initialized_ = true;
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    if (!initialized_) {
        std::scoped_lock lock(mutex_);
        if (!initialized_) build_(config::LoggingConfig{});
    }

    auto logger = spdlog::get(name);
    if (!logger) throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

std::filesystem::path LogRegistry::mainLogPath() { return main_log_path_; }

}
