#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace stash::config {

constexpr static int DEFAULT_JPEG_QUALITY = 90;

struct StorageConfig {
    std::string base_directory = "caches";
    std::string folder = "Default";
    std::string app_identifier;
    std::string codec = "json";
    bool pretty = false;
    bool allow_fragments = false;
    bool protect = true;              // owner-only permissions on the engine folder
    std::size_t cache_max_entries = 0; // 0 = unbounded
};

struct ImageConfig {
    int jpeg_quality = DEFAULT_JPEG_QUALITY;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum stash   = spdlog::level::info;   // Engine lifecycle, CLI
    spdlog::level::level_enum storage = spdlog::level::warn;   // Failed reads/writes, construction errors
    spdlog::level::level_enum cache   = spdlog::level::warn;   // Evictions and type mismatches at debug
    spdlog::level::level_enum codec   = spdlog::level::warn;   // Rejected documents, image codec failures
    spdlog::level::level_enum fs      = spdlog::level::warn;   // Underlying I/O issues
};

struct LoggingConfig {
    std::filesystem::path log_dir; // empty disables the rotating file sink
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    StorageConfig storage;
    ImageConfig image;
    LoggingConfig logging;

    void save(const std::filesystem::path& path) const;
};

Config loadConfig(const std::filesystem::path& path);
Config parseConfig(const std::string& yaml);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const StorageConfig& c);
void to_json(nlohmann::json& j, const ImageConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);

} // namespace stash::config
