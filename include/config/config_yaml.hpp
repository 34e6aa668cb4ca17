#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace stash::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["base_directory"] = rhs.base_directory;
        node["folder"] = rhs.folder;
        node["app_identifier"] = rhs.app_identifier;
        node["codec"] = rhs.codec;
        node["pretty"] = rhs.pretty;
        node["allow_fragments"] = rhs.allow_fragments;
        node["protect"] = rhs.protect;
        node["cache_max_entries"] = rhs.cache_max_entries;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.base_directory = node["base_directory"].as<std::string>("caches");
        rhs.folder = node["folder"].as<std::string>("Default");
        rhs.app_identifier = node["app_identifier"].as<std::string>("");
        rhs.codec = node["codec"].as<std::string>("json");
        rhs.pretty = node["pretty"].as<bool>(false);
        rhs.allow_fragments = node["allow_fragments"].as<bool>(false);
        rhs.protect = node["protect"].as<bool>(true);
        rhs.cache_max_entries = node["cache_max_entries"].as<std::size_t>(0);
        return true;
    }
};

template<>
struct convert<ImageConfig> {
    static Node encode(const ImageConfig& rhs) {
        Node node;
        node["jpeg_quality"] = rhs.jpeg_quality;
        return node;
    }

    static bool decode(const Node& node, ImageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.jpeg_quality = node["jpeg_quality"].as<int>(DEFAULT_JPEG_QUALITY);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["stash"]   = to_std_string(spdlog::level::to_string_view(rhs.stash));
        node["storage"] = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["cache"]   = to_std_string(spdlog::level::to_string_view(rhs.cache));
        node["codec"]   = to_std_string(spdlog::level::to_string_view(rhs.codec));
        node["fs"]      = to_std_string(spdlog::level::to_string_view(rhs.fs));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.stash = spdlog::level::from_str(node["stash"].as<std::string>("info"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warn"));
        rhs.cache = spdlog::level::from_str(node["cache"].as<std::string>("warn"));
        rhs.codec = spdlog::level::from_str(node["codec"].as<std::string>("warn"));
        rhs.fs = spdlog::level::from_str(node["fs"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"] = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (const auto levels = node["subsystem_levels"])
            convert<SubsystemLogLevelsConfig>::decode(levels, rhs.subsystem_levels);
        return true;
    }
};

} // namespace YAML
