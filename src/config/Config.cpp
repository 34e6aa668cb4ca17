#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace stash::config {

namespace {

Config fromRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a YAML mapping");

    if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
    if (auto node = root["image"]) YAML::convert<ImageConfig>::decode(node, cfg.image);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

std::string level_string(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

}

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) throw std::runtime_error("Config file not found: " + path.string());
    return fromRoot(YAML::LoadFile(path.string()));
}

Config parseConfig(const std::string& yaml) {
    return fromRoot(YAML::Load(yaml));
}

void Config::save(const std::filesystem::path& path) const {
    YAML::Node root;
    root["storage"] = storage;
    root["image"] = image;
    root["logging"] = logging;

    YAML::Emitter out;
    out << root;

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) throw std::runtime_error("Failed to write config file: " + path.string());

    file << out.c_str() << '\n';
    file.close();
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"storage", c.storage},
        {"image", c.image},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = {
        {"base_directory", c.base_directory},
        {"folder", c.folder},
        {"app_identifier", c.app_identifier},
        {"codec", c.codec},
        {"pretty", c.pretty},
        {"allow_fragments", c.allow_fragments},
        {"protect", c.protect},
        {"cache_max_entries", c.cache_max_entries}
    };
}

void to_json(nlohmann::json& j, const ImageConfig& c) {
    j = {{"jpeg_quality", c.jpeg_quality}};
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"console_log_level", level_string(c.console_log_level)},
        {"file_log_level", level_string(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"stash", level_string(c.stash)},
        {"storage", level_string(c.storage)},
        {"cache", level_string(c.cache)},
        {"codec", level_string(c.codec)},
        {"fs", level_string(c.fs)}
    };
}

} // namespace stash::config
