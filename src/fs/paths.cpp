#include "fs/paths.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace stash::fs {

std::string_view to_string(const BaseDirectory kind) {
    switch (kind) {
        case BaseDirectory::Caches: return "caches";
        case BaseDirectory::ApplicationSupport: return "application_support";
        case BaseDirectory::Documents: return "documents";
        case BaseDirectory::Temporary: return "temporary";
    }
    return "unknown";
}

BaseDirectory baseDirectoryFromString(const std::string_view name) {
    std::string lower(name);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lower == "caches" || lower == "cache") return BaseDirectory::Caches;
    if (lower == "application_support" || lower == "data") return BaseDirectory::ApplicationSupport;
    if (lower == "documents") return BaseDirectory::Documents;
    if (lower == "temporary" || lower == "tmp") return BaseDirectory::Temporary;
    throw std::invalid_argument("Unknown base directory: " + std::string(name));
}

}

namespace stash::fs::paths {

namespace {

std::optional<std::filesystem::path> absoluteVar(const Environment& env, const std::string& name) {
    const auto value = env(name);
    if (!value) return std::nullopt;
    std::filesystem::path p(*value);
    if (!p.is_absolute()) return std::nullopt;
    return p;
}

std::filesystem::path underHome(const Environment& env, const std::filesystem::path& rel, const std::string& xdgVar) {
    const auto home = absoluteVar(env, "HOME");
    if (!home) throw std::runtime_error("Cannot resolve " + xdgVar + ": $HOME is not set to an absolute path");
    return *home / rel;
}

}

Environment processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value || !*value) return std::nullopt;
        return std::string(value);
    };
}

std::filesystem::path resolveRoot(const BaseDirectory kind, const Environment& env) {
    switch (kind) {
        case BaseDirectory::Caches:
            if (auto p = absoluteVar(env, "XDG_CACHE_HOME")) return *p;
            return underHome(env, ".cache", "XDG_CACHE_HOME");
        case BaseDirectory::ApplicationSupport:
            if (auto p = absoluteVar(env, "XDG_DATA_HOME")) return *p;
            return underHome(env, std::filesystem::path(".local") / "share", "XDG_DATA_HOME");
        case BaseDirectory::Documents:
            if (auto p = absoluteVar(env, "XDG_DOCUMENTS_DIR")) return *p;
            return underHome(env, "Documents", "XDG_DOCUMENTS_DIR");
        case BaseDirectory::Temporary:
            if (auto p = absoluteVar(env, "TMPDIR")) return *p;
            return "/tmp";
    }
    throw std::invalid_argument("Unhandled base directory kind");
}

}
