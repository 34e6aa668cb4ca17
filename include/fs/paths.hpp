#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace stash::fs {

// OS-provided roots an engine folder can live under.
enum class BaseDirectory { Caches, ApplicationSupport, Documents, Temporary };

std::string_view to_string(BaseDirectory kind);
BaseDirectory baseDirectoryFromString(std::string_view name);

}

namespace stash::fs::paths {

// Looks up an environment variable; std::nullopt when unset or empty.
using Environment = std::function<std::optional<std::string>(const std::string&)>;

Environment processEnvironment();

// XDG base-directory rules: $XDG_CACHE_HOME, $XDG_DATA_HOME, $XDG_DOCUMENTS_DIR
// (relative values are ignored), falling back under $HOME; $TMPDIR or /tmp for Temporary.
// Throws std::runtime_error when neither the XDG variable nor $HOME is usable.
std::filesystem::path resolveRoot(BaseDirectory kind, const Environment& env = processEnvironment());

}
