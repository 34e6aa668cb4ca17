#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace stash::fs {

// Protection attributes applied to an engine folder. An empty set means the
// platform has nothing to apply.
struct Attributes {
    std::optional<std::filesystem::perms> permissions;

    [[nodiscard]] bool empty() const noexcept { return !permissions.has_value(); }

    static Attributes none() { return {}; }
    static Attributes ownerOnly() { return {std::filesystem::perms::owner_all}; }
};

// Host filesystem capability used by storage::Engine.
// Failing operations throw std::filesystem::filesystem_error unless noted.
class Driver {
public:
    virtual ~Driver() = default;

    [[nodiscard]] virtual bool exists(const std::filesystem::path& path) const = 0;

    // Creates the directory and any missing parents.
    virtual void createDirectory(const std::filesystem::path& path) = 0;

    virtual void setAttributes(const std::filesystem::path& path, const Attributes& attrs) = 0;

    // Creates or truncates the file. Returns false if the bytes could not be written.
    [[nodiscard]] virtual bool writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) = 0;

    // std::nullopt if no file exists at path; throws std::runtime_error if it exists but cannot be read.
    [[nodiscard]] virtual std::optional<std::vector<uint8_t>> readFile(const std::filesystem::path& path) const = 0;

    virtual void removeFile(const std::filesystem::path& path) = 0;

    // Recursive.
    virtual void removeDirectory(const std::filesystem::path& path) = 0;
};

}
