#include "fs/LocalDriver.hpp"
#include "logging/LogRegistry.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

using namespace stash::fs;
using namespace stash::logging;

namespace stdfs = std::filesystem;

bool LocalDriver::exists(const stdfs::path& path) const {
    std::error_code ec;
    const bool found = stdfs::exists(path, ec);
    if (ec) LogRegistry::fs()->debug("[LocalDriver] exists({}) failed: {}", path.string(), ec.message());
    return found && !ec;
}

void LocalDriver::createDirectory(const stdfs::path& path) {
    stdfs::create_directories(path);
    LogRegistry::fs()->debug("[LocalDriver] Created directory {}", path.string());
}

void LocalDriver::setAttributes(const stdfs::path& path, const Attributes& attrs) {
    if (attrs.permissions) stdfs::permissions(path, *attrs.permissions, stdfs::perm_options::replace);
}

bool LocalDriver::writeFile(const stdfs::path& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        LogRegistry::fs()->warn("[LocalDriver] Failed to open {} for writing", path.string());
        return false;
    }

    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.close();

    if (!out) {
        LogRegistry::fs()->warn("[LocalDriver] Short write to {} ({} bytes)", path.string(), bytes.size());
        return false;
    }
    return true;
}

std::optional<std::vector<uint8_t>> LocalDriver::readFile(const stdfs::path& path) const {
    if (!stdfs::is_regular_file(path)) return std::nullopt;

    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    if (size < 0) throw std::runtime_error("Failed to determine size of file: " + path.string());
    in.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char*>(buffer.data()), size))
        throw std::runtime_error("Failed to read file: " + path.string());

    return buffer;
}

void LocalDriver::removeFile(const stdfs::path& path) {
    if (!stdfs::remove(path))
        throw stdfs::filesystem_error("Failed to remove file", path,
                                      std::make_error_code(std::errc::no_such_file_or_directory));
}

void LocalDriver::removeDirectory(const stdfs::path& path) {
    if (stdfs::remove_all(path) == 0)
        throw stdfs::filesystem_error("Failed to remove directory", path,
                                      std::make_error_code(std::errc::no_such_file_or_directory));
}
