#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace stash::storage {
class Engine;
}

namespace stash::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_STORAGE_ERROR = 1; // also `exists` on a missing key
constexpr int EXIT_USAGE = 2;

// Reading or writing a file named on the command line failed.
class IoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void usage();

std::vector<uint8_t> readAll(const std::filesystem::path& path);
void writeAll(const std::filesystem::path& path, const std::vector<uint8_t>& bytes);

// Runs one stashctl command against the engine and returns the exit code.
// storage::Error and IoError are reported on stderr as EXIT_STORAGE_ERROR.
int run(storage::Engine& engine, const std::string& cmd, const std::vector<std::string>& args);

}
