#include "cli/Commands.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "storage/Engine.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <fmt/core.h>

using namespace stash;
using namespace stash::cli;

int main(int argc, char** argv) {
    std::optional<std::filesystem::path> configPath, root;
    std::optional<std::string> folder;

    int i = 1;
    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) break;
        if (i + 1 >= argc) {
            usage();
            return EXIT_USAGE;
        }
        if (arg == "--config") configPath = argv[++i];
        else if (arg == "--root") root = argv[++i];
        else if (arg == "--folder") folder = argv[++i];
        else {
            fmt::print(stderr, "stashctl: unknown option '{}'\n", arg);
            usage();
            return EXIT_USAGE;
        }
    }

    if (i >= argc) {
        usage();
        return EXIT_USAGE;
    }

    const std::string cmd = argv[i++];
    const std::vector<std::string> args(argv + i, argv + argc);

    try {
        if (configPath) config::ConfigRegistry::init(*configPath);
        else config::ConfigRegistry::init(config::Config{});

        const auto& cfg = config::ConfigRegistry::get();
        logging::LogRegistry::init(cfg.logging);

        auto options = storage::Options::fromConfig(cfg);
        if (root) options.rootOverride = *root;
        if (folder) options.folder = *folder;

        storage::Engine engine(std::move(options));
        return run(engine, cmd, args);
    } catch (const storage::Error& e) {
        fmt::print(stderr, "stashctl: {}\n", e.what());
        return EXIT_STORAGE_ERROR;
    } catch (const std::exception& e) {
        // Unreadable config, bad option values
        fmt::print(stderr, "stashctl: {}\n", e.what());
        return EXIT_USAGE;
    }
}
