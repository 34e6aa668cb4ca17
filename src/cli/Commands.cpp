#include "cli/Commands.hpp"
#include "config/ConfigRegistry.hpp"
#include "media/ImageCodec.hpp"
#include "storage/Engine.hpp"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <fmt/core.h>

namespace stash::cli {

void usage() {
    fmt::print(stderr,
               "usage: stashctl [--config FILE] [--root DIR] [--folder NAME] <cmd> [args...]\n"
               "  put KEY VALUE          store a string\n"
               "  get KEY                print a stored string\n"
               "  exists KEY             exit 0 if KEY is on disk, 1 otherwise\n"
               "  rm KEY                 remove KEY\n"
               "  clear                  remove every key\n"
               "  put-image KEY FILE     decode FILE and store it as an image\n"
               "  get-image KEY FILE     write a stored image to FILE as JPEG\n"
               "  stats                  print cache statistics and the folder path\n"
               "  config                 print the effective configuration\n");
}

std::vector<uint8_t> readAll(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw IoError("Failed to open file: " + path.string());
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

void writeAll(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw IoError("Failed to open file: " + path.string());
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) throw IoError("Failed to write file: " + path.string());
}

namespace {

int dispatch(storage::Engine& engine, const std::string& cmd, const std::vector<std::string>& args) {
    const auto need = [&](const size_t n) {
        if (args.size() != n) {
            usage();
            return false;
        }
        return true;
    };

    if (cmd == "put") {
        if (!need(2)) return EXIT_USAGE;
        engine.save(args[1], args[0]);
    } else if (cmd == "get") {
        if (!need(1)) return EXIT_USAGE;
        fmt::print("{}\n", engine.load<std::string>(args[0]));
    } else if (cmd == "exists") {
        if (!need(1)) return EXIT_USAGE;
        return engine.exists(args[0]) ? EXIT_OK : EXIT_STORAGE_ERROR;
    } else if (cmd == "rm") {
        if (!need(1)) return EXIT_USAGE;
        engine.remove(args[0]);
    } else if (cmd == "clear") {
        if (!need(0)) return EXIT_USAGE;
        engine.removeAll();
    } else if (cmd == "put-image") {
        if (!need(2)) return EXIT_USAGE;
        const auto image = engine.options().imageCodec->decode(readAll(args[1]));
        if (!image) {
            fmt::print(stderr, "stashctl: {} is not a readable image\n", args[1]);
            return EXIT_STORAGE_ERROR;
        }
        engine.save(*image, args[0]);
    } else if (cmd == "get-image") {
        if (!need(2)) return EXIT_USAGE;
        const auto image = engine.loadImage(args[0]);
        const auto bytes = engine.options().imageCodec->encode(image);
        if (!bytes) {
            fmt::print(stderr, "stashctl: failed to encode {}\n", args[0]);
            return EXIT_STORAGE_ERROR;
        }
        writeAll(args[1], *bytes);
    } else if (cmd == "stats") {
        if (!need(0)) return EXIT_USAGE;
        const nlohmann::json j = {
            {"folder", engine.folder().string()},
            {"codec", engine.options().codec->name()},
            {"cache", engine.memoryCache().stats()}
        };
        fmt::print("{}\n", j.dump(2));
    } else if (cmd == "config") {
        if (!need(0)) return EXIT_USAGE;
        fmt::print("{}\n", nlohmann::json(config::ConfigRegistry::get()).dump(2));
    } else {
        fmt::print(stderr, "stashctl: unknown command '{}'\n", cmd);
        usage();
        return EXIT_USAGE;
    }
    return EXIT_OK;
}

}

int run(storage::Engine& engine, const std::string& cmd, const std::vector<std::string>& args) {
    try {
        return dispatch(engine, cmd, args);
    } catch (const storage::Error& e) {
        fmt::print(stderr, "stashctl: {}\n", e.what());
        return EXIT_STORAGE_ERROR;
    } catch (const IoError& e) {
        fmt::print(stderr, "stashctl: {}\n", e.what());
        return EXIT_STORAGE_ERROR;
    }
}

}
