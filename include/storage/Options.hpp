#pragma once

#include "fs/Driver.hpp"
#include "fs/paths.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace stash::codec {
class Codec;
}

namespace stash::media {
class ImageCodec;
}

namespace stash::config {
struct Config;
}

namespace stash::storage {

struct Options {
    fs::BaseDirectory baseDirectory = fs::BaseDirectory::Caches;
    std::string folder = "Default";

    // Namespace segment between the OS root and the folder; empty adds no segment.
    std::string appIdentifier;

    std::shared_ptr<const stash::codec::Codec> codec;
    std::shared_ptr<const media::ImageCodec> imageCodec;
    std::shared_ptr<fs::Driver> driver;
    fs::Attributes attributes = fs::Attributes::ownerOnly();

    // Replaces the resolved OS root when set.
    std::optional<std::filesystem::path> rootOverride;

    std::size_t cacheMaxEntries = 0;

    // Defaults: JsonCodec, JpegImageCodec, LocalDriver.
    Options();

    static Options fromConfig(const config::Config& cfg);
};

}
