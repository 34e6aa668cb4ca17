#include "storage/Options.hpp"
#include "codec/JsonCodec.hpp"
#include "config/Config.hpp"
#include "fs/LocalDriver.hpp"
#include "media/JpegImageCodec.hpp"

using namespace stash::storage;

Options::Options()
    : codec(std::make_shared<stash::codec::JsonCodec>()),
      imageCodec(std::make_shared<media::JpegImageCodec>()),
      driver(std::make_shared<fs::LocalDriver>()) {}

Options Options::fromConfig(const config::Config& cfg) {
    const auto& s = cfg.storage;

    Options o;
    o.baseDirectory = fs::baseDirectoryFromString(s.base_directory);
    o.folder = s.folder;
    o.appIdentifier = s.app_identifier;
    o.codec = stash::codec::makeCodec(s.codec, {.pretty = s.pretty, .allowFragments = s.allow_fragments});
    o.imageCodec = std::make_shared<media::JpegImageCodec>(cfg.image.jpeg_quality);
    o.attributes = s.protect ? fs::Attributes::ownerOnly() : fs::Attributes::none();
    o.cacheMaxEntries = s.cache_max_entries;
    return o;
}
