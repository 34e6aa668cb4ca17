#include "storage/Engine.hpp"
#include "codec/Codec.hpp"
#include "media/ImageCodec.hpp"

#include <stdexcept>

using namespace stash::storage;
using namespace stash::logging;

namespace stdfs = std::filesystem;

Engine::Engine(Options options)
    : options_(std::move(options)),
      cache_(options_.cacheMaxEntries) {
    if (!options_.driver) throw std::invalid_argument("Storage options require a filesystem driver");
    if (!options_.codec) throw std::invalid_argument("Storage options require a codec");
    if (!options_.imageCodec) throw std::invalid_argument("Storage options require an image codec");
    if (options_.folder.empty()) throw std::invalid_argument("Storage folder name cannot be empty");

    folder_ = resolveFolder();
    createDirectoryIfNeeded();
    applyAttributesIfAny();

    LogRegistry::storage()->info("[Engine] Bound to {} (codec: {})", folder_.string(), options_.codec->name());
}

stdfs::path Engine::resolveFolder() const {
    stdfs::path root;
    try {
        root = options_.rootOverride ? *options_.rootOverride : fs::paths::resolveRoot(options_.baseDirectory);
        if (!options_.driver->exists(root)) options_.driver->createDirectory(root);
    } catch (const std::exception& e) {
        LogRegistry::storage()->error("[Engine] Failed to resolve {} directory: {}",
                                      fs::to_string(options_.baseDirectory), e.what());
        throw Error(ErrorCode::DirectoryResolution, e.what());
    }

    auto folder = root;
    if (!options_.appIdentifier.empty()) folder /= options_.appIdentifier;
    return folder / options_.folder;
}

void Engine::createDirectoryIfNeeded() const {
    if (options_.driver->exists(folder_)) return;

    try {
        options_.driver->createDirectory(folder_);
    } catch (const std::exception& e) {
        LogRegistry::storage()->error("[Engine] Failed to create {}: {}", folder_.string(), e.what());
        throw Error(ErrorCode::CreateDirectory, e.what());
    }
}

void Engine::applyAttributesIfAny() const {
    if (options_.attributes.empty()) return;

    try {
        options_.driver->setAttributes(folder_, options_.attributes);
    } catch (const std::exception& e) {
        LogRegistry::storage()->error("[Engine] Failed to set attributes on {}: {}", folder_.string(), e.what());
        throw Error(ErrorCode::Attribute, e.what());
    }
}

bool Engine::exists(const std::string& key) const {
    validateKey(key);
    return options_.driver->exists(filePath(key));
}

void Engine::save(const media::Image& image, const std::string& key) {
    validateKey(key);
    cache_.put(key, image);

    const auto bytes = options_.imageCodec->encode(image);
    if (!bytes) {
        LogRegistry::storage()->error("[Engine] Image codec produced no data for '{}'", key);
        throw Error(ErrorCode::EncodeData, "Failed to encode image for key: " + key);
    }

    writeBytes(key, *bytes);
}

stash::media::Image Engine::loadImage(const std::string& key) {
    validateKey(key);
    if (auto cached = cache_.get<media::Image>(key)) return std::move(*cached);

    auto image = options_.imageCodec->decode(readBytes(key));
    if (!image) {
        LogRegistry::storage()->error("[Engine] Failed to decode image '{}'", key);
        throw Error(ErrorCode::DecodeData, "Failed to decode image for key: " + key);
    }

    cache_.put(key, *image);
    return std::move(*image);
}

void Engine::remove(const std::string& key) {
    validateKey(key);
    cache_.evict(key);

    try {
        options_.driver->removeFile(filePath(key));
    } catch (const stdfs::filesystem_error& e) {
        LogRegistry::storage()->warn("[Engine] Failed to remove '{}': {}", key, e.what());
        throw Error(ErrorCode::Remove, e.what());
    }
}

void Engine::removeAll() {
    cache_.clear();

    try {
        options_.driver->removeDirectory(folder_);
    } catch (const stdfs::filesystem_error& e) {
        LogRegistry::storage()->error("[Engine] Failed to remove {}: {}", folder_.string(), e.what());
        throw Error(ErrorCode::Remove, e.what());
    }

    createDirectoryIfNeeded();
    applyAttributesIfAny();
    LogRegistry::storage()->debug("[Engine] Cleared {}", folder_.string());
}

void Engine::writeBytes(const std::string& key, const std::vector<uint8_t>& bytes) const {
    if (!options_.driver->writeFile(filePath(key), bytes)) {
        LogRegistry::storage()->error("[Engine] Failed to write {} bytes for '{}'", bytes.size(), key);
        throw Error(ErrorCode::CreateFile, "Failed to write file for key: " + key);
    }
}

std::vector<uint8_t> Engine::readBytes(const std::string& key) const {
    std::optional<std::vector<uint8_t>> bytes;
    try {
        bytes = options_.driver->readFile(filePath(key));
    } catch (const std::runtime_error& e) {
        LogRegistry::storage()->error("[Engine] Failed to read '{}': {}", key, e.what());
        throw Error(ErrorCode::ReadFile, e.what());
    }

    if (!bytes) throw Error(ErrorCode::NotFound, "No entry for key: " + key);
    return std::move(*bytes);
}

void Engine::validateKey(const std::string& key) {
    if (key.empty()) throw std::invalid_argument("Storage key cannot be empty");
}
