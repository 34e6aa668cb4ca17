#pragma once

#include "storage/Error.hpp"
#include "storage/Options.hpp"
#include "cache/MemoryCache.hpp"
#include "codec/TypeWrapper.hpp"
#include "media/Image.hpp"
#include "logging/LogRegistry.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace stash::storage {

// Hybrid memory + disk key-value store bound to one folder:
//   <root>/<appIdentifier>/<folder>/<key>
//
// save() writes the memory cache first, then the file. load() returns a cached
// value of the requested type when there is one, otherwise decodes the file and
// caches the result. Failures are thrown as storage::Error.
//
// Compound operations are not atomic; see MemoryCache for what is synchronized.
class Engine {
public:
    // Throws Error(DirectoryResolution | CreateDirectory | Attribute).
    explicit Engine(Options options);

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Disk only; the cache is not consulted.
    [[nodiscard]] bool exists(const std::string& key) const;

    template <codec::Storable T>
    void save(const T& value, const std::string& key);

    template <codec::Storable T>
    [[nodiscard]] T load(const std::string& key);

    void save(const media::Image& image, const std::string& key);
    [[nodiscard]] media::Image loadImage(const std::string& key);

    // Deletes the file and drops the cached value. A missing file is an Error(Remove).
    void remove(const std::string& key);

    // Clears the cache, deletes the folder and recreates it empty.
    void removeAll();

    [[nodiscard]] const std::filesystem::path& folder() const noexcept { return folder_; }
    [[nodiscard]] std::filesystem::path filePath(const std::string& key) const { return folder_ / key; }
    [[nodiscard]] const Options& options() const noexcept { return options_; }
    [[nodiscard]] const stash::cache::MemoryCache& memoryCache() const noexcept { return cache_; }

private:
    Options options_;
    std::filesystem::path folder_;
    stash::cache::MemoryCache cache_;

    [[nodiscard]] std::filesystem::path resolveFolder() const;
    void createDirectoryIfNeeded() const;
    void applyAttributesIfAny() const;

    void writeBytes(const std::string& key, const std::vector<uint8_t>& bytes) const;
    [[nodiscard]] std::vector<uint8_t> readBytes(const std::string& key) const;

    static void validateKey(const std::string& key);
};

template <codec::Storable T>
void Engine::save(const T& value, const std::string& key) {
    validateKey(key);
    cache_.put(key, value);

    std::vector<uint8_t> bytes;
    try {
        bytes = codec::encodeValue(*options_.codec, value);
    } catch (const codec::EncodeError& e) {
        logging::LogRegistry::storage()->error("[Engine] Failed to encode '{}' with {}: {}",
                                               key, options_.codec->name(), e.what());
        throw Error(ErrorCode::EncodeData, "Failed to encode value for key: " + key);
    }

    writeBytes(key, bytes);
}

template <codec::Storable T>
T Engine::load(const std::string& key) {
    validateKey(key);
    if (auto cached = cache_.get<T>(key)) return std::move(*cached);

    const auto bytes = readBytes(key);

    T value;
    try {
        value = codec::decodeValue<T>(*options_.codec, bytes);
    } catch (const codec::DecodeError& e) {
        logging::LogRegistry::storage()->error("[Engine] Failed to decode '{}' with {}: {}",
                                               key, options_.codec->name(), e.what());
        throw Error(ErrorCode::DecodeData, "Failed to decode value for key: " + key);
    }

    cache_.put(key, value);
    return value;
}

}
