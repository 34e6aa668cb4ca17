#pragma once

#include "cache/Stats.hpp"
#include "logging/LogRegistry.hpp"

#include <any>
#include <cstddef>
#include <list>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace stash::cache {

// Process-local, string-keyed store of values of any copyable type. Each slot
// remembers the type it was stored as; reading it back as another type is a miss.
// With maxEntries > 0 the oldest insertion is evicted first.
class MemoryCache {
public:
    explicit MemoryCache(std::size_t maxEntries = 0);

    MemoryCache(const MemoryCache&) = delete;
    MemoryCache& operator=(const MemoryCache&) = delete;

    template <typename T>
    void put(const std::string& key, T&& value) {
        insert_(key, std::any(std::in_place_type<std::decay_t<T>>, std::forward<T>(value)));
    }

    template <typename T>
    [[nodiscard]] std::optional<T> get(const std::string& key) const {
        std::shared_lock lock(mutex_);

        const auto it = entries_.find(key);
        if (it == entries_.end()) {
            stats_.record_miss();
            return std::nullopt;
        }

        if (const auto* value = std::any_cast<T>(&it->second.value)) {
            stats_.record_hit();
            return *value;
        }

        stats_.record_type_mismatch();
        logging::LogRegistry::cache()->debug("[MemoryCache] Type mismatch for '{}': stored {}, requested {}",
                                             key, it->second.value.type().name(), typeid(T).name());
        return std::nullopt;
    }

    [[nodiscard]] bool contains(const std::string& key) const;

    // Returns true if an entry was dropped.
    bool evict(const std::string& key);
    void clear();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t maxEntries() const noexcept { return maxEntries_; }
    [[nodiscard]] StatsSnapshot stats() const noexcept { return stats_.snapshot(); }

private:
    struct Slot {
        std::any value;
        std::list<std::string>::iterator order;
    };

    void insert_(const std::string& key, std::any value);

    const std::size_t maxEntries_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Slot> entries_;
    std::list<std::string> order_; // oldest insertion first
    mutable Stats stats_;
};

}
