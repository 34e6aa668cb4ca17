#include "cache/MemoryCache.hpp"

#include <iterator>
#include <mutex>

using namespace stash::cache;
using namespace stash::logging;

MemoryCache::MemoryCache(const std::size_t maxEntries) : maxEntries_(maxEntries) {
    stats_.set_capacity(maxEntries_);
}

void MemoryCache::insert_(const std::string& key, std::any value) {
    std::unique_lock lock(mutex_);

    if (const auto it = entries_.find(key); it != entries_.end()) {
        it->second.value = std::move(value);
        order_.splice(order_.end(), order_, it->second.order);
    } else {
        order_.push_back(key);
        entries_.emplace(key, Slot{std::move(value), std::prev(order_.end())});
    }
    stats_.record_insert();

    while (maxEntries_ && entries_.size() > maxEntries_) {
        const auto& oldest = order_.front();
        LogRegistry::cache()->debug("[MemoryCache] Evicting '{}' (limit {})", oldest, maxEntries_);
        entries_.erase(oldest);
        order_.pop_front();
        stats_.record_eviction();
    }

    stats_.set_entries(entries_.size());
}

bool MemoryCache::contains(const std::string& key) const {
    std::shared_lock lock(mutex_);
    return entries_.contains(key);
}

bool MemoryCache::evict(const std::string& key) {
    std::unique_lock lock(mutex_);

    const auto it = entries_.find(key);
    if (it == entries_.end()) return false;

    order_.erase(it->second.order);
    entries_.erase(it);
    stats_.record_invalidation();
    stats_.set_entries(entries_.size());
    return true;
}

void MemoryCache::clear() {
    std::unique_lock lock(mutex_);
    stats_.record_invalidation(entries_.size());
    entries_.clear();
    order_.clear();
    stats_.set_entries(0);
}

std::size_t MemoryCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}
