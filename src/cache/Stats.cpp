#include "cache/Stats.hpp"

#include <nlohmann/json.hpp>

using namespace stash::cache;

void Stats::record_hit() noexcept {
    hits.v.fetch_add(1, std::memory_order_relaxed);
}

// A type mismatch is also a miss: the caller falls through to disk.
void Stats::record_type_mismatch() noexcept {
    type_mismatches.v.fetch_add(1, std::memory_order_relaxed);
    misses.v.fetch_add(1, std::memory_order_relaxed);
}

void Stats::record_miss() noexcept {
    misses.v.fetch_add(1, std::memory_order_relaxed);
}

void Stats::record_insert() noexcept {
    inserts.v.fetch_add(1, std::memory_order_relaxed);
}

void Stats::record_eviction() noexcept {
    evictions.v.fetch_add(1, std::memory_order_relaxed);
}

void Stats::record_invalidation(const uint64_t n) noexcept {
    invalidations.v.fetch_add(n, std::memory_order_relaxed);
}

void Stats::set_entries(const uint64_t n) noexcept {
    entries.v.store(n, std::memory_order_relaxed);
}

void Stats::set_capacity(const uint64_t cap) noexcept {
    capacity.v.store(cap, std::memory_order_relaxed);
}

StatsSnapshot Stats::snapshot() const noexcept {
    StatsSnapshot s;
    s.hits = hits.v.load(std::memory_order_relaxed);
    s.misses = misses.v.load(std::memory_order_relaxed);
    s.type_mismatches = type_mismatches.v.load(std::memory_order_relaxed);

    s.inserts = inserts.v.load(std::memory_order_relaxed);
    s.evictions = evictions.v.load(std::memory_order_relaxed);
    s.invalidations = invalidations.v.load(std::memory_order_relaxed);

    s.entries = entries.v.load(std::memory_order_relaxed);
    s.capacity = capacity.v.load(std::memory_order_relaxed);
    return s;
}

double Stats::hit_rate(const StatsSnapshot& s) noexcept {
    const auto denom = s.hits + s.misses;
    return denom ? static_cast<double>(s.hits) / static_cast<double>(denom) : 0.0;
}

void stash::cache::to_json(nlohmann::json& j, const StatsSnapshot& s) {
    j = nlohmann::json{
        {"hits", s.hits},
        {"misses", s.misses},
        {"type_mismatches", s.type_mismatches},
        {"inserts", s.inserts},
        {"evictions", s.evictions},
        {"invalidations", s.invalidations},
        {"entries", s.entries},
        {"capacity", s.capacity},
        {"hit_rate", Stats::hit_rate(s)},
    };
}
