#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

#include <nlohmann/json_fwd.hpp>

namespace stash::cache {

// 64-byte cache line padding helper to avoid false sharing.
constexpr std::size_t kCacheLine = 64;

template <typename T>
struct alignas(kCacheLine) PaddedAtomic {
    std::atomic<T> v{0};
    char pad[kCacheLine - (sizeof(std::atomic<T>) % kCacheLine ? (sizeof(std::atomic<T>) % kCacheLine) : kCacheLine)]{};
};

struct StatsSnapshot {
    uint64_t hits{};
    uint64_t misses{};
    uint64_t type_mismatches{};

    uint64_t inserts{};
    uint64_t evictions{};
    uint64_t invalidations{};

    uint64_t entries{};
    uint64_t capacity{};
};

struct Stats {
    PaddedAtomic<uint64_t> hits;
    PaddedAtomic<uint64_t> misses;
    PaddedAtomic<uint64_t> type_mismatches;

    PaddedAtomic<uint64_t> inserts;
    PaddedAtomic<uint64_t> evictions;
    PaddedAtomic<uint64_t> invalidations;

    PaddedAtomic<uint64_t> entries;
    PaddedAtomic<uint64_t> capacity;

    void record_hit() noexcept;
    void record_miss() noexcept;
    void record_type_mismatch() noexcept;
    void record_insert() noexcept;
    void record_eviction() noexcept;
    void record_invalidation(uint64_t n = 1) noexcept;

    void set_entries(uint64_t n) noexcept;
    void set_capacity(uint64_t cap) noexcept;

    [[nodiscard]] StatsSnapshot snapshot() const noexcept;

    static double hit_rate(const StatsSnapshot& s) noexcept;
};

void to_json(nlohmann::json& j, const StatsSnapshot& s);

} // namespace stash::cache
