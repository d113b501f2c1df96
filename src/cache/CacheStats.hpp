#ifndef CACHESTATS_HPP
#define CACHESTATS_HPP

#include <cstddef>
#include <cstdint>

#include <nlohmann/json.hpp>

// Point-in-time counters for one store.
struct CacheStats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t load_successes = 0;
    std::uint64_t load_failures = 0;
    std::uint64_t evictions = 0;   // LRU overflow only
    std::uint64_t expirations = 0;
    std::uint64_t puts = 0;
    std::uint64_t removals = 0;    // evict() and evictAll()
    std::size_t size = 0;

    double hitRate() const {
        const auto requests = hits + misses;
        return requests == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(requests);
    }
};

void to_json(nlohmann::json& j, const CacheStats& stats);

#endif // CACHESTATS_HPP
