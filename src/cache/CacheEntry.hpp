#ifndef CACHEENTRY_HPP
#define CACHEENTRY_HPP

#include <algorithm>
#include <chrono>
#include <optional>
#include <utility>

#include <nlohmann/json.hpp>

#include "../interfaces/IClock.hpp"

// Cached payload. Domain types convert through to_json/from_json.
using CacheValue = nlohmann::json;

struct CacheEntry {
    CacheValue value;
    CacheTimePoint created_at;              // Insertion or last refresh
    std::optional<CacheTimePoint> expires_at; // nullopt: no TTL, only LRU removes it
    CacheTimePoint last_accessed_at;        // Drives LRU order

    // Negative TTLs are clamped to zero so that expires_at >= created_at always holds.
    static CacheEntry create(CacheValue value, CacheTimePoint now, std::optional<std::chrono::milliseconds> ttl) {
        CacheEntry entry;
        entry.value = std::move(value);
        entry.created_at = now;
        entry.last_accessed_at = now;
        if (ttl) {
            entry.expires_at = now + std::max(*ttl, std::chrono::milliseconds::zero());
        }
        return entry;
    }
};

#endif // CACHEENTRY_HPP
