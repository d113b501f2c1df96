#ifndef CACHESPEC_HPP
#define CACHESPEC_HPP

#include <chrono>
#include <optional>
#include <sstream>
#include <string>

#include "../errors/CacheErrors.hpp"

// Per-cache settings. Unset capacity means unbounded, unset TTL means entries
// only leave through eviction.
struct CacheSpec {
    std::optional<int> capacity;
    std::optional<std::chrono::milliseconds> default_ttl;

    // Throws ConfigurationError for a non-positive capacity or TTL
    void validate(const std::string& cache_name) const {
        if (capacity && *capacity <= 0) {
            throw ConfigurationError("Cache '" + cache_name + "': capacity must be positive, got " +
                std::to_string(*capacity));
        }
        if (default_ttl && default_ttl->count() <= 0) {
            throw ConfigurationError("Cache '" + cache_name + "': default TTL must be positive, got " +
                std::to_string(default_ttl->count()) + "ms");
        }
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "capacity=";
        if (capacity) {
            ss << *capacity;
        } else {
            ss << "unbounded";
        }
        ss << ", default_ttl=";
        if (default_ttl) {
            ss << default_ttl->count() << "ms";
        } else {
            ss << "none";
        }
        return ss.str();
    }

    bool operator==(const CacheSpec& other) const {
        return capacity == other.capacity && default_ttl == other.default_ttl;
    }
};

#endif // CACHESPEC_HPP
