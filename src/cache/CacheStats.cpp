#include "CacheStats.hpp"

void to_json(nlohmann::json& j, const CacheStats& stats) {
    j = nlohmann::json{
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"hit_rate", stats.hitRate()},
        {"load_successes", stats.load_successes},
        {"load_failures", stats.load_failures},
        {"evictions", stats.evictions},
        {"expirations", stats.expirations},
        {"puts", stats.puts},
        {"removals", stats.removals},
        {"size", stats.size}
    };
}
