#include "TtlExpirationPolicy.hpp"

#include "../cache/CacheEntry.hpp"

using namespace std::chrono;

bool TtlExpirationPolicy::isExpired(const CacheEntry& entry, CacheTimePoint now) const {
    return entry.expires_at.has_value() && now >= *entry.expires_at;
}

std::optional<milliseconds> TtlExpirationPolicy::remaining(const CacheEntry& entry, CacheTimePoint now) const {
    if (!entry.expires_at) {
        return std::nullopt;
    }
    if (isExpired(entry, now)) {
        return milliseconds::zero();
    }
    return duration_cast<milliseconds>(*entry.expires_at - now);
}
