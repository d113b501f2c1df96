#ifndef TTLEXPIRATIONPOLICY_HPP
#define TTLEXPIRATIONPOLICY_HPP

#include <chrono>
#include <optional>

#include "../interfaces/IExpirationPolicy.hpp"

// Absolute-deadline expiry: an entry is stale once now reaches expires_at.
// Entries without a deadline never expire.
class TtlExpirationPolicy : public IExpirationPolicy {
public:
    bool isExpired(const CacheEntry& entry, CacheTimePoint now) const override;

    // Time left before the entry goes stale; nullopt when it has no deadline.
    std::optional<std::chrono::milliseconds> remaining(const CacheEntry& entry, CacheTimePoint now) const;
};

#endif // TTLEXPIRATIONPOLICY_HPP
