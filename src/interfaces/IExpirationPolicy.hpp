#ifndef IEXPIRATIONPOLICY_HPP
#define IEXPIRATIONPOLICY_HPP

#include "IClock.hpp"

struct CacheEntry;

// Decides whether an entry is stale at a given instant.
// Implementations must be stateless: one instance is shared by every store.
class IExpirationPolicy {
public:
    virtual ~IExpirationPolicy() = default;
    virtual bool isExpired(const CacheEntry& entry, CacheTimePoint now) const = 0;
};

#endif // IEXPIRATIONPOLICY_HPP
