#ifndef ICLOCK_HPP
#define ICLOCK_HPP

#include <chrono>

using CacheClock = std::chrono::steady_clock;
using CacheTimePoint = CacheClock::time_point;

// Time source for entry timestamps. Tests substitute a manual clock.
class IClock {
public:
    virtual ~IClock() = default;
    virtual CacheTimePoint now() const = 0;
};

#endif // ICLOCK_HPP
