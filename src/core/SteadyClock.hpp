#ifndef STEADYCLOCK_HPP
#define STEADYCLOCK_HPP

#include "../interfaces/IClock.hpp"

class SteadyClock : public IClock {
public:
    CacheTimePoint now() const override { return CacheClock::now(); }
};

#endif // STEADYCLOCK_HPP
