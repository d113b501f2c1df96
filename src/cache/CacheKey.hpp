#ifndef CACHEKEY_HPP
#define CACHEKEY_HPP

#include <sstream>
#include <string>

// Composite key derivation: CacheKey::of("alice", 30) == "alice-30".
class CacheKey {
public:
    static constexpr char SEPARATOR = '-';

    template <typename First, typename... Rest>
    static std::string of(const First& first, const Rest&... rest) {
        std::ostringstream oss;
        oss << first;
        ((oss << SEPARATOR << rest), ...);
        return oss.str();
    }
};

#endif // CACHEKEY_HPP
