#ifndef CACHEERRORS_HPP
#define CACHEERRORS_HPP

#include <exception>
#include <stdexcept>
#include <string>

// Raised by the get-or-compute family when the supplied compute function fails.
// The failure is never cached: the next call for the same key computes again.
class ComputeError : public std::runtime_error {
public:
    ComputeError(const std::string& cache_name, const std::string& key, std::exception_ptr cause);

    const std::string& cacheName() const noexcept { return cache_name_; }
    const std::string& key() const noexcept { return key_; }
    std::exception_ptr cause() const noexcept { return cause_; }

    // Rethrows whatever the compute function originally threw.
    [[noreturn]] void rethrowCause() const;

private:
    static std::string describe(const std::string& cache_name, const std::string& key, std::exception_ptr cause);

    std::string cache_name_;
    std::string key_;
    std::exception_ptr cause_;
};

// Invalid cache spec (non-positive capacity or TTL) or an invalid/cyclic
// invalidation rule.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

#endif // CACHEERRORS_HPP
