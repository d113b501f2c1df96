#include "CacheErrors.hpp"

ComputeError::ComputeError(const std::string& cache_name, const std::string& key, std::exception_ptr cause)
    : std::runtime_error(describe(cache_name, key, cause)),
      cache_name_(cache_name),
      key_(key),
      cause_(cause) {}

void ComputeError::rethrowCause() const {
    if (cause_) {
        std::rethrow_exception(cause_);
    }
    throw std::runtime_error(what());
}

std::string ComputeError::describe(const std::string& cache_name, const std::string& key, std::exception_ptr cause) {
    std::string reason = "unknown error";
    if (cause) {
        try {
            std::rethrow_exception(cause);
        } catch (const std::exception& e) {
            reason = e.what();
        } catch (...) {
            // Non-standard exception type, keep the generic reason
        }
    }
    return "Compute failed for key '" + key + "' in cache '" + cache_name + "': " + reason;
}
