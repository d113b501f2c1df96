#ifndef CACHEMANAGER_HPP
#define CACHEMANAGER_HPP

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "CacheStore.hpp"
#include "InvalidationCoordinator.hpp"
#include "../config/AppConfig.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/IExpirationPolicy.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Entry point for the service layer. Owns every named CacheStore, creates them
// on first reference, and clears dependent caches after writes.
class CacheManager {
public:
    // Pre-registers config.cache_specs and config.invalidation_rules.
    // Throws ConfigurationError on an invalid spec or rule, std::invalid_argument on a null collaborator.
    // A null clock means the steady clock.
    CacheManager(const AppConfig& config,
                 std::shared_ptr<ILogger> logger,
                 std::shared_ptr<IStatsDClient> statsd_client,
                 std::shared_ptr<IClock> clock = nullptr);

    ~CacheManager();

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;
    CacheManager(CacheManager&&) = delete;
    CacheManager& operator=(CacheManager&&) = delete;

    // Store for name, created with the configured or default spec if it does not exist yet.
    CacheStore& cache(const std::string& name);
    // spec only applies if this call creates the store.
    CacheStore& cache(const std::string& name, const CacheSpec& spec);

    bool hasCache(const std::string& name) const;
    std::vector<std::string> cacheNames() const;

    CacheValue getOrCompute(const std::string& cache_name,
                            const std::string& key,
                            const CacheStore::ComputeFn& compute_fn,
                            std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    CacheValue getOrComputeIf(const std::string& cache_name,
                              const std::string& key,
                              const CacheStore::ComputeFn& compute_fn,
                              const CacheStore::CachePredicate& should_cache,
                              std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    // Writes through, then clears the caches that depend on cache_name.
    void put(const std::string& cache_name,
             const std::string& key,
             CacheValue value,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    void evict(const std::string& cache_name, const std::string& key);

    // Clears cache_name, then the caches that depend on it.
    void evictAll(const std::string& cache_name);

    // Rules come from AppConfig::invalidation_rules and are frozen once constructed
    const InvalidationCoordinator& invalidationCoordinator() const { return invalidation_coordinator_; }

    std::size_t purgeExpired();
    nlohmann::json statsJson() const;

    // Clears every store. Idempotent; stores stay registered.
    void shutdown();
    bool isShutdown() const { return shutdown_.load(); }

private:
    CacheStore* findStore(const std::string& name) const;
    CacheStore& createStore(const std::string& name, const CacheSpec& spec);
    CacheSpec specFor(const std::string& name) const;
    void cascadeInvalidation(const std::string& trigger);

    CacheSpec default_spec_;
    std::map<std::string, CacheSpec> cache_specs_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<const IExpirationPolicy> expiration_policy_;
    InvalidationCoordinator invalidation_coordinator_;

    mutable std::shared_mutex stores_mutex_;
    std::unordered_map<std::string, std::unique_ptr<CacheStore>> stores_;
    std::atomic<bool> shutdown_{false};
};

#endif // CACHEMANAGER_HPP
