#ifndef CACHESTORE_HPP
#define CACHESTORE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "CacheEntry.hpp"
#include "CacheStats.hpp"
#include "../config/CacheSpec.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/IExpirationPolicy.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Entries of one named cache. Bounded by an optional capacity (LRU eviction)
// and expired through the injected policy. Concurrent misses on the same key
// share a single computation.
class CacheStore {
public:
    using ComputeFn = std::function<CacheValue()>;
    using CachePredicate = std::function<bool(const CacheValue&)>;

    // Throws ConfigurationError if the spec is invalid, std::invalid_argument on a null collaborator.
    CacheStore(std::string name,
               CacheSpec spec,
               std::shared_ptr<const IExpirationPolicy> expiration_policy,
               std::shared_ptr<IClock> clock,
               std::shared_ptr<ILogger> logger,
               std::shared_ptr<IStatsDClient> statsd_client);

    ~CacheStore() = default;

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;
    CacheStore(CacheStore&&) = delete;
    CacheStore& operator=(CacheStore&&) = delete;

    // Live value for key, refreshing its recency. A stale entry is dropped and reported absent.
    std::optional<CacheValue> get(const std::string& key);

    // Returns the cached value, or runs compute_fn once for all concurrent callers of this key
    // and stores its result with ttl (falls back to the default TTL).
    // Throws ComputeError if compute_fn throws; nothing is stored in that case.
    CacheValue getOrCompute(const std::string& key,
                            const ComputeFn& compute_fn,
                            std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    // Like getOrCompute, but the computed value is only stored when should_cache accepts it.
    CacheValue getOrComputeIf(const std::string& key,
                              const ComputeFn& compute_fn,
                              const CachePredicate& should_cache,
                              std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    void put(const std::string& key, CacheValue value, std::optional<std::chrono::milliseconds> ttl = std::nullopt);
    bool evict(const std::string& key);
    void evictAll();

    // Drops every expired entry, returns how many were removed.
    std::size_t purgeExpired();

    // No recency update
    bool contains(const std::string& key) const;
    std::size_t size() const;
    std::vector<std::string> keys() const; // Most recently used first

    const std::string& name() const { return name_; }
    const CacheSpec& spec() const { return spec_; }
    CacheStats stats() const;

private:
    struct Slot {
        CacheEntry entry;
        std::list<std::string>::iterator lru_position;
    };

    struct InFlightCall {
        std::promise<CacheValue> promise;
        std::shared_future<CacheValue> result;
        std::thread::id leader;
        bool detached = false; // Set by put/evict while computing: the result must not be stored
    };

    using SlotMap = std::unordered_map<std::string, Slot>;

    CacheValue computeAndPublish(const std::string& key,
                                 const std::shared_ptr<InFlightCall>& call,
                                 const ComputeFn& compute_fn,
                                 const CachePredicate& should_cache,
                                 std::optional<std::chrono::milliseconds> ttl);

    // Helpers below expect mutex_ to be held
    // Returns the key evicted to make room, if any
    std::optional<std::string> insertLocked(const std::string& key, CacheValue value,
                                            std::optional<std::chrono::milliseconds> ttl, CacheTimePoint now);
    void touchLocked(SlotMap::iterator it, CacheTimePoint now);
    void eraseLocked(SlotMap::iterator it);
    std::optional<std::string> evictLeastRecentlyUsedLocked();
    void detachInFlightLocked(const std::string& key);
    void detachAllInFlightLocked();
    void releaseInFlightLocked(const std::string& key, const std::shared_ptr<InFlightCall>& call);

    void reportEviction(const std::string& evicted_key);
    void reportExpiration(const std::string& key, const std::string& suffix);

    std::optional<std::chrono::milliseconds> effectiveTtl(std::optional<std::chrono::milliseconds> ttl) const;
    void recordMetric(const std::string& metric, int value = 1) const;

    const std::string name_;
    const CacheSpec spec_;
    const std::string metric_prefix_;
    std::shared_ptr<const IExpirationPolicy> expiration_policy_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;

    mutable std::mutex mutex_;
    SlotMap entries_;
    std::list<std::string> lru_list_; // front=most recent, back=least recent
    std::unordered_map<std::string, std::shared_ptr<InFlightCall>> in_flight_;

    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> load_successes_{0};
    std::atomic<std::uint64_t> load_failures_{0};
    std::atomic<std::uint64_t> evictions_{0};
    std::atomic<std::uint64_t> expirations_{0};
    std::atomic<std::uint64_t> puts_{0};
    std::atomic<std::uint64_t> removals_{0};
};

#endif // CACHESTORE_HPP
