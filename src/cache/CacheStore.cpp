#include "CacheStore.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include "../config/AppConfig.hpp"
#include "../errors/CacheErrors.hpp"

using namespace std::chrono;

CacheStore::CacheStore(std::string name,
                       CacheSpec spec,
                       std::shared_ptr<const IExpirationPolicy> expiration_policy,
                       std::shared_ptr<IClock> clock,
                       std::shared_ptr<ILogger> logger,
                       std::shared_ptr<IStatsDClient> statsd_client)
    : name_(std::move(name)),
      spec_(spec),
      metric_prefix_(MetricsDefinitions::PREFIX + name_ + "."),
      expiration_policy_(std::move(expiration_policy)),
      clock_(std::move(clock)),
      logger_(std::move(logger)),
      statsd_client_(std::move(statsd_client)) {
    if (!expiration_policy_) {
        throw std::invalid_argument("Expiration policy cannot be null for CacheStore");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for CacheStore");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for CacheStore");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for CacheStore");
    }
    spec_.validate(name_);
}

std::optional<CacheValue> CacheStore::get(const std::string& key) {
    std::optional<CacheValue> value;
    bool expired = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            auto now = clock_->now();
            if (expiration_policy_->isExpired(it->second.entry, now)) {
                // Lazy expiry: the stale entry goes away on the read that notices it
                eraseLocked(it);
                expired = true;
            } else {
                touchLocked(it, now);
                value = it->second.entry.value;
            }
        }
    }

    if (expired) {
        reportExpiration(key, "");
    }
    if (value) {
        hits_++;
        recordMetric(MetricsDefinitions::CACHE_HIT);
    } else {
        misses_++;
        recordMetric(MetricsDefinitions::CACHE_MISS);
    }
    return value;
}

CacheValue CacheStore::getOrCompute(const std::string& key,
                                    const ComputeFn& compute_fn,
                                    std::optional<milliseconds> ttl) {
    return getOrComputeIf(key, compute_fn, nullptr, ttl);
}

CacheValue CacheStore::getOrComputeIf(const std::string& key,
                                      const ComputeFn& compute_fn,
                                      const CachePredicate& should_cache,
                                      std::optional<milliseconds> ttl) {
    std::shared_ptr<InFlightCall> call;
    bool is_leader = false;
    bool expired = false;
    std::optional<CacheValue> cached;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_->now();
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            if (!expiration_policy_->isExpired(it->second.entry, now)) {
                touchLocked(it, now);
                cached = it->second.entry.value;
            } else {
                eraseLocked(it);
                expired = true;
            }
        }

        if (!cached) {
            auto flight_it = in_flight_.find(key);
            if (flight_it != in_flight_.end()) {
                call = flight_it->second;
            } else {
                call = std::make_shared<InFlightCall>();
                call->result = call->promise.get_future().share();
                call->leader = std::this_thread::get_id();
                in_flight_.emplace(key, call);
                is_leader = true;
            }
        }
    }

    if (cached) {
        hits_++;
        recordMetric(MetricsDefinitions::CACHE_HIT);
        return *cached;
    }
    if (expired) {
        reportExpiration(key, ", recomputing");
    }
    misses_++;
    recordMetric(MetricsDefinitions::CACHE_MISS);

    if (is_leader) {
        return computeAndPublish(key, call, compute_fn, should_cache, ttl);
    }

    if (call->leader == std::this_thread::get_id()) {
        // Waiting on our own computation would never return
        throw ComputeError(name_, key,
            std::make_exception_ptr(std::logic_error("recursive computation of the same key")));
    }
    if (logger_->isDebugEnabled()) {
        logger_->debug("Cache '" + name_ + "': waiting for in-flight computation of key : " + key);
    }
    return call->result.get(); // Rethrows the leader's ComputeError
}

CacheValue CacheStore::computeAndPublish(const std::string& key,
                                         const std::shared_ptr<InFlightCall>& call,
                                         const ComputeFn& compute_fn,
                                         const CachePredicate& should_cache,
                                         std::optional<milliseconds> ttl) {
    const auto started = steady_clock::now();
    CacheValue value;
    bool cacheable = true;
    try {
        if (!compute_fn) {
            throw std::invalid_argument("compute function is empty");
        }
        value = compute_fn();
        if (should_cache) {
            cacheable = should_cache(value);
        }
    } catch (...) {
        ComputeError error(name_, key, std::current_exception());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            releaseInFlightLocked(key, call);
        }
        load_failures_++;
        recordMetric(MetricsDefinitions::LOAD_FAILURE);
        logger_->warn(error.what());
        call->promise.set_exception(std::make_exception_ptr(error));
        throw error;
    }

    bool stored = false;
    bool detached = false;
    std::optional<std::string> evicted_key;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        releaseInFlightLocked(key, call);
        detached = call->detached;
        if (cacheable && !detached) {
            evicted_key = insertLocked(key, value, ttl, clock_->now());
            stored = true;
        }
    }
    if (evicted_key) {
        reportEviction(*evicted_key);
    }

    load_successes_++;
    recordMetric(MetricsDefinitions::LOAD_SUCCESS);
    statsd_client_->timing(metric_prefix_ + MetricsDefinitions::LOAD_TIME,
        duration_cast<milliseconds>(steady_clock::now() - started));
    if (logger_->isDebugEnabled()) {
        std::stringstream ss;
        ss << "Cache '" << name_ << "': computed key : " << key
           << (stored ? " (stored)" : (detached ? " (discarded, invalidated while computing)" : " (not cached)"));
        logger_->debug(ss.str());
    }

    call->promise.set_value(value);
    return value;
}

void CacheStore::put(const std::string& key, CacheValue value, std::optional<milliseconds> ttl) {
    std::optional<std::string> evicted_key;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // A computation racing with this write must not overwrite it afterwards
        detachInFlightLocked(key);
        evicted_key = insertLocked(key, std::move(value), ttl, clock_->now());
    }
    puts_++;
    recordMetric(MetricsDefinitions::PUT);
    if (evicted_key) {
        reportEviction(*evicted_key);
    }
}

bool CacheStore::evict(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        detachInFlightLocked(key);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }
        eraseLocked(it);
    }
    removals_++;
    recordMetric(MetricsDefinitions::REMOVAL);
    return true;
}

void CacheStore::evictAll() {
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        detachAllInFlightLocked();
        removed = entries_.size();
        entries_.clear();
        lru_list_.clear();
    }
    if (removed > 0) {
        removals_ += removed;
        recordMetric(MetricsDefinitions::REMOVAL, static_cast<int>(removed));
        if (logger_->isDebugEnabled()) {
            logger_->debug("Cache '" + name_ + "': cleared " + std::to_string(removed) + " entries");
        }
    }
}

std::size_t CacheStore::purgeExpired() {
    std::size_t removed = 0;
    std::size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_->now();
        for (auto it = entries_.begin(); it != entries_.end(); ) {
            if (expiration_policy_->isExpired(it->second.entry, now)) {
                lru_list_.erase(it->second.lru_position);
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        remaining = entries_.size();
    }
    if (removed > 0) {
        expirations_ += removed;
        recordMetric(MetricsDefinitions::EXPIRATION, static_cast<int>(removed));
    }
    statsd_client_->gauge(metric_prefix_ + MetricsDefinitions::SIZE, static_cast<double>(remaining));
    return removed;
}

bool CacheStore::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it != entries_.end() && !expiration_policy_->isExpired(it->second.entry, clock_->now());
}

std::size_t CacheStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<std::string> CacheStore::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(lru_list_.begin(), lru_list_.end());
}

CacheStats CacheStore::stats() const {
    CacheStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.load_successes = load_successes_.load();
    stats.load_failures = load_failures_.load();
    stats.evictions = evictions_.load();
    stats.expirations = expirations_.load();
    stats.puts = puts_.load();
    stats.removals = removals_.load();
    stats.size = size();
    return stats;
}

// --- Private helpers, mutex_ held by the caller ---

std::optional<std::string> CacheStore::insertLocked(const std::string& key, CacheValue value,
                                                    std::optional<milliseconds> ttl, CacheTimePoint now) {
    CacheEntry entry = CacheEntry::create(std::move(value), now, effectiveTtl(ttl));

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        // Refresh in place and move to the front (most recent) of the LRU list
        it->second.entry = std::move(entry);
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_position);
        return std::nullopt;
    }

    // New key: make room first so the bound is never exceeded
    std::optional<std::string> evicted_key;
    if (spec_.capacity && entries_.size() >= static_cast<std::size_t>(*spec_.capacity)) {
        evicted_key = evictLeastRecentlyUsedLocked();
    }
    lru_list_.push_front(key);
    entries_.emplace(key, Slot{std::move(entry), lru_list_.begin()});
    return evicted_key;
}

void CacheStore::touchLocked(SlotMap::iterator it, CacheTimePoint now) {
    it->second.entry.last_accessed_at = now;
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_position);
}

void CacheStore::eraseLocked(SlotMap::iterator it) {
    lru_list_.erase(it->second.lru_position);
    entries_.erase(it);
}

std::optional<std::string> CacheStore::evictLeastRecentlyUsedLocked() {
    if (lru_list_.empty()) {
        return std::nullopt;
    }
    std::string oldest_key = lru_list_.back(); // Least recently used key
    lru_list_.pop_back();
    entries_.erase(oldest_key);
    return oldest_key;
}

void CacheStore::detachInFlightLocked(const std::string& key) {
    auto it = in_flight_.find(key);
    if (it != in_flight_.end()) {
        it->second->detached = true;
        in_flight_.erase(it);
    }
}

void CacheStore::detachAllInFlightLocked() {
    for (auto& [key, call] : in_flight_) {
        call->detached = true;
    }
    in_flight_.clear();
}

void CacheStore::releaseInFlightLocked(const std::string& key, const std::shared_ptr<InFlightCall>& call) {
    auto it = in_flight_.find(key);
    // A detached call may already have been replaced by a newer computation
    if (it != in_flight_.end() && it->second == call) {
        in_flight_.erase(it);
    }
}

std::optional<milliseconds> CacheStore::effectiveTtl(std::optional<milliseconds> ttl) const {
    return ttl ? ttl : spec_.default_ttl;
}

// --- Reporting, called without mutex_ ---

void CacheStore::reportEviction(const std::string& evicted_key) {
    evictions_++;
    recordMetric(MetricsDefinitions::EVICTION);
    if (logger_->isDebugEnabled()) {
        logger_->debug("Cache '" + name_ + "' at capacity " + std::to_string(*spec_.capacity) +
            ", evicted least recently used key : " + evicted_key);
    }
}

void CacheStore::reportExpiration(const std::string& key, const std::string& suffix) {
    expirations_++;
    recordMetric(MetricsDefinitions::EXPIRATION);
    if (logger_->isDebugEnabled()) {
        logger_->debug("Cache '" + name_ + "': expired key : " + key + suffix);
    }
}

void CacheStore::recordMetric(const std::string& metric, int value) const {
    statsd_client_->increment(metric_prefix_ + metric, value);
}
