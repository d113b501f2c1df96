#include "CacheManager.hpp"

#include <algorithm>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "../core/SteadyClock.hpp"
#include "../policy/TtlExpirationPolicy.hpp"

CacheManager::CacheManager(const AppConfig& config,
                           std::shared_ptr<ILogger> logger,
                           std::shared_ptr<IStatsDClient> statsd_client,
                           std::shared_ptr<IClock> clock)
    : default_spec_(config.default_cache_spec),
      cache_specs_(config.cache_specs),
      logger_(std::move(logger)),
      statsd_client_(std::move(statsd_client)),
      clock_(std::move(clock)),
      expiration_policy_(std::make_shared<TtlExpirationPolicy>()) {
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient pointer cannot be null");
    }
    if (!clock_) {
        clock_ = std::make_shared<SteadyClock>();
    }

    default_spec_.validate("<default>");
    for (const auto& [name, spec] : cache_specs_) {
        createStore(name, spec);
    }
    for (const auto& [trigger, dependents] : config.invalidation_rules) {
        invalidation_coordinator_.registerDependency(trigger, dependents);
        if (logger_->isDebugEnabled()) {
            std::stringstream ss;
            ss << "Registered invalidation rule " << trigger << " ->";
            for (const auto& dependent : dependents) {
                ss << " " << dependent;
            }
            logger_->debug(ss.str());
        }
    }
    invalidation_coordinator_.freeze();
    logger_->setup("CacheManager initialized with " + std::to_string(stores_.size()) +
        " pre-registered caches, default " + default_spec_.to_string());
}

CacheManager::~CacheManager() {
    shutdown();
}

CacheStore& CacheManager::cache(const std::string& name) {
    if (auto* store = findStore(name)) {
        return *store;
    }
    return createStore(name, specFor(name));
}

CacheStore& CacheManager::cache(const std::string& name, const CacheSpec& spec) {
    if (auto* store = findStore(name)) {
        if (!(store->spec() == spec)) {
            logger_->warn("Cache '" + name + "' already exists with " + store->spec().to_string() +
                ", ignoring requested " + spec.to_string());
        }
        return *store;
    }
    return createStore(name, spec);
}

bool CacheManager::hasCache(const std::string& name) const {
    return findStore(name) != nullptr;
}

std::vector<std::string> CacheManager::cacheNames() const {
    std::shared_lock<std::shared_mutex> lock(stores_mutex_);
    std::vector<std::string> names;
    names.reserve(stores_.size());
    for (const auto& [name, store] : stores_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

CacheValue CacheManager::getOrCompute(const std::string& cache_name,
                                      const std::string& key,
                                      const CacheStore::ComputeFn& compute_fn,
                                      std::optional<std::chrono::milliseconds> ttl) {
    return cache(cache_name).getOrCompute(key, compute_fn, ttl);
}

CacheValue CacheManager::getOrComputeIf(const std::string& cache_name,
                                        const std::string& key,
                                        const CacheStore::ComputeFn& compute_fn,
                                        const CacheStore::CachePredicate& should_cache,
                                        std::optional<std::chrono::milliseconds> ttl) {
    return cache(cache_name).getOrComputeIf(key, compute_fn, should_cache, ttl);
}

void CacheManager::put(const std::string& cache_name,
                       const std::string& key,
                       CacheValue value,
                       std::optional<std::chrono::milliseconds> ttl) {
    cache(cache_name).put(key, std::move(value), ttl);
    cascadeInvalidation(cache_name);
}

void CacheManager::evict(const std::string& cache_name, const std::string& key) {
    if (auto* store = findStore(cache_name)) {
        store->evict(key);
    }
}

void CacheManager::evictAll(const std::string& cache_name) {
    if (auto* store = findStore(cache_name)) {
        store->evictAll();
    }
    cascadeInvalidation(cache_name);
}

std::size_t CacheManager::purgeExpired() {
    std::shared_lock<std::shared_mutex> lock(stores_mutex_);
    std::size_t removed = 0;
    for (auto& [name, store] : stores_) {
        removed += store->purgeExpired();
    }
    return removed;
}

nlohmann::json CacheManager::statsJson() const {
    std::shared_lock<std::shared_mutex> lock(stores_mutex_);
    nlohmann::json caches = nlohmann::json::object();
    for (const auto& [name, store] : stores_) {
        caches[name] = store->stats();
    }
    return caches;
}

void CacheManager::shutdown() {
    if (shutdown_.exchange(true)) {
        return; // Already shut down
    }
    std::shared_lock<std::shared_mutex> lock(stores_mutex_);
    for (auto& [name, store] : stores_) {
        store->evictAll();
    }
    logger_->info("CacheManager shut down, cleared " + std::to_string(stores_.size()) + " caches");
}

// --- Private Helper Method Implementations ---

CacheStore* CacheManager::findStore(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(stores_mutex_);
    auto it = stores_.find(name);
    return it == stores_.end() ? nullptr : it->second.get();
}

CacheStore& CacheManager::createStore(const std::string& name, const CacheSpec& spec) {
    std::unique_lock<std::shared_mutex> lock(stores_mutex_);
    // Another caller may have created it between the shared lookup and this lock
    auto it = stores_.find(name);
    if (it != stores_.end()) {
        return *it->second;
    }
    auto store = std::make_unique<CacheStore>(name, spec, expiration_policy_, clock_, logger_, statsd_client_);
    auto [inserted_it, success] = stores_.emplace(name, std::move(store));
    logger_->info("Created cache '" + name + "' with " + spec.to_string());
    return *inserted_it->second;
}

CacheSpec CacheManager::specFor(const std::string& name) const {
    auto it = cache_specs_.find(name);
    return it == cache_specs_.end() ? default_spec_ : it->second;
}

void CacheManager::cascadeInvalidation(const std::string& trigger) {
    std::set<std::string> visited{trigger};
    std::vector<std::string> pending{trigger};
    while (!pending.empty()) {
        std::string current = pending.back();
        pending.pop_back();
        for (const auto& dependent : invalidation_coordinator_.dependentsOf(current)) {
            if (!visited.insert(dependent).second) {
                continue;
            }
            // A cache nobody has referenced yet holds nothing, but its own dependents still cascade
            if (auto* store = findStore(dependent)) {
                store->evictAll();
                statsd_client_->increment(MetricsDefinitions::PREFIX + dependent + "." + MetricsDefinitions::INVALIDATION);
            }
            if (logger_->isDebugEnabled()) {
                logger_->debug("Write to cache '" + current + "' invalidated cache '" + dependent + "'");
            }
            pending.push_back(dependent);
        }
    }
}
