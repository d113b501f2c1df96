#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <chrono>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <sstream>

#include "CacheSpec.hpp"
#include "LogUtils.hpp"

// Metric suffixes, emitted as "cachify.<cache name>.<suffix>".
namespace MetricsDefinitions {
    static std::string PREFIX = "cachify.";

    static std::string CACHE_HIT = "hit";
    static std::string CACHE_MISS = "miss";
    static std::string LOAD_SUCCESS = "load_success";
    static std::string LOAD_FAILURE = "load_failure";
    static std::string LOAD_TIME = "load_time";
    static std::string EVICTION = "eviction";
    static std::string EXPIRATION = "expiration";
    static std::string PUT = "put";
    static std::string REMOVAL = "removal";
    static std::string INVALIDATION = "invalidation";
    static std::string SIZE = "size";

    static std::string POOL_QUEUE_WAIT = "cachify.pool.queue_wait";
}

namespace CacheNames {
    static const std::string USERS = "users";
    static const std::string ALL_USERS = "allUsers";
    static const std::string USERS_BY_NAME_AND_AGE = "usersByNameAndAge";
    static const std::string PRODUCTS = "products";
    static const std::string ALL_PRODUCTS = "allProducts";
    static const std::string PRODUCTS_BY_CATEGORY = "productsByCategory";
}

namespace Constants {
    static constexpr auto CONFIG_FILE_NAME = "cachify.config";
    static constexpr auto CACHE_KEY_PREFIX = "cache.";
    static constexpr auto INVALIDATE_KEY_PREFIX = "invalidate.";
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Cache configuration
    CacheSpec default_cache_spec;
    std::map<std::string, CacheSpec> cache_specs; // Pre-registered caches, key: cache name
    std::map<std::string, std::set<std::string>> invalidation_rules; // Key: trigger cache name
    int expiry_sweep_interval_in_millis;

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    int metrics_batch_size;
    int metrics_send_interval_in_millis;

    // Demo workload
    int workload_threads;
    int workload_requests;
    int repository_latency_in_millis;

    AppConfig() {
        // --- Set Defaults  ---
        default_cache_spec.capacity = 10000;
        expiry_sweep_interval_in_millis = 1000;
        log_level = LogUtils::LogLevel::CERROR; // Default log level
        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;
        workload_threads = 4;
        workload_requests = 200;
        repository_latency_in_millis = 50;

        invalidation_rules[CacheNames::USERS] = {CacheNames::ALL_USERS, CacheNames::USERS_BY_NAME_AND_AGE};
        invalidation_rules[CacheNames::PRODUCTS] = {CacheNames::ALL_PRODUCTS, CacheNames::PRODUCTS_BY_CATEGORY};
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "// --- Cache Configuration --- //" << std::endl
            << "default_cache: " << default_cache_spec.to_string() << std::endl
            << "expiry_sweep_interval_in_millis: " << expiry_sweep_interval_in_millis << std::endl
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl  // Cast enum to int
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_in_millis: " << metrics_send_interval_in_millis << std::endl
            << "// --- Demo Workload --- //" << std::endl
            << "workload_threads: " << workload_threads << std::endl
            << "workload_requests: " << workload_requests << std::endl
            << "repository_latency_in_millis: " << repository_latency_in_millis << std::endl;

        ss << "--- Cache name : spec ---" << std::endl;
        for (const auto& [name, spec] : cache_specs) {
            ss << name << " : " << spec.to_string() << std::endl;
        }
        ss << "--- Invalidation trigger : dependent caches ---" << std::endl;
        for (const auto& [trigger, dependents] : invalidation_rules) {
            ss << trigger << " :";
            for (const auto& dependent : dependents) {
                ss << " " << dependent;
            }
            ss << std::endl;
        }
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
