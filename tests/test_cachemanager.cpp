// tests/test_cachemanager.cpp
#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "TestMocks.hpp"
#include "../src/cache/CacheManager.hpp"
#include "../src/config/AppConfig.hpp"
#include "../src/errors/CacheErrors.hpp"

using namespace std::chrono_literals;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;

class CacheManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_ = makeNiceLogger();
        statsd_ = std::make_shared<NiceMock<MockStatsDClient>>();
        clock_ = std::make_shared<ManualClock>();
        config_.invalidation_rules.clear(); // Each test declares its own rules
    }

    std::unique_ptr<CacheManager> makeManager() {
        return std::make_unique<CacheManager>(config_, logger_, statsd_, clock_);
    }

    static CacheStore::ComputeFn counting(std::atomic<int>& calls, CacheValue value) {
        return [&calls, value]() -> CacheValue {
            calls++;
            return value;
        };
    }

    AppConfig config_;
    std::shared_ptr<NiceMock<MockLogger>> logger_;
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd_;
    std::shared_ptr<ManualClock> clock_;
};

TEST_F(CacheManagerTest, CreatesStoresOnFirstReference) {
    auto manager = makeManager();
    EXPECT_FALSE(manager->hasCache("users"));

    CacheStore& first = manager->cache("users");
    CacheStore& second = manager->cache("users");

    EXPECT_TRUE(manager->hasCache("users"));
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(first.name(), "users");
}

TEST_F(CacheManagerTest, ConfiguredCachesArePreRegistered) {
    config_.cache_specs["small"] = CacheSpec{1, 500ms};
    auto manager = makeManager();

    ASSERT_TRUE(manager->hasCache("small"));
    EXPECT_EQ(manager->cache("small").spec(), (CacheSpec{1, 500ms}));
}

TEST_F(CacheManagerTest, UnconfiguredCachesUseDefaultSpec) {
    config_.default_cache_spec = CacheSpec{5, std::nullopt};
    auto manager = makeManager();

    EXPECT_EQ(manager->cache("anything").spec(), (CacheSpec{5, std::nullopt}));
}

TEST_F(CacheManagerTest, SpecOverrideOnlyAppliesOnCreation) {
    auto manager = makeManager();
    EXPECT_EQ(manager->cache("custom", CacheSpec{3, std::nullopt}).spec().capacity, 3);

    EXPECT_CALL(*logger_, warn(HasSubstr("custom"))).Times(1);
    EXPECT_EQ(manager->cache("custom", CacheSpec{7, std::nullopt}).spec().capacity, 3);
}

TEST_F(CacheManagerTest, CacheNamesAreSorted) {
    auto manager = makeManager();
    manager->cache("b");
    manager->cache("a");
    manager->cache("c");
    EXPECT_EQ(manager->cacheNames(), (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(CacheManagerTest, WriteToTriggerClearsDependentCache) {
    config_.invalidation_rules["users"] = {"allUsers"};
    auto manager = makeManager();
    std::atomic<int> calls{0};

    manager->getOrCompute("allUsers", "all", counting(calls, {"alice"}));
    manager->getOrCompute("allUsers", "all", counting(calls, {"alice"}));
    EXPECT_EQ(calls.load(), 1);

    manager->put("users", "1", {{"id", 1}, {"name", "bob"}});
    EXPECT_EQ(manager->cache("allUsers").size(), 0u);

    manager->getOrCompute("allUsers", "all", counting(calls, {"alice", "bob"}));
    EXPECT_EQ(calls.load(), 2);
    EXPECT_EQ(manager->cache("users").size(), 1u); // The write itself is kept
}

TEST_F(CacheManagerTest, TwoThreadsShareOneComputation) {
    auto manager = makeManager();
    std::atomic<int> counter{0};
    auto slow = [&counter]() -> CacheValue {
        std::this_thread::sleep_for(50ms);
        return ++counter;
    };

    int first = 0;
    int second = 0;
    std::thread t1([&]() { first = manager->getOrCompute("slow", "k", slow).get<int>(); });
    std::thread t2([&]() { second = manager->getOrCompute("slow", "k", slow).get<int>(); });
    t1.join();
    t2.join();

    EXPECT_EQ(counter.load(), 1);
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 1);
}

TEST_F(CacheManagerTest, FailedComputationIsRetried) {
    auto manager = makeManager();
    int calls = 0;

    EXPECT_THROW(manager->getOrCompute("c", "k", [&calls]() -> CacheValue {
        calls++;
        throw std::runtime_error("unavailable");
    }), ComputeError);

    auto value = manager->getOrCompute("c", "k", [&calls]() -> CacheValue {
        calls++;
        return "ok";
    });
    EXPECT_EQ(value.get<std::string>(), "ok");
    EXPECT_EQ(calls, 2);
}

TEST_F(CacheManagerTest, GetOrComputeIfSkipsRejectedValues) {
    auto manager = makeManager();
    std::atomic<int> calls{0};
    auto is_present = [](const CacheValue& value) { return !value.is_null(); };

    manager->getOrComputeIf("users", "404", counting(calls, nullptr), is_present);
    manager->getOrComputeIf("users", "404", counting(calls, nullptr), is_present);
    EXPECT_EQ(calls.load(), 2);
    EXPECT_FALSE(manager->cache("users").contains("404"));
}

TEST_F(CacheManagerTest, CascadeIsTransitive) {
    config_.invalidation_rules["a"] = {"b"};
    config_.invalidation_rules["b"] = {"c"};
    auto manager = makeManager();
    manager->put("b", "k", 1);
    manager->put("c", "k", 2);

    manager->put("a", "k", 3);

    EXPECT_EQ(manager->cache("b").size(), 0u);
    EXPECT_EQ(manager->cache("c").size(), 0u);
    EXPECT_EQ(manager->cache("a").size(), 1u);
}

TEST_F(CacheManagerTest, CascadePassesThroughCachesNotYetCreated) {
    config_.invalidation_rules["a"] = {"b"};
    config_.invalidation_rules["b"] = {"c"};
    auto manager = makeManager();
    manager->cache("c").put("k", 1);

    manager->put("a", "k", 1);

    EXPECT_EQ(manager->cache("c").size(), 0u);
    EXPECT_FALSE(manager->hasCache("b")); // Cascading does not create caches
}

TEST_F(CacheManagerTest, DiamondCascadeClearsEachCacheOnce) {
    config_.invalidation_rules["a"] = {"b", "c"};
    config_.invalidation_rules["b"] = {"d"};
    config_.invalidation_rules["c"] = {"d"};
    auto manager = makeManager();
    manager->cache("d").put("k", 1);

    EXPECT_CALL(*statsd_, increment("cachify.d.invalidation", 1)).Times(1);
    manager->put("a", "k", 1);
    EXPECT_EQ(manager->cache("d").size(), 0u);
}

TEST_F(CacheManagerTest, EvictDoesNotCascade) {
    config_.invalidation_rules["users"] = {"allUsers"};
    auto manager = makeManager();
    manager->cache("users").put("1", "alice");
    manager->cache("allUsers").put("all", {"alice"});

    manager->evict("users", "1");

    EXPECT_FALSE(manager->cache("users").contains("1"));
    EXPECT_EQ(manager->cache("allUsers").size(), 1u);
}

TEST_F(CacheManagerTest, EvictAllCascades) {
    config_.invalidation_rules["products"] = {"allProducts"};
    auto manager = makeManager();
    manager->cache("products").put("1", "lamp");
    manager->cache("allProducts").put("all", {"lamp"});

    manager->evictAll("products");

    EXPECT_EQ(manager->cache("products").size(), 0u);
    EXPECT_EQ(manager->cache("allProducts").size(), 0u);
}

TEST_F(CacheManagerTest, EvictOnUnknownCacheIsNoop) {
    auto manager = makeManager();
    EXPECT_NO_THROW(manager->evict("ghost", "k"));
    EXPECT_NO_THROW(manager->evictAll("ghost"));
    EXPECT_FALSE(manager->hasCache("ghost"));
}

TEST_F(CacheManagerTest, ConfiguredRulesAreFrozenAfterConstruction) {
    config_.invalidation_rules["orders"] = {"orderTotals"};
    auto manager = makeManager();
    manager->cache("orderTotals").put("sum", 10);

    manager->put("orders", "1", {{"total", 10}});

    EXPECT_EQ(manager->cache("orderTotals").size(), 0u);
    EXPECT_TRUE(manager->invalidationCoordinator().frozen());
    EXPECT_EQ(manager->invalidationCoordinator().dependentsOf("orders"), (std::set<std::string>{"orderTotals"}));
}

TEST_F(CacheManagerTest, CyclicConfigurationIsRejected) {
    config_.invalidation_rules["users"] = {"allUsers"};
    config_.invalidation_rules["allUsers"] = {"users"};
    EXPECT_THROW(makeManager(), ConfigurationError);
}

TEST_F(CacheManagerTest, InvalidCacheSpecIsRejected) {
    config_.cache_specs["bad"] = CacheSpec{0, std::nullopt};
    EXPECT_THROW(makeManager(), ConfigurationError);
}

TEST_F(CacheManagerTest, InvalidDefaultSpecIsRejected) {
    config_.default_cache_spec = CacheSpec{std::nullopt, -5ms};
    EXPECT_THROW(makeManager(), ConfigurationError);
}

TEST_F(CacheManagerTest, NullCollaboratorsAreRejected) {
    EXPECT_THROW(CacheManager(config_, nullptr, statsd_), std::invalid_argument);
    EXPECT_THROW(CacheManager(config_, logger_, nullptr), std::invalid_argument);
}

TEST_F(CacheManagerTest, ConcurrentFirstReferencesCreateOneStore) {
    auto manager = makeManager();
    const int kThreads = 16;
    std::vector<CacheStore*> seen(kThreads, nullptr);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() { seen[i] = &manager->cache("race"); });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (auto* store : seen) {
        EXPECT_EQ(store, seen.front());
    }
    auto names = manager->cacheNames();
    EXPECT_EQ(std::count(names.begin(), names.end(), "race"), 1);
}

TEST_F(CacheManagerTest, PurgeExpiredCoversEveryStore) {
    auto manager = makeManager();
    manager->put("a", "1", 1, 10ms);
    manager->put("b", "1", 1, 10ms);
    manager->put("b", "2", 2);

    clock_->advance(20ms);

    EXPECT_EQ(manager->purgeExpired(), 2u);
    EXPECT_EQ(manager->cache("a").size(), 0u);
    EXPECT_EQ(manager->cache("b").size(), 1u);
}

TEST_F(CacheManagerTest, StatsJsonListsEveryCache) {
    auto manager = makeManager();
    manager->put("users", "1", "alice");
    manager->cache("users").get("1");
    manager->cache("products");

    auto stats = manager->statsJson();
    ASSERT_TRUE(stats.contains("users"));
    ASSERT_TRUE(stats.contains("products"));
    EXPECT_EQ(stats["users"]["hits"].get<int>(), 1);
    EXPECT_EQ(stats["users"]["size"].get<int>(), 1);
    EXPECT_EQ(stats["products"]["size"].get<int>(), 0);
}

TEST_F(CacheManagerTest, ShutdownClearsStoresAndIsIdempotent) {
    auto manager = makeManager();
    CacheStore& users = manager->cache("users");
    users.put("1", "alice");
    manager->put("products", "1", "lamp");

    manager->shutdown();
    EXPECT_TRUE(manager->isShutdown());
    EXPECT_EQ(users.size(), 0u);
    EXPECT_EQ(manager->cache("products").size(), 0u);
    EXPECT_TRUE(manager->hasCache("users"));

    EXPECT_NO_THROW(manager->shutdown());
}

TEST_F(CacheManagerTest, DefaultConfigurationWiresCatalogRules) {
    AppConfig defaults;
    CacheManager manager(defaults, logger_, statsd_, clock_);

    EXPECT_EQ(manager.invalidationCoordinator().dependentsOf(CacheNames::USERS),
              (std::set<std::string>{CacheNames::ALL_USERS, CacheNames::USERS_BY_NAME_AND_AGE}));
    EXPECT_EQ(manager.invalidationCoordinator().dependentsOf(CacheNames::PRODUCTS),
              (std::set<std::string>{CacheNames::ALL_PRODUCTS, CacheNames::PRODUCTS_BY_CATEGORY}));
}
