// tests/test_catalogservice.cpp
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "TestMocks.hpp"
#include "../src/cache/CacheManager.hpp"
#include "../src/config/AppConfig.hpp"
#include "../src/service/CatalogRepository.hpp"
#include "../src/service/CatalogService.hpp"

using namespace std::chrono_literals;
using ::testing::HasSubstr;
using ::testing::NiceMock;

class CatalogServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_ = makeNiceLogger();
        statsd_ = std::make_shared<NiceMock<MockStatsDClient>>();
        manager_ = std::make_unique<CacheManager>(AppConfig{}, logger_, statsd_);
        repository_ = std::make_shared<CatalogRepository>(0ms, logger_);
        repository_->seedDemoData();
        service_ = std::make_unique<CatalogService>(repository_, *manager_, logger_);
    }

    std::shared_ptr<NiceMock<MockLogger>> logger_;
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd_;
    std::unique_ptr<CacheManager> manager_;
    std::shared_ptr<CatalogRepository> repository_;
    std::unique_ptr<CatalogService> service_;
};

TEST_F(CatalogServiceTest, GetProductIsCached) {
    auto first = service_->getProduct(1);
    auto second = service_->getProduct(1);

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->name, "Laptop");
    EXPECT_TRUE(*first == *second);
    EXPECT_EQ(repository_->queryCount(), 1u);
}

TEST_F(CatalogServiceTest, MissingProductIsNotCached) {
    EXPECT_FALSE(service_->getProduct(99).has_value());
    EXPECT_FALSE(service_->getProduct(99).has_value());

    EXPECT_EQ(repository_->queryCount(), 2u);
    EXPECT_FALSE(manager_->cache(CacheNames::PRODUCTS).contains("99"));
}

TEST_F(CatalogServiceTest, ProductListingsAreCached) {
    EXPECT_EQ(service_->getAllProducts().size(), 5u);
    EXPECT_EQ(service_->getAllProducts().size(), 5u);
    EXPECT_EQ(service_->getProductsByCategory("furniture").size(), 2u);
    EXPECT_EQ(service_->getProductsByCategory("furniture").size(), 2u);
    EXPECT_TRUE(service_->getProductsByCategory("garden").empty()); // Empty lists are cached too
    EXPECT_TRUE(service_->getProductsByCategory("garden").empty());

    EXPECT_EQ(repository_->queryCount(), 3u);
}

TEST_F(CatalogServiceTest, SaveProductRefreshesEntryAndClearsListings) {
    service_->getAllProducts();
    service_->getProductsByCategory("electronics");
    ASSERT_EQ(repository_->queryCount(), 2u);

    service_->saveProduct(Product{6, "Monitor", "electronics", 250.0});

    // Written through: no repository query needed
    auto monitor = service_->getProduct(6);
    ASSERT_TRUE(monitor.has_value());
    EXPECT_EQ(monitor->name, "Monitor");
    EXPECT_EQ(repository_->queryCount(), 2u);

    EXPECT_EQ(service_->getAllProducts().size(), 6u);
    EXPECT_EQ(service_->getProductsByCategory("electronics").size(), 3u);
    EXPECT_EQ(repository_->queryCount(), 4u);
}

TEST_F(CatalogServiceTest, UpdatedProductIsVisibleImmediately) {
    auto notebook = service_->getProduct(5);
    ASSERT_TRUE(notebook.has_value());
    notebook->price = 9.99;
    service_->saveProduct(*notebook);

    auto reread = service_->getProduct(5);
    ASSERT_TRUE(reread.has_value());
    EXPECT_DOUBLE_EQ(reread->price, 9.99);
}

TEST_F(CatalogServiceTest, DeleteProductClearsEntryAndListings) {
    service_->getProduct(1);
    service_->getAllProducts();
    ASSERT_EQ(repository_->queryCount(), 2u);

    EXPECT_TRUE(service_->deleteProduct(1));

    EXPECT_FALSE(service_->getProduct(1).has_value());
    EXPECT_EQ(service_->getAllProducts().size(), 4u);
    EXPECT_EQ(repository_->queryCount(), 4u);
}

TEST_F(CatalogServiceTest, DeleteUnknownProductWarns) {
    EXPECT_CALL(*logger_, warn(HasSubstr("unknown product 42"))).Times(1);
    EXPECT_FALSE(service_->deleteProduct(42));
}

TEST_F(CatalogServiceTest, GetUserIsCachedAndMissingUserIsNot) {
    ASSERT_TRUE(service_->getUser(2).has_value());
    ASSERT_TRUE(service_->getUser(2).has_value());
    EXPECT_FALSE(service_->getUser(77).has_value());
    EXPECT_FALSE(service_->getUser(77).has_value());

    EXPECT_EQ(repository_->queryCount(), 3u);
}

TEST_F(CatalogServiceTest, UsersByNameAndAgeUseCompositeKey) {
    EXPECT_EQ(service_->findUsersByNameAndAge("alice", 30).size(), 1u);
    EXPECT_EQ(service_->findUsersByNameAndAge("alice", 30).size(), 1u);
    EXPECT_EQ(service_->findUsersByNameAndAge("alice", 41).size(), 1u);

    EXPECT_EQ(repository_->queryCount(), 2u);
    auto& cache = manager_->cache(CacheNames::USERS_BY_NAME_AND_AGE);
    EXPECT_TRUE(cache.contains("alice-30"));
    EXPECT_TRUE(cache.contains("alice-41"));
}

TEST_F(CatalogServiceTest, SaveUserClearsUserQueries) {
    EXPECT_EQ(service_->getAllUsers().size(), 4u);
    EXPECT_EQ(service_->findUsersByNameAndAge("bob", 25).size(), 1u);

    service_->saveUser(User{2, "bob", 26, "bob@example.com"});

    EXPECT_EQ(manager_->cache(CacheNames::ALL_USERS).size(), 0u);
    EXPECT_EQ(manager_->cache(CacheNames::USERS_BY_NAME_AND_AGE).size(), 0u);
    EXPECT_TRUE(service_->findUsersByNameAndAge("bob", 25).empty());

    auto bob = service_->getUser(2);
    ASSERT_TRUE(bob.has_value());
    EXPECT_EQ(bob->age, 26);
}

TEST_F(CatalogServiceTest, ConcurrentReadsQueryRepositoryOnce) {
    auto slow_repository = std::make_shared<CatalogRepository>(50ms, logger_);
    slow_repository->seedDemoData();
    CatalogService slow_service(slow_repository, *manager_, logger_);

    std::vector<std::thread> threads;
    std::vector<std::optional<Product>> results(8);
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i]() { results[i] = slow_service.getProduct(3); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(slow_repository->queryCount(), 1u);
    for (const auto& result : results) {
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(result->name, "Desk");
    }
}

TEST_F(CatalogServiceTest, NullRepositoryIsRejected) {
    EXPECT_THROW(CatalogService(nullptr, *manager_, logger_), std::invalid_argument);
}
