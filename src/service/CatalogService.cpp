#include "CatalogService.hpp"

#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "../cache/CacheKey.hpp"
#include "../config/AppConfig.hpp"

using json = nlohmann::json;

namespace {
    // Absent rows come back as json null and must not be cached
    bool isPresent(const CacheValue& value) {
        return !value.is_null();
    }
}

CatalogService::CatalogService(std::shared_ptr<CatalogRepository> repository,
                               CacheManager& cache_manager,
                               std::shared_ptr<ILogger> logger)
    : repository_(std::move(repository)),
      cache_manager_(cache_manager),
      logger_(std::move(logger)) {
    if (!repository_) {
        throw std::invalid_argument("Repository pointer cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    logger_->debug("CatalogService initialized");
}

std::optional<Product> CatalogService::getProduct(int id) {
    CacheValue value = cache_manager_.getOrComputeIf(CacheNames::PRODUCTS, CacheKey::of(id),
        [this, id]() -> CacheValue {
            auto product = repository_->findProduct(id);
            return product ? json(*product) : json(nullptr);
        },
        isPresent);
    if (value.is_null()) {
        return std::nullopt;
    }
    return value.get<Product>();
}

std::vector<Product> CatalogService::getAllProducts() {
    CacheValue value = cache_manager_.getOrCompute(CacheNames::ALL_PRODUCTS, "all",
        [this]() -> CacheValue { return repository_->findAllProducts(); });
    return value.get<std::vector<Product>>();
}

std::vector<Product> CatalogService::getProductsByCategory(const std::string& category) {
    CacheValue value = cache_manager_.getOrCompute(CacheNames::PRODUCTS_BY_CATEGORY, CacheKey::of(category),
        [this, &category]() -> CacheValue { return repository_->findProductsByCategory(category); });
    return value.get<std::vector<Product>>();
}

Product CatalogService::saveProduct(const Product& product) {
    Product saved = repository_->saveProduct(product);
    cache_manager_.put(CacheNames::PRODUCTS, CacheKey::of(saved.id), json(saved));
    logger_->info("Saved " + saved.to_string());
    return saved;
}

bool CatalogService::deleteProduct(int id) {
    bool deleted = repository_->deleteProduct(id);
    cache_manager_.evict(CacheNames::PRODUCTS, CacheKey::of(id));
    // evict does not cascade, the listings still hold the deleted product
    for (const auto& dependent : cache_manager_.invalidationCoordinator().dependentsOf(CacheNames::PRODUCTS)) {
        cache_manager_.evictAll(dependent);
    }
    if (deleted) {
        logger_->info("Deleted product " + std::to_string(id));
    } else {
        logger_->warn("Delete requested for unknown product " + std::to_string(id));
    }
    return deleted;
}

std::optional<User> CatalogService::getUser(int id) {
    CacheValue value = cache_manager_.getOrComputeIf(CacheNames::USERS, CacheKey::of(id),
        [this, id]() -> CacheValue {
            auto user = repository_->findUser(id);
            return user ? json(*user) : json(nullptr);
        },
        isPresent);
    if (value.is_null()) {
        return std::nullopt;
    }
    return value.get<User>();
}

std::vector<User> CatalogService::findUsersByNameAndAge(const std::string& name, int age) {
    CacheValue value = cache_manager_.getOrCompute(CacheNames::USERS_BY_NAME_AND_AGE, CacheKey::of(name, age),
        [this, &name, age]() -> CacheValue { return repository_->findUsersByNameAndAge(name, age); });
    return value.get<std::vector<User>>();
}

std::vector<User> CatalogService::getAllUsers() {
    CacheValue value = cache_manager_.getOrCompute(CacheNames::ALL_USERS, "all",
        [this]() -> CacheValue { return repository_->findAllUsers(); });
    return value.get<std::vector<User>>();
}

User CatalogService::saveUser(const User& user) {
    User saved = repository_->saveUser(user);
    cache_manager_.put(CacheNames::USERS, CacheKey::of(saved.id), json(saved));
    logger_->info("Saved " + saved.to_string());
    return saved;
}
