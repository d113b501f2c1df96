#ifndef CATALOGSERVICE_HPP
#define CATALOGSERVICE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "CatalogRepository.hpp"
#include "../cache/CacheManager.hpp"
#include "../interfaces/ILogger.hpp"
#include "../models/Product.hpp"
#include "../models/User.hpp"

// Read-through caching in front of CatalogRepository. Reads go through the
// manager's named caches, writes go to the repository first and then update or
// clear the caches. Lookups that find nothing are not cached.
// Repository failures surface as ComputeError.
class CatalogService {
public:
    CatalogService(std::shared_ptr<CatalogRepository> repository,
                   CacheManager& cache_manager,
                   std::shared_ptr<ILogger> logger);
    ~CatalogService() = default;

    CatalogService(const CatalogService&) = delete;
    CatalogService& operator=(const CatalogService&) = delete;

    std::optional<Product> getProduct(int id);
    std::vector<Product> getAllProducts();
    std::vector<Product> getProductsByCategory(const std::string& category);
    // Updates the products cache, which clears the product listings
    Product saveProduct(const Product& product);
    bool deleteProduct(int id);

    std::optional<User> getUser(int id);
    std::vector<User> findUsersByNameAndAge(const std::string& name, int age);
    std::vector<User> getAllUsers();
    User saveUser(const User& user);

private:
    std::shared_ptr<CatalogRepository> repository_;
    CacheManager& cache_manager_;
    std::shared_ptr<ILogger> logger_;
};

#endif // CATALOGSERVICE_HPP
