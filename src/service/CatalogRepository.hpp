#ifndef CATALOGREPOSITORY_HPP
#define CATALOGREPOSITORY_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../interfaces/ILogger.hpp"
#include "../models/Product.hpp"
#include "../models/User.hpp"

// In-memory stand-in for a slow database. Every lookup sleeps for the configured
// latency and is counted, which is what the cache in front of it saves.
class CatalogRepository {
public:
    CatalogRepository(std::chrono::milliseconds latency, std::shared_ptr<ILogger> logger);
    ~CatalogRepository() = default;

    CatalogRepository(const CatalogRepository&) = delete;
    CatalogRepository& operator=(const CatalogRepository&) = delete;

    // Loads a handful of users and products for the demo workload.
    void seedDemoData();

    std::optional<Product> findProduct(int id) const;
    std::vector<Product> findAllProducts() const;
    std::vector<Product> findProductsByCategory(const std::string& category) const;
    Product saveProduct(const Product& product);
    bool deleteProduct(int id);

    std::optional<User> findUser(int id) const;
    std::vector<User> findUsersByNameAndAge(const std::string& name, int age) const;
    std::vector<User> findAllUsers() const;
    User saveUser(const User& user);

    // Number of find* calls served so far
    std::uint64_t queryCount() const { return query_count_.load(); }

private:
    void simulateQuery(const std::string& description) const;

    std::chrono::milliseconds latency_;
    std::shared_ptr<ILogger> logger_;

    mutable std::mutex mutex_;
    std::map<int, Product> products_;
    std::map<int, User> users_;
    mutable std::atomic<std::uint64_t> query_count_{0};
};

#endif // CATALOGREPOSITORY_HPP
