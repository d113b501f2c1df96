#include "CatalogRepository.hpp"

#include <stdexcept>
#include <thread>
#include <utility>

CatalogRepository::CatalogRepository(std::chrono::milliseconds latency, std::shared_ptr<ILogger> logger)
    : latency_(latency), logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for CatalogRepository");
    }
    if (latency_.count() < 0) {
        latency_ = std::chrono::milliseconds(0);
    }
}

void CatalogRepository::seedDemoData() {
    std::lock_guard<std::mutex> lock(mutex_);
    products_[1] = Product{1, "Laptop", "electronics", 1299.0};
    products_[2] = Product{2, "Headphones", "electronics", 199.0};
    products_[3] = Product{3, "Desk", "furniture", 349.0};
    products_[4] = Product{4, "Chair", "furniture", 149.0};
    products_[5] = Product{5, "Notebook", "stationery", 4.5};

    users_[1] = User{1, "alice", 30, "alice@example.com"};
    users_[2] = User{2, "bob", 25, "bob@example.com"};
    users_[3] = User{3, "carol", 30, "carol@example.com"};
    users_[4] = User{4, "alice", 41, "alice.w@example.com"};
    logger_->setup("CatalogRepository seeded with " + std::to_string(products_.size()) + " products and " +
        std::to_string(users_.size()) + " users");
}

std::optional<Product> CatalogRepository::findProduct(int id) const {
    simulateQuery("findProduct " + std::to_string(id));
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = products_.find(id);
    if (it == products_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Product> CatalogRepository::findAllProducts() const {
    simulateQuery("findAllProducts");
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Product> result;
    result.reserve(products_.size());
    for (const auto& [id, product] : products_) {
        result.push_back(product);
    }
    return result;
}

std::vector<Product> CatalogRepository::findProductsByCategory(const std::string& category) const {
    simulateQuery("findProductsByCategory " + category);
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Product> result;
    for (const auto& [id, product] : products_) {
        if (product.category == category) {
            result.push_back(product);
        }
    }
    return result;
}

Product CatalogRepository::saveProduct(const Product& product) {
    std::lock_guard<std::mutex> lock(mutex_);
    products_[product.id] = product;
    return product;
}

bool CatalogRepository::deleteProduct(int id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return products_.erase(id) > 0;
}

std::optional<User> CatalogRepository::findUser(int id) const {
    simulateQuery("findUser " + std::to_string(id));
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(id);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<User> CatalogRepository::findUsersByNameAndAge(const std::string& name, int age) const {
    simulateQuery("findUsersByNameAndAge " + name + " " + std::to_string(age));
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<User> result;
    for (const auto& [id, user] : users_) {
        if (user.name == name && user.age == age) {
            result.push_back(user);
        }
    }
    return result;
}

std::vector<User> CatalogRepository::findAllUsers() const {
    simulateQuery("findAllUsers");
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<User> result;
    result.reserve(users_.size());
    for (const auto& [id, user] : users_) {
        result.push_back(user);
    }
    return result;
}

User CatalogRepository::saveUser(const User& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    users_[user.id] = user;
    return user;
}

void CatalogRepository::simulateQuery(const std::string& description) const {
    query_count_++;
    if (logger_->isDebugEnabled()) {
        logger_->debug("Repository query : " + description);
    }
    if (latency_.count() > 0) {
        std::this_thread::sleep_for(latency_);
    }
}
