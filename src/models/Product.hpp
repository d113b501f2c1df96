#ifndef PRODUCT_HPP
#define PRODUCT_HPP

#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

class Product {
public:
    int id = 0;
    std::string name;
    std::string category;
    double price = 0.0;

    bool operator==(const Product& other) const {
        return id == other.id && name == other.name && category == other.category && price == other.price;
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "Product { Id: " << id << ", Name: " << name << ", Category: " << category << ", Price: " << price << " }";
        return oss.str();
    }
};

inline void to_json(nlohmann::json& j, const Product& product) {
    j = nlohmann::json{
        {"id", product.id},
        {"name", product.name},
        {"category", product.category},
        {"price", product.price}
    };
}

inline void from_json(const nlohmann::json& j, Product& product) {
    j.at("id").get_to(product.id);
    j.at("name").get_to(product.name);
    product.category = j.value("category", "");
    product.price = j.value("price", 0.0);
}

#endif // PRODUCT_HPP
