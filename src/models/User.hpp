#ifndef USER_HPP
#define USER_HPP

#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

class User {
public:
    int id = 0;
    std::string name;
    int age = 0;
    std::string email;

    bool operator==(const User& other) const {
        return id == other.id && name == other.name && age == other.age && email == other.email;
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "User { Id: " << id << ", Name: " << name << ", Age: " << age << ", Email: " << email << " }";
        return oss.str();
    }
};

inline void to_json(nlohmann::json& j, const User& user) {
    j = nlohmann::json{
        {"id", user.id},
        {"name", user.name},
        {"age", user.age},
        {"email", user.email}
    };
}

inline void from_json(const nlohmann::json& j, User& user) {
    j.at("id").get_to(user.id);
    j.at("name").get_to(user.name);
    user.age = j.value("age", 0);
    user.email = j.value("email", "");
}

#endif // USER_HPP
