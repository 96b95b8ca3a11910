#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

enum class Role {
    Admin,
    Customer
};

// Only meaningful for customers; admins carry None
enum class CustomerType {
    None,
    Member,
    Regular
};

struct User {
    int id = 0;
    std::string username;
    std::string password;       // crypto_pwhash_str hash
    Role role = Role::Customer;
    CustomerType customer_type = CustomerType::None;
    double balance = 0.0;

    bool is_admin() const { return role == Role::Admin; }
    bool is_customer() const { return role == Role::Customer; }
};

struct Room {
    int id = 0;
    std::string type;
    double price = 0.0;
    int total = 0;
    int available = 0;
};

bool operator==(const User& a, const User& b);
bool operator!=(const User& a, const User& b);
bool operator==(const Room& a, const Room& b);
bool operator!=(const Room& a, const Room& b);

std::string role_name(Role role);
std::optional<Role> parse_role(const std::string& name);

std::string customer_type_name(CustomerType type);
std::optional<CustomerType> parse_customer_type(const std::string& name);

// nlohmann::json picks these up through ADL; from_json throws
// nlohmann::json::exception on missing or mistyped fields
void to_json(nlohmann::json& j, const User& user);
void from_json(const nlohmann::json& j, User& user);

void to_json(nlohmann::json& j, const Room& room);
void from_json(const nlohmann::json& j, Room& room);
