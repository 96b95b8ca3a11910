#include "Models.h"

#include <stdexcept>
#include <cstdint>
#include <limits>

namespace {
    int read_id(const nlohmann::json& j) {
        const nlohmann::json& value = j.at("id");
        if (!value.is_number_integer())
            throw std::runtime_error("id " + value.dump() + " is not an integer");

        bool in_range = value.is_number_unsigned()
            ? value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            : value.get<std::int64_t>() >= std::numeric_limits<int>::min()
                && value.get<std::int64_t>() <= std::numeric_limits<int>::max();
        if (!in_range)
            throw std::runtime_error("id " + value.dump() + " is out of range");
        return value.get<int>();
    }
}

bool operator==(const User& a, const User& b) {
    return a.id == b.id
        && a.username == b.username
        && a.password == b.password
        && a.role == b.role
        && a.customer_type == b.customer_type
        && a.balance == b.balance;
}

bool operator!=(const User& a, const User& b) {
    return !(a == b);
}

bool operator==(const Room& a, const Room& b) {
    return a.id == b.id
        && a.type == b.type
        && a.price == b.price
        && a.total == b.total
        && a.available == b.available;
}

bool operator!=(const Room& a, const Room& b) {
    return !(a == b);
}

std::string role_name(Role role) {
    switch (role) {
        case Role::Admin:
            return "admin";
        case Role::Customer:
            return "customer";
    }
    return "";
}

std::optional<Role> parse_role(const std::string& name) {
    if (name == "admin")
        return Role::Admin;
    if (name == "customer")
        return Role::Customer;
    return std::nullopt;
}

std::string customer_type_name(CustomerType type) {
    switch (type) {
        case CustomerType::Member:
            return "member";
        case CustomerType::Regular:
            return "regular";
        case CustomerType::None:
            break;
    }
    return "";
}

std::optional<CustomerType> parse_customer_type(const std::string& name) {
    if (name.empty())
        return CustomerType::None;
    if (name == "member")
        return CustomerType::Member;
    if (name == "regular")
        return CustomerType::Regular;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const User& user) {
    j = nlohmann::json{
        {"id", user.id},
        {"username", user.username},
        {"password", user.password},
        {"role", role_name(user.role)},
        {"customer_type", customer_type_name(user.customer_type)},
        {"balance", user.balance}
    };
}

void from_json(const nlohmann::json& j, User& user) {
    user.id = read_id(j);
    j.at("username").get_to(user.username);
    j.at("password").get_to(user.password);

    std::string role = j.at("role").get<std::string>();
    std::optional<Role> parsed_role = parse_role(role);
    if (!parsed_role)
        throw std::runtime_error("unknown role '" + role + "' for user " + std::to_string(user.id));
    user.role = *parsed_role;

    std::string type = j.value("customer_type", std::string());
    std::optional<CustomerType> parsed_type = parse_customer_type(type);
    if (!parsed_type)
        throw std::runtime_error("unknown customer type '" + type + "' for user " + std::to_string(user.id));
    user.customer_type = *parsed_type;

    user.balance = j.value("balance", 0.0);
}

void to_json(nlohmann::json& j, const Room& room) {
    j = nlohmann::json{
        {"id", room.id},
        {"type", room.type},
        {"price", room.price},
        {"total", room.total},
        {"available", room.available}
    };
}

void from_json(const nlohmann::json& j, Room& room) {
    room.id = read_id(j);
    j.at("type").get_to(room.type);
    j.at("price").get_to(room.price);
    j.at("total").get_to(room.total);
    j.at("available").get_to(room.available);
}
