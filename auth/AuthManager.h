#pragma once
#include <string>
#include <optional>

#include "../common/Models.h"

class UserStore;

class AuthManager {
public:
    AuthManager(UserStore& users, double default_balance);

    // nullopt when the username is empty or already taken
    std::optional<int> register_customer(const std::string& username, const std::string& password,
                                         CustomerType type);
    std::optional<int> create_user(const std::string& username, const std::string& password,
                                   Role role, CustomerType type);

    // Id of the authenticated user
    std::optional<int> login(const std::string& username, const std::string& password);

    std::string hash_password(const std::string& password);
    bool verify_password(const std::string& password, const std::string& stored_hash);

private:
    UserStore& users;
    double default_balance;
};
