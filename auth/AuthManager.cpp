#include "AuthManager.h"
#include "../store/UserStore.h"

#include <sodium.h>
#include <stdexcept>

AuthManager::AuthManager(UserStore& users, double default_balance)
    : users(users), default_balance(default_balance)
{
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium init failed");
    }
}

std::string AuthManager::hash_password(const std::string& password) {
    char hash[crypto_pwhash_STRBYTES];

    if (crypto_pwhash_str(
            hash,
            password.c_str(),
            password.size(),
            crypto_pwhash_OPSLIMIT_INTERACTIVE,
            crypto_pwhash_MEMLIMIT_INTERACTIVE
        ) != 0)
    {
        throw std::runtime_error("Out of memory hashing password");
    }

    return std::string(hash);
}

bool AuthManager::verify_password(const std::string& password, const std::string& stored_hash) {
    return crypto_pwhash_str_verify(
        stored_hash.c_str(),
        password.c_str(),
        password.size()
    ) == 0;
}

std::optional<int> AuthManager::register_customer(const std::string& username, const std::string& password,
                                                  CustomerType type) {
    return create_user(username, password, Role::Customer, type);
}

std::optional<int> AuthManager::create_user(const std::string& username, const std::string& password,
                                            Role role, CustomerType type) {
    if (username.empty() || users.find_by_username(username))
        return std::nullopt;

    User user;
    user.username = username;
    user.password = hash_password(password);
    user.role = role;

    if (role == Role::Customer) {
        user.customer_type = (type == CustomerType::None) ? CustomerType::Regular : type;
        user.balance = default_balance;
    }

    return users.add(user);
}

std::optional<int> AuthManager::login(const std::string& username, const std::string& password) {
    const User* user = users.find_by_username(username);
    if (!user)
        return std::nullopt;

    if (!verify_password(password, user->password))
        return std::nullopt;

    return user->id;
}
