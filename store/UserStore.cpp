#include "UserStore.h"
#include "../database/Database.h"

#include <iostream>
#include <algorithm>
#include <set>
#include <stdexcept>
#include <limits>

UserStore::UserStore(Database& db)
    : db(db)
{
}

bool UserStore::load() {
    std::optional<nlohmann::json> document = db.read();
    if (!document)
        return false;

    if (!document->is_array()) {
        throw std::runtime_error("Corrupt user data in " + db.get_path() + ": expected a JSON array");
    }

    std::vector<User> loaded;
    std::set<int> ids;
    std::set<std::string> names;

    try {
        for (const auto& entry : *document) {
            User user = entry.get<User>();
            if (!ids.insert(user.id).second)
                throw std::runtime_error("duplicate user id " + std::to_string(user.id));
            if (!names.insert(user.username).second)
                throw std::runtime_error("duplicate username '" + user.username + "'");
            loaded.push_back(user);
        }
    } catch (const std::exception& ex) {
        throw std::runtime_error("Corrupt user data in " + db.get_path() + ": " + ex.what());
    }

    users = std::move(loaded);
    std::cout << "Loaded " << users.size() << " users from " << db.get_path() << "\n";
    return true;
}

void UserStore::save() {
    nlohmann::json document = nlohmann::json::array();
    for (const auto& user : users) {
        document.push_back(user);
    }
    db.write(document);
}

User* UserStore::find(int id) {
    for (auto& user : users) {
        if (user.id == id)
            return &user;
    }
    return nullptr;
}

const User* UserStore::find(int id) const {
    for (const auto& user : users) {
        if (user.id == id)
            return &user;
    }
    return nullptr;
}

const User* UserStore::find_by_username(const std::string& username) const {
    for (const auto& user : users) {
        if (user.username == username)
            return &user;
    }
    return nullptr;
}

int UserStore::next_id() const {
    int max_id = 0;
    for (const auto& user : users) {
        max_id = std::max(max_id, user.id);
    }
    if (max_id == std::numeric_limits<int>::max())
        throw std::runtime_error("User id space exhausted");
    return max_id + 1;
}

bool UserStore::username_taken(const std::string& username, int except_id) const {
    const User* existing = find_by_username(username);
    return existing && existing->id != except_id;
}

std::optional<int> UserStore::add(User user) {
    if (user.username.empty() || username_taken(user.username, 0))
        return std::nullopt;

    user.id = next_id();
    users.push_back(user);

    try {
        save();
    } catch (const std::exception&) {
        users.pop_back();
        throw;
    }
    return user.id;
}

StoreResult UserStore::update(int id, const UserChanges& changes) {
    User* user = find(id);
    if (!user)
        return StoreResult::NotFound;

    if (changes.username) {
        if (changes.username->empty())
            return StoreResult::Invalid;
        if (username_taken(*changes.username, id))
            return StoreResult::Duplicate;
    }

    if (user->is_admin() && (changes.customer_type || changes.balance))
        return StoreResult::Invalid;
    if (changes.customer_type && *changes.customer_type == CustomerType::None)
        return StoreResult::Invalid;
    if (changes.balance && *changes.balance < 0.0)
        return StoreResult::Invalid;

    User previous = *user;

    if (changes.username)
        user->username = *changes.username;
    if (changes.password)
        user->password = *changes.password;
    if (changes.customer_type)
        user->customer_type = *changes.customer_type;
    if (changes.balance)
        user->balance = *changes.balance;

    try {
        save();
    } catch (const std::exception&) {
        *user = previous;
        throw;
    }
    return StoreResult::Ok;
}

StoreResult UserStore::remove(int id) {
    auto it = std::find_if(users.begin(), users.end(),
                           [id](const User& user) { return user.id == id; });
    if (it == users.end())
        return StoreResult::NotFound;

    size_t index = it - users.begin();
    User removed = *it;
    users.erase(it);

    try {
        save();
    } catch (const std::exception&) {
        users.insert(users.begin() + index, removed);
        throw;
    }
    return StoreResult::Ok;
}
