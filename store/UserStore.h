#pragma once

#include <string>
#include <vector>
#include <optional>

#include "../common/Models.h"
#include "StoreResult.h"

class Database;

// Partial update; unset fields keep their current value.
struct UserChanges {
    std::optional<std::string> username;
    std::optional<std::string> password;    // already hashed
    std::optional<CustomerType> customer_type;
    std::optional<double> balance;
};

class UserStore {
public:
    UserStore(Database& db);

    // false when the backing file does not exist yet; throws on corrupt content
    bool load();
    void save();

    const std::vector<User>& list() const { return users; }
    bool empty() const { return users.empty(); }

    User* find(int id);
    const User* find(int id) const;
    const User* find_by_username(const std::string& username) const;

    int next_id() const;

    // Each mutation is saved before returning. A failed save restores the
    // previous in-memory state and rethrows.
    std::optional<int> add(User user);
    StoreResult update(int id, const UserChanges& changes);
    StoreResult remove(int id);

private:
    Database& db;
    std::vector<User> users;

    bool username_taken(const std::string& username, int except_id) const;
};
