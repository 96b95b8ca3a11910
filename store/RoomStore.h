#pragma once

#include <string>
#include <vector>
#include <optional>

#include "../common/Models.h"
#include "StoreResult.h"

class Database;

// Partial update; unset fields keep their current value.
struct RoomChanges {
    std::optional<std::string> type;
    std::optional<double> price;
    std::optional<int> total;
};

class RoomStore {
public:
    RoomStore(Database& db);

    // false when the backing file does not exist yet; throws on corrupt content
    bool load();
    void save();

    const std::vector<Room>& list() const { return rooms; }
    bool empty() const { return rooms.empty(); }

    Room* find(int id);
    const Room* find(int id) const;

    int next_id() const;

    // Available starts equal to total. nullopt for a negative price or total.
    std::optional<int> add(const std::string& type, double price, int total);

    // A new total shifts available by the same difference, clamped at 0.
    StoreResult update(int id, const RoomChanges& changes);
    StoreResult remove(int id);

private:
    Database& db;
    std::vector<Room> rooms;
};
