#include "RoomStore.h"
#include "../database/Database.h"

#include <iostream>
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>
#include <limits>

RoomStore::RoomStore(Database& db)
    : db(db)
{
}

bool RoomStore::load() {
    std::optional<nlohmann::json> document = db.read();
    if (!document)
        return false;

    if (!document->is_array()) {
        throw std::runtime_error("Corrupt room data in " + db.get_path() + ": expected a JSON array");
    }

    std::vector<Room> loaded;
    std::set<int> ids;

    try {
        for (const auto& entry : *document) {
            Room room = entry.get<Room>();
            if (!ids.insert(room.id).second)
                throw std::runtime_error("duplicate room id " + std::to_string(room.id));
            if (room.price < 0.0 || room.total < 0 || room.available < 0 || room.available > room.total)
                throw std::runtime_error("inconsistent inventory for room " + std::to_string(room.id));
            loaded.push_back(room);
        }
    } catch (const std::exception& ex) {
        throw std::runtime_error("Corrupt room data in " + db.get_path() + ": " + ex.what());
    }

    rooms = std::move(loaded);
    std::cout << "Loaded " << rooms.size() << " rooms from " << db.get_path() << "\n";
    return true;
}

void RoomStore::save() {
    nlohmann::json document = nlohmann::json::array();
    for (const auto& room : rooms) {
        document.push_back(room);
    }
    db.write(document);
}

Room* RoomStore::find(int id) {
    for (auto& room : rooms) {
        if (room.id == id)
            return &room;
    }
    return nullptr;
}

const Room* RoomStore::find(int id) const {
    for (const auto& room : rooms) {
        if (room.id == id)
            return &room;
    }
    return nullptr;
}

int RoomStore::next_id() const {
    int max_id = 0;
    for (const auto& room : rooms) {
        max_id = std::max(max_id, room.id);
    }
    if (max_id == std::numeric_limits<int>::max())
        throw std::runtime_error("Room id space exhausted");
    return max_id + 1;
}

std::optional<int> RoomStore::add(const std::string& type, double price, int total) {
    if (!std::isfinite(price) || price < 0.0 || total < 0)
        return std::nullopt;

    Room room;
    room.id = next_id();
    room.type = type;
    room.price = price;
    room.total = total;
    room.available = total;
    rooms.push_back(room);

    try {
        save();
    } catch (const std::exception&) {
        rooms.pop_back();
        throw;
    }
    return room.id;
}

StoreResult RoomStore::update(int id, const RoomChanges& changes) {
    Room* room = find(id);
    if (!room)
        return StoreResult::NotFound;

    if (changes.price && (!std::isfinite(*changes.price) || *changes.price < 0.0))
        return StoreResult::Invalid;
    if (changes.total && *changes.total < 0)
        return StoreResult::Invalid;

    Room previous = *room;

    if (changes.type)
        room->type = *changes.type;
    if (changes.price)
        room->price = *changes.price;
    if (changes.total) {
        int diff = *changes.total - room->total;
        room->total = *changes.total;
        room->available = std::max(0, room->available + diff);
    }

    try {
        save();
    } catch (const std::exception&) {
        *room = previous;
        throw;
    }
    return StoreResult::Ok;
}

StoreResult RoomStore::remove(int id) {
    auto it = std::find_if(rooms.begin(), rooms.end(),
                           [id](const Room& room) { return room.id == id; });
    if (it == rooms.end())
        return StoreResult::NotFound;

    size_t index = it - rooms.begin();
    Room removed = *it;
    rooms.erase(it);

    try {
        save();
    } catch (const std::exception&) {
        rooms.insert(rooms.begin() + index, removed);
        throw;
    }
    return StoreResult::Ok;
}
