#include "BookingService.h"
#include "../store/UserStore.h"
#include "../store/RoomStore.h"

#include <iostream>
#include <stdexcept>

BookingService::BookingService(UserStore& users, RoomStore& rooms)
    : users(users), rooms(rooms)
{
}

BookingResult BookingService::book(int customer_id, int room_id, int quantity) {
    BookingResult result;

    User* customer = users.find(customer_id);
    if (!customer) {
        result.status = BookingStatus::UnknownCustomer;
        result.message = "Customer not found";
        return result;
    }
    result.balance = customer->balance;

    if (!customer->is_customer()) {
        result.status = BookingStatus::NotCustomer;
        result.message = "Only customers can book rooms";
        return result;
    }

    Room* room = rooms.find(room_id);
    if (!room) {
        result.status = BookingStatus::UnknownRoom;
        result.message = "Room not found";
        return result;
    }

    if (quantity <= 0) {
        result.status = BookingStatus::InvalidQuantity;
        result.message = "Invalid quantity";
        return result;
    }

    if (quantity > room->available) {
        result.status = BookingStatus::NotEnoughRooms;
        result.message = "Requested quantity exceeds the rooms available";
        return result;
    }

    result.cost = room->price * quantity;
    if (customer->balance < result.cost) {
        result.status = BookingStatus::InsufficientBalance;
        result.message = "Insufficient balance";
        return result;
    }

    double previous_balance = customer->balance;
    int previous_available = room->available;

    customer->balance -= result.cost;
    room->available -= quantity;

    try {
        users.save();
        rooms.save();
    } catch (const std::exception& ex) {
        std::cerr << "Booking save failed: " << ex.what() << "\n";

        customer->balance = previous_balance;
        room->available = previous_available;

        // users.json may already hold the debit
        try {
            users.save();
        } catch (const std::exception& restore_ex) {
            std::cerr << "Restoring user data failed: " << restore_ex.what() << "\n";
        }

        result.status = BookingStatus::SaveFailed;
        result.balance = previous_balance;
        result.message = std::string("Booking could not be saved: ") + ex.what();
        return result;
    }

    result.status = BookingStatus::Booked;
    result.balance = customer->balance;
    result.message = "Booking successful";
    std::cout << "Booked " << quantity << " x room " << room_id << " for user " << customer_id << "\n";
    return result;
}
