#pragma once

#include <string>

class UserStore;
class RoomStore;

enum class BookingStatus {
    Booked,
    UnknownCustomer,
    NotCustomer,
    UnknownRoom,
    InvalidQuantity,
    NotEnoughRooms,
    InsufficientBalance,
    SaveFailed
};

struct BookingResult {
    BookingStatus status;
    double cost = 0.0;          // price x quantity, also filled on balance failures
    double balance = 0.0;       // customer balance after the attempt
    std::string message;

    bool ok() const { return status == BookingStatus::Booked; }
};

// Debits the customer and takes rooms out of inventory as one step: either
// both records change and both files are saved, or nothing changes.
class BookingService {
public:
    BookingService(UserStore& users, RoomStore& rooms);

    BookingResult book(int customer_id, int room_id, int quantity);

private:
    UserStore& users;
    RoomStore& rooms;
};
