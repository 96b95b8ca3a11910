#pragma once

#include <iosfwd>
#include <string>
#include <optional>

struct Config;
class UserStore;
class RoomStore;
class AuthManager;
class BookingService;

// Numbered-menu front end. Reads one answer per line from `in` and writes
// prompts and results to `out`; end of input behaves like choosing exit.
class Console {
private:
    std::istream& in;
    std::ostream& out;

    UserStore& users;
    RoomStore& rooms;
    AuthManager& auth;
    BookingService& booking;
    double default_balance;

    bool closed;

    std::string prompt(const std::string& text);
    std::optional<int> promptId(const std::string& text);
    bool confirm(const std::string& question);
    void invalidChoice();

    // Top level
    void login();
    void registerCustomer();

    // Admin
    void adminMenu();
    void userManagement();
    void roomManagement();
    void listUsers();
    void addUser();
    void updateUser();
    void deleteUser();
    void listRooms();
    void addRoom();
    void updateRoom();
    void deleteRoom();

    // Customer
    void customerMenu(int customer_id);
    void bookRoom(int customer_id);
    void showBalance(int customer_id);

public:
    Console(std::istream& in, std::ostream& out,
            UserStore& users, RoomStore& rooms,
            AuthManager& auth, BookingService& booking,
            const Config& config);

    // Runs until the user exits; returns the process exit code
    int run();
};
