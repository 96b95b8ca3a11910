#include "Console.h"
#include "../common/Config.h"
#include "../common/Models.h"
#include "../common/TextInput.h"
#include "../store/UserStore.h"
#include "../store/RoomStore.h"
#include "../auth/AuthManager.h"
#include "../booking/BookingService.h"

#include <iostream>
#include <iomanip>
#include <sstream>

namespace {
    const char* kRule = "================================";

    std::string money(double amount) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << amount;
        return ss.str();
    }

    std::optional<CustomerType> customer_type_choice(const std::string& choice) {
        if (choice == "1")
            return CustomerType::Member;
        if (choice == "2")
            return CustomerType::Regular;
        return std::nullopt;
    }
}

Console::Console(std::istream& in, std::ostream& out,
                 UserStore& users, RoomStore& rooms,
                 AuthManager& auth, BookingService& booking,
                 const Config& config)
    : in(in), out(out), users(users), rooms(rooms), auth(auth), booking(booking),
      default_balance(config.default_balance), closed(false)
{
}

int Console::run() {
    while (!closed) {
        out << kRule << "\n";
        out << "Hotel Management System\n";
        out << "1. Log in\n";
        out << "2. Register (customers only)\n";
        out << "3. Exit\n";
        std::string choice = prompt("Choose an option: ");
        if (closed)
            break;

        try {
            if (choice == "1") {
                login();
            }
            else if (choice == "2") {
                registerCustomer();
            }
            else if (choice == "3") {
                out << "Goodbye\n";
                return 0;
            }
            else {
                invalidChoice();
            }
        } catch (const std::exception& ex) {
            out << "Error: " << ex.what() << "\n";
        }
    }

    out << "\nInput closed, exiting\n";
    return 0;
}

std::string Console::prompt(const std::string& text) {
    out << text;
    out.flush();

    std::string line;
    if (!std::getline(in, line)) {
        closed = true;
        return "";
    }
    return trim(line);
}

std::optional<int> Console::promptId(const std::string& text) {
    std::optional<int> id = parse_int(prompt(text));
    if (!id && !closed)
        out << "Invalid ID\n";
    return id;
}

bool Console::confirm(const std::string& question) {
    std::string answer = prompt(question + " (y/n): ");
    return answer == "y" || answer == "Y";
}

void Console::invalidChoice() {
    out << "Invalid option, please try again.\n";
}

void Console::login() {
    std::string username = prompt("Username: ");
    std::string password = prompt("Password: ");
    if (closed)
        return;

    std::optional<int> id = auth.login(username, password);
    if (!id) {
        out << "Invalid username or password!\n";
        return;
    }

    out << "Login successful!\n";

    const User* user = users.find(*id);
    if (user->is_admin()) {
        adminMenu();
    }
    else {
        customerMenu(*id);
    }
}

void Console::registerCustomer() {
    out << "Register a new customer account\n";
    std::string username = prompt("Username: ");
    if (closed)
        return;
    if (username.empty()) {
        out << "Username cannot be empty\n";
        return;
    }
    if (users.find_by_username(username)) {
        out << "Username already exists!\n";
        return;
    }

    std::string password = prompt("Password: ");
    std::string choice = prompt("Customer type (1. Member 2. Regular): ");
    if (closed)
        return;

    CustomerType type = customer_type_choice(choice).value_or(CustomerType::Regular);
    std::optional<int> id = auth.register_customer(username, password, type);
    if (!id) {
        out << "Username already exists!\n";
        return;
    }

    out << "Registration successful! Starting balance: " << money(default_balance) << "\n";
}

// ------------------------- Admin -------------------------

void Console::adminMenu() {
    while (!closed) {
        out << kRule << "\n";
        out << "Admin menu\n";
        out << "1. User management\n";
        out << "2. Room management\n";
        out << "3. Log out\n";
        std::string choice = prompt("Choose an option: ");
        if (closed)
            return;

        if (choice == "1") {
            userManagement();
        }
        else if (choice == "2") {
            roomManagement();
        }
        else if (choice == "3") {
            out << "Logged out\n";
            return;
        }
        else {
            invalidChoice();
        }
    }
}

void Console::userManagement() {
    while (!closed) {
        out << "--------- User management ---------\n";
        out << "1. List users\n";
        out << "2. Add user\n";
        out << "3. Update user\n";
        out << "4. Delete user\n";
        out << "5. Back\n";
        std::string choice = prompt("Choose an option: ");
        if (closed)
            return;

        try {
            if (choice == "1") {
                listUsers();
            }
            else if (choice == "2") {
                addUser();
            }
            else if (choice == "3") {
                updateUser();
            }
            else if (choice == "4") {
                deleteUser();
            }
            else if (choice == "5") {
                return;
            }
            else {
                invalidChoice();
            }
        } catch (const std::exception& ex) {
            out << "Error: " << ex.what() << "\n";
        }
    }
}

void Console::roomManagement() {
    while (!closed) {
        out << "--------- Room management ---------\n";
        out << "1. List rooms\n";
        out << "2. Add room\n";
        out << "3. Update room\n";
        out << "4. Delete room\n";
        out << "5. Back\n";
        std::string choice = prompt("Choose an option: ");
        if (closed)
            return;

        try {
            if (choice == "1") {
                listRooms();
            }
            else if (choice == "2") {
                addRoom();
            }
            else if (choice == "3") {
                updateRoom();
            }
            else if (choice == "4") {
                deleteRoom();
            }
            else if (choice == "5") {
                return;
            }
            else {
                invalidChoice();
            }
        } catch (const std::exception& ex) {
            out << "Error: " << ex.what() << "\n";
        }
    }
}

void Console::listUsers() {
    out << "----- Users -----\n";
    for (const auto& user : users.list()) {
        out << "ID: " << user.id << ", username: " << user.username << ", role: " << role_name(user.role);
        if (user.is_customer()) {
            out << ", type: " << customer_type_name(user.customer_type)
                << ", balance: " << money(user.balance);
        }
        out << "\n";
    }
}

void Console::addUser() {
    out << "----- Add user -----\n";
    std::string username = prompt("Username: ");
    if (closed)
        return;
    if (username.empty()) {
        out << "Username cannot be empty\n";
        return;
    }
    if (users.find_by_username(username)) {
        out << "Username already exists!\n";
        return;
    }

    std::string password = prompt("Password: ");
    std::string role_choice = prompt("Role (1. Admin 2. Customer): ");
    if (closed)
        return;

    Role role = Role::Customer;
    CustomerType type = CustomerType::None;
    if (role_choice == "1") {
        role = Role::Admin;
    }
    else if (role_choice == "2") {
        role = Role::Customer;
        std::string choice = prompt("Customer type (1. Member 2. Regular): ");
        if (closed)
            return;
        type = customer_type_choice(choice).value_or(CustomerType::Regular);
    }
    else {
        out << "Invalid role\n";
        return;
    }

    if (!auth.create_user(username, password, role, type)) {
        out << "Username already exists!\n";
        return;
    }
    out << "User added\n";
}

void Console::updateUser() {
    std::optional<int> id = promptId("ID of the user to update: ");
    if (!id)
        return;

    const User* user = users.find(*id);
    if (!user) {
        out << "User not found\n";
        return;
    }

    UserChanges changes;

    out << "Current username: " << user->username << "\n";
    std::string username = prompt("New username (Enter to keep): ");
    if (!username.empty())
        changes.username = username;

    std::string password = prompt("New password (Enter to keep): ");
    if (closed)
        return;
    if (!password.empty())
        changes.password = auth.hash_password(password);

    if (user->is_customer()) {
        out << "Current customer type: " << customer_type_name(user->customer_type) << "\n";
        std::string choice = prompt("New customer type (1. Member 2. Regular, Enter to keep): ");
        std::optional<CustomerType> type = customer_type_choice(choice);
        if (type)
            changes.customer_type = type;

        out << "Current balance: " << money(user->balance) << "\n";
        std::string balance_text = prompt("New balance (Enter to keep): ");
        if (closed)
            return;
        if (!balance_text.empty()) {
            std::optional<double> balance = parse_decimal(balance_text);
            if (balance && *balance >= 0.0)
                changes.balance = balance;
            else
                out << "Invalid balance, keeping " << money(user->balance) << "\n";
        }
    }

    switch (users.update(*id, changes)) {
        case StoreResult::Ok:
            out << "User updated\n";
            break;
        case StoreResult::Duplicate:
            out << "Username already exists!\n";
            break;
        case StoreResult::NotFound:
            out << "User not found\n";
            break;
        case StoreResult::Invalid:
            out << "Invalid user data\n";
            break;
    }
}

void Console::deleteUser() {
    std::optional<int> id = promptId("ID of the user to delete: ");
    if (!id)
        return;

    if (!users.find(*id)) {
        out << "User not found\n";
        return;
    }

    if (!confirm("Delete this user?"))
        return;

    if (users.remove(*id) == StoreResult::Ok)
        out << "User deleted\n";
    else
        out << "User not found\n";
}

void Console::listRooms() {
    if (rooms.empty()) {
        out << "No rooms on record\n";
        return;
    }

    out << "----- Rooms -----\n";
    for (const auto& room : rooms.list()) {
        out << "ID: " << room.id << ", type: " << room.type << ", price: " << money(room.price)
            << ", total: " << room.total << ", available: " << room.available << "\n";
    }
}

void Console::addRoom() {
    out << "----- Add room -----\n";
    std::string type = prompt("Room type: ");
    std::optional<double> price = parse_decimal(prompt("Price: "));
    if (closed)
        return;
    if (!price || *price < 0.0) {
        out << "Invalid price\n";
        return;
    }

    std::optional<int> total = parse_int(prompt("Number of rooms: "));
    if (closed)
        return;
    if (!total || *total < 0) {
        out << "Invalid number of rooms\n";
        return;
    }

    if (!rooms.add(type, *price, *total)) {
        out << "Invalid room data\n";
        return;
    }
    out << "Room added\n";
}

void Console::updateRoom() {
    std::optional<int> id = promptId("ID of the room to update: ");
    if (!id)
        return;

    const Room* room = rooms.find(*id);
    if (!room) {
        out << "Room not found\n";
        return;
    }

    RoomChanges changes;

    out << "Current type: " << room->type << "\n";
    std::string type = prompt("New type (Enter to keep): ");
    if (!type.empty())
        changes.type = type;

    out << "Current price: " << money(room->price) << "\n";
    std::string price_text = prompt("New price (Enter to keep): ");
    if (!price_text.empty()) {
        std::optional<double> price = parse_decimal(price_text);
        if (price && *price >= 0.0)
            changes.price = price;
        else
            out << "Invalid price, keeping the current one\n";
    }

    out << "Current total: " << room->total << "\n";
    std::string total_text = prompt("New total (Enter to keep): ");
    if (closed)
        return;
    if (!total_text.empty()) {
        std::optional<int> total = parse_int(total_text);
        if (total && *total >= 0)
            changes.total = total;
        else
            out << "Invalid number of rooms, keeping the current one\n";
    }

    switch (rooms.update(*id, changes)) {
        case StoreResult::Ok:
            out << "Room updated\n";
            break;
        case StoreResult::NotFound:
            out << "Room not found\n";
            break;
        case StoreResult::Duplicate:
        case StoreResult::Invalid:
            out << "Invalid room data\n";
            break;
    }
}

void Console::deleteRoom() {
    std::optional<int> id = promptId("ID of the room to delete: ");
    if (!id)
        return;

    if (!rooms.find(*id)) {
        out << "Room not found\n";
        return;
    }

    if (!confirm("Delete this room?"))
        return;

    if (rooms.remove(*id) == StoreResult::Ok)
        out << "Room deleted\n";
    else
        out << "Room not found\n";
}

// ------------------------- Customer -------------------------

void Console::customerMenu(int customer_id) {
    while (!closed) {
        out << kRule << "\n";
        out << "Customer menu\n";
        out << "1. List rooms\n";
        out << "2. Book a room\n";
        out << "3. Show balance\n";
        out << "4. Log out\n";
        std::string choice = prompt("Choose an option: ");
        if (closed)
            return;

        try {
            if (choice == "1") {
                listRooms();
            }
            else if (choice == "2") {
                bookRoom(customer_id);
            }
            else if (choice == "3") {
                showBalance(customer_id);
            }
            else if (choice == "4") {
                out << "Logged out\n";
                return;
            }
            else {
                invalidChoice();
            }
        } catch (const std::exception& ex) {
            out << "Error: " << ex.what() << "\n";
        }
    }
}

void Console::bookRoom(int customer_id) {
    if (rooms.empty()) {
        out << "No rooms available for booking\n";
        return;
    }

    listRooms();
    std::optional<int> room_id = promptId("ID of the room to book: ");
    if (!room_id)
        return;

    const Room* room = rooms.find(*room_id);
    if (!room) {
        out << "Room not found\n";
        return;
    }

    out << "Selected: " << room->type << ", price: " << money(room->price)
        << ", available: " << room->available << "\n";

    std::optional<int> quantity = parse_int(prompt("Quantity: "));
    if (closed)
        return;
    if (!quantity || *quantity <= 0) {
        out << "Invalid quantity\n";
        return;
    }

    BookingResult result = booking.book(customer_id, *room_id, *quantity);
    if (!result.ok()) {
        out << result.message << "\n";
        return;
    }

    out << "Booking successful! Charged " << money(result.cost)
        << ", remaining balance: " << money(result.balance) << "\n";
}

void Console::showBalance(int customer_id) {
    const User* user = users.find(customer_id);
    if (!user) {
        out << "User not found\n";
        return;
    }
    out << "Current balance: " << money(user->balance) << "\n";
}
