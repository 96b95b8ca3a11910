#include "Console.h"
#include "../common/Config.h"
#include "../database/Database.h"
#include "../database/Bootstrap.h"
#include "../store/UserStore.h"
#include "../store/RoomStore.h"
#include "../auth/AuthManager.h"
#include "../booking/BookingService.h"

#include <iostream>

int main() {
    Config config;

    try {
        Database user_db(config.users_file);
        Database room_db(config.rooms_file);

        UserStore users(user_db);
        RoomStore rooms(room_db);
        AuthManager auth(users, config.default_balance);

        load_or_seed(users, rooms, auth, config);

        BookingService booking(users, rooms);
        Console console(std::cin, std::cout, users, rooms, auth, booking, config);

        return console.run();
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << "\n";
        return 1;
    }
}
