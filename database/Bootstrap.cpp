#include "Bootstrap.h"
#include "../common/Config.h"
#include "../store/UserStore.h"
#include "../store/RoomStore.h"
#include "../auth/AuthManager.h"

#include <iostream>
#include <stdexcept>

void load_or_seed(UserStore& users, RoomStore& rooms, AuthManager& auth, const Config& config) {
    if (!users.load()) {
        std::cout << "No user data found, seeding default admin account '"
                  << config.default_admin_username << "'\n";

        std::optional<int> id = auth.create_user(config.default_admin_username,
                                                 config.default_admin_password,
                                                 Role::Admin, CustomerType::None);
        if (!id) {
            throw std::runtime_error("Failed to seed default admin account");
        }
    }

    if (!rooms.load()) {
        std::cout << "No room data found, starting with an empty room list\n";
        rooms.save();
    }
}
