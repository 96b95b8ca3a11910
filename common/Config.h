#pragma once

#include <string>

struct Config {
    std::string users_file = "users.json";
    std::string rooms_file = "rooms.json";

    std::string default_admin_username = "admin";
    std::string default_admin_password = "admin";

    // Starting balance for every new customer account
    double default_balance = 1000.0;
};
