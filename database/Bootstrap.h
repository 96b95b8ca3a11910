#pragma once

struct Config;
class UserStore;
class RoomStore;
class AuthManager;

// Loads both collections. A missing users file is created with the default
// admin account, a missing rooms file with an empty list. Corrupt files throw.
void load_or_seed(UserStore& users, RoomStore& rooms, AuthManager& auth, const Config& config);
