#include "client/Console.h"
#include "common/Config.h"
#include "database/Database.h"
#include "database/Bootstrap.h"
#include "store/UserStore.h"
#include "store/RoomStore.h"
#include "auth/AuthManager.h"
#include "booking/BookingService.h"
#include "TempDir.h"

#include <gtest/gtest.h>
#include <sstream>

namespace {

Config make_config(const TempDir& dir) {
    Config config;
    config.users_file = dir.file("users.json");
    config.rooms_file = dir.file("rooms.json");
    return config;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

class ConsoleTest : public ::testing::Test {
protected:
    TempDir dir;
    Config config = make_config(dir);
    Database user_db{config.users_file};
    Database room_db{config.rooms_file};
    UserStore users{user_db};
    RoomStore rooms{room_db};
    AuthManager auth{users, config.default_balance};
    BookingService booking{users, rooms};

    int exit_code = -1;

    void SetUp() override {
        load_or_seed(users, rooms, auth, config);
    }

    std::string session(const std::string& script) {
        std::istringstream in(script);
        std::ostringstream out;
        Console console(in, out, users, rooms, auth, booking, config);
        exit_code = console.run();
        return out.str();
    }
};

}

TEST_F(ConsoleTest, ExitOptionEndsWithStatusZero) {
    std::string output = session("3\n");

    EXPECT_EQ(exit_code, 0);
    EXPECT_TRUE(contains(output, "Hotel Management System"));
    EXPECT_TRUE(contains(output, "Goodbye"));
}

TEST_F(ConsoleTest, EndOfInputEndsSession) {
    std::string output = session("1\nadmin\nadmin\n1\n");

    EXPECT_EQ(exit_code, 0);
    EXPECT_TRUE(contains(output, "Input closed"));
}

TEST_F(ConsoleTest, UnknownOptionIsReported) {
    std::string output = session("9\n3\n");
    EXPECT_TRUE(contains(output, "Invalid option, please try again."));
}

TEST_F(ConsoleTest, CustomerRegistersLogsInAndBooks) {
    ASSERT_TRUE(rooms.add("Double", 150.0, 3).has_value());

    std::string output = session(
        "2\nalice\npw\n1\n"         // register as member
        "1\nalice\npw\n"            // log in
        "2\n1\n2\n"                 // book two of room 1
        "3\n"                       // balance
        "4\n3\n");

    EXPECT_TRUE(contains(output, "Registration successful! Starting balance: 1000.00"));
    EXPECT_TRUE(contains(output, "Customer menu"));
    EXPECT_TRUE(contains(output, "Charged 300.00, remaining balance: 700.00"));
    EXPECT_TRUE(contains(output, "Current balance: 700.00"));

    const User* alice = users.find_by_username("alice");
    ASSERT_NE(alice, nullptr);
    EXPECT_EQ(alice->customer_type, CustomerType::Member);
    EXPECT_DOUBLE_EQ(alice->balance, 700.0);
    EXPECT_EQ(rooms.find(1)->available, 1);
}

TEST_F(ConsoleTest, OverbookingLeavesEverythingUnchanged) {
    ASSERT_TRUE(rooms.add("Double", 150.0, 3).has_value());
    ASSERT_TRUE(auth.register_customer("alice", "pw", CustomerType::Regular).has_value());

    std::string output = session("1\nalice\npw\n2\n1\n5\n2\n1\nabc\n4\n3\n");

    EXPECT_TRUE(contains(output, "Requested quantity exceeds the rooms available"));
    EXPECT_TRUE(contains(output, "Invalid quantity"));
    EXPECT_DOUBLE_EQ(users.find_by_username("alice")->balance, 1000.0);
    EXPECT_EQ(rooms.find(1)->available, 3);
}

TEST_F(ConsoleTest, BookingWithoutRoomsIsReported) {
    ASSERT_TRUE(auth.register_customer("alice", "pw", CustomerType::Regular).has_value());

    std::string output = session("1\nalice\npw\n2\n1\n4\n3\n");

    EXPECT_TRUE(contains(output, "No rooms available for booking"));
    EXPECT_TRUE(contains(output, "No rooms on record"));
}

TEST_F(ConsoleTest, DuplicateRegistrationIsRejected) {
    std::string output = session("2\nadmin\n3\n");

    EXPECT_TRUE(contains(output, "Username already exists!"));
    EXPECT_EQ(users.list().size(), 1u);
}

TEST_F(ConsoleTest, WrongPasswordIsRejected) {
    std::string output = session("1\nadmin\nnope\n3\n");

    EXPECT_TRUE(contains(output, "Invalid username or password!"));
    EXPECT_FALSE(contains(output, "Admin menu"));
}

TEST_F(ConsoleTest, AdminManagesRooms) {
    std::string output = session(
        "1\nadmin\nadmin\n2\n"
        "2\nSuite\n450\n2\n"        // add
        "4\n99\n"                   // delete unknown
        "4\nabc\n"                  // non-numeric id
        "3\n1\n\n\n4\n"             // raise total, keep type and price
        "1\n"
        "5\n3\n3\n");

    EXPECT_TRUE(contains(output, "Room added"));
    EXPECT_TRUE(contains(output, "Room not found"));
    EXPECT_TRUE(contains(output, "Invalid ID"));
    EXPECT_TRUE(contains(output, "Room updated"));
    EXPECT_TRUE(contains(output, "ID: 1, type: Suite, price: 450.00, total: 4, available: 4"));

    const Room* room = rooms.find(1);
    ASSERT_NE(room, nullptr);
    EXPECT_EQ(room->type, "Suite");
    EXPECT_DOUBLE_EQ(room->price, 450.0);
    EXPECT_EQ(room->total, 4);
    EXPECT_EQ(room->available, 4);
}

TEST_F(ConsoleTest, InvalidRoomInputAddsNothing) {
    std::string output = session("1\nadmin\nadmin\n2\n2\nSuite\ncheap\n2\nSuite\n100\n-1\n5\n3\n3\n");

    EXPECT_TRUE(contains(output, "Invalid price"));
    EXPECT_TRUE(contains(output, "Invalid number of rooms"));
    EXPECT_TRUE(rooms.empty());
}

TEST_F(ConsoleTest, DeleteNeedsConfirmation) {
    int bob = *auth.register_customer("bob", "pw", CustomerType::Regular);

    session("1\nadmin\nadmin\n1\n4\n2\nn\n5\n3\n3\n");
    EXPECT_NE(users.find(bob), nullptr);

    std::string output = session("1\nadmin\nadmin\n1\n4\n2\nY\n5\n3\n3\n");
    EXPECT_TRUE(contains(output, "User deleted"));
    EXPECT_EQ(users.find(bob), nullptr);
}

TEST_F(ConsoleTest, AdminUpdatesCustomer) {
    int bob = *auth.register_customer("bob", "pw", CustomerType::Member);

    std::string output = session(
        "1\nadmin\nadmin\n1\n"
        "3\n2\n\nnewpw\n2\n50.5\n"  // keep name, new password, regular, balance
        "1\n5\n3\n"
        "1\nbob\nnewpw\n4\n3\n");

    EXPECT_TRUE(contains(output, "User updated"));
    EXPECT_TRUE(contains(output, "ID: 2, username: bob, role: customer, type: regular, balance: 50.50"));

    const User* user = users.find(bob);
    EXPECT_EQ(user->customer_type, CustomerType::Regular);
    EXPECT_DOUBLE_EQ(user->balance, 50.5);
    EXPECT_TRUE(contains(output, "Customer menu"));
}

TEST_F(ConsoleTest, AdminAddsUsers) {
    std::string output = session(
        "1\nadmin\nadmin\n1\n"
        "2\nclerk\npw\n1\n"         // admin
        "2\ncarol\npw\n2\n1\n"      // member customer
        "2\ndave\npw\n7\n"          // bad role
        "2\nclerk\n"                // duplicate
        "5\n3\n3\n");

    EXPECT_TRUE(contains(output, "Invalid role"));
    EXPECT_TRUE(contains(output, "Username already exists!"));
    ASSERT_EQ(users.list().size(), 3u);
    EXPECT_TRUE(users.find_by_username("clerk")->is_admin());
    EXPECT_EQ(users.find_by_username("carol")->customer_type, CustomerType::Member);
    EXPECT_DOUBLE_EQ(users.find_by_username("carol")->balance, 1000.0);
    EXPECT_EQ(users.find_by_username("dave"), nullptr);
}
