#include "common/TextInput.h"

#include <gtest/gtest.h>

TEST(TextInputTest, TrimStripsSurroundingWhitespace) {
    EXPECT_EQ(trim("  alice \r\n"), "alice");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim("a b"), "a b");
}

TEST(TextInputTest, ParseIntAcceptsWholeNumbersOnly) {
    EXPECT_EQ(parse_int("42"), 42);
    EXPECT_EQ(parse_int(" -3 "), -3);
    EXPECT_FALSE(parse_int("").has_value());
    EXPECT_FALSE(parse_int("4x").has_value());
    EXPECT_FALSE(parse_int("1.5").has_value());
    EXPECT_FALSE(parse_int("abc").has_value());
    EXPECT_FALSE(parse_int("99999999999999").has_value());
}

TEST(TextInputTest, ParseDecimalRejectsGarbageAndNonFinite) {
    EXPECT_DOUBLE_EQ(*parse_decimal("12.5"), 12.5);
    EXPECT_DOUBLE_EQ(*parse_decimal("1e3"), 1000.0);
    EXPECT_FALSE(parse_decimal("12,5").has_value());
    EXPECT_FALSE(parse_decimal("nan").has_value());
    EXPECT_FALSE(parse_decimal("inf").has_value());
    EXPECT_FALSE(parse_decimal("").has_value());
}

TEST(TextInputTest, ParseDecimalRejectsHexadecimal) {
    EXPECT_FALSE(parse_decimal("0x10").has_value());
    EXPECT_FALSE(parse_decimal("-0X1p3").has_value());
    EXPECT_FALSE(parse_decimal(" +0x1.8 ").has_value());
    EXPECT_DOUBLE_EQ(*parse_decimal("0.5"), 0.5);
    EXPECT_DOUBLE_EQ(*parse_decimal("0"), 0.0);
}
