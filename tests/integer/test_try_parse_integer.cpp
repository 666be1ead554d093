#include "integer/integer_parser.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

using namespace numparse;

// ============================================================================
// int32
// ============================================================================

TEST(TryParseInt32Test, ValidNumerals) {
    int32_t v = 0;
    EXPECT_TRUE(try_parse_int32("123", v));
    EXPECT_EQ(v, 123);
    EXPECT_TRUE(try_parse_int32(" -42 ", v));
    EXPECT_EQ(v, -42);
    EXPECT_TRUE(try_parse_int32("+7", v));
    EXPECT_EQ(v, 7);
    EXPECT_TRUE(try_parse_int32("0000012", v));
    EXPECT_EQ(v, 12);
    EXPECT_TRUE(try_parse_int32("-0", v));
    EXPECT_EQ(v, 0);
}

TEST(TryParseInt32Test, RangeLimits) {
    int32_t v = 0;
    EXPECT_TRUE(try_parse_int32("2147483647", v));
    EXPECT_EQ(v, std::numeric_limits<int32_t>::max());
    EXPECT_TRUE(try_parse_int32("-2147483648", v));
    EXPECT_EQ(v, std::numeric_limits<int32_t>::min());
}

TEST(TryParseInt32Test, FailureStoresZero) {
    int32_t v = 99;
    EXPECT_FALSE(try_parse_int32("2147483648", v));
    EXPECT_EQ(v, 0);

    v = 99;
    EXPECT_FALSE(try_parse_int32("-2147483649", v));
    EXPECT_EQ(v, 0);

    v = 99;
    EXPECT_FALSE(try_parse_int32("abc", v));
    EXPECT_EQ(v, 0);

    for (const char* text : {"", "   ", "12.5", "1e3", "1,000", "0x10", "- 1", "1-"}) {
        v = 99;
        EXPECT_FALSE(try_parse_int32(text, v)) << text;
        EXPECT_EQ(v, 0) << text;
    }
}

TEST(TryParseInt32Test, AbsentInput) {
    int32_t v = 5;
    const char* missing = nullptr;
    EXPECT_FALSE(try_parse_int32(missing, v));
    EXPECT_EQ(v, 0);

    v = 5;
    EXPECT_FALSE(try_parse_int32(std::nullopt, v));
    EXPECT_EQ(v, 0);
}

TEST(TryParseInt32Test, OwnedAndViewedText) {
    int32_t v = 0;
    std::string owned = "321";
    EXPECT_TRUE(try_parse_int32(owned, v));
    EXPECT_EQ(v, 321);

    std::string_view view = "  654";
    EXPECT_TRUE(try_parse_int32(view, v));
    EXPECT_EQ(v, 654);

    // A view need not be NUL-terminated
    std::string_view prefix = std::string_view("789xyz").substr(0, 3);
    EXPECT_TRUE(try_parse_int32(prefix, v));
    EXPECT_EQ(v, 789);
}

// ============================================================================
// 8-bit
// ============================================================================

TEST(TryParseInt8Test, Range) {
    int8_t v = 0;
    EXPECT_TRUE(try_parse_int8("127", v));
    EXPECT_EQ(v, 127);
    EXPECT_TRUE(try_parse_int8("-128", v));
    EXPECT_EQ(v, -128);
    EXPECT_FALSE(try_parse_int8("128", v));
    EXPECT_EQ(v, 0);
    EXPECT_FALSE(try_parse_int8("-129", v));
    EXPECT_EQ(v, 0);
}

TEST(TryParseUint8Test, Range) {
    uint8_t v = 0;
    EXPECT_TRUE(try_parse_uint8("255", v));
    EXPECT_EQ(v, 255);
    EXPECT_TRUE(try_parse_uint8("-0", v));
    EXPECT_EQ(v, 0);
    EXPECT_FALSE(try_parse_uint8("256", v));
    EXPECT_EQ(v, 0);
    EXPECT_FALSE(try_parse_uint8("-1", v));
    EXPECT_EQ(v, 0);
    EXPECT_FALSE(try_parse_uint8(nullptr, v));
}

// ============================================================================
// 16-bit
// ============================================================================

TEST(TryParseInt16Test, Range) {
    int16_t v = 0;
    EXPECT_TRUE(try_parse_int16("32767", v));
    EXPECT_EQ(v, 32767);
    EXPECT_TRUE(try_parse_int16("-32768", v));
    EXPECT_EQ(v, -32768);
    EXPECT_FALSE(try_parse_int16("32768", v));
    EXPECT_EQ(v, 0);
}

TEST(TryParseUint16Test, Range) {
    uint16_t v = 0;
    EXPECT_TRUE(try_parse_uint16("65535", v));
    EXPECT_EQ(v, 65535);
    EXPECT_FALSE(try_parse_uint16("65536", v));
    EXPECT_EQ(v, 0);
    EXPECT_FALSE(try_parse_uint16("-1", v));
    EXPECT_EQ(v, 0);
}

// ============================================================================
// 32/64-bit unsigned and 64-bit signed
// ============================================================================

TEST(TryParseUint32Test, Range) {
    uint32_t v = 0;
    EXPECT_TRUE(try_parse_uint32("4294967295", v));
    EXPECT_EQ(v, std::numeric_limits<uint32_t>::max());
    EXPECT_FALSE(try_parse_uint32("4294967296", v));
    EXPECT_EQ(v, 0u);
}

TEST(TryParseUint32Test, AbsentInputDoesNotRaise) {
    uint32_t v = 3;
    const char* missing = nullptr;
    EXPECT_FALSE(try_parse_uint32(missing, v));
    EXPECT_EQ(v, 0u);
}

TEST(TryParseInt64Test, Range) {
    int64_t v = 0;
    EXPECT_TRUE(try_parse_int64("9223372036854775807", v));
    EXPECT_EQ(v, std::numeric_limits<int64_t>::max());
    EXPECT_TRUE(try_parse_int64("-9223372036854775808", v));
    EXPECT_EQ(v, std::numeric_limits<int64_t>::min());
    EXPECT_FALSE(try_parse_int64("9223372036854775808", v));
    EXPECT_EQ(v, 0);
    EXPECT_FALSE(try_parse_int64("-9223372036854775809", v));
    EXPECT_FALSE(try_parse_int64("99999999999999999999999", v));
}

TEST(TryParseUint64Test, Range) {
    uint64_t v = 0;
    EXPECT_TRUE(try_parse_uint64("18446744073709551615", v));
    EXPECT_EQ(v, std::numeric_limits<uint64_t>::max());
    EXPECT_TRUE(try_parse_uint64("000000000000000000018446744073709551615", v));
    EXPECT_EQ(v, std::numeric_limits<uint64_t>::max());
    EXPECT_FALSE(try_parse_uint64("18446744073709551616", v));
    EXPECT_EQ(v, 0u);
    EXPECT_FALSE(try_parse_uint64("-1", v));
}

TEST(TryParseIntegerTest, RepeatedCallsAgree) {
    for (const char* text : {"17", "-17", "abc", "", "300", "9223372036854775808"}) {
        int64_t first = 0;
        int64_t second = 0;
        bool ok_first = try_parse_int64(text, first);
        bool ok_second = try_parse_int64(text, second);
        EXPECT_EQ(ok_first, ok_second) << text;
        EXPECT_EQ(first, second) << text;
    }
}
