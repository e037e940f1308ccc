#include "radix-parser.h"
#include "gtest/gtest.h"
#include <stdio.h>
#include <string>

namespace numsys {

TEST(RadixParserTest, Sanity) {
    ASSERT_EQ(0, RadixParser::ParseByRadix("0", 10));
    ASSERT_EQ(0, RadixParser::ParseByRadix("0", 8));
    ASSERT_EQ(0, RadixParser::ParseByRadix("0", 16));
}

TEST(RadixParserTest, SupportedRadix) {
    EXPECT_TRUE(RadixParser::IsSupportedRadix(8));
    EXPECT_TRUE(RadixParser::IsSupportedRadix(10));
    EXPECT_TRUE(RadixParser::IsSupportedRadix(16));

    EXPECT_FALSE(RadixParser::IsSupportedRadix(0));
    EXPECT_FALSE(RadixParser::IsSupportedRadix(2));
    EXPECT_FALSE(RadixParser::IsSupportedRadix(5));
    EXPECT_FALSE(RadixParser::IsSupportedRadix(-10));
    EXPECT_FALSE(RadixParser::IsSupportedRadix(36));
}

TEST(RadixParserTest, DigitValue) {
    EXPECT_EQ(7, RadixParser::DigitValue('7', 8));
    EXPECT_EQ(-1, RadixParser::DigitValue('8', 8));
    EXPECT_EQ(9, RadixParser::DigitValue('9', 10));
    EXPECT_EQ(-1, RadixParser::DigitValue('A', 10));
    EXPECT_EQ(10, RadixParser::DigitValue('a', 16));
    EXPECT_EQ(15, RadixParser::DigitValue('F', 16));
    EXPECT_EQ(-1, RadixParser::DigitValue('G', 16));
    EXPECT_EQ(-1, RadixParser::DigitValue('-', 10));
    EXPECT_EQ(-1, RadixParser::DigitValue('0', 5));
}

TEST(RadixParserTest, DecimalParsing) {
    EXPECT_EQ(123, RadixParser::ParseByRadix("123", 10));
    EXPECT_EQ(-123, RadixParser::ParseByRadix("-123", 10));
    EXPECT_EQ(7, RadixParser::ParseByRadix("0007", 10));
    EXPECT_EQ(0, RadixParser::ParseByRadix("-0", 10));
    EXPECT_EQ(2147483647, RadixParser::ParseByRadix("2147483647", 10));
    EXPECT_EQ(INT32_MIN, RadixParser::ParseByRadix("-2147483648", 10));
}

TEST(RadixParserTest, OctalParsing) {
    EXPECT_EQ(8, RadixParser::ParseByRadix("10", 8));
    EXPECT_EQ(511, RadixParser::ParseByRadix("777", 8));
    EXPECT_EQ(INT32_MAX, RadixParser::ParseByRadix("17777777777", 8));
    EXPECT_EQ(INT32_MIN, RadixParser::ParseByRadix("20000000000", 8));
    EXPECT_EQ(-1, RadixParser::ParseByRadix("37777777777", 8));
}

TEST(RadixParserTest, HexParsing) {
    EXPECT_EQ(255, RadixParser::ParseByRadix("FF", 16));
    EXPECT_EQ(255, RadixParser::ParseByRadix("ff", 16));
    EXPECT_EQ(255, RadixParser::ParseByRadix("fF", 16));
    EXPECT_EQ(INT32_MAX, RadixParser::ParseByRadix("7FFFFFFF", 16));
    EXPECT_EQ(INT32_MIN, RadixParser::ParseByRadix("80000000", 16));
    EXPECT_EQ(-1, RadixParser::ParseByRadix("FFFFFFFF", 16));
    EXPECT_EQ(-559038737, RadixParser::ParseByRadix("deadbeef", 16));
}

TEST(RadixParserTest, OverflowWrapsAround) {
    EXPECT_EQ(INT32_MIN, RadixParser::ParseByRadix("2147483648", 10));
    EXPECT_EQ(-1, RadixParser::ParseByRadix("4294967295", 10));
    EXPECT_EQ(0, RadixParser::ParseByRadix("4294967296", 10));
    EXPECT_EQ(1410065407, RadixParser::ParseByRadix("9999999999", 10));
    EXPECT_EQ(2147483647, RadixParser::ParseByRadix("-2147483649", 10));

    EXPECT_EQ(0, RadixParser::ParseByRadix("100000000", 16));
    EXPECT_EQ(-1698898192, RadixParser::ParseByRadix("123456789ABCDEF0", 16));
    EXPECT_EQ(-1, RadixParser::ParseByRadix("77777777777", 8));
}

TEST(RadixParserTest, DecimalRoundTrip) {
    const int64_t kStride = 7919 * 1031;
    for (int64_t n = INT32_MIN; n <= INT32_MAX; n += kStride) {
        auto text = std::to_string(n);
        ASSERT_EQ(n, RadixParser::ParseByRadix(text, 10)) << text;
    }
    EXPECT_EQ(INT32_MAX, RadixParser::ParseByRadix(std::to_string(INT32_MAX), 10));
    EXPECT_EQ(INT32_MIN, RadixParser::ParseByRadix(std::to_string(INT32_MIN), 10));
}

TEST(RadixParserTest, OctalAndHexMatchBitPattern) {
    char buf[32];
    const numsys_u64_t kStride = 6151 * 3571;
    for (numsys_u64_t bits = 0; bits <= 0xffffffffu; bits += kStride) {
        auto word = static_cast<numsys_u32_t>(bits);

        snprintf(buf, sizeof(buf), "%o", word);
        ASSERT_EQ(WrapToI32(word), RadixParser::ParseByRadix(buf, 8)) << buf;

        snprintf(buf, sizeof(buf), "%x", word);
        ASSERT_EQ(WrapToI32(word), RadixParser::ParseByRadix(buf, 16)) << buf;
    }
}

TEST(RadixParserTest, LengthAndStringSources) {
    EXPECT_EQ(12, RadixParser::ParseByRadix("1234", 2, 10));
    EXPECT_EQ(0x1a, RadixParser::ParseByRadix(std::string("1a"), 16));

    std::string embedded("1\0" "2", 3);
    auto result = RadixParser::Parse(embedded.data(), embedded.size(), 10);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(RadixError::BAD_FORMAT, result.error().kind);
    EXPECT_EQ(1, result.error().position);
}

TEST(RadixParserTest, InvalidDigitNegative) {
    EXPECT_THROW(RadixParser::ParseByRadix("8", 8), FormatError);
    EXPECT_THROW(RadixParser::ParseByRadix("12A", 10), FormatError);
    EXPECT_THROW(RadixParser::ParseByRadix("FG", 16), FormatError);
    EXPECT_THROW(RadixParser::ParseByRadix(" 1", 10), FormatError);
    EXPECT_THROW(RadixParser::ParseByRadix("1 ", 10), FormatError);
    EXPECT_THROW(RadixParser::ParseByRadix("+1", 10), FormatError);

    auto result = RadixParser::Parse("12X4", 4, 10);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(2, result.error().position);
    EXPECT_EQ(0, result.value());
}

TEST(RadixParserTest, SignOnlyForDecimal) {
    EXPECT_THROW(RadixParser::ParseByRadix("-1", 8), FormatError);
    EXPECT_THROW(RadixParser::ParseByRadix("-1", 16), FormatError);

    auto result = RadixParser::Parse("-F", 2, 16);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(RadixError::BAD_FORMAT, result.error().kind);
    EXPECT_EQ(0, result.error().position);
}

TEST(RadixParserTest, MisplacedSignNegative) {
    auto result = RadixParser::Parse("--1", 3, 10);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(1, result.error().position);

    result = RadixParser::Parse("1-2", 3, 10);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(1, result.error().position);

    EXPECT_THROW(RadixParser::ParseByRadix("-", 10), FormatError);
}

TEST(RadixParserTest, NullAndEmptySource) {
    const char *null_source = nullptr;
    EXPECT_THROW(RadixParser::ParseByRadix(null_source, 10), FormatError);
    EXPECT_THROW(RadixParser::ParseByRadix("", 10), FormatError);
    EXPECT_THROW(RadixParser::ParseByRadix(std::string(), 16), FormatError);
}

TEST(RadixParserTest, UnsupportedRadix) {
    EXPECT_THROW(RadixParser::ParseByRadix("1", 2), ConfigurationError);
    EXPECT_THROW(RadixParser::ParseByRadix("123", 5), ConfigurationError);
    EXPECT_THROW(RadixParser::ParseByRadix("XYZ", 7), ConfigurationError);
    EXPECT_THROW(RadixParser::ParseByRadix("10", 0), ConfigurationError);
    EXPECT_THROW(RadixParser::ParseByRadix("10", -16), ConfigurationError);

    try {
        RadixParser::ParseByRadix("10", 36);
        FAIL() << "radix 36 accepted";
    } catch (const ConfigurationError &e) {
        EXPECT_STREQ("radix must be 8, 10, or 16", e.what());
    }
}

TEST(RadixParserTest, CheckingOrder) {
    // null source is reported before a bad radix
    auto result = RadixParser::Parse(nullptr, 0, 5);
    EXPECT_EQ(RadixError::BAD_FORMAT, result.error().kind);

    // a bad radix is reported before anything in the text
    result = RadixParser::Parse("", 0, 5);
    EXPECT_EQ(RadixError::BAD_RADIX, result.error().kind);
    result = RadixParser::Parse("-Z", 2, 5);
    EXPECT_EQ(RadixError::BAD_RADIX, result.error().kind);

    result = RadixParser::Parse("", 0, 10);
    EXPECT_EQ(RadixError::BAD_FORMAT, result.error().kind);

    const char *null_source = nullptr;
    EXPECT_THROW(RadixParser::ParseByRadix(null_source, 5), FormatError);
    EXPECT_THROW(RadixParser::ParseByRadix("", 5), ConfigurationError);
}

TEST(RadixParserTest, PositiveParsing) {
    EXPECT_EQ(0, RadixParser::ParsePositiveByRadix("0", 10));
    EXPECT_EQ(0, RadixParser::ParsePositiveByRadix("-0", 10));
    EXPECT_EQ(INT32_MAX, RadixParser::ParsePositiveByRadix("7fffffff", 16));

    EXPECT_EQ(511, RadixParser::ParsePositiveFromOctal("777"));
    EXPECT_EQ(1234, RadixParser::ParsePositiveFromDecimal("1234"));
    EXPECT_EQ(0xabc, RadixParser::ParsePositiveFromHex("ABC"));
    EXPECT_EQ(0xab, RadixParser::ParsePositiveFromHex("ABC", 2));
    EXPECT_EQ(1, RadixParser::ParsePositiveFromOctal(std::string("1")));
}

TEST(RadixParserTest, PositiveParsingNegative) {
    EXPECT_THROW(RadixParser::ParsePositiveByRadix("FFFFFFFF", 16), FormatError);
    EXPECT_THROW(RadixParser::ParsePositiveFromDecimal("-1"), FormatError);
    EXPECT_THROW(RadixParser::ParsePositiveFromDecimal("2147483648"), FormatError);
    EXPECT_THROW(RadixParser::ParsePositiveFromOctal("20000000000"), FormatError);
    EXPECT_THROW(RadixParser::ParsePositiveFromHex("-1"), FormatError);
    EXPECT_THROW(RadixParser::ParsePositiveFromOctal("9"), FormatError);
    EXPECT_THROW(RadixParser::ParsePositiveByRadix("1", 5), ConfigurationError);

    try {
        RadixParser::ParsePositiveByRadix("-42", 10);
        FAIL() << "negative number accepted";
    } catch (const FormatError &e) {
        EXPECT_STREQ("source does not represent a positive number", e.what());
    }
}

TEST(RadixParserTest, ErrorsAreInvalidArguments) {
    EXPECT_THROW(RadixParser::ParseByRadix("Q", 10), std::invalid_argument);
    EXPECT_THROW(RadixParser::ParseByRadix("1", 3), std::invalid_argument);
}

TEST(RadixParserTest, TryParsing) {
    numsys_i32_t value = 0;
    EXPECT_TRUE(RadixParser::TryParseByRadix("-77", 10, &value));
    EXPECT_EQ(-77, value);

    EXPECT_TRUE(RadixParser::TryParseByRadix("FFFFFFFF", 16, &value));
    EXPECT_EQ(-1, value);

    EXPECT_TRUE(RadixParser::TryParseByRadix("7654", 2, 8, &value));
    EXPECT_EQ(62, value);

    EXPECT_TRUE(RadixParser::TryParseByRadix("-12x", 3, 10, &value));
    EXPECT_EQ(-12, value);

    EXPECT_TRUE(RadixParser::TryParsePositiveByRadix("ffff", 2, 16, &value));
    EXPECT_EQ(255, value);
}

TEST(RadixParserTest, TryParsingNegative) {
    numsys_i32_t value = 42;
    EXPECT_FALSE(RadixParser::TryParseByRadix("XYZ", 10, &value));
    EXPECT_EQ(0, value);

    value = 42;
    const char *null_source = nullptr;
    EXPECT_FALSE(RadixParser::TryParseByRadix(null_source, 16, &value));
    EXPECT_EQ(0, value);

    value = 42;
    EXPECT_FALSE(RadixParser::TryParseByRadix(std::string("-"), 10, &value));
    EXPECT_EQ(0, value);
}

TEST(RadixParserTest, TryParsingRethrowsUnsupportedRadix) {
    numsys_i32_t value = 42;
    EXPECT_THROW(RadixParser::TryParseByRadix("123", 5, &value),
                 ConfigurationError);
    EXPECT_THROW(RadixParser::TryParseByRadix("XYZ", 36, &value),
                 ConfigurationError);
    EXPECT_THROW(RadixParser::TryParsePositiveByRadix("-1", 2, &value),
                 ConfigurationError);
    EXPECT_EQ(42, value);
}

TEST(RadixParserTest, TryPositiveParsing) {
    numsys_i32_t value = 0;
    EXPECT_TRUE(RadixParser::TryParsePositiveFromOctal("777", &value));
    EXPECT_EQ(511, value);

    EXPECT_TRUE(RadixParser::TryParsePositiveFromDecimal("-0", &value));
    EXPECT_EQ(0, value);

    EXPECT_TRUE(RadixParser::TryParsePositiveFromHex(std::string("7fffffff"), &value));
    EXPECT_EQ(INT32_MAX, value);

    EXPECT_TRUE(RadixParser::TryParsePositiveByRadix("10", 16, &value));
    EXPECT_EQ(16, value);
}

TEST(RadixParserTest, TryPositiveParsingNegative) {
    numsys_i32_t value = 42;
    EXPECT_FALSE(RadixParser::TryParsePositiveFromHex("FFFFFFFF", &value));
    EXPECT_EQ(0, value);

    value = 42;
    EXPECT_FALSE(RadixParser::TryParsePositiveFromDecimal("-5", &value));
    EXPECT_EQ(0, value);

    value = 42;
    EXPECT_FALSE(RadixParser::TryParsePositiveFromOctal("18", &value));
    EXPECT_EQ(0, value);

    value = 42;
    EXPECT_FALSE(RadixParser::TryParsePositiveByRadix("", 10, &value));
    EXPECT_EQ(0, value);
}

} // namespace numsys
