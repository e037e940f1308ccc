#include "radix-error.h"
#include "gtest/gtest.h"

namespace numsys {

TEST(RadixErrorTest, Sanity) {
    auto error = RadixError::NoError();
    ASSERT_TRUE(error.ok());
    ASSERT_EQ(RadixError::NONE, error.kind);
    EXPECT_EQ(-1, error.position);
    EXPECT_EQ("ok", error.ToString());
}

TEST(RadixErrorTest, Kinds) {
    EXPECT_EQ(RadixError::BAD_FORMAT, RadixError::NullSource().kind);
    EXPECT_EQ(RadixError::BAD_FORMAT, RadixError::EmptySource().kind);
    EXPECT_EQ(RadixError::BAD_FORMAT, RadixError::InvalidDigit(0).kind);
    EXPECT_EQ(RadixError::BAD_FORMAT, RadixError::NoDigits().kind);
    EXPECT_EQ(RadixError::BAD_FORMAT, RadixError::NotPositive().kind);
    EXPECT_EQ(RadixError::BAD_RADIX, RadixError::UnsupportedRadix(7).kind);
    EXPECT_FALSE(RadixError::UnsupportedRadix(7).ok());
}

TEST(RadixErrorTest, ToString) {
    EXPECT_EQ("source value is null", RadixError::NullSource().ToString());
    EXPECT_EQ("radix must be 8, 10, or 16",
              RadixError::UnsupportedRadix(2).ToString());
    EXPECT_EQ("[3] source does not represent a valid number in the given "
              "numeral system", RadixError::InvalidDigit(3).ToString());
}

TEST(RadixErrorTest, Throwing) {
    EXPECT_THROW(RadixError::UnsupportedRadix(2).Throw(), ConfigurationError);
    EXPECT_THROW(RadixError::EmptySource().Throw(), FormatError);

    try {
        RadixError::InvalidDigit(0).Throw();
        FAIL() << "nothing thrown";
    } catch (const FormatError &e) {
        EXPECT_STREQ("[0] source does not represent a valid number in the "
                     "given numeral system", e.what());
    }
}

TEST(RadixErrorDeathTest, ThrowingNoError) {
    EXPECT_DEATH(RadixError::NoError().Throw(), "no error to throw");
}

} // namespace numsys
