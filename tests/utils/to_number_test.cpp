#include <gtest/gtest.h>
#include <cstdint>
#include <tlsfp/utils/to_number.hpp>

using namespace tlsfp::utils;

TEST(ToNumberTest, ParsesDecimal)
{
    std::uint16_t value{0};
    std::error_code ec;
    to_number("65535", value, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(value, 65535);
}

TEST(ToNumberTest, OutOfRange)
{
    std::uint8_t value{0};
    std::error_code ec;
    to_number("256", value, ec);
    EXPECT_EQ(ec, std::make_error_code(std::errc::result_out_of_range));
}

TEST(ToNumberTest, RejectsPartialInput)
{
    std::uint16_t value{0};
    std::error_code ec;
    to_number("12ab", value, ec);
    EXPECT_EQ(ec, std::make_error_code(std::errc::invalid_argument));
}

TEST(ToNumberTest, RejectsEmptyAndSigned)
{
    std::uint16_t value{0};

    std::error_code ec;
    to_number("", value, ec);
    EXPECT_TRUE(ec);

    ec.clear();
    to_number("-1", value, ec);
    EXPECT_TRUE(ec);

    ec.clear();
    to_number("+1", value, ec);
    EXPECT_TRUE(ec);
}

TEST(ToNumberTest, ThrowingOverload)
{
    std::uint16_t value{0};
    EXPECT_NO_THROW(to_number("771", value));
    EXPECT_EQ(value, 771);
    EXPECT_ANY_THROW(to_number("x", value));
}
