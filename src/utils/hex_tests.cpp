#include "hex.hpp"
#include <cctype>
#include <gtest/gtest.h>

using namespace shortid::utils;

class HexTest : public ::testing::Test {
protected:
    void SetUp() override { }
    void TearDown() override { }
};

TEST_F(HexTest, FormatsTwoLowercaseDigitsPerByte)
{
    const std::array<std::uint8_t, 4> bytes{0x00, 0x0f, 0xa0, 0xff};
    EXPECT_EQ(to_hex(bytes), "000fa0ff");
}

TEST_F(HexTest, EmptyInputGivesEmptyString)
{
    EXPECT_EQ(to_hex(nullptr, 0), "");
}

TEST_F(HexTest, OutputLengthIsTwiceTheInput)
{
    const std::array<std::uint8_t, 12> bytes{};
    const std::string hex = to_hex(bytes);

    EXPECT_EQ(hex.length(), 24);
    for (char c: hex)
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c)));
}
