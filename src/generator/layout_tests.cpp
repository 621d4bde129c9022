#include "id_generator.hpp"
#include "layout.hpp"
#include <gtest/gtest.h>

using namespace shortid;

class LayoutTest : public ::testing::Test {
protected:
    void SetUp() override { }
    void TearDown() override { }
};

TEST_F(LayoutTest, TablesTileTheirIdentifiers)
{
    EXPECT_TRUE(layout::tiles<layout::uuid_v1::size>(layout::uuid_v1::fields));
    EXPECT_TRUE(layout::tiles<layout::short_128::size>(layout::short_128::fields));
    EXPECT_TRUE(layout::tiles<layout::short_96::size>(layout::short_96::fields));
    EXPECT_TRUE(layout::tiles<layout::short_64::size>(layout::short_64::fields));
}

TEST_F(LayoutTest, TilesRejectsGapsAndShortTables)
{
    constexpr std::array<layout::bit_field, 2> gap{{{"a", 0, 8}, {"b", 9, 7}}};
    constexpr std::array<layout::bit_field, 1> too_short{{{"a", 0, 8}}};
    EXPECT_FALSE(layout::tiles<2>(gap));
    EXPECT_FALSE(layout::tiles<2>(too_short));
}

TEST_F(LayoutTest, EncodeWritesBigEndianAtBitOffset)
{
    std::array<std::uint8_t, 4> bytes{};
    layout::encode(bytes, {"f", 4, 16}, 0xABCD);

    EXPECT_EQ(bytes[0], 0x0A);
    EXPECT_EQ(bytes[1], 0xBC);
    EXPECT_EQ(bytes[2], 0xD0);
    EXPECT_EQ(bytes[3], 0x00);
}

TEST_F(LayoutTest, EncodeMasksValueToFieldWidth)
{
    std::array<std::uint8_t, 2> bytes{};
    layout::encode(bytes, {"f", 0, 4}, 0xFF);

    EXPECT_EQ(bytes[0], 0xF0);
    EXPECT_EQ(bytes[1], 0x00);
}

TEST_F(LayoutTest, EncodeLeavesNeighbouringBitsAlone)
{
    std::array<std::uint8_t, 2> bytes{0xFF, 0xFF};
    layout::encode(bytes, {"f", 6, 4}, 0);

    EXPECT_EQ(bytes[0], 0xFC);
    EXPECT_EQ(bytes[1], 0x3F);
}

TEST_F(LayoutTest, DecodeReadsBackEncodedFields)
{
    bytes12 id{};
    layout::encode(id, layout::short_96::time, 0x3'FFFF'FFFF'FFULL);
    layout::encode(id, layout::short_96::sequence, 0x1234);
    layout::encode(id, layout::short_96::worker_id, 0xBEEF);
    layout::encode(id, layout::short_96::machine_id, 0x0A0B0C);

    EXPECT_EQ(layout::decode(id, layout::short_96::time), 0x3'FFFF'FFFF'FFULL);
    EXPECT_EQ(layout::decode(id, layout::short_96::sequence), 0x1234u);
    EXPECT_EQ(layout::decode(id, layout::short_96::worker_id), 0xBEEFu);
    EXPECT_EQ(layout::decode(id, layout::short_96::machine_id), 0x0A0B0Cu);
}

TEST_F(LayoutTest, FullWidthFieldIsNotMasked)
{
    bytes8 id{};
    layout::encode(id, {"all", 0, 64}, 0x0102030405060708ULL);

    EXPECT_EQ(id, (bytes8{1, 2, 3, 4, 5, 6, 7, 8}));
    EXPECT_EQ(layout::decode(id, {"all", 0, 64}), 0x0102030405060708ULL);
}

TEST_F(LayoutTest, OutOfRangeFieldThrows)
{
    bytes8 id{};
    EXPECT_THROW(layout::encode(id, {"f", 60, 8}, 1), std::out_of_range);
    EXPECT_THROW(layout::decode(id, {"f", 0, 0}), std::out_of_range);
    EXPECT_THROW(layout::decode(id, {"f", 0, 65}), std::out_of_range);
}

TEST_F(LayoutTest, DiscriminatorBytesAreReadBigEndian)
{
    EXPECT_EQ(layout::to_uint(std::array<std::uint8_t, 3>{1, 2, 3}), 0x010203u);
    EXPECT_EQ(layout::to_uint(std::array<std::uint8_t, 6>{1, 2, 3, 4, 5, 6}), 0x010203040506ULL);
}
