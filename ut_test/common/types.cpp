#include "common/types.hpp"

#include <limits>

#include "test_base.hpp"
using namespace XFSFIX;
namespace {

TEST(TypesTest, store_be_u32_most_significant_first) {
    uint8_t buf[4] = {};
    store_be<uint32_t>(buf, 0x58465342);

    EXPECT_EQ(buf[0], 'X');
    EXPECT_EQ(buf[1], 'F');
    EXPECT_EQ(buf[2], 'S');
    EXPECT_EQ(buf[3], 'B');
}

TEST(TypesTest, store_be_u64) {
    uint8_t buf[8] = {};
    store_be<uint64_t>(buf, 0x0102030405060708ULL);

    for (int i = 0; i < 8; i++) {
        EXPECT_EQ(buf[i], i + 1);
    }
}

TEST(TypesTest, store_be_u16_does_not_touch_neighbours) {
    uint8_t buf[4] = {0xAA, 0xAA, 0xAA, 0xAA};
    store_be<uint16_t>(buf + 1, 256);

    EXPECT_EQ(buf[0], 0xAA);
    EXPECT_EQ(buf[1], 0x01);
    EXPECT_EQ(buf[2], 0x00);
    EXPECT_EQ(buf[3], 0xAA);
}

TEST(TypesTest, load_be_reads_most_significant_first) {
    const uint8_t buf[8] = {0x00, 0x00, 0x00, 0x00, 0x02, 0x58, 0x00, 0x00};

    EXPECT_EQ(load_be<uint64_t>(buf), 0x0000000002580000ULL);
    EXPECT_EQ(load_be<uint32_t>(buf + 4), 0x02580000U);
    EXPECT_EQ(load_be<uint16_t>(buf + 4), 0x0258);
}

TEST(TypesTest, load_be_max_values) {
    const uint8_t buf[8] = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};

    EXPECT_EQ(load_be<uint64_t>(buf), std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(load_be<uint32_t>(buf), std::numeric_limits<uint32_t>::max());
}
}
