#include "xfsfix/super_block.hpp"

#include "test_base.hpp"
#include "xfsfix/errors.hpp"
using namespace XFSFIX;
namespace {
class SuperBlockTest : public ::testing::TestWithParam<int64_t>, public TestBaseBasic {
   protected:
    int64_t logical_size = GetParam() * size_mib;
    super_block MB = SuperBlock::make(logical_size);
    DataBufferType header = SuperBlock::encode(MB);
};

TEST(SuperBlockBasicTest, make_throw_negative_size) { EXPECT_THROW(SuperBlock::make(-1), std::invalid_argument); }

TEST(SuperBlockBasicTest, make_rounds_down_to_whole_blocks) {
    auto MB = SuperBlock::make(fs_block_size * 10 + fs_block_size - 1);
    EXPECT_EQ(MB.data_block_count, 10u);
    EXPECT_EQ(MB.ag_block_count, 2u);
}

TEST(SuperBlockBasicTest, make_smaller_than_block) {
    auto MB = SuperBlock::make(100);
    EXPECT_EQ(MB.data_block_count, 0u);
    EXPECT_EQ(MB.ag_block_count, 0u);
}

TEST(SuperBlockBasicTest, ag_block_count_zero_ag_guard) {
    EXPECT_EQ(SuperBlock::calc_ag_block_count(1000, 0), 1000u);
    EXPECT_EQ(SuperBlock::calc_ag_block_count(1000, 4), 250u);
    EXPECT_EQ(SuperBlock::calc_ag_block_count(1001, 4), 250u);
}

TEST(SuperBlockBasicTest, ag_block_count_throw_overflow) {
    EXPECT_THROW(SuperBlock::calc_ag_block_count(uint64_t{1} << 40, 4), std::overflow_error);
}

TEST(SuperBlockBasicTest, decode_throw_short_header) {
    auto header = SuperBlock::encode(SuperBlock::make(size_mib));
    EXPECT_THROW(SuperBlock::decode(header.data(), sb_header_size - 1), FormatError);
    EXPECT_THROW(SuperBlock::decode(header.data(), 92), FormatError);
    EXPECT_THROW(SuperBlock::decode(header.data(), 0), FormatError);
}

TEST(SuperBlockBasicTest, decode_throw_magic_mismatch) {
    auto header = SuperBlock::encode(SuperBlock::make(size_mib));
    header[3] = 'C';
    EXPECT_THROW(SuperBlock::decode(header.data(), header.size()), FormatError);
}

TEST(SuperBlockBasicTest, decode_throw_little_endian_magic) {
    auto header = SuperBlock::encode(SuperBlock::make(size_mib));
    header[0] = 'B';
    header[1] = 'S';
    header[2] = 'F';
    header[3] = 'X';
    EXPECT_THROW(SuperBlock::decode(header.data(), header.size()), FormatError);
}

TEST(SuperBlockBasicTest, decode_throw_zero_block_size) {
    auto header = SuperBlock::encode(SuperBlock::make(size_mib));
    store_be<uint32_t>(header.data() + sb_offset_block_size, 0);
    EXPECT_THROW(SuperBlock::decode(header.data(), header.size()), FormatError);
}

TEST(SuperBlockBasicTest, patch_geometry_touches_only_counts) {
    auto header = SuperBlock::encode(SuperBlock::make(size_mib));
    auto ref_header = header;

    super_block MB = SuperBlock::decode(header.data(), header.size());
    MB.data_block_count = 0x0123456789ULL;
    MB.ag_block_count = 0xCAFE;
    SuperBlock::patch_geometry(header.data(), MB);

    EXPECT_EQ(load_be<uint64_t>(header.data() + sb_offset_data_block_count), 0x0123456789ULL);
    EXPECT_EQ(load_be<uint32_t>(header.data() + sb_offset_ag_block_count), 0xCAFEu);
    for (int64_t i = 0; i < sb_header_size; i++) {
        bool in_counts = (i >= sb_offset_data_block_count && i < sb_offset_data_block_count + 8) ||
                         (i >= sb_offset_ag_block_count && i < sb_offset_ag_block_count + 4);
        if (!in_counts) {
            ASSERT_EQ(header[i], ref_header[i]) << "offset " << i;
        }
    }
}

TEST_P(SuperBlockTest, header_is_exactly_header_size) { EXPECT_EQ(static_cast<int64_t>(header.size()), sb_header_size); }

TEST_P(SuperBlockTest, magic_is_xfsb) {
    EXPECT_TRUE(cmp_data(header.data(), sb_magic_seq_lut, sizeof(sb_magic_seq_lut)));
}

TEST_P(SuperBlockTest, fields_at_fixed_offsets) {
    uint64_t n_blocks = logical_size / fs_block_size;

    EXPECT_EQ(load_be<uint32_t>(header.data() + sb_offset_block_size), 4096u);
    EXPECT_EQ(load_be<uint64_t>(header.data() + sb_offset_data_block_count), n_blocks);
    EXPECT_EQ(load_be<uint32_t>(header.data() + sb_offset_ag_block_count), n_blocks / 4);
    EXPECT_EQ(load_be<uint32_t>(header.data() + sb_offset_ag_count), 4u);
    EXPECT_EQ(load_be<uint16_t>(header.data() + sb_offset_inode_size), 256u);
}

TEST_P(SuperBlockTest, unassigned_bytes_are_zero) {
    const std::pair<int64_t, int64_t> fields[] = {
        {sb_offset_magic, 4},           {sb_offset_block_size, 4}, {sb_offset_data_block_count, 8},
        {sb_offset_ag_block_count, 4}, {sb_offset_ag_count, 4},   {sb_offset_inode_size, 2},
    };

    for (int64_t i = 0; i < sb_header_size; i++) {
        bool assigned = false;
        for (auto& field : fields) {
            assigned |= i >= field.first && i < field.first + field.second;
        }
        if (!assigned) {
            ASSERT_EQ(header[i], 0) << "offset " << i;
        }
    }
}

TEST_P(SuperBlockTest, decode_matches_made_record) {
    auto decoded = SuperBlock::decode(header.data(), header.size());

    EXPECT_EQ(decoded.magic, sb_magic);
    EXPECT_EQ(decoded.block_size, MB.block_size);
    EXPECT_EQ(decoded.data_block_count, MB.data_block_count);
    EXPECT_EQ(decoded.ag_block_count, MB.ag_block_count);
    EXPECT_EQ(decoded.ag_count, MB.ag_count);
    EXPECT_EQ(decoded.inode_size, MB.inode_size);
    EXPECT_EQ(SuperBlock::logical_size(decoded), static_cast<uint64_t>(logical_size));
}

TEST_P(SuperBlockTest, encode_into_dirty_buffer_clears_padding) {
    DataBufferType dirty(sb_header_size, 0xAB);
    SuperBlock::encode(MB, dirty.data());
    EXPECT_EQ(dirty, header);
}

INSTANTIATE_TEST_SUITE_P(ImageSize, SuperBlockTest, testing::ValuesIn(valid_image_sizes_mb));
}
