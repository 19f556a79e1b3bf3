#include "xfsfix/image_builder.hpp"

#include "test_base.hpp"
#include "xfsfix/seed_table.hpp"
#include "xfsfix/super_block.hpp"
using namespace XFSFIX;
namespace {
class ImageBuilderTest : public ::testing::TestWithParam<int64_t>, public TestBaseBasic {
   protected:
    int64_t logical_size = GetParam() * size_mib;
    std::string disk_name;

   public:
    void SetUp() override {
        disk_name = tmp_name("base");
        ImageBuilder::create(disk_name.c_str(), logical_size);
    }
};

TEST(ImageBuilderBasicTest, create_throw_invalid_path) {
    EXPECT_THROW(ImageBuilder::create("no_such_dir/base.img", size_mib), std::runtime_error);
}

TEST(ImageBuilderBasicTest, create_throw_negative_size) {
    EXPECT_THROW(ImageBuilder::create("_tmp_negative_base.img", -1), std::invalid_argument);
}

class ImageBuilderSmallTest : public ::testing::Test, public TestBaseBasic {};

TEST_F(ImageBuilderSmallTest, create_smaller_than_seed_area) {
    auto disk_name = tmp_name("small");
    int64_t size = 10000;
    ImageBuilder::create(disk_name.c_str(), size);

    EXPECT_EQ(file_size(disk_name), size);
    auto header = read_file(disk_name, 0, sb_header_size);
    auto MB = SuperBlock::decode(header.data(), header.size());
    EXPECT_EQ(MB.data_block_count, 2u);

    for (auto& seed : get_seed_table()) {
        if (seed.offset + seed.payload_len <= size) {
            auto r_data = read_file(disk_name, seed.offset, seed.payload_len);
            EXPECT_TRUE(cmp_data(r_data.data(), seed.payload, seed.payload_len)) << seed.label;
        }
    }
}

TEST_F(ImageBuilderSmallTest, create_overwrites_existing_file) {
    auto disk_name = tmp_name("overwrite");
    write_file(disk_name, DataBufferType(3 * size_mib, 0xEE));

    ImageBuilder::create(disk_name.c_str(), size_mib);

    EXPECT_EQ(file_size(disk_name), size_mib);
    auto tail = read_file(disk_name, size_mib - 4096, 4096);
    for (auto byte : tail) {
        ASSERT_EQ(byte, 0);
    }
}

TEST_P(ImageBuilderTest, physical_size_equals_logical_size) { EXPECT_EQ(file_size(disk_name), logical_size); }

TEST_P(ImageBuilderTest, magic_at_offset_zero) {
    auto magic = read_file(disk_name, sb_offset_magic, sizeof(sb_magic_seq_lut));
    ASSERT_EQ(magic.size(), sizeof(sb_magic_seq_lut));
    EXPECT_TRUE(cmp_data(magic.data(), sb_magic_seq_lut, sizeof(sb_magic_seq_lut)));
}

TEST_P(ImageBuilderTest, block_count_matches_physical_size) {
    auto header = read_file(disk_name, 0, sb_header_size);
    auto MB = SuperBlock::decode(header.data(), header.size());

    EXPECT_EQ(MB.block_size, fs_block_size);
    EXPECT_EQ(MB.data_block_count, static_cast<uint64_t>(file_size(disk_name)) / MB.block_size);
    EXPECT_EQ(MB.ag_count, fs_ag_count);
    EXPECT_EQ(MB.ag_block_count, MB.data_block_count / fs_ag_count);
    EXPECT_EQ(MB.inode_size, fs_inode_size);
}

TEST_P(ImageBuilderTest, header_matches_encoded_super_block) {
    auto header = read_file(disk_name, 0, sb_header_size);
    EXPECT_EQ(header, SuperBlock::encode(SuperBlock::make(logical_size)));
}

TEST_P(ImageBuilderTest, seeds_written_verbatim) {
    for (auto& seed : get_seed_table()) {
        auto r_data = read_file(disk_name, seed.offset, seed.payload_len);
        ASSERT_EQ(static_cast<int64_t>(r_data.size()), seed.payload_len) << seed.label;
        EXPECT_TRUE(cmp_data(r_data.data(), seed.payload, seed.payload_len)) << seed.label;
    }
}

TEST_P(ImageBuilderTest, gaps_between_seeds_are_zero) {
    auto end = seed_table_end(get_seed_table());
    auto r_data = read_file(disk_name, sb_header_size, end - sb_header_size);

    DataBufferType ref_data(end - sb_header_size, 0);
    for (auto& seed : get_seed_table()) {
        std::memcpy(&ref_data[seed.offset - sb_header_size], seed.payload, seed.payload_len);
    }
    EXPECT_EQ(r_data, ref_data);

    auto after_seeds = read_file(disk_name, end, 4096);
    for (auto byte : after_seeds) {
        ASSERT_EQ(byte, 0);
    }
}

TEST_P(ImageBuilderTest, create_is_deterministic) {
    auto second_name = tmp_name("second");
    ImageBuilder::create(second_name.c_str(), logical_size);

    EXPECT_TRUE(files_equal(disk_name, second_name));
}

TEST_P(ImageBuilderTest, create_returns_written_super_block) {
    auto second_name = tmp_name("returned");
    auto MB = ImageBuilder::create(second_name.c_str(), logical_size);

    EXPECT_EQ(MB.magic, sb_magic);
    EXPECT_EQ(SuperBlock::logical_size(MB), static_cast<uint64_t>(logical_size));
}

INSTANTIATE_TEST_SUITE_P(ImageSize, ImageBuilderTest, testing::ValuesIn(valid_image_sizes_mb));
}
