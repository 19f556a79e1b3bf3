#include "xfsfix/image_inspector.hpp"

#include "test_base.hpp"
#include "xfsfix/errors.hpp"
#include "xfsfix/image_builder.hpp"
#include "xfsfix/seed_table.hpp"
#include "xfsfix/size_inflator.hpp"
using namespace XFSFIX;
namespace {
class ImageInspectorTest : public ::testing::TestWithParam<int64_t>, public TestBaseBasic {
   protected:
    int64_t logical_size = GetParam() * size_mib;
    std::string disk_name;

   public:
    void SetUp() override {
        disk_name = tmp_name("base");
        ImageBuilder::create(disk_name.c_str(), logical_size);
    }
};

class ImageInspectorBasicTest : public ::testing::Test, public TestBaseBasic {};

TEST_F(ImageInspectorBasicTest, read_throw_missing_image) {
    EXPECT_THROW(ImageInspector::read_super_block("xxx.img"), std::runtime_error);
    EXPECT_THROW(ImageInspector::verify_seeds("xxx.img"), std::runtime_error);
}

TEST_F(ImageInspectorBasicTest, read_throw_foreign_image) {
    auto disk_name = tmp_name("foreign");
    write_file(disk_name, DataBufferType(2 * sb_header_size, 0x42));
    EXPECT_THROW(ImageInspector::read_super_block(disk_name.c_str()), FormatError);
}

TEST_F(ImageInspectorBasicTest, read_throw_short_image) {
    auto disk_name = tmp_name("short");
    write_file(disk_name, DataBufferType(sb_magic_seq_lut, sb_magic_seq_lut + sizeof(sb_magic_seq_lut)));
    EXPECT_THROW(ImageInspector::read_super_block(disk_name.c_str()), FormatError);
}

TEST_F(ImageInspectorBasicTest, verify_seeds_on_truncated_image) {
    auto disk_name = tmp_name("truncated");
    ImageBuilder::create(disk_name.c_str(), 20480 + 4);

    for (auto& check : ImageInspector::verify_seeds(disk_name.c_str())) {
        bool fits = check.seed->offset + check.seed->payload_len <= 20480 + 4;
        EXPECT_EQ(check.present, fits) << check.seed->label;
    }
}

TEST_P(ImageInspectorTest, read_super_block_of_built_image) {
    auto MB = ImageInspector::read_super_block(disk_name.c_str());

    EXPECT_EQ(MB.magic, sb_magic);
    EXPECT_EQ(MB.block_size, fs_block_size);
    EXPECT_EQ(MB.data_block_count, static_cast<uint64_t>(logical_size / fs_block_size));
    EXPECT_EQ(MB.ag_count, fs_ag_count);
    EXPECT_EQ(MB.inode_size, fs_inode_size);
}

TEST_P(ImageInspectorTest, read_super_block_of_inflated_image) {
    auto out_name = tmp_name("big");
    SizeInflator::inflate(disk_name.c_str(), out_name.c_str(), 150 * size_gib, test_inflate_floor);

    auto MB = ImageInspector::read_super_block(out_name.c_str());
    EXPECT_EQ(MB.data_block_count, static_cast<uint64_t>(150 * size_gib / fs_block_size));
    EXPECT_EQ(ImageInspector::physical_size(out_name.c_str()), std::max(logical_size, test_inflate_floor));
}

TEST_P(ImageInspectorTest, physical_size_of_built_image) {
    EXPECT_EQ(ImageInspector::physical_size(disk_name.c_str()), logical_size);
}

TEST_P(ImageInspectorTest, verify_seeds_all_present) {
    auto checks = ImageInspector::verify_seeds(disk_name.c_str());

    ASSERT_EQ(checks.size(), get_seed_table().size());
    for (auto& check : checks) {
        EXPECT_TRUE(check.present) << check.seed->label;
    }
}

TEST_P(ImageInspectorTest, verify_seeds_detect_corruption) {
    auto& table = get_seed_table();
    auto& corrupted = table[1];
    patch_file(disk_name, corrupted.offset + 1, {0x00});

    for (auto& check : ImageInspector::verify_seeds(disk_name.c_str())) {
        EXPECT_EQ(check.present, check.seed != &corrupted) << check.seed->label;
    }
}

INSTANTIATE_TEST_SUITE_P(ImageSize, ImageInspectorTest, testing::ValuesIn(valid_image_sizes_mb));
}
