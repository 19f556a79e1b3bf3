#include "xfsfix/size_inflator.hpp"

#include <filesystem>

#include "test_base.hpp"
#include "xfsfix/errors.hpp"
#include "xfsfix/image_builder.hpp"
#include "xfsfix/seed_table.hpp"
#include "xfsfix/super_block.hpp"
using namespace XFSFIX;
namespace {
class SizeInflatorTest : public ::testing::TestWithParam<int64_t>, public TestBaseBasic {
   protected:
    int64_t base_size = GetParam() * size_mib;
    std::string base_name;
    std::string out_name;

   public:
    void SetUp() override {
        base_name = tmp_name("base");
        out_name = tmp_name("big");
        ImageBuilder::create(base_name.c_str(), base_size);
    }

    super_block read_out_super_block() {
        auto header = read_file(out_name, 0, sb_header_size);
        return SuperBlock::decode(header.data(), header.size());
    }
};

class SizeInflatorRejectTest : public ::testing::Test, public TestBaseBasic {};

TEST_P(SizeInflatorTest, block_count_matches_target) {
    const int64_t targets[] = {150 * size_gib, 150 * size_gib + 4095, 1 * size_gib + 1, 4096, 1};

    for (auto target : targets) {
        SizeInflator::inflate(base_name.c_str(), out_name.c_str(), target, test_inflate_floor);
        auto MB = read_out_super_block();

        EXPECT_EQ(MB.data_block_count, static_cast<uint64_t>(target) / fs_block_size) << target;
        EXPECT_EQ(SuperBlock::logical_size(MB), static_cast<uint64_t>(target / fs_block_size * fs_block_size))
            << target;
    }
}

TEST_P(SizeInflatorTest, ag_block_count_recomputed) {
    SizeInflator::inflate(base_name.c_str(), out_name.c_str(), 150 * size_gib, test_inflate_floor);
    auto MB = read_out_super_block();

    EXPECT_EQ(MB.ag_count, fs_ag_count);
    EXPECT_EQ(MB.ag_block_count, MB.data_block_count / fs_ag_count);
}

TEST_P(SizeInflatorTest, ag_block_count_zero_ag_guard) {
    DataBufferType zero_ag(4, 0);
    patch_file(base_name, sb_offset_ag_count, zero_ag);

    SizeInflator::inflate(base_name.c_str(), out_name.c_str(), 8 * size_gib, test_inflate_floor);
    auto MB = read_out_super_block();

    EXPECT_EQ(MB.ag_count, 0u);
    EXPECT_EQ(MB.ag_block_count, MB.data_block_count);
}

TEST_P(SizeInflatorTest, ag_count_taken_from_header) {
    DataBufferType ag_count(4, 0);
    store_be<uint32_t>(ag_count.data(), 16);
    patch_file(base_name, sb_offset_ag_count, ag_count);

    SizeInflator::inflate(base_name.c_str(), out_name.c_str(), 8 * size_gib, test_inflate_floor);
    auto MB = read_out_super_block();

    EXPECT_EQ(MB.ag_count, 16u);
    EXPECT_EQ(MB.ag_block_count, MB.data_block_count / 16);
}

TEST_P(SizeInflatorTest, physical_size_is_max_of_input_and_floor) {
    const int64_t min_sizes[] = {base_size / 2, base_size, base_size + 4096, 3 * base_size};

    for (auto min_size : min_sizes) {
        SizeInflator::inflate(base_name.c_str(), out_name.c_str(), 150 * size_gib, min_size);
        EXPECT_EQ(file_size(out_name), std::max(base_size, min_size)) << min_size;
    }
}

TEST_P(SizeInflatorTest, report_describes_rewrite) {
    auto report = SizeInflator::inflate(base_name.c_str(), out_name.c_str(), 150 * size_gib, test_inflate_floor);

    EXPECT_EQ(report.block_size, fs_block_size);
    EXPECT_EQ(report.orig_block_count, static_cast<uint64_t>(base_size / fs_block_size));
    EXPECT_EQ(report.orig_ag_block_count, static_cast<uint32_t>(base_size / fs_block_size / fs_ag_count));
    EXPECT_EQ(report.new_block_count, static_cast<uint64_t>(150 * size_gib / fs_block_size));
    EXPECT_EQ(report.new_ag_block_count, static_cast<uint32_t>(150 * size_gib / fs_block_size / fs_ag_count));
    EXPECT_EQ(report.physical_size, file_size(out_name));
}

TEST_P(SizeInflatorTest, only_counts_change) {
    SizeInflator::inflate(base_name.c_str(), out_name.c_str(), 150 * size_gib, test_inflate_floor);

    auto ref_header = read_file(base_name, 0, sb_header_size);
    auto header = read_file(out_name, 0, sb_header_size);
    auto ref_MB = SuperBlock::decode(ref_header.data(), ref_header.size());
    auto MB = SuperBlock::decode(header.data(), header.size());
    SuperBlock::patch_geometry(ref_header.data(), MB);

    EXPECT_EQ(header, ref_header);
    EXPECT_EQ(MB.block_size, ref_MB.block_size);
    EXPECT_EQ(MB.inode_size, ref_MB.inode_size);

    for (auto& seed : get_seed_table()) {
        auto r_data = read_file(out_name, seed.offset, seed.payload_len);
        ASSERT_EQ(static_cast<int64_t>(r_data.size()), seed.payload_len) << seed.label;
        EXPECT_TRUE(cmp_data(r_data.data(), seed.payload, seed.payload_len)) << seed.label;
    }
}

TEST_P(SizeInflatorTest, padding_is_zero) {
    int64_t min_size = base_size + 2 * 4096;
    SizeInflator::inflate(base_name.c_str(), out_name.c_str(), 150 * size_gib, min_size);

    auto padding = read_file(out_name, base_size, min_size - base_size);
    ASSERT_EQ(static_cast<int64_t>(padding.size()), min_size - base_size);
    for (auto byte : padding) {
        ASSERT_EQ(byte, 0);
    }
}

TEST_P(SizeInflatorTest, input_left_untouched) {
    auto copy_name = tmp_name("copy");
    ImageBuilder::create(copy_name.c_str(), base_size);

    SizeInflator::inflate(base_name.c_str(), out_name.c_str(), 150 * size_gib, test_inflate_floor);

    EXPECT_TRUE(files_equal(base_name, copy_name));
}

TEST_P(SizeInflatorTest, reject_corrupted_magic) {
    DataBufferType bad_magic = {'X', 'F', 'S', 'C'};
    patch_file(base_name, sb_offset_magic, bad_magic);

    EXPECT_THROW(SizeInflator::inflate(base_name.c_str(), out_name.c_str(), 150 * size_gib, test_inflate_floor),
                 FormatError);
    EXPECT_FALSE(file_exists(out_name));
}

TEST_P(SizeInflatorTest, reject_keeps_existing_output) {
    DataBufferType old_output(100, 0x11);
    write_file(out_name, old_output);
    DataBufferType bad_magic(4, 0);
    patch_file(base_name, sb_offset_magic, bad_magic);

    EXPECT_THROW(SizeInflator::inflate(base_name.c_str(), out_name.c_str(), 150 * size_gib, test_inflate_floor),
                 FormatError);
    EXPECT_EQ(read_file(out_name, 0, 1000), old_output);
}

TEST_F(SizeInflatorRejectTest, reject_short_input) {
    auto short_name = tmp_name("short");
    auto out_name = tmp_name("out");
    auto header = SuperBlock::encode(SuperBlock::make(size_mib));
    header.resize(92);
    write_file(short_name, header);

    EXPECT_THROW(SizeInflator::inflate(short_name.c_str(), out_name.c_str(), size_gib, test_inflate_floor),
                 FormatError);
    EXPECT_FALSE(file_exists(out_name));
}

TEST_F(SizeInflatorRejectTest, reject_empty_input) {
    auto empty_name = tmp_name("empty");
    auto out_name = tmp_name("out");
    write_file(empty_name, {});

    EXPECT_THROW(SizeInflator::inflate(empty_name.c_str(), out_name.c_str(), size_gib, test_inflate_floor),
                 FormatError);
    EXPECT_FALSE(file_exists(out_name));
}

TEST_F(SizeInflatorRejectTest, reject_missing_input) {
    auto out_name = tmp_name("out");
    EXPECT_THROW(SizeInflator::inflate("no_such_input.img", out_name.c_str(), size_gib, test_inflate_floor),
                 std::runtime_error);
    EXPECT_FALSE(file_exists(out_name));
}

TEST_F(SizeInflatorRejectTest, reject_unwritable_output) {
    auto base_name = tmp_name("base");
    ImageBuilder::create(base_name.c_str(), size_mib);

    EXPECT_THROW(SizeInflator::inflate(base_name.c_str(), "no_such_dir/out.img", size_gib, test_inflate_floor),
                 std::runtime_error);
}

TEST_F(SizeInflatorRejectTest, uncreatable_output_is_not_removed) {
    auto base_name = tmp_name("base");
    auto dir_name = tmp_name("dir");
    ImageBuilder::create(base_name.c_str(), size_mib);
    std::filesystem::create_directory(dir_name);

    EXPECT_THROW(SizeInflator::inflate(base_name.c_str(), dir_name.c_str(), size_gib, test_inflate_floor),
                 std::runtime_error);
    EXPECT_TRUE(std::filesystem::is_directory(dir_name));
}

TEST_F(SizeInflatorRejectTest, header_only_input) {
    auto header_name = tmp_name("header");
    auto out_name = tmp_name("out");
    write_file(header_name, SuperBlock::encode(SuperBlock::make(size_mib)));

    SizeInflator::inflate(header_name.c_str(), out_name.c_str(), size_gib, test_inflate_floor);

    EXPECT_EQ(file_size(out_name), test_inflate_floor);
    auto header = read_file(out_name, 0, sb_header_size);
    EXPECT_EQ(SuperBlock::decode(header.data(), header.size()).data_block_count,
              static_cast<uint64_t>(size_gib / fs_block_size));
}

TEST_F(SizeInflatorRejectTest, default_floor_example_scenario) {
    auto base_name = tmp_name("base");
    auto out_name = tmp_name("big");
    ImageBuilder::create(base_name.c_str(), 50 * size_mib);
    ASSERT_EQ(file_size(base_name), 52428800);

    SizeInflator::inflate(base_name.c_str(), out_name.c_str(), 150 * size_gib);

    EXPECT_EQ(file_size(out_name), inflate_min_physical_size);
    auto header = read_file(out_name, 0, sb_header_size);
    auto MB = SuperBlock::decode(header.data(), header.size());
    EXPECT_EQ(SuperBlock::logical_size(MB), static_cast<uint64_t>(150 * size_gib));
}

INSTANTIATE_TEST_SUITE_P(ImageSize, SizeInflatorTest, testing::ValuesIn(valid_image_sizes_mb));
}
