#include "disk-image/disk.hpp"

#include "test_base.hpp"
using namespace XFSFIX;
namespace {
class DiskTest : public ::testing::TestWithParam<int64_t>, public TestBaseBasic {
   protected:
    int64_t disk_size = GetParam() * size_mib;
    std::string disk_name;
    Disk disk;

   public:
    void SetUp() override {
        disk_name = tmp_name("disk");
        Disk::create(disk_name.c_str(), disk_size);
    }

    void TearDown() override { disk.close(); }
};

TEST(DiskBasicTest, is_not_open_by_default) {
    Disk disk;
    EXPECT_FALSE(disk.is_open());
    EXPECT_EQ(disk.get_disk_size(), 0);
}

TEST(DiskBasicTest, io_without_open_image) {
    Disk disk;
    uint8_t buf[16] = {};
    EXPECT_EQ(disk.write(0, buf, sizeof(buf)), -1);
    EXPECT_EQ(disk.read(0, buf, sizeof(buf)), -1);
}

TEST(DiskBasicTest, create_throw_negative_size) {
    EXPECT_THROW(Disk::create("_tmp_negative.img", -1), std::invalid_argument);
}

TEST(DiskBasicTest, create_throw_invalid_path) {
    EXPECT_THROW(Disk::create("no_such_dir/xxx.img", 1024), std::runtime_error);
}

TEST(DiskBasicTest, open_throw_when_invalid_img_name) {
    Disk disk;
    EXPECT_THROW(disk.open("xxx.img"), std::runtime_error);
    EXPECT_THROW(disk.open("xxx.img", access::ReadOnly), std::runtime_error);
}

TEST_P(DiskTest, create_requested_disk_size_test) { EXPECT_EQ(file_size(disk_name), disk_size); }

TEST_P(DiskTest, create_truncates_existing_image) {
    Disk::create(disk_name.c_str(), 4096);
    EXPECT_EQ(file_size(disk_name), 4096);
}

TEST_P(DiskTest, open_reports_disk_size) {
    disk.open(disk_name.c_str());
    EXPECT_TRUE(disk.is_open());
    EXPECT_EQ(disk.get_disk_size(), disk_size);
}

TEST_P(DiskTest, open_throw_when_opened_already) {
    disk.open(disk_name.c_str());
    EXPECT_THROW(disk.open(disk_name.c_str()), std::runtime_error);
}

TEST_P(DiskTest, holes_read_as_zero) {
    disk.open(disk_name.c_str(), access::ReadOnly);

    DataBufferType r_data(4096, 0xFF);
    auto n_read = disk.read(disk_size / 2, r_data.data(), r_data.size());
    ASSERT_EQ(n_read, 4096);
    for (auto byte : r_data) {
        ASSERT_EQ(byte, 0);
    }
}

TEST_P(DiskTest, write_and_read_at_offset) {
    DataBufferType w_data = {0xDE, 0xAD, 0xC0, 0xDE};
    disk.open(disk_name.c_str());

    ASSERT_EQ(disk.write(12345, w_data.data(), w_data.size()), 4);

    DataBufferType r_data(w_data.size());
    ASSERT_EQ(disk.read(12345, r_data.data(), r_data.size()), 4);
    EXPECT_EQ(r_data, w_data);
    disk.close();

    EXPECT_EQ(read_file(disk_name, 12345, 4), w_data);
    EXPECT_EQ(file_size(disk_name), disk_size);
}

TEST_P(DiskTest, write_last_bytes_with_overflow) {
    DataBufferType w_data(64, 0x5A);
    disk.open(disk_name.c_str());

    auto n_written = disk.write(disk_size - 16, w_data.data(), w_data.size());
    EXPECT_EQ(n_written, 16);
    disk.close();

    EXPECT_EQ(file_size(disk_name), disk_size);
}

TEST_P(DiskTest, write_past_end) {
    DataBufferType w_data(64, 0x5A);
    disk.open(disk_name.c_str());

    EXPECT_EQ(disk.write(disk_size, w_data.data(), w_data.size()), 0);
    EXPECT_EQ(disk.write(-1, w_data.data(), w_data.size()), 0);
}

TEST_P(DiskTest, read_last_bytes_with_overflow) {
    /* Guard value should remain unchanged after not full read */
    constexpr uint8_t guard_value = 0xFF;
    DataBufferType r_data(64, guard_value);
    disk.open(disk_name.c_str(), access::ReadOnly);

    auto n_read = disk.read(disk_size - 16, r_data.data(), r_data.size());
    ASSERT_EQ(n_read, 16);
    for (auto i = 0; i < n_read; i++) {
        ASSERT_EQ(r_data[i], 0);
    }
    for (auto i = n_read; i < 64; i++) {
        ASSERT_EQ(r_data[i], guard_value);
    }
}

INSTANTIATE_TEST_SUITE_P(ImageSize, DiskTest, testing::ValuesIn(valid_image_sizes_mb));
}
