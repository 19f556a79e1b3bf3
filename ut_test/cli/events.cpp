#include "cli/events.hpp"

#include "test_base.hpp"
#include "xfsfix/image_inspector.hpp"
#include "xfsfix/super_block.hpp"
using namespace XFSFIX;
namespace {
class EventsTest : public ::testing::Test, public TestBaseBasic {
   protected:
    std::string disk_name;

   public:
    void SetUp() override { disk_name = tmp_name("base"); }
};

TEST_F(EventsTest, create_image) {
    testing::internal::CaptureStdout();
    auto status = event_create_image(disk_name.c_str(), 2);
    auto output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(status, 0);
    EXPECT_EQ(file_size(disk_name), 2 * size_mib);
    EXPECT_NE(output.find("Image created as: " + disk_name), std::string::npos);
}

TEST_F(EventsTest, create_image_unwritable_path) {
    testing::internal::CaptureStdout();
    auto status = event_create_image("no_such_dir/base.img", 2);
    auto output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(status, 1);
    EXPECT_NE(output.find("Action terminated!"), std::string::npos);
}

TEST_F(EventsTest, display_stats_and_verify) {
    testing::internal::CaptureStdout();
    ASSERT_EQ(event_create_image(disk_name.c_str(), 1), 0);
    EXPECT_EQ(event_display_stats(disk_name.c_str()), 0);
    EXPECT_EQ(event_verify_seeds(disk_name.c_str()), 0);
    auto output = testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("Total blocks: 256"), std::string::npos);
    EXPECT_NE(output.find("Seeds found: 5/5"), std::string::npos);
}

TEST_F(EventsTest, verify_reports_missing_seed) {
    testing::internal::CaptureStdout();
    ASSERT_EQ(event_create_image(disk_name.c_str(), 1), 0);
    patch_file(disk_name, 24576, {0x00});
    auto status = event_verify_seeds(disk_name.c_str());
    auto output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(status, 1);
    EXPECT_NE(output.find("MISSING"), std::string::npos);
}

TEST_F(EventsTest, inflate_image) {
    auto out_name = tmp_name("big");
    testing::internal::CaptureStdout();
    ASSERT_EQ(event_create_image(disk_name.c_str(), 1), 0);
    auto status = event_inflate_image(disk_name.c_str(), out_name.c_str(), 2);
    testing::internal::GetCapturedStdout();

    ASSERT_EQ(status, 0);
    EXPECT_EQ(file_size(out_name), inflate_min_physical_size);
    auto MB = ImageInspector::read_super_block(out_name.c_str());
    EXPECT_EQ(SuperBlock::logical_size(MB), static_cast<uint64_t>(2 * size_gib));
}

TEST_F(EventsTest, inflate_rejects_foreign_image) {
    auto out_name = tmp_name("big");
    write_file(disk_name, DataBufferType(2 * sb_header_size, 0));

    testing::internal::CaptureStdout();
    auto status = event_inflate_image(disk_name.c_str(), out_name.c_str(), 150);
    auto output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(status, 1);
    EXPECT_FALSE(file_exists(out_name));
    EXPECT_NE(output.find("Not a valid XFS image"), std::string::npos);
}

TEST_F(EventsTest, create_image_rejects_overflowing_size) {
    testing::internal::CaptureStdout();
    auto status = event_create_image(disk_name.c_str(), max_size_mb + 1);
    auto output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(status, 1);
    EXPECT_FALSE(file_exists(disk_name));
    EXPECT_NE(output.find("Action terminated!"), std::string::npos);
}

TEST_F(EventsTest, inflate_image_rejects_overflowing_size) {
    auto out_name = tmp_name("big");
    testing::internal::CaptureStdout();
    ASSERT_EQ(event_create_image(disk_name.c_str(), 1), 0);
    auto status = event_inflate_image(disk_name.c_str(), out_name.c_str(), max_size_gb + 1);
    testing::internal::GetCapturedStdout();

    EXPECT_EQ(status, 1);
    EXPECT_FALSE(file_exists(out_name));
}

TEST_F(EventsTest, display_stats_missing_image) {
    testing::internal::CaptureStdout();
    auto status = event_display_stats("xxx.img");
    testing::internal::GetCapturedStdout();

    EXPECT_EQ(status, 1);
}
}
