#include "cli/opt_parser.hpp"

#include <string>
#include <vector>

#include "test_base.hpp"
using namespace XFSFIX;
namespace {
class OptParserTest : public ::testing::Test {
   protected:
    std::vector<std::string> storage;
    std::vector<char*> argv;

   public:
    OptParser parse(std::vector<std::string> args) {
        storage = std::move(args);
        storage.insert(storage.begin(), "xfsfix");

        argv.clear();
        for (auto& arg : storage) {
            argv.push_back(&arg[0]);
        }
        argv.push_back(nullptr);

        return OptParser(static_cast<int>(storage.size()), argv.data());
    }
};

TEST_F(OptParserTest, no_arguments_is_invalid) {
    auto parser = parse({});
    EXPECT_EQ(parser.action_type, ActionType::INVALID_PARSING);
}

TEST_F(OptParserTest, help) {
    auto parser = parse({"-h"});
    EXPECT_EQ(parser.action_type, ActionType::DISPLAY_HELP);
}

TEST_F(OptParserTest, create_image) {
    auto parser = parse({"-c", "test-xfs.img", "-s", "50"});
    ASSERT_EQ(parser.action_type, ActionType::CREATE_IMAGE);
    EXPECT_STREQ(parser.parsed_args.disk_path, "test-xfs.img");
    EXPECT_EQ(parser.parsed_args.size_mb, 50);
}

TEST_F(OptParserTest, create_image_size_before_path) {
    auto parser = parse({"-s", "50", "-c", "test-xfs.img"});
    ASSERT_EQ(parser.action_type, ActionType::CREATE_IMAGE);
    EXPECT_STREQ(parser.parsed_args.disk_path, "test-xfs.img");
    EXPECT_EQ(parser.parsed_args.size_mb, 50);
}

TEST_F(OptParserTest, create_image_default_size) {
    auto parser = parse({"-c", "test-xfs.img"});
    ASSERT_EQ(parser.action_type, ActionType::CREATE_IMAGE);
    EXPECT_EQ(parser.parsed_args.size_mb, 50);
}

TEST_F(OptParserTest, create_image_size_limit) {
    auto max_mb = std::to_string(INT64_MAX / size_mib);
    auto parser = parse({"-c", "test-xfs.img", "-s", max_mb});
    ASSERT_EQ(parser.action_type, ActionType::CREATE_IMAGE);
    EXPECT_EQ(parser.parsed_args.size_mb, max_size_mb);

    const char* too_big[] = {"8796093022209", "17592186044417", "9223372036854775807", "99999999999999999999"};
    for (auto size : too_big) {
        auto rejected = parse({"-c", "test-xfs.img", "-s", size});
        EXPECT_EQ(rejected.action_type, ActionType::INVALID_PARSING) << size;
    }
}

TEST_F(OptParserTest, invalid_sizes) {
    const char* sizes[] = {"0", "-5", "abc", "12x", ""};
    for (auto size : sizes) {
        auto parser = parse({"-c", "test-xfs.img", "-s", size});
        EXPECT_EQ(parser.action_type, ActionType::INVALID_PARSING) << size;
    }
}

TEST_F(OptParserTest, inflate_image) {
    auto parser = parse({"-e", "test-xfs.img", "-o", "large-xfs-test.img", "-g", "150"});
    ASSERT_EQ(parser.action_type, ActionType::INFLATE_IMAGE);
    EXPECT_STREQ(parser.parsed_args.disk_path, "test-xfs.img");
    EXPECT_STREQ(parser.parsed_args.out_disk_path, "large-xfs-test.img");
    EXPECT_EQ(parser.parsed_args.size_gb, 150);
}

TEST_F(OptParserTest, inflate_image_missing_output_is_invalid) {
    auto parser = parse({"-e", "test-xfs.img", "-g", "150"});
    EXPECT_EQ(parser.action_type, ActionType::INVALID_PARSING);
}

TEST_F(OptParserTest, inflate_image_default_size) {
    auto parser = parse({"-e", "test-xfs.img", "-o", "large-xfs-test.img"});
    ASSERT_EQ(parser.action_type, ActionType::INFLATE_IMAGE);
    EXPECT_EQ(parser.parsed_args.size_gb, 150);
}

TEST_F(OptParserTest, inflate_image_size_limit) {
    auto max_gb = std::to_string(INT64_MAX / size_gib);
    auto parser = parse({"-e", "test-xfs.img", "-o", "large-xfs-test.img", "-g", max_gb});
    ASSERT_EQ(parser.action_type, ActionType::INFLATE_IMAGE);
    EXPECT_EQ(parser.parsed_args.size_gb, max_size_gb);

    auto over_gb = std::to_string(INT64_MAX / size_gib + 1);
    parser = parse({"-e", "test-xfs.img", "-o", "large-xfs-test.img", "-g", over_gb});
    EXPECT_EQ(parser.action_type, ActionType::INVALID_PARSING);
}

TEST_F(OptParserTest, display_stats) {
    auto parser = parse({"-x", "test-xfs.img"});
    ASSERT_EQ(parser.action_type, ActionType::DISPLAY_STATS);
    EXPECT_STREQ(parser.parsed_args.disk_path, "test-xfs.img");
}

TEST_F(OptParserTest, verify_seeds) {
    auto parser = parse({"-v", "test-xfs.img"});
    ASSERT_EQ(parser.action_type, ActionType::VERIFY_SEEDS);
    EXPECT_STREQ(parser.parsed_args.disk_path, "test-xfs.img");
}

TEST_F(OptParserTest, first_action_wins) {
    auto parser = parse({"-x", "first.img", "-v", "second.img"});
    ASSERT_EQ(parser.action_type, ActionType::DISPLAY_STATS);
    EXPECT_STREQ(parser.parsed_args.disk_path, "first.img");
}

TEST_F(OptParserTest, unknown_option_is_invalid) {
    auto parser = parse({"-x", "test-xfs.img", "-z"});
    EXPECT_EQ(parser.action_type, ActionType::INVALID_PARSING);
}

TEST_F(OptParserTest, parse_twice_in_one_process) {
    auto first = parse({"-x", "first.img"});
    ASSERT_EQ(first.action_type, ActionType::DISPLAY_STATS);

    auto second = parse({"-v", "second.img"});
    ASSERT_EQ(second.action_type, ActionType::VERIFY_SEEDS);
    EXPECT_STREQ(second.parsed_args.disk_path, "second.img");
}
}
