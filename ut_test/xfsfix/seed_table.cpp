#include "xfsfix/seed_table.hpp"

#include <string>

#include "test_base.hpp"
using namespace XFSFIX;
namespace {
std::string payload_str(const seed_block& seed) {
    return std::string(reinterpret_cast<const char*>(seed.payload), seed.payload_len);
}

const seed_block* find_seed(const char* label) {
    for (auto& seed : get_seed_table()) {
        if (std::string(seed.label) == label) {
            return &seed;
        }
    }
    return nullptr;
}

TEST(SeedTableTest, default_table_is_valid) { EXPECT_NO_THROW(validate_seed_table(get_seed_table())); }

TEST(SeedTableTest, default_table_entries) {
    auto& table = get_seed_table();
    ASSERT_EQ(table.size(), 5u);

    const std::pair<const char*, int64_t> expected[] = {
        {"plain-text", 8192}, {"json", 12288}, {"config-ini", 16384}, {"png-signature", 20480},
        {"jpeg-signature", 24576},
    };
    for (auto& entry : expected) {
        auto* seed = find_seed(entry.first);
        ASSERT_NE(seed, nullptr) << entry.first;
        EXPECT_EQ(seed->offset, entry.second);
    }
}

TEST(SeedTableTest, text_payloads_verbatim) {
    auto* text = find_seed("plain-text");
    ASSERT_NE(text, nullptr);
    EXPECT_EQ(payload_str(*text),
              "This is a test document for XFS recovery.\n"
              "It contains multiple lines.\n"
              "Created by GhostFS test generator.\n");

    auto* json = find_seed("json");
    ASSERT_NE(json, nullptr);
    EXPECT_EQ(payload_str(*json),
              "{\"users\": [{\"id\": 1, \"name\": \"John Doe\"}, {\"id\": 2, \"name\": \"Jane Smith\"}], "
              "\"config\": {\"theme\": \"dark\"}}");

    auto* ini = find_seed("config-ini");
    ASSERT_NE(ini, nullptr);
    EXPECT_EQ(payload_str(*ini),
              "[Settings]\nversion=1.0\ndebug=true\nmax_files=1000\n\n"
              "[Database]\nhost=localhost\nport=5432\n");
}

TEST(SeedTableTest, binary_payloads_keep_embedded_zeros) {
    auto* png = find_seed("png-signature");
    ASSERT_NE(png, nullptr);
    ASSERT_EQ(png->payload_len, 24);
    const uint8_t png_magic[] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    EXPECT_EQ(std::memcmp(png->payload, png_magic, sizeof(png_magic)), 0);
    EXPECT_EQ(png->payload[8], 0x00);

    auto* jpeg = find_seed("jpeg-signature");
    ASSERT_NE(jpeg, nullptr);
    ASSERT_EQ(jpeg->payload_len, 10);
    EXPECT_EQ(jpeg->payload[0], 0xFF);
    EXPECT_EQ(jpeg->payload[1], 0xD8);
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(jpeg->payload) + 6, 4), "JFIF");
}

TEST(SeedTableTest, table_end_after_last_seed) {
    auto* jpeg = find_seed("jpeg-signature");
    ASSERT_NE(jpeg, nullptr);
    EXPECT_EQ(seed_table_end(get_seed_table()), jpeg->offset + jpeg->payload_len);
    EXPECT_EQ(seed_table_end({}), sb_header_size);
}

TEST(SeedTableTest, validate_throw_header_overlap) {
    const uint8_t payload[] = {1, 2, 3};
    std::vector<seed_block> table = {{sb_header_size - 1, "header", payload, sizeof(payload)}};
    EXPECT_THROW(validate_seed_table(table), std::logic_error);
}

TEST(SeedTableTest, validate_throw_seed_overlap) {
    const uint8_t payload[] = {1, 2, 3, 4};
    std::vector<seed_block> table = {
        {8192 + 2, "second", payload, sizeof(payload)},
        {8192, "first", payload, sizeof(payload)},
    };
    EXPECT_THROW(validate_seed_table(table), std::logic_error);
}

TEST(SeedTableTest, validate_adjacent_seeds) {
    const uint8_t payload[] = {1, 2, 3, 4};
    std::vector<seed_block> table = {
        {8192, "first", payload, sizeof(payload)},
        {8192 + 4, "second", payload, sizeof(payload)},
    };
    EXPECT_NO_THROW(validate_seed_table(table));
}

TEST(SeedTableTest, validate_throw_empty_payload) {
    const uint8_t payload[] = {1};
    std::vector<seed_block> table = {{8192, "empty", payload, 0}};
    EXPECT_THROW(validate_seed_table(table), std::logic_error);
}
}
