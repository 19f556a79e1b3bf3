#include "seed_table.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace XFSFIX {
namespace {
const char seed_text[] =
    "This is a test document for XFS recovery.\n"
    "It contains multiple lines.\n"
    "Created by GhostFS test generator.\n";

const char seed_json[] =
    "{\"users\": [{\"id\": 1, \"name\": \"John Doe\"}, {\"id\": 2, \"name\": \"Jane Smith\"}], "
    "\"config\": {\"theme\": \"dark\"}}";

const char seed_ini[] =
    "[Settings]\nversion=1.0\ndebug=true\nmax_files=1000\n\n"
    "[Database]\nhost=localhost\nport=5432\n";

const uint8_t seed_png[] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A, 0x00, 0x00, 0x00, 0x0D,
                            0x49, 0x48, 0x44, 0x52, 0x00, 0x00, 0x00, 0x10, 0x00, 0x00, 0x00, 0x10};

const uint8_t seed_jpeg[] = {0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10, 0x4A, 0x46, 0x49, 0x46};

template <size_t N>
seed_block text_seed(int64_t offset, const char* label, const char (&payload)[N]) {
    return {offset, label, reinterpret_cast<const uint8_t*>(payload), static_cast<int64_t>(N - 1)};
}

template <size_t N>
seed_block binary_seed(int64_t offset, const char* label, const uint8_t (&payload)[N]) {
    return {offset, label, payload, static_cast<int64_t>(N)};
}
}

const std::vector<seed_block>& get_seed_table() {
    static const std::vector<seed_block> table = {
        text_seed(8192, "plain-text", seed_text),
        text_seed(12288, "json", seed_json),
        text_seed(16384, "config-ini", seed_ini),
        binary_seed(20480, "png-signature", seed_png),
        binary_seed(24576, "jpeg-signature", seed_jpeg),
    };
    return table;
}

void validate_seed_table(const std::vector<seed_block>& table) {
    std::vector<const seed_block*> sorted;
    for (auto& seed : table) {
        if (seed.offset < sb_header_size) {
            throw std::logic_error(std::string("Seed overlaps superblock header: ") + seed.label);
        }
        if (seed.payload_len <= 0) {
            throw std::logic_error(std::string("Seed has empty payload: ") + seed.label);
        }
        sorted.push_back(&seed);
    }

    std::sort(sorted.begin(), sorted.end(),
              [](const seed_block* lhs, const seed_block* rhs) { return lhs->offset < rhs->offset; });

    for (size_t i = 1; i < sorted.size(); i++) {
        if (sorted[i - 1]->offset + sorted[i - 1]->payload_len > sorted[i]->offset) {
            throw std::logic_error(std::string("Seeds overlap: ") + sorted[i - 1]->label + " and " + sorted[i]->label);
        }
    }
}

int64_t seed_table_end(const std::vector<seed_block>& table) {
    int64_t end = sb_header_size;
    for (auto& seed : table) {
        end = std::max(end, seed.offset + seed.payload_len);
    }
    return end;
}
}
