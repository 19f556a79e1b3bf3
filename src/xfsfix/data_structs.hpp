#ifndef XFSFIX_DATA_STRUCTS_HPP
#define XFSFIX_DATA_STRUCTS_HPP

#include "common/types.hpp"
namespace XFSFIX {
constexpr int64_t sb_header_size = 4096;

constexpr int64_t sb_offset_magic = 0;
constexpr int64_t sb_offset_block_size = 4;
constexpr int64_t sb_offset_data_block_count = 8;
constexpr int64_t sb_offset_ag_block_count = 84;
constexpr int64_t sb_offset_ag_count = 88;
constexpr int64_t sb_offset_inode_size = 94;

constexpr uint32_t sb_magic = 0x58465342;  // "XFSB"
const uint8_t sb_magic_seq_lut[] = {'X', 'F', 'S', 'B'};

constexpr uint32_t fs_block_size = 4096;
constexpr uint32_t fs_ag_count = 4;
constexpr uint16_t fs_inode_size = 256;

constexpr int64_t size_mib = 1024 * 1024;
constexpr int64_t size_gib = size_mib * 1024;
constexpr int64_t inflate_min_physical_size = 100 * size_mib;

constexpr int64_t max_size_mb = INT64_MAX / size_mib;
constexpr int64_t max_size_gb = INT64_MAX / size_gib;

static_assert(sb_offset_inode_size + static_cast<int64_t>(sizeof(uint16_t)) <= sb_header_size);
static_assert(sb_offset_ag_count + static_cast<int64_t>(sizeof(uint32_t)) <= sb_header_size);

struct super_block {
    uint32_t magic;
    uint32_t block_size;
    uint64_t data_block_count;
    uint32_t ag_block_count;
    uint32_t ag_count;
    uint16_t inode_size;
};

struct seed_block {
    int64_t offset;
    const char* label;
    const uint8_t* payload;
    int64_t payload_len;
};

struct seed_check {
    const seed_block* seed;
    bool present;
};

struct inflate_report {
    uint32_t block_size;
    uint64_t orig_block_count;
    uint64_t new_block_count;
    uint32_t orig_ag_block_count;
    uint32_t new_ag_block_count;
    int64_t physical_size;
};
}
#endif
