#include "super_block.hpp"

#include <cstring>
#include <limits>
#include <stdexcept>

#include "errors.hpp"

namespace XFSFIX {

super_block SuperBlock::make(int64_t logical_size) {
    if (logical_size < 0) {
        throw std::invalid_argument("Logical size lower than zero.");
    }

    super_block MB = {};
    MB.magic = sb_magic;
    MB.block_size = fs_block_size;
    MB.data_block_count = static_cast<uint64_t>(logical_size) / fs_block_size;
    MB.ag_count = fs_ag_count;
    MB.ag_block_count = calc_ag_block_count(MB.data_block_count, MB.ag_count);
    MB.inode_size = fs_inode_size;
    return MB;
}

std::vector<uint8_t> SuperBlock::encode(const super_block& MB) {
    std::vector<uint8_t> header(sb_header_size, 0);
    encode(MB, header.data());
    return header;
}

void SuperBlock::encode(const super_block& MB, uint8_t* header) {
    std::memset(header, 0, sb_header_size);

    store_be<uint32_t>(header + sb_offset_magic, MB.magic);
    store_be<uint32_t>(header + sb_offset_block_size, MB.block_size);
    patch_geometry(header, MB);
    store_be<uint32_t>(header + sb_offset_ag_count, MB.ag_count);
    store_be<uint16_t>(header + sb_offset_inode_size, MB.inode_size);
}

void SuperBlock::patch_geometry(uint8_t* header, const super_block& MB) {
    store_be<uint64_t>(header + sb_offset_data_block_count, MB.data_block_count);
    store_be<uint32_t>(header + sb_offset_ag_block_count, MB.ag_block_count);
}

super_block SuperBlock::decode(const uint8_t* header, int64_t length) {
    if (length < sb_header_size) {
        throw FormatError("Image shorter than superblock header.");
    }

    super_block MB = {};
    MB.magic = load_be<uint32_t>(header + sb_offset_magic);
    if (MB.magic != sb_magic) {
        throw FormatError("Super block corrupted. Magic number error.");
    }

    MB.block_size = load_be<uint32_t>(header + sb_offset_block_size);
    if (MB.block_size == 0) {
        throw FormatError("Super block corrupted. Block size is zero.");
    }

    MB.data_block_count = load_be<uint64_t>(header + sb_offset_data_block_count);
    MB.ag_block_count = load_be<uint32_t>(header + sb_offset_ag_block_count);
    MB.ag_count = load_be<uint32_t>(header + sb_offset_ag_count);
    MB.inode_size = load_be<uint16_t>(header + sb_offset_inode_size);
    return MB;
}

/* An allocation group count of zero falls back to a single group spanning the volume. */
uint32_t SuperBlock::calc_ag_block_count(uint64_t data_block_count, uint32_t ag_count) {
    uint64_t ag_blocks = ag_count > 0 ? data_block_count / ag_count : data_block_count;
    if (ag_blocks > std::numeric_limits<uint32_t>::max()) {
        throw std::overflow_error("Allocation group block count does not fit in 32 bits.");
    }
    return static_cast<uint32_t>(ag_blocks);
}

uint64_t SuperBlock::logical_size(const super_block& MB) { return MB.data_block_count * MB.block_size; }
}
