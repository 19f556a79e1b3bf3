#ifndef XFSFIX_SUPER_BLOCK_HPP
#define XFSFIX_SUPER_BLOCK_HPP
#include <vector>

#include "common/types.hpp"
#include "data_structs.hpp"

namespace XFSFIX {
class SuperBlock {
   public:
    static super_block make(int64_t logical_size);

    static std::vector<uint8_t> encode(const super_block& MB);
    static void encode(const super_block& MB, uint8_t* header);

    static super_block decode(const uint8_t* header, int64_t length);
    static void patch_geometry(uint8_t* header, const super_block& MB);

    static uint32_t calc_ag_block_count(uint64_t data_block_count, uint32_t ag_count);
    static uint64_t logical_size(const super_block& MB);
};
}
#endif
