#ifndef XFSFIX_IMAGE_BUILDER_HPP
#define XFSFIX_IMAGE_BUILDER_HPP
#include "common/types.hpp"
#include "data_structs.hpp"

namespace XFSFIX {
class ImageBuilder {
   public:
    /* Writes a new image of exactly logical_size bytes with the superblock and every seed block. */
    static super_block create(const char* path, int64_t logical_size);
};
}
#endif
