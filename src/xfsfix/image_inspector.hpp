#ifndef XFSFIX_IMAGE_INSPECTOR_HPP
#define XFSFIX_IMAGE_INSPECTOR_HPP
#include <vector>

#include "common/types.hpp"
#include "data_structs.hpp"

namespace XFSFIX {
class ImageInspector {
   public:
    static super_block read_super_block(const char* path);
    static std::vector<seed_check> verify_seeds(const char* path);
    static int64_t physical_size(const char* path);
};
}
#endif
