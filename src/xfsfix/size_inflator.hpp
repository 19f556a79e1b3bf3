#ifndef XFSFIX_SIZE_INFLATOR_HPP
#define XFSFIX_SIZE_INFLATOR_HPP
#include "common/types.hpp"
#include "data_structs.hpp"

namespace XFSFIX {
class SizeInflator {
   public:
    /*
     * Copies input_path to output_path with a superblock claiming target_logical_size bytes.
     * The output is zero padded to at least min_physical_size. A FormatError is raised
     * before output_path is touched when the input is not an XFS image.
     */
    static inflate_report inflate(const char* input_path, const char* output_path, int64_t target_logical_size,
                                  int64_t min_physical_size = inflate_min_physical_size);
};
}
#endif
