#include "image_builder.hpp"

#include <algorithm>
#include <stdexcept>

#include "disk-image/disk.hpp"
#include "seed_table.hpp"
#include "super_block.hpp"

namespace XFSFIX {

super_block ImageBuilder::create(const char* path, int64_t logical_size) {
    auto MB = SuperBlock::make(logical_size);
    auto header = SuperBlock::encode(MB);

    auto& seeds = get_seed_table();
    validate_seed_table(seeds);

    Disk::create(path, logical_size);

    Disk disk;
    disk.open(path);

    int64_t header_len = std::min<int64_t>(header.size(), disk.get_disk_size());
    if (disk.write(0, header.data(), header.size()) != header_len) {
        throw std::runtime_error("Cannot write super block.");
    }

    // Seeds past the end of a small image are cut at the image boundary.
    for (auto& seed : seeds) {
        disk.write(seed.offset, seed.payload, seed.payload_len);
    }

    disk.close();
    return MB;
}
}
