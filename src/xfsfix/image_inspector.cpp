#include "image_inspector.hpp"

#include <cstring>

#include "disk-image/disk.hpp"
#include "seed_table.hpp"
#include "super_block.hpp"

namespace XFSFIX {

super_block ImageInspector::read_super_block(const char* path) {
    Disk disk;
    disk.open(path, access::ReadOnly);

    std::vector<uint8_t> header(sb_header_size, 0);
    auto n_read = disk.read(0, header.data(), sb_header_size);

    return SuperBlock::decode(header.data(), n_read);
}

std::vector<seed_check> ImageInspector::verify_seeds(const char* path) {
    Disk disk;
    disk.open(path, access::ReadOnly);

    std::vector<seed_check> checks;
    std::vector<uint8_t> rbuffer;
    for (auto& seed : get_seed_table()) {
        rbuffer.assign(seed.payload_len, 0);
        auto n_read = disk.read(seed.offset, rbuffer.data(), seed.payload_len);

        bool present =
            (n_read == seed.payload_len) && std::memcmp(rbuffer.data(), seed.payload, seed.payload_len) == 0;
        checks.push_back({&seed, present});
    }
    return checks;
}

int64_t ImageInspector::physical_size(const char* path) {
    Disk disk;
    disk.open(path, access::ReadOnly);
    return disk.get_disk_size();
}
}
