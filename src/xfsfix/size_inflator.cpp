#include "size_inflator.hpp"

#include <cstdio>
#include <stdexcept>
#include <vector>

#include "disk-image/disk.hpp"
#include "super_block.hpp"

namespace XFSFIX {
namespace {
std::vector<uint8_t> load_image(const char* path) {
    Disk disk;
    disk.open(path, access::ReadOnly);

    std::vector<uint8_t> image(disk.get_disk_size());
    auto n_read = disk.read(0, image.data(), image.size());
    if (n_read != static_cast<int64_t>(image.size())) {
        throw std::runtime_error("Cannot read whole image.");
    }
    return image;
}

void store_image(const char* path, const std::vector<uint8_t>& image) {
    Disk::create(path, image.size());

    try {
        Disk disk;
        disk.open(path);
        auto n_written = disk.write(0, image.data(), image.size());
        if (n_written != static_cast<int64_t>(image.size())) {
            throw std::runtime_error("Cannot write whole image.");
        }
    } catch (const std::exception&) {
        std::remove(path);
        throw;
    }
}
}

inflate_report SizeInflator::inflate(const char* input_path, const char* output_path, int64_t target_logical_size,
                                     int64_t min_physical_size) {
    if (target_logical_size < 0) {
        throw std::invalid_argument("Target size lower than zero.");
    }

    auto image = load_image(input_path);
    auto MB = SuperBlock::decode(image.data(), image.size());

    inflate_report report = {};
    report.block_size = MB.block_size;
    report.orig_block_count = MB.data_block_count;
    report.orig_ag_block_count = MB.ag_block_count;

    MB.data_block_count = static_cast<uint64_t>(target_logical_size) / MB.block_size;
    MB.ag_block_count = SuperBlock::calc_ag_block_count(MB.data_block_count, MB.ag_count);
    SuperBlock::patch_geometry(image.data(), MB);

    report.new_block_count = MB.data_block_count;
    report.new_ag_block_count = MB.ag_block_count;

    if (static_cast<int64_t>(image.size()) < min_physical_size) {
        image.resize(min_physical_size, 0);
    }

    store_image(output_path, image);
    report.physical_size = image.size();
    return report;
}
}
