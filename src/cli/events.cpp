#include "events.hpp"

#include <cinttypes>
#include <cstdio>
#include <stdexcept>

#include "xfsfix/errors.hpp"
#include "xfsfix/image_builder.hpp"
#include "xfsfix/image_inspector.hpp"
#include "xfsfix/size_inflator.hpp"
#include "xfsfix/super_block.hpp"

namespace XFSFIX {
namespace {
void display_critical_error(const std::exception& e) {
    printf("Critical error occured with message:\n\t%s\nAction terminated!\n", e.what());
}

double to_mb(uint64_t size) { return static_cast<double>(size) / size_mib; }
double to_gb(uint64_t size) { return static_cast<double>(size) / size_gib; }

int64_t to_bytes(int64_t size, int64_t unit, int64_t max_size) {
    if (size < 0 || size > max_size) {
        throw std::out_of_range("Requested size does not fit in a 64-bit byte count.");
    }
    return size * unit;
}
}

int event_create_image(const char* disk_path, int64_t size_mb) {
    try {
        auto MB = ImageBuilder::create(disk_path, to_bytes(size_mb, size_mib, max_size_mb));

        printf("Image created as: %s, with block size: %" PRIu32 " bytes and total size of %" PRId64 " MB.\n",
               disk_path, MB.block_size, size_mb);
        printf("\tData blocks: %" PRIu64 "\n", MB.data_block_count);
        printf("\tAllocation groups: %" PRIu32 " x %" PRIu32 " blocks\n", MB.ag_count, MB.ag_block_count);
        return 0;
    } catch (const std::exception& e) {
        display_critical_error(e);
        return 1;
    }
}

int event_inflate_image(const char* disk_path, const char* out_disk_path, int64_t size_gb) {
    try {
        auto target_size = to_bytes(size_gb, size_gib, max_size_gb);
        printf("Expanding %s to appear as %" PRId64 " GB...\n", disk_path, size_gb);
        auto report = SizeInflator::inflate(disk_path, out_disk_path, target_size);

        printf("\tBlock size: %" PRIu32 " bytes\n", report.block_size);
        printf("\tOriginal blocks: %" PRIu64 " (%.2f GB)\n", report.orig_block_count,
               to_gb(report.orig_block_count * report.block_size));
        printf("\tTarget blocks: %" PRIu64 " (%.2f GB)\n", report.new_block_count,
               to_gb(report.new_block_count * report.block_size));
        printf("\tAG blocks updated: %" PRIu32 " -> %" PRIu32 "\n", report.orig_ag_block_count,
               report.new_ag_block_count);
        printf("Image created as: %s, physical size %.2f MB.\n", out_disk_path, to_mb(report.physical_size));
        return 0;
    } catch (const FormatError& e) {
        printf("Not a valid XFS image: %s\n", disk_path);
        display_critical_error(e);
        return 1;
    } catch (const std::exception& e) {
        display_critical_error(e);
        return 1;
    }
}

int event_display_stats(const char* disk_path) {
    try {
        auto MB = ImageInspector::read_super_block(disk_path);
        auto physical_size = ImageInspector::physical_size(disk_path);

        printf("XFS image stats:\n");
        printf("\tBlock size: %" PRIu32 " bytes\n", MB.block_size);
        printf("\tTotal blocks: %" PRIu64 "\n", MB.data_block_count);
        printf("\tFile system size: %" PRIu64 " MB\n", SuperBlock::logical_size(MB) / size_mib);
        printf("\tAllocation groups: %" PRIu32 "\n", MB.ag_count);
        printf("\tBlocks per AG: %" PRIu32 "\n", MB.ag_block_count);
        printf("\tInode size: %" PRIu16 " bytes\n", MB.inode_size);
        printf("\tPhysical size: %.2f MB\n", to_mb(physical_size));
        return 0;
    } catch (const std::exception& e) {
        display_critical_error(e);
        return 1;
    }
}

int event_verify_seeds(const char* disk_path) {
    try {
        ImageInspector::read_super_block(disk_path);

        size_t seeds_found = 0;
        auto checks = ImageInspector::verify_seeds(disk_path);
        for (auto& check : checks) {
            printf("\t[%" PRId64 "]\t%s\t%" PRId64 " bytes\t%s\n", check.seed->offset, check.seed->label,
                   check.seed->payload_len, check.present ? "OK" : "MISSING");
            seeds_found += check.present ? 1 : 0;
        }

        printf("Seeds found: %zu/%zu\n", seeds_found, checks.size());
        return seeds_found == checks.size() ? 0 : 1;
    } catch (const std::exception& e) {
        display_critical_error(e);
        return 1;
    }
}
}
