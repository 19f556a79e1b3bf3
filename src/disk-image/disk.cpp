#include "disk.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace XFSFIX {

Disk::Disk() : disk_img_size(0) {}

Disk::~Disk() { disk_img.close(); }

void Disk::open(const char* path, access mode) {
    if (disk_img.is_open()) {
        throw std::runtime_error("Image already opened.");
    }

    auto flags = std::ios::in | std::ios::binary;
    if (mode == access::ReadWrite) {
        flags |= std::ios::out;
    }

    disk_img.open(path, flags);
    if (!disk_img.is_open()) {
        throw std::runtime_error(std::string("Unable to open image: ") + path);
    }

    disk_img.seekg(0, std::ios::end);
    disk_img_size = disk_img.tellg();
    if (disk_img_size < 0) {
        disk_img.close();
        throw std::runtime_error("Cannot determine image size.");
    }
}

void Disk::close() {
    disk_img.close();
    disk_img_size = 0;
}

/* The file length is set with truncate(2), holes are not allocated and read back as zero. */
void Disk::create(const char* path, int64_t size) {
    if (size < 0) {
        throw std::invalid_argument("Image size lower than zero.");
    }

    std::fstream disk(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!disk.is_open()) {
        throw std::runtime_error(std::string("Unable to create image: ") + path);
    }
    disk.close();

    std::filesystem::resize_file(path, static_cast<std::uintmax_t>(size));
}

int64_t Disk::clamp_length(int64_t offset, int64_t data_len) const {
    if (offset < 0 || data_len < 0 || offset >= disk_img_size) {
        return 0;
    }
    return std::min(data_len, disk_img_size - offset);
}

int64_t Disk::write(int64_t offset, const uint8_t* data, int64_t data_len) {
    if (!disk_img.is_open()) {
        return -1;
    }

    data_len = clamp_length(offset, data_len);
    if (data_len == 0) {
        return 0;
    }

    disk_img.seekp(offset, disk_img.beg);
    disk_img.write(reinterpret_cast<const char*>(data), data_len);
    disk_img.flush();
    if (!disk_img) {
        throw std::runtime_error("Error while write operation.");
    }

    return data_len;
}

int64_t Disk::read(int64_t offset, uint8_t* data, int64_t data_len) {
    if (!disk_img.is_open()) {
        return -1;
    }

    data_len = clamp_length(offset, data_len);
    if (data_len == 0) {
        return 0;
    }

    disk_img.seekg(offset, disk_img.beg);
    disk_img.read(reinterpret_cast<char*>(data), data_len);
    if (!disk_img) {
        throw std::runtime_error("Error while read operation.");
    }

    return data_len;
}
}
