#ifndef DISK_IMAGE_DISK_HPP
#define DISK_IMAGE_DISK_HPP
#include <fstream>

#include "common/types.hpp"
namespace XFSFIX {
enum class access { ReadOnly, ReadWrite };

class Disk {
   private:
    int64_t disk_img_size;
    std::fstream disk_img;

    int64_t clamp_length(int64_t offset, int64_t data_len) const;

   public:
    Disk();
    ~Disk();
    void open(const char* path, access mode = access::ReadWrite);
    void close();
    int64_t write(int64_t offset, const uint8_t* data, int64_t data_len);
    int64_t read(int64_t offset, uint8_t* data, int64_t data_len);
    int64_t get_disk_size() const { return disk_img_size; };
    bool is_open() const { return disk_img.is_open(); };

    static void create(const char* path, int64_t size);
};

}
#endif
