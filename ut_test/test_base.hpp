#ifndef UT_TEST_TEST_BASE_HPP
#define UT_TEST_TEST_BASE_HPP
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "gtest/gtest.h"
#include "xfsfix/data_structs.hpp"

namespace XFSFIX {

const int64_t valid_image_sizes_mb[] = {1, 2, 50};

/* Small floor keeps inflator tests away from 100 MiB buffers. */
constexpr int64_t test_inflate_floor = 1 * size_mib;

class TestBaseBasic {
   protected:
    std::vector<std::string> created_files;

   public:
    using DataBufferType = std::vector<uint8_t>;

    ~TestBaseBasic() {
        for (auto& file_name : created_files) {
            std::remove(file_name.c_str());
        }
    }

    /* File name unique to the running test, removed on teardown. */
    std::string tmp_name(const char* tag) {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = std::string("_tmp_") + info->test_suite_name() + "_" + info->name() + "_" + tag + ".img";
        for (auto& c : name) {
            if (c == '/') {
                c = '_';
            }
        }
        std::remove(name.c_str());
        created_files.push_back(name);
        return name;
    }

    static int64_t file_size(const std::string& file_name) {
        std::ifstream file(file_name, std::ios::binary | std::ios::ate);
        if (!file.is_open()) {
            return -1;
        }
        return file.tellg();
    }

    static bool file_exists(const std::string& file_name) { return std::ifstream(file_name).good(); }

    static DataBufferType read_file(const std::string& file_name, int64_t offset, int64_t length) {
        DataBufferType data(length);
        std::ifstream file(file_name, std::ios::binary);
        file.seekg(offset);
        file.read(reinterpret_cast<char*>(data.data()), length);
        data.resize(file.gcount());
        return data;
    }

    static void write_file(const std::string& file_name, const DataBufferType& data) {
        std::ofstream file(file_name, std::ios::binary | std::ios::trunc);
        file.write(reinterpret_cast<const char*>(data.data()), data.size());
    }

    static void patch_file(const std::string& file_name, int64_t offset, const DataBufferType& data) {
        std::fstream file(file_name, std::ios::in | std::ios::out | std::ios::binary);
        file.seekp(offset);
        file.write(reinterpret_cast<const char*>(data.data()), data.size());
    }

    static bool files_equal(const std::string& lhs, const std::string& rhs) {
        constexpr int64_t chunk_size = size_mib;
        auto size = file_size(lhs);
        if (size != file_size(rhs)) {
            return false;
        }
        for (int64_t offset = 0; offset < size; offset += chunk_size) {
            if (read_file(lhs, offset, chunk_size) != read_file(rhs, offset, chunk_size)) {
                return false;
            }
        }
        return true;
    }

    template <typename T>
    bool cmp_data(const T* data_lhs, const T* data_rhs, size_t length) {
        return std::memcmp(data_lhs, data_rhs, length) == 0;
    }
};
}
#endif
