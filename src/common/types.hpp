#ifndef COMMON_TYPES_HPP
#define COMMON_TYPES_HPP
#include <stddef.h>
#include <stdint.h>

#include <type_traits>
namespace XFSFIX {

/* XFS keeps every on-disk integer in big-endian order. */
template <typename T>
void store_be(uint8_t* dst, T value) {
    static_assert(std::is_unsigned<T>::value);
    for (int32_t i = sizeof(T) - 1; i >= 0; i--) {
        dst[i] = static_cast<uint8_t>(value & 0xFF);
        value = static_cast<T>(value >> 8);
    }
}

template <typename T>
T load_be(const uint8_t* src) {
    static_assert(std::is_unsigned<T>::value);
    T value = 0;
    for (size_t i = 0; i < sizeof(T); i++) {
        value = static_cast<T>((value << 8) | src[i]);
    }
    return value;
}

}

#endif
