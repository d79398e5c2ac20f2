#ifndef CDDA_SDK_ENDIAN_H
#define CDDA_SDK_ENDIAN_H

#include <cdda/sdk/types.hh>
#include <cdda/sdk/cdda_sdk_config.h>

namespace cdda {

// Platform endianness detection using CMake-generated config
#if CDDA_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

// Byte swapping functions
inline uint16_t swap16(uint16_t x) {
    return static_cast<uint16_t>((x << 8) | (x >> 8));
}

inline uint32_t swap32(uint32_t x) {
    return ((x << 24) | ((x << 8) & 0x00FF0000) |
            ((x >> 8) & 0x0000FF00) | (x >> 24));
}

// Conditional byte swapping based on platform
inline uint16_t swap16le(uint16_t x) {
    return is_little_endian ? x : swap16(x);
}

inline uint16_t swap16be(uint16_t x) {
    return is_big_endian ? x : swap16(x);
}

inline uint32_t swap32le(uint32_t x) {
    return is_little_endian ? x : swap32(x);
}

inline uint32_t swap32be(uint32_t x) {
    return is_big_endian ? x : swap32(x);
}

} // namespace cdda

#endif // CDDA_SDK_ENDIAN_H
