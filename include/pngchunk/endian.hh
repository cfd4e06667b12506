//
// Created by igor on 02/09/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>

#include <pngchunk/pngchunk_config.h>

namespace pngchunk {
    // Platform endianness detection using CMake-generated config
#if PNGCHUNK_BIG_ENDIAN
    constexpr bool is_big_endian = true;
#else
    constexpr bool is_big_endian = false;
#endif

    inline std::uint32_t swap32(std::uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    // Conditional byte swapping based on platform
    inline std::uint32_t swap32be(std::uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }

    // PNG stores every multi-byte integer in network (big-endian) order
    inline std::uint32_t load_be32(const std::byte* src) {
        std::uint32_t value;
        std::memcpy(&value, src, sizeof(value));
        return swap32be(value);
    }

    inline void store_be32(std::byte* dst, std::uint32_t value) {
        value = swap32be(value);
        std::memcpy(dst, &value, sizeof(value));
    }
}
