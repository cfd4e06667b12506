//
// Created by igor on 04/09/2025.
//

#include <cstdint>

#include "utf8.hh"

namespace pngchunk {
    std::size_t utf8_valid_prefix(const std::byte* data, std::size_t size) {
        const auto* p = reinterpret_cast<const std::uint8_t*>(data);
        std::size_t i = 0;

        while (i < size) {
            std::uint8_t c = p[i];
            if (c < 0x80) {
                ++i;
                continue;
            }

            std::size_t len;
            std::uint8_t lo = 0x80;
            std::uint8_t hi = 0xBF;
            if (c >= 0xC2 && c <= 0xDF) {
                len = 2;
            } else if (c >= 0xE0 && c <= 0xEF) {
                len = 3;
                if (c == 0xE0) {
                    lo = 0xA0;  // overlong
                } else if (c == 0xED) {
                    hi = 0x9F;  // surrogates
                }
            } else if (c >= 0xF0 && c <= 0xF4) {
                len = 4;
                if (c == 0xF0) {
                    lo = 0x90;  // overlong
                } else if (c == 0xF4) {
                    hi = 0x8F;  // above U+10FFFF
                }
            } else {
                return i;
            }

            if (size - i < len) {
                return i;
            }
            if (p[i + 1] < lo || p[i + 1] > hi) {
                return i;
            }
            for (std::size_t k = 2; k < len; ++k) {
                if ((p[i + k] & 0xC0) != 0x80) {
                    return i;
                }
            }
            i += len;
        }
        return size;
    }
}
