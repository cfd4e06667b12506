//
// Created by igor on 03/09/2025.
//

#include <zlib.h>

#include "crc.hh"

namespace pngchunk {
    std::uint32_t chunk_crc(const chunk_type& type, const std::byte* data, std::size_t size) {
        uLong crc = crc32_z(0L, Z_NULL, 0);
        crc = crc32_z(crc, type.bytes().data(), type.bytes().size());
        if (size > 0) {
            crc = crc32_z(crc, reinterpret_cast<const Bytef*>(data), size);
        }
        return static_cast<std::uint32_t>(crc);
    }
}
