//
// Created by igor on 03/09/2025.
//

#pragma once

#include <cstdint>
#include <cstddef>

#include <pngchunk/chunk_type.hh>

namespace pngchunk {
    // CRC-32 (ISO 3309 / ITU-T V.42, as used by PNG) over type bytes followed by data
    std::uint32_t chunk_crc(const chunk_type& type, const std::byte* data, std::size_t size);
}
