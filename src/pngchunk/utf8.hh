//
// Created by igor on 04/09/2025.
//

#pragma once

#include <cstddef>

namespace pngchunk {
    // Returns the offset of the first byte that does not start a well formed
    // UTF-8 sequence, or size if the whole buffer is valid
    std::size_t utf8_valid_prefix(const std::byte* data, std::size_t size);
}
