//
// Created by igor on 02/09/2025.
//

#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>

namespace pngchunk {

    chunk_type chunk_type::from_string(std::string_view text) {
        PNGCHUNK_THROW_UNLESS(text.size() == 4, invalid_chunk_type,
                              "Chunk type '", text, "' must be exactly 4 characters, got ", text.size());

        chunk_type result(text[0], text[1], text[2], text[3]);
        for (std::size_t i = 0; i < 4; ++i) {
            PNGCHUNK_THROW_UNLESS(is_letter(result.b[i]), invalid_chunk_type,
                                  "Chunk type '", result, "' has a non-letter at position ", i);
        }
        return result;
    }

}
