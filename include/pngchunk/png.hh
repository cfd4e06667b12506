/**
 * @file png.hh
 * @brief PNG container: signature plus an ordered list of chunks
 * @author Igor
 * @date 03/09/2025
 */

#pragma once

#include <array>
#include <cstddef>
#include <iosfwd>
#include <string_view>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @class png
     * @brief Whole PNG file as a sequence of chunks
     *
     * The container does not interpret chunk contents and does not enforce
     * PNG chunk ordering rules. Chunks are kept, and written back, in the
     * order they were decoded or appended. Several chunks may share a type;
     * lookup and removal act on the first one.
     */
    class PNGCHUNK_EXPORT png {
    public:
        /// 89 50 4E 47 0D 0A 1A 0A
        static constexpr std::array<std::byte, 8> standard_header = {
            std::byte{0x89}, std::byte{'P'}, std::byte{'N'}, std::byte{'G'},
            std::byte{'\r'}, std::byte{'\n'}, std::byte{0x1A}, std::byte{'\n'}
        };

        /**
         * @brief Empty container with the standard signature
         */
        png() = default;

        /**
         * @brief Container holding the given chunks in order
         */
        explicit png(std::vector<chunk> chunks);

        /**
         * @brief Decode a complete PNG file held in memory
         *
         * @throws signature_mismatch if the buffer does not start with the PNG signature
         * @throws invalid_length, invalid_chunk_type, invalid_crc from the
         *         first chunk that fails to decode; no partial result is returned
         */
        static png decode(const std::byte* data, std::size_t size, const parse_options& options = {});
        static png decode(const std::vector<std::byte>& bytes, const parse_options& options = {});

        /**
         * @brief Serialize signature and chunks; inverse of decode()
         */
        [[nodiscard]] std::vector<std::byte> as_bytes() const;

        [[nodiscard]] const std::array<std::byte, 8>& header() const { return standard_header; }

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }

        /**
         * @brief Append a chunk at the end; duplicates are allowed
         */
        void append_chunk(chunk c);

        /**
         * @brief First chunk whose type equals the given text
         * @return Pointer into the container, or nullptr if there is none
         */
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        /**
         * @brief Remove the first chunk whose type equals the given text
         * @return The removed chunk
         * @throws chunk_not_found if no chunk has that type
         */
        chunk remove_chunk(std::string_view type);

        friend std::ostream& operator<<(std::ostream& os, const png& p);

    private:
        std::vector<chunk> m_chunks;
    };

} // namespace pngchunk
