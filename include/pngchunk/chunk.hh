/**
 * @file chunk.hh
 * @brief A single PNG chunk: length, type, payload and CRC
 * @author Igor
 * @date 03/09/2025
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @class chunk
     * @brief One length-prefixed, checksummed record of a PNG file
     *
     * Wire layout (big-endian):
     * @code
     *   length : u32      payload byte count
     *   type   : 4 bytes
     *   data   : length bytes
     *   crc    : u32      CRC-32 over type ++ data
     * @endcode
     *
     * The CRC is always computed by the library; a chunk built from a type and
     * payload can never carry a stale checksum, and a decoded chunk is only
     * returned after its checksum has been verified.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        /// Bytes taken by length, type and crc fields
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Build a chunk from a type and payload, computing length and CRC
         * @throws invalid_length if the payload does not fit the 32-bit length field
         */
        chunk(const chunk_type& type, std::vector<std::byte> data);

        /**
         * @brief Build a chunk whose payload is the bytes of a text message
         */
        static chunk from_text(const chunk_type& type, std::string_view text);

        /**
         * @brief Decode a buffer holding exactly one chunk
         *
         * @throws invalid_length if the buffer is shorter than 12 bytes, the
         *         declared length runs past the end, or bytes follow the CRC
         * @throws invalid_chunk_type if the type bytes are not ASCII letters
         * @throws invalid_crc if the stored CRC does not match
         */
        static chunk decode(const std::byte* data, std::size_t size, const parse_options& options = {});
        static chunk decode(const std::vector<std::byte>& bytes, const parse_options& options = {});

        /**
         * @brief Decode the chunk at the front of a longer buffer
         *
         * Same checks as decode() but bytes after the CRC are left alone;
         * encoded_size() of the result tells how far to advance.
         *
         * @param offset Position of data within the enclosing buffer, used in
         *        error and warning messages
         */
        static chunk read(const std::byte* data, std::size_t size,
                          std::uint64_t offset, const parse_options& options);

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /// Size of the chunk on the wire: 12 + length()
        [[nodiscard]] std::size_t encoded_size() const { return overhead + m_data.size(); }

        /**
         * @brief Payload as text
         * @throws encoding_error if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /**
         * @brief Serialize to the wire layout; inverse of decode()
         */
        [[nodiscard]] std::vector<std::byte> as_bytes() const;

        // Append the wire layout to an existing buffer
        void write_to(std::vector<std::byte>& out) const;

        bool operator==(const chunk& o) const {
            return m_length == o.m_length && m_type == o.m_type &&
                   m_crc == o.m_crc && m_data == o.m_data;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

        friend std::ostream& operator<<(std::ostream& os, const chunk& c);

    private:
        chunk(std::uint32_t length, const chunk_type& type, std::vector<std::byte> data, std::uint32_t crc);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

} // namespace pngchunk
