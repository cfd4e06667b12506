//
// Created by igor on 03/09/2025.
//

#include <ostream>
#include <cstring>
#include <limits>

#include <pngchunk/chunk.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>

#include "crc.hh"
#include "utf8.hh"

namespace pngchunk {

    namespace {
        // Valid UTF-8 without control characters other than tab, LF and CR
        bool is_displayable_text(const std::vector<std::byte>& data) {
            for (std::byte b : data) {
                auto c = std::to_integer<unsigned>(b);
                if ((c < 0x20 && c != '\t' && c != '\n' && c != '\r') || c == 0x7F) {
                    return false;
                }
            }
            return utf8_valid_prefix(data.data(), data.size()) == data.size();
        }
    }

    chunk::chunk(const chunk_type& type, std::vector<std::byte> data)
        : m_length(0)
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(0) {
        PNGCHUNK_THROW_IF(m_data.size() > std::numeric_limits<std::uint32_t>::max(), invalid_length,
                          "Chunk '", m_type, "' payload of ", m_data.size(),
                          " bytes does not fit the 32-bit length field");
        m_length = static_cast<std::uint32_t>(m_data.size());
        m_crc = chunk_crc(m_type, m_data.data(), m_data.size());
    }

    chunk::chunk(std::uint32_t length, const chunk_type& type, std::vector<std::byte> data, std::uint32_t crc)
        : m_length(length)
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(crc) {
    }

    chunk chunk::from_text(const chunk_type& type, std::string_view text) {
        const auto* first = reinterpret_cast<const std::byte*>(text.data());
        return {type, std::vector<std::byte>(first, first + text.size())};
    }

    chunk chunk::decode(const std::byte* data, std::size_t size, const parse_options& options) {
        chunk result = read(data, size, 0, options);
        PNGCHUNK_THROW_IF(result.encoded_size() != size, invalid_length,
                          "Chunk '", result.type(), "' occupies ", result.encoded_size(),
                          " bytes but the buffer holds ", size);
        return result;
    }

    chunk chunk::decode(const std::vector<std::byte>& bytes, const parse_options& options) {
        return decode(bytes.data(), bytes.size(), options);
    }

    chunk chunk::read(const std::byte* data, std::size_t size,
                      std::uint64_t offset, const parse_options& options) {
        PNGCHUNK_THROW_IF(size < overhead, invalid_length,
                          "Chunk at offset ", offset, " needs at least ", overhead,
                          " bytes, only ", size, " available");

        const std::uint32_t length = load_be32(data);
        const chunk_type type = chunk_type::from_bytes(data + 4);

        PNGCHUNK_THROW_UNLESS(type.is_alphabetic(), invalid_chunk_type,
                              "Chunk at offset ", offset, " has invalid type '", type,
                              "': all four bytes must be ASCII letters");

        if (!type.is_reserved_bit_valid()) {
            PNGCHUNK_THROW_IF(options.strict, invalid_chunk_type,
                              "Chunk '", type, "' at offset ", offset, " has the reserved bit set");
            if (options.on_warning) {
                options.on_warning(offset, "reserved_bit",
                    build_error_msg("Chunk '", type, "' has the reserved bit set (lowercase third letter)"));
            }
        }

        PNGCHUNK_THROW_IF(length > options.max_chunk_size, invalid_length,
                          "Chunk '", type, "' at offset ", offset, " has length ", length,
                          " bytes, which exceeds maximum allowed size of ",
                          options.max_chunk_size, " bytes");

        // size >= overhead here
        PNGCHUNK_THROW_IF(length > size - overhead, invalid_length,
                          "Chunk '", type, "' at offset ", offset, " declares ", length,
                          " data bytes but only ", size - overhead, " remain");

        const std::byte* payload = data + 8;
        std::vector<std::byte> bytes(payload, payload + length);
        const std::uint32_t stored_crc = load_be32(payload + length);
        const std::uint32_t actual_crc = chunk_crc(type, bytes.data(), bytes.size());

        PNGCHUNK_THROW_IF(stored_crc != actual_crc, invalid_crc,
                          "Chunk '", type, "' at offset ", offset, " has CRC ", stored_crc,
                          ", computed ", actual_crc);

        return {length, type, std::move(bytes), stored_crc};
    }

    std::string chunk::data_as_string() const {
        std::size_t valid = utf8_valid_prefix(m_data.data(), m_data.size());
        PNGCHUNK_THROW_IF(valid != m_data.size(), encoding_error,
                          "Chunk '", m_type, "' data is not valid UTF-8 at byte ", valid);
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::vector<std::byte> chunk::as_bytes() const {
        std::vector<std::byte> out;
        out.reserve(encoded_size());
        write_to(out);
        return out;
    }

    void chunk::write_to(std::vector<std::byte>& out) const {
        std::size_t pos = out.size();
        out.resize(pos + encoded_size());

        std::byte* dst = out.data() + pos;
        store_be32(dst, m_length);
        m_type.to_bytes(dst + 4);
        if (!m_data.empty()) {
            std::memcpy(dst + 8, m_data.data(), m_data.size());
        }
        store_be32(dst + 8 + m_data.size(), m_crc);
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        os << "Chunk Type: " << c.m_type << "\n";
        os << "Length: " << c.m_length << "\n";
        if (is_displayable_text(c.m_data)) {
            os << "Data: " << c.data_as_string() << "\n";
        } else {
            os << "Data: <" << c.m_data.size() << " bytes of binary data>\n";
        }
        os << "CRC: " << c.m_crc;
        return os;
    }

} // namespace pngchunk
