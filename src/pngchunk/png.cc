//
// Created by igor on 03/09/2025.
//

#include <algorithm>
#include <iomanip>
#include <ostream>

#include <pngchunk/png.hh>
#include <pngchunk/exceptions.hh>

namespace pngchunk {

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png png::decode(const std::byte* data, std::size_t size, const parse_options& options) {
        PNGCHUNK_THROW_IF(size < standard_header.size(), signature_mismatch,
                          "Buffer of ", size, " bytes is too short for the PNG signature");
        PNGCHUNK_THROW_UNLESS(std::equal(standard_header.begin(), standard_header.end(), data),
                              signature_mismatch, "Buffer does not start with the PNG signature");

        std::vector<chunk> chunks;
        std::size_t pos = standard_header.size();
        while (pos < size) {
            chunks.push_back(chunk::read(data + pos, size - pos, pos, options));
            pos += chunks.back().encoded_size();
        }
        return png(std::move(chunks));
    }

    png png::decode(const std::vector<std::byte>& bytes, const parse_options& options) {
        return decode(bytes.data(), bytes.size(), options);
    }

    std::vector<std::byte> png::as_bytes() const {
        std::size_t total = standard_header.size();
        for (const auto& c : m_chunks) {
            total += c.encoded_size();
        }

        std::vector<std::byte> out;
        out.reserve(total);
        out.insert(out.end(), standard_header.begin(), standard_header.end());
        for (const auto& c : m_chunks) {
            c.write_to(out);
        }
        return out;
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    const chunk* png::chunk_by_type(std::string_view type) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
                               [type](const chunk& c) { return c.type() == type; });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    chunk png::remove_chunk(std::string_view type) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
                               [type](const chunk& c) { return c.type() == type; });
        PNGCHUNK_THROW_IF(it == m_chunks.end(), chunk_not_found,
                          "Chunk '", type, "' not found");

        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    std::ostream& operator<<(std::ostream& os, const png& p) {
        auto flags = os.flags();
        auto fill = os.fill();

        os << "Signature:";
        for (std::byte b : p.header()) {
            os << ' ' << std::hex << std::setfill('0') << std::setw(2)
               << std::to_integer<unsigned>(b);
        }
        os.flags(flags);
        os.fill(fill);

        os << "\nChunks: " << p.m_chunks.size() << "\n";
        for (std::size_t i = 0; i < p.m_chunks.size(); ++i) {
            os << "\n[" << i << "]\n" << p.m_chunks[i] << "\n";
        }
        return os;
    }

} // namespace pngchunk
