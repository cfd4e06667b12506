//
// Created by igor on 02/09/2025.
//
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <iomanip>
#include <stdexcept>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {
    /**
     * @struct chunk_type
     * @brief Four byte PNG chunk type code
     *
     * Bit 5 (0x20, the ASCII lowercase bit) of each byte carries a property:
     * byte 0 ancillary, byte 1 private, byte 2 reserved, byte 3 safe-to-copy.
     * Any four bytes can be held; is_valid() tells whether they form a
     * conforming type.
     */
    struct PNGCHUNK_EXPORT chunk_type {
        static constexpr std::uint8_t property_bit = 0x20;

        std::array<std::uint8_t, 4> b{};

        constexpr chunk_type() = default;

        // Constructor from 4 individual chars
        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : b{ static_cast<std::uint8_t>(c0), static_cast<std::uint8_t>(c1),
                 static_cast<std::uint8_t>(c2), static_cast<std::uint8_t>(c3) } {}

        // Constructor from raw bytes, never fails
        static chunk_type from_bytes(const void* data) {
            chunk_type result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        static chunk_type from_bytes(const std::array<std::uint8_t, 4>& bytes) {
            chunk_type result;
            result.b = bytes;
            return result;
        }

        /**
         * @brief Parse a chunk type from its textual form
         * @throws invalid_chunk_type unless text is exactly four ASCII letters
         */
        static chunk_type from_string(std::string_view text);

        [[nodiscard]] const std::array<std::uint8_t, 4>& bytes() const { return b; }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(b.data()), 4};
        }

        [[nodiscard]] static constexpr bool is_letter(std::uint8_t c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        // All four bytes are ASCII letters
        [[nodiscard]] constexpr bool is_alphabetic() const {
            return is_letter(b[0]) && is_letter(b[1]) && is_letter(b[2]) && is_letter(b[3]);
        }

        [[nodiscard]] constexpr bool is_valid() const {
            return is_alphabetic() && is_reserved_bit_valid();
        }

        // Uppercase first letter: decoders must understand the chunk
        [[nodiscard]] constexpr bool is_critical() const {
            return (b[0] & property_bit) == 0;
        }

        // Uppercase second letter: registered with the PNG specification
        [[nodiscard]] constexpr bool is_public() const {
            return (b[1] & property_bit) == 0;
        }

        [[nodiscard]] constexpr bool is_reserved_bit_valid() const {
            return (b[2] & property_bit) == 0;
        }

        // Lowercase fourth letter: editors may copy the chunk without understanding it
        [[nodiscard]] constexpr bool is_safe_to_copy() const {
            return (b[3] & property_bit) != 0;
        }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return b == o.b; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return b < o.b; }

        bool operator==(std::string_view text) const {
            return text.size() == 4 && std::equal(b.begin(), b.end(), text.begin(),
                [](std::uint8_t l, char r) { return l == static_cast<std::uint8_t>(r); });
        }
        bool operator!=(std::string_view text) const { return !(*this == text); }

        // Stream output, non-printable bytes are escaped
        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            for (std::uint8_t c : t.b) {
                if (c >= 32 && c <= 126) {
                    os << static_cast<char>(c);
                } else {
                    auto flags = os.flags();
                    auto fill = os.fill();
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(c);
                    os.flags(flags);
                    os.fill(fill);
                }
            }
            return os;
        }
    };

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.b.data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for well known chunk types, e.g. "IEND"_ct
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != 4) {
            throw std::invalid_argument("Chunk type literal must be exactly 4 characters");
        }
        return {str[0], str[1], str[2], str[3]};
    }
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
