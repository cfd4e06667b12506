/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG chunk decoding
 * @author Igor
 * @date 02/09/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @struct parse_options
     * @brief Configuration options for decoding chunks and PNG containers
     *
     * Controls strictness, size limits, and warning handling.
     */
    struct parse_options {
        /**
         * @brief Largest chunk length the PNG format allows (2^31 - 1)
         */
        static constexpr std::uint32_t png_max_chunk_size = 0x7FFFFFFFu;

        /**
         * @brief Strict chunk type checking
         *
         * When true, a chunk type with a lowercase third letter (reserved
         * bit set) is rejected. When false, it is accepted and reported
         * through on_warning.
         */
        bool strict = false;

        /**
         * @brief Maximum allowed declared chunk length in bytes
         *
         * Chunks declaring more than this are rejected with invalid_length.
         */
        std::uint32_t max_chunk_size = png_max_chunk_size;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Buffer offset of the chunk that triggered the warning
         * @param category Warning category (e.g., "reserved_bit")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during decoding.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
