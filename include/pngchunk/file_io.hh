/**
 * @file file_io.hh
 * @brief Whole-file read and write helpers
 * @author Igor
 * @date 04/09/2025
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @brief Read a whole file into memory
     * @throws io_error if the file cannot be opened or read
     */
    PNGCHUNK_EXPORT std::vector<std::byte> read_file(const std::filesystem::path& path);

    /**
     * @brief Replace the contents of a file with the given bytes
     * @throws io_error if the file cannot be created or written
     */
    PNGCHUNK_EXPORT void write_file(const std::filesystem::path& path, const std::vector<std::byte>& bytes);

} // namespace pngchunk
