//
// Created by igor on 04/09/2025.
//

#include <fstream>
#include <system_error>

#include <pngchunk/file_io.hh>
#include <pngchunk/exceptions.hh>

namespace pngchunk {

    std::vector<std::byte> read_file(const std::filesystem::path& path) {
        std::error_code ec;
        THROW_IO_IF(!std::filesystem::is_regular_file(path, ec),
                    "'", path.string(), "' is not a regular file");

        std::ifstream stream(path, std::ios::binary);
        THROW_IO_IF(!stream, "Cannot open file '", path.string(), "' for reading");

        stream.seekg(0, std::ios::end);
        auto end = stream.tellg();
        THROW_IO_IF(end == std::streampos(-1), "Failed to get size of '", path.string(), "'");
        stream.seekg(0, std::ios::beg);

        std::vector<std::byte> data(static_cast<std::size_t>(end));
        if (!data.empty()) {
            stream.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
            THROW_IO_IF(static_cast<std::size_t>(stream.gcount()) != data.size(),
                        "Unexpected EOF in '", path.string(), "': requested ", data.size(),
                        " got ", stream.gcount());
        }
        return data;
    }

    void write_file(const std::filesystem::path& path, const std::vector<std::byte>& bytes) {
        std::ofstream stream(path, std::ios::binary | std::ios::trunc);
        THROW_IO_IF(!stream, "Cannot open file '", path.string(), "' for writing");

        stream.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        stream.flush();
        THROW_IO_IF(!stream, "Failed to write ", bytes.size(), " bytes to '", path.string(), "'");
    }

} // namespace pngchunk
