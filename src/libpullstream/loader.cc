//
// Created by igor on 04/09/2025.
//

#include <pullstream/loader.hh>
#include <pullstream/exceptions.hh>
#include <fstream>
#include <istream>
#include <system_error>

namespace pullstream {

    std::vector<std::byte> read_file_bytes(const std::filesystem::path& path, std::uint64_t max_size) {
        std::error_code ec;
        auto status = std::filesystem::status(path, ec);
        THROW_IO_IF(ec || !std::filesystem::exists(status), "Cannot open file '", path.string(), "'");
        THROW_IO_IF(std::filesystem::is_directory(status), "'", path.string(), "' is a directory");

        std::ifstream file(path, std::ios::binary);
        THROW_IO_UNLESS(file, "Cannot open file '", path.string(), "'");

        try {
            return read_stream_bytes(file, max_size);
        } catch (const io_error& e) {
            THROW_IO("Failed to read '", path.string(), "': ", e.what());
        }
    }

    std::vector<std::byte> read_stream_bytes(std::istream& is, std::uint64_t max_size) {
        THROW_IO_UNLESS(is.good(), "Stream in bad state");

        // Seekable streams tell us the size up front
        auto start = is.tellg();
        if (start != std::streampos(-1)) {
            is.seekg(0, std::ios::end);
            auto end = is.tellg();
            is.seekg(start, std::ios::beg);
            THROW_IO_IF(end == std::streampos(-1) || !is, "Failed to get stream size");

            auto size = static_cast<std::uint64_t>(end - start);
            THROW_IO_IF(size > max_size, "Input too large: ", size, " bytes, limit is ", max_size);

            std::vector<std::byte> data(static_cast<std::size_t>(size));
            if (size > 0) {
                is.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
                THROW_IO_IF(is.bad(), "Stream read failed");
                THROW_IO_IF(static_cast<std::uint64_t>(is.gcount()) != size,
                            "Unexpected EOF: requested ", size, " got ", is.gcount());
            }
            return data;
        }

        // Non-seekable input: read in blocks until EOF
        is.clear();
        std::vector<std::byte> data;
        char block[4096];
        while (is) {
            is.read(block, sizeof(block));
            auto got = static_cast<std::size_t>(is.gcount());
            THROW_IO_IF(is.bad(), "Stream read failed");
            THROW_IO_IF(data.size() + got > max_size, "Input too large: limit is ", max_size, " bytes");
            const auto* first = reinterpret_cast<const std::byte*>(block);
            data.insert(data.end(), first, first + got);
        }
        return data;
    }

}
