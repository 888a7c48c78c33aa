/**
 * @file loader.hh
 * @brief Loading input bytes into memory
 * @author Igor
 * @date 04/09/2025
 *
 * A pull_stream needs its whole input resident in memory. These helpers
 * produce that buffer from a file or a std::istream.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <vector>

#include <pullstream/export_pullstream.h>

namespace pullstream {

    /**
     * @brief Read a whole file
     * @param path File to read
     * @param max_size Maximum accepted file size in bytes
     * @return File contents
     * @throws io_error if the file cannot be opened or read, or is larger than max_size
     */
    PULLSTREAM_EXPORT std::vector<std::byte> read_file_bytes(const std::filesystem::path& path,
                                                             std::uint64_t max_size);

    /**
     * @brief Read everything from the current position of a stream to its end
     * @param is Source stream
     * @param max_size Maximum accepted number of bytes
     * @return Stream contents
     * @throws io_error on read failure or if more than max_size bytes are available
     */
    PULLSTREAM_EXPORT std::vector<std::byte> read_stream_bytes(std::istream& is, std::uint64_t max_size);

}
