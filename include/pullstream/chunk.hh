/**
 * @file chunk.hh
 * @brief Bounded reading window over a pull_stream
 * @author Igor
 * @date 03/09/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <pullstream/export_pullstream.h>
#include <pullstream/byte_view.hh>

namespace pullstream {

    class pull_stream;

    /**
     * @class chunk
     * @brief A window on a pull_stream that prevents reading past its end
     *
     * A chunk owns no data and has no position of its own: it stores an
     * exclusive absolute upper bound and checks every read against it before
     * delegating to the stream. All chunks created from the same stream,
     * directly or through other chunks, advance the same shared position, so
     * reading through one chunk changes what its siblings see as remaining.
     *
     * Sub-chunks are bounded by the end of the buffer only. They are not
     * clamped to the parent chunk's bound.
     */
    class PULLSTREAM_EXPORT chunk {
    public:
        /**
         * @brief Create a chunk running to the end of the stream's buffer
         * @param name Friendly name, used for troubleshooting
         * @param stream Underlying stream
         */
        chunk(std::string name, pull_stream& stream);

        /**
         * @brief Create a chunk of given length at the stream's current position
         * @param name Friendly name, used for troubleshooting
         * @param stream Underlying stream
         * @param length Chunk length. Reads fail beyond this limit
         * @throws boundary_error if the chunk would extend past the buffer
         */
        chunk(std::string name, pull_stream& stream, std::size_t length);

        /**
         * @brief Create a sub-chunk at the current position running to the end of the buffer
         */
        [[nodiscard]] chunk create_chunk(std::string name) const;

        /**
         * @brief Create a sub-chunk at the current position with given length
         * @throws boundary_error if the sub-chunk would extend past the buffer
         */
        [[nodiscard]] chunk create_chunk(std::string name, std::size_t length) const;

        [[nodiscard]] const std::string& name() const noexcept { return m_name; }
        [[nodiscard]] std::size_t max_position() const noexcept { return m_max_position; }
        [[nodiscard]] pull_stream& stream() const noexcept { return *m_stream; }

        /**
         * @brief Bytes left before the chunk end (0 if the shared position is already past it)
         */
        [[nodiscard]] std::size_t remaining() const noexcept;

        /**
         * @brief Is there any more data in this chunk?
         * @param n Expected number of bytes
         */
        [[nodiscard]] bool has_more(std::size_t n = 1) const;

        /**
         * @brief Throw unless at least n bytes remain in the chunk
         * @throws boundary_error carrying position, chunk end and n
         */
        void ensure_capacity(std::size_t n) const;

        /**
         * @brief Skip to the end of the chunk
         */
        void skip();

        /**
         * @brief Skip n bytes
         * @throws boundary_error if fewer than n bytes remain in the chunk
         */
        void skip(std::size_t n);

        /**
         * @brief Move the chunk end further by n bytes
         * @throws boundary_error if the new end would be past the buffer
         */
        void extend(std::size_t n);

        std::uint8_t read_byte();
        std::uint16_t read_short();
        std::uint32_t read_3bytes();
        std::uint32_t read_long();
        std::string read_ascii3();
        std::string read_ascii4();

        /**
         * @brief View of the bytes from the current position to the chunk end
         *
         * Does not advance the position. Call skip() to consume the bytes.
         */
        [[nodiscard]] byte_view read_buffer() const;

        /**
         * @brief Decode the rest of the chunk as ISO-8859-1 and advance to its end
         */
        std::string read_string_8859_1();

        /**
         * @brief Decode the rest of the chunk as UTF-8
         *
         * Does not advance the position.
         */
        [[nodiscard]] std::string read_string_utf8() const;

        /**
         * @brief Decode the rest of the chunk as UTF-16LE
         *
         * Does not advance the position. A trailing odd byte is ignored.
         */
        [[nodiscard]] std::string read_string_utf16() const;

        /**
         * @brief Read a null-terminated ISO-8859-1 string
         * @param allow_short_read Accept a string ended by the chunk end instead of a 0
         * @return The decoded string, without the terminator
         * @throws boundary_error if no terminator is found and allow_short_read is false
         */
        std::string read_zstring_8859_1(bool allow_short_read = false);

        /**
         * @brief Read a null-terminated UTF-8 string
         * @param allow_short_read Accept a string ended by the chunk end instead of a 0
         * @return The decoded string, without the terminator
         * @throws boundary_error if no terminator is found and allow_short_read is false
         */
        std::string read_zstring_utf8(bool allow_short_read = false);

        /**
         * @brief Read a UTF-16 string terminated by a 0x0000 code unit
         * @param allow_short_read Accept a string ended by the chunk end instead of 0x0000
         * @return The decoded string (UTF-8), without BOMs or terminator
         * @throws boundary_error if no terminator is found and allow_short_read is false
         *
         * Little-endian unless a FE FF byte-order mark is met, after which
         * units are big-endian. FF FE marks are consumed. The byte sequence
         * FF 00 X, produced by some broken ID3 writers, is read as X FF 00.
         */
        std::string read_zstring_utf16(bool allow_short_read = false);

    private:
        void trace_creation() const;

        std::string m_name;
        pull_stream* m_stream;
        std::size_t m_max_position;
    };

}
