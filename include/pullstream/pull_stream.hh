/**
 * @file pull_stream.hh
 * @brief Forward-only cursor over an in-memory byte buffer
 * @author Igor
 * @date 02/09/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

#include <pullstream/export_pullstream.h>
#include <pullstream/byte_view.hh>
#include <pullstream/stream_options.hh>

namespace pullstream {

    class chunk;
    class position_guard;

    /**
     * @class pull_stream
     * @brief Owns a byte buffer and the single read position over it
     *
     * All multi-byte integers are read big-endian. Every read or skip checks
     * capacity before touching the position, so a failed operation leaves
     * the stream exactly where it was.
     *
     * Chunks created from a stream keep a reference to it and share its
     * position, so a stream is neither copyable nor movable and must
     * outlive its chunks. A stream is not thread safe: one logical
     * reader is assumed.
     */
    class PULLSTREAM_EXPORT pull_stream {
        friend class chunk;
        friend class position_guard;

    public:
        /**
         * @brief Create an empty stream (length 0)
         */
        pull_stream();

        /**
         * @brief Create an empty stream with custom options
         * @param options Tracing and loader configuration
         */
        explicit pull_stream(stream_options options);

        pull_stream(const pull_stream&) = delete;
        pull_stream& operator = (const pull_stream&) = delete;

        pull_stream(pull_stream&&) = delete;
        pull_stream& operator = (pull_stream&&) = delete;

        /**
         * @brief Take ownership of a byte buffer and rewind to its start
         * @param bytes Buffer contents
         */
        void populate(std::vector<std::byte> bytes);

        /**
         * @brief Copy raw memory into the stream and rewind to its start
         * @param data Source memory
         * @param size Number of bytes to copy
         */
        void populate(const void* data, std::size_t size);

        /**
         * @brief Populate from a file
         * @param path File to load
         * @throws io_error if the file cannot be read or exceeds max_input_size
         */
        void load_file(const std::filesystem::path& path);

        /**
         * @brief Populate from everything remaining in an input stream
         * @param is Source stream
         * @throws io_error on read failure or if the input exceeds max_input_size
         */
        void load_stream(std::istream& is);

        /**
         * @brief Check that at least n unread bytes remain
         */
        [[nodiscard]] bool has_more(std::size_t n = 1) const noexcept;

        /**
         * @brief Throw unless at least n unread bytes remain
         * @throws boundary_error carrying position, length and n
         */
        void ensure_capacity(std::size_t n) const;

        [[nodiscard]] std::size_t remaining() const noexcept { return m_max_position - m_position; }
        [[nodiscard]] std::size_t tell() const noexcept { return m_position; }
        [[nodiscard]] std::size_t max_position() const noexcept { return m_max_position; }

        /**
         * @brief Restore a position previously obtained from tell()
         * @param position Absolute position, at most max_position()
         * @throws boundary_error if position is past the buffer end
         *
         * This is the only way to move backwards. Meant for callers that
         * snapshot the position before a speculative parse.
         */
        void rewind_to(std::size_t position);

        void skip(std::size_t n);

        std::uint8_t read_byte();
        std::uint16_t read_short();
        std::uint32_t read_3bytes();
        std::uint32_t read_long();

        /**
         * @brief Read a 3 character tag
         * @return Each byte as one code point (0-255), UTF-8 encoded
         */
        std::string read_ascii3();

        /**
         * @brief Read a 4 character tag
         * @return Each byte as one code point (0-255), UTF-8 encoded
         */
        std::string read_ascii4();

        /**
         * @brief Scan forward for a 3-byte big-endian signature
         * @param expected Signature in the low 24 bits
         * @return True if found, with the stream right after the signature.
         *         False if the stream was exhausted (position at the end).
         */
        bool scan_3bytes(std::uint32_t expected);

        /**
         * @brief Scan forward for a 4-byte big-endian signature
         * @param expected Signature
         * @return True if found, with the stream right after the signature.
         *         False if the stream was exhausted (position at the end).
         */
        bool scan_long(std::uint32_t expected);

        /**
         * @brief Create a chunk from the current position
         * @param name Diagnostic label
         * @return Chunk bounded by the end of the buffer
         */
        [[nodiscard]] chunk create_chunk(std::string name);

        /**
         * @brief Create a chunk of given length from the current position
         * @param name Diagnostic label
         * @param length Chunk length in bytes
         * @throws boundary_error if the chunk would extend past the buffer
         */
        [[nodiscard]] chunk create_chunk(std::string name, std::size_t length);

        [[nodiscard]] const stream_options& options() const noexcept { return m_options; }

        /**
         * @brief View of an absolute byte range of the buffer
         * @throws boundary_error unless from <= to <= max_position()
         */
        [[nodiscard]] byte_view view(std::size_t from, std::size_t to) const;

    private:
        [[nodiscard]] bool tracing() const noexcept { return static_cast<bool>(m_options.on_trace); }
        void emit(const trace_event& event) const { m_options.on_trace(event); }

        std::uint32_t read_be(std::size_t width);

        stream_options m_options;
        std::vector<std::byte> m_buffer;
        std::size_t m_position;
        std::size_t m_max_position;
    };

    /**
     * @class position_guard
     * @brief Restores a stream position on scope exit unless committed
     *
     * @code
     * pullstream::position_guard guard(stream);
     * auto header = try_parse_header(stream);   // may throw
     * guard.commit();
     * @endcode
     */
    class PULLSTREAM_EXPORT position_guard {
    public:
        explicit position_guard(pull_stream& stream) noexcept;
        explicit position_guard(chunk& c) noexcept;
        ~position_guard();

        position_guard(const position_guard&) = delete;
        position_guard& operator = (const position_guard&) = delete;

        /**
         * @brief Keep the current position when the guard goes out of scope
         */
        void commit() noexcept { m_committed = true; }

        [[nodiscard]] std::size_t saved_position() const noexcept { return m_saved; }

    private:
        pull_stream& m_stream;
        std::size_t m_saved;
        bool m_committed;
    };
}
