//
// Created by igor on 03/09/2025.
//

#include <pullstream/chunk.hh>
#include <pullstream/pull_stream.hh>
#include <pullstream/exceptions.hh>
#include <utility>
#include <vector>

#include "text_codec.hh"

namespace pullstream {

    namespace {
        constexpr std::string_view category = "pullstream::chunk";

        inline unsigned octet(std::byte b) {
            return std::to_integer<unsigned>(b);
        }
    }

    chunk::chunk(std::string name, pull_stream& stream)
        : m_name(std::move(name))
        , m_stream(&stream)
        , m_max_position(stream.max_position()) {
        trace_creation();
    }

    chunk::chunk(std::string name, pull_stream& stream, std::size_t length)
        : m_name(std::move(name))
        , m_stream(&stream)
        , m_max_position(0) {
        if (length > stream.remaining()) {
            THROW_BOUNDARY(stream.tell(), stream.max_position(), length,
                           "chunk '", m_name, "' extends past the stream end");
        }
        m_max_position = stream.tell() + length;
        trace_creation();
    }

    void chunk::trace_creation() const {
        if (m_stream->tracing()) {
            m_stream->emit({category, "New chunk", {
                {"name", m_name},
                {"max_position", std::to_string(m_max_position)},
                {"position", std::to_string(m_stream->tell())}
            }});
        }
    }

    chunk chunk::create_chunk(std::string name) const {
        return chunk(std::move(name), *m_stream);
    }

    chunk chunk::create_chunk(std::string name, std::size_t length) const {
        return chunk(std::move(name), *m_stream, length);
    }

    std::size_t chunk::remaining() const noexcept {
        const std::size_t position = m_stream->tell();
        return position < m_max_position ? m_max_position - position : 0;
    }

    bool chunk::has_more(std::size_t n) const {
        const std::size_t position = m_stream->tell();
        if (m_stream->tracing()) {
            m_stream->emit({category, "Chunk has more?", {
                {"n", std::to_string(n)},
                {"max_position", std::to_string(m_max_position)},
                {"position", std::to_string(position)}
            }});
        }
        if (position > m_max_position) {
            return false;
        }
        return n <= m_max_position - position;
    }

    void chunk::ensure_capacity(std::size_t n) const {
        const std::size_t position = m_stream->tell();
        if (position > m_max_position || n > m_max_position - position) {
            if (m_stream->tracing()) {
                m_stream->emit({category, "Short read", {
                    {"name", m_name},
                    {"n", std::to_string(n)},
                    {"max_position", std::to_string(m_max_position)},
                    {"position", std::to_string(position)}
                }});
            }
            THROW_BOUNDARY(position, m_max_position, n, "chunk '", m_name, "' end boundary reached");
        }
    }

    void chunk::skip() {
        const std::size_t n = remaining();
        if (n == 0) {
            return;
        }
        m_stream->skip(n);
    }

    void chunk::skip(std::size_t n) {
        if (n == 0) {
            return;
        }
        ensure_capacity(n);
        m_stream->skip(n);
    }

    void chunk::extend(std::size_t n) {
        if (n > m_stream->max_position() - m_max_position) {
            THROW_BOUNDARY(m_stream->tell(), m_stream->max_position(), n,
                           "extending chunk '", m_name, "' past the stream end");
        }
        m_max_position += n;
    }

    std::uint8_t chunk::read_byte() {
        ensure_capacity(1);
        return m_stream->read_byte();
    }

    std::uint16_t chunk::read_short() {
        ensure_capacity(2);
        return m_stream->read_short();
    }

    std::uint32_t chunk::read_3bytes() {
        ensure_capacity(3);
        return m_stream->read_3bytes();
    }

    std::uint32_t chunk::read_long() {
        ensure_capacity(4);
        return m_stream->read_long();
    }

    std::string chunk::read_ascii3() {
        ensure_capacity(3);
        return m_stream->read_ascii3();
    }

    std::string chunk::read_ascii4() {
        ensure_capacity(4);
        return m_stream->read_ascii4();
    }

    byte_view chunk::read_buffer() const {
        const std::size_t position = m_stream->tell();
        return m_stream->view(position, position + remaining());
    }

    std::string chunk::read_string_8859_1() {
        const byte_view window = read_buffer();
        m_stream->m_position += window.size();
        return detail::decode_latin1(window.begin(), window.end());
    }

    std::string chunk::read_string_utf8() const {
        const byte_view window = read_buffer();
        return detail::decode_utf8(window.begin(), window.end());
    }

    std::string chunk::read_string_utf16() const {
        const byte_view window = read_buffer();
        return detail::decode_utf16le(window.begin(), window.end());
    }

    std::string chunk::read_zstring_8859_1(bool allow_short_read) {
        const std::size_t start = m_stream->tell();
        const byte_view window = read_buffer();

        for (std::size_t i = 0; i < window.size(); i++) {
            if (window[i] == std::byte{0}) {
                m_stream->m_position = start + i + 1;
                return detail::decode_latin1(window.begin(), window.begin() + i);
            }
        }

        if (!allow_short_read) {
            THROW_BOUNDARY(start, m_max_position, window.size() + 1,
                           "chunk '", m_name, "' end boundary reached when reading ISO-8859-1 string");
        }
        m_stream->m_position = start + window.size();
        return detail::decode_latin1(window.begin(), window.end());
    }

    std::string chunk::read_zstring_utf8(bool allow_short_read) {
        const std::size_t start = m_stream->tell();
        const byte_view window = read_buffer();

        for (std::size_t i = 0; i < window.size(); i++) {
            if (window[i] == std::byte{0}) {
                m_stream->m_position = start + i + 1;
                return detail::decode_utf8(window.begin(), window.begin() + i);
            }
        }

        if (!allow_short_read) {
            THROW_BOUNDARY(start, m_max_position, window.size() + 1,
                           "chunk '", m_name, "' end boundary reached when reading UTF-8 string");
        }
        m_stream->m_position = start + window.size();
        return detail::decode_utf8(window.begin(), window.end());
    }

    std::string chunk::read_zstring_utf16(bool allow_short_read) {
        const std::size_t start = m_stream->tell();
        const byte_view window = read_buffer();

        std::vector<std::uint16_t> units;
        bool big_endian = false;
        // set by the malformed BOM fix-up: the first byte of the next pair reads as 0x00
        bool zero_next = false;
        std::size_t i = 0;

        while (window.size() - i > 1) {
            unsigned b1 = zero_next ? 0u : octet(window[i]);
            unsigned b2 = octet(window[i + 1]);
            zero_next = false;
            i += 2;

            // Some ID3 tags have malformed BOMs: FF 00 FE must be read FE FF 00
            if (b1 == 0xFF && b2 == 0x00 && i < window.size()) {
                b2 = b1;
                b1 = octet(window[i]);
                zero_next = true;
            }
            if (b1 == 0xFF && b2 == 0xFE) {
                continue;
            }
            if (b1 == 0xFE && b2 == 0xFF) {
                big_endian = true;
                continue;
            }
            if (b1 == 0x00 && b2 == 0x00) {
                m_stream->m_position = start + i;
                return detail::decode_utf16(units);
            }
            units.push_back(static_cast<std::uint16_t>(big_endian ? (b1 << 8) | b2 : (b2 << 8) | b1));
        }

        if (!allow_short_read) {
            THROW_BOUNDARY(start, m_max_position, window.size() + 2,
                           "chunk '", m_name, "' end boundary reached when reading UTF-16 string");
        }
        // a dangling odd byte is left unread
        m_stream->m_position = start + i;
        return detail::decode_utf16(units);
    }

}
