//
// Created by igor on 02/09/2025.
//

#include <pullstream/pull_stream.hh>
#include <pullstream/chunk.hh>
#include <pullstream/exceptions.hh>
#include <pullstream/loader.hh>
#include <algorithm>
#include <cstring>
#include <utility>

#include "text_codec.hh"

namespace pullstream {

    pull_stream::pull_stream()
        : pull_stream(stream_options{}) {}

    pull_stream::pull_stream(stream_options options)
        : m_options(std::move(options))
        , m_position(0)
        , m_max_position(0) {}

    void pull_stream::populate(std::vector<std::byte> bytes) {
        m_buffer = std::move(bytes);
        m_position = 0;
        m_max_position = m_buffer.size();
    }

    void pull_stream::populate(const void* data, std::size_t size) {
        THROW_IO_IF(!data && size > 0, "Null buffer in populate");
        std::vector<std::byte> bytes(size);
        if (size > 0) {
            std::memcpy(bytes.data(), data, size);
        }
        populate(std::move(bytes));
    }

    void pull_stream::load_file(const std::filesystem::path& path) {
        if (tracing()) {
            emit({"pullstream::stream", "Reading file", {{"file_name", path.string()}}});
        }
        populate(read_file_bytes(path, m_options.max_input_size));
    }

    void pull_stream::load_stream(std::istream& is) {
        populate(read_stream_bytes(is, m_options.max_input_size));
    }

    bool pull_stream::has_more(std::size_t n) const noexcept {
        return n <= remaining();
    }

    void pull_stream::ensure_capacity(std::size_t n) const {
        if (n > remaining()) {
            THROW_BOUNDARY(m_position, m_max_position, n, "stream end boundary reached");
        }
    }

    void pull_stream::rewind_to(std::size_t position) {
        if (position > m_max_position) {
            THROW_BOUNDARY(m_position, m_max_position, position, "rewind target is past the stream end");
        }
        m_position = position;
    }

    void pull_stream::skip(std::size_t n) {
        if (n == 0) {
            return;
        }
        ensure_capacity(n);
        m_position += n;
    }

    std::uint32_t pull_stream::read_be(std::size_t width) {
        ensure_capacity(width);
        std::uint32_t sum = 0;
        for (std::size_t i = 0; i < width; i++) {
            sum = (sum << 8) | std::to_integer<std::uint32_t>(m_buffer[m_position + i]);
        }
        m_position += width;
        return sum;
    }

    std::uint8_t pull_stream::read_byte() {
        return static_cast<std::uint8_t>(read_be(1));
    }

    std::uint16_t pull_stream::read_short() {
        return static_cast<std::uint16_t>(read_be(2));
    }

    std::uint32_t pull_stream::read_3bytes() {
        return read_be(3);
    }

    std::uint32_t pull_stream::read_long() {
        return read_be(4);
    }

    std::string pull_stream::read_ascii3() {
        ensure_capacity(3);
        const std::byte* first = m_buffer.data() + m_position;
        m_position += 3;
        return detail::decode_latin1(first, first + 3);
    }

    std::string pull_stream::read_ascii4() {
        ensure_capacity(4);
        const std::byte* first = m_buffer.data() + m_position;
        m_position += 4;
        return detail::decode_latin1(first, first + 4);
    }

    bool pull_stream::scan_3bytes(std::uint32_t expected) {
        std::uint32_t magic = 0;
        while (has_more()) {
            magic = ((magic & 0xFFFF) << 8) | read_byte();
            if (magic == expected) {
                return true;
            }
        }
        return false;
    }

    bool pull_stream::scan_long(std::uint32_t expected) {
        std::uint32_t magic = 0;
        while (has_more()) {
            magic = ((magic & 0xFFFFFF) << 8) | read_byte();
            if (magic == expected) {
                return true;
            }
        }
        return false;
    }

    chunk pull_stream::create_chunk(std::string name) {
        return chunk(std::move(name), *this);
    }

    chunk pull_stream::create_chunk(std::string name, std::size_t length) {
        return chunk(std::move(name), *this, length);
    }

    byte_view pull_stream::view(std::size_t from, std::size_t to) const {
        if (from > to || to > m_max_position) {
            THROW_BOUNDARY(from, m_max_position, to > from ? to - from : 0, "view outside of the stream");
        }
        return {m_buffer.data() + from, to - from};
    }

    // position_guard implementation
    position_guard::position_guard(pull_stream& stream) noexcept
        : m_stream(stream)
        , m_saved(stream.m_position)
        , m_committed(false) {}

    position_guard::position_guard(chunk& c) noexcept
        : position_guard(c.stream()) {}

    position_guard::~position_guard() {
        if (!m_committed) {
            // the stream may have been repopulated with a shorter buffer
            m_stream.m_position = std::min(m_saved, m_stream.m_max_position);
        }
    }
}
