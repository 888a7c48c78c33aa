//
// Created by igor on 02/09/2025.
//

#pragma once

#include <cstddef>
#include <vector>

namespace pullstream {

    // Non-owning view of a contiguous byte range inside a pull_stream buffer.
    // Valid as long as the stream that produced it is alive and not repopulated.
    class byte_view {
        public:
            constexpr byte_view() noexcept = default;
            constexpr byte_view(const std::byte* data, std::size_t size) noexcept
                : m_data(data), m_size(size) {}

            [[nodiscard]] constexpr const std::byte* data() const noexcept { return m_data; }
            [[nodiscard]] constexpr std::size_t size() const noexcept { return m_size; }
            [[nodiscard]] constexpr bool empty() const noexcept { return m_size == 0; }

            constexpr const std::byte& operator[](std::size_t i) const { return m_data[i]; }

            [[nodiscard]] constexpr const std::byte* begin() const noexcept { return m_data; }
            [[nodiscard]] constexpr const std::byte* end() const noexcept { return m_data + m_size; }

            [[nodiscard]] std::vector<std::byte> to_vector() const {
                return {begin(), end()};
            }

        private:
            const std::byte* m_data = nullptr;
            std::size_t m_size = 0;
    };
}
