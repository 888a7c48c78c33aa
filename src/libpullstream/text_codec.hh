//
// Created by igor on 03/09/2025.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pullstream {
    namespace detail {

        constexpr std::uint32_t replacement_character = 0xFFFD;

        // Append a code point to a UTF-8 string. Invalid code points
        // (surrogates, > U+10FFFF) are written as U+FFFD.
        void append_utf8(std::string& out, std::uint32_t cp);

        // One byte per code point.
        std::string decode_latin1(const std::byte* first, const std::byte* last);

        // Malformed sequences are replaced by U+FFFD, one per maximal invalid subpart.
        std::string decode_utf8(const std::byte* first, const std::byte* last);

        // Surrogate pairs are joined; unpaired surrogates become U+FFFD.
        std::string decode_utf16(const std::vector<std::uint16_t>& units);

        // Little-endian code units; a dangling odd byte at the end is ignored.
        std::string decode_utf16le(const std::byte* first, const std::byte* last);
    }
}
