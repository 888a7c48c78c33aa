//
// Created by igor on 03/09/2025.
//

#include "text_codec.hh"

namespace pullstream {
    namespace detail {

        namespace {
            inline unsigned octet(const std::byte* p) {
                return std::to_integer<unsigned>(*p);
            }

            inline bool is_high_surrogate(std::uint32_t u) { return u >= 0xD800 && u <= 0xDBFF; }
            inline bool is_low_surrogate(std::uint32_t u) { return u >= 0xDC00 && u <= 0xDFFF; }
        }

        void append_utf8(std::string& out, std::uint32_t cp) {
            if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
                cp = replacement_character;
            }

            if (cp < 0x80) {
                out.push_back(static_cast<char>(cp));
            } else if (cp < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp < 0x10000) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        std::string decode_latin1(const std::byte* first, const std::byte* last) {
            std::string result;
            result.reserve(static_cast<std::size_t>(last - first));
            for (; first != last; ++first) {
                append_utf8(result, octet(first));
            }
            return result;
        }

        std::string decode_utf8(const std::byte* first, const std::byte* last) {
            std::string result;
            result.reserve(static_cast<std::size_t>(last - first));

            while (first != last) {
                const unsigned lead = octet(first);
                if (lead < 0x80) {
                    result.push_back(static_cast<char>(lead));
                    ++first;
                    continue;
                }

                // Sequence length and the valid range of the second byte
                // (excludes overlong forms, surrogates and > U+10FFFF)
                std::size_t length = 0;
                unsigned lo = 0x80;
                unsigned hi = 0xBF;
                std::uint32_t cp = 0;
                if (lead >= 0xC2 && lead <= 0xDF) {
                    length = 2;
                    cp = lead & 0x1F;
                } else if (lead >= 0xE0 && lead <= 0xEF) {
                    length = 3;
                    cp = lead & 0x0F;
                    if (lead == 0xE0) lo = 0xA0;
                    if (lead == 0xED) hi = 0x9F;
                } else if (lead >= 0xF0 && lead <= 0xF4) {
                    length = 4;
                    cp = lead & 0x07;
                    if (lead == 0xF0) lo = 0x90;
                    if (lead == 0xF4) hi = 0x8F;
                } else {
                    append_utf8(result, replacement_character);
                    ++first;
                    continue;
                }

                std::size_t consumed = 1;
                bool valid = true;
                while (consumed < length) {
                    if (first + consumed == last) {
                        valid = false;
                        break;
                    }
                    const unsigned b = octet(first + consumed);
                    const unsigned min = consumed == 1 ? lo : 0x80;
                    const unsigned max = consumed == 1 ? hi : 0xBF;
                    if (b < min || b > max) {
                        valid = false;
                        break;
                    }
                    cp = (cp << 6) | (b & 0x3F);
                    ++consumed;
                }

                append_utf8(result, valid ? cp : replacement_character);
                first += consumed;
            }
            return result;
        }

        std::string decode_utf16(const std::vector<std::uint16_t>& units) {
            std::string result;
            result.reserve(units.size());

            for (std::size_t i = 0; i < units.size(); ++i) {
                const std::uint32_t u = units[i];
                if (is_high_surrogate(u) && i + 1 < units.size() && is_low_surrogate(units[i + 1])) {
                    const std::uint32_t low = units[i + 1];
                    append_utf8(result, 0x10000 + ((u - 0xD800) << 10) + (low - 0xDC00));
                    ++i;
                } else {
                    // lone surrogates are mapped to U+FFFD by append_utf8
                    append_utf8(result, u);
                }
            }
            return result;
        }

        std::string decode_utf16le(const std::byte* first, const std::byte* last) {
            std::vector<std::uint16_t> units;
            units.reserve(static_cast<std::size_t>(last - first) / 2);
            for (; last - first >= 2; first += 2) {
                units.push_back(static_cast<std::uint16_t>(octet(first) | (octet(first + 1) << 8)));
            }
            return decode_utf16(units);
        }
    }
}
