/**
 * @file id3_frames.cpp
 * @brief Dumps the text frames of an ID3v2.3 / ID3v2.4 tag
 *
 * Demonstrates signature scanning and the string decoders: text frames
 * start with an encoding byte selecting ISO-8859-1, UTF-16 with BOM
 * or UTF-8.
 */

#include <pullstream/pull_stream.hh>
#include <pullstream/chunk.hh>
#include <pullstream/exceptions.hh>
#include <cstdint>
#include <iostream>
#include <string>

namespace {

    constexpr std::uint32_t ID3_MAGIC = 0x494433;  // "ID3"

    std::uint32_t syncsafe(std::uint32_t v) {
        return ((v >> 24) & 0x7F) << 21 | ((v >> 16) & 0x7F) << 14 | ((v >> 8) & 0x7F) << 7 | (v & 0x7F);
    }

    std::string read_text(pullstream::chunk& frame, std::uint8_t encoding) {
        switch (encoding) {
            case 0:
                return frame.read_zstring_8859_1(true);
            case 1:
                return frame.read_zstring_utf16(true);
            case 3:
                return frame.read_zstring_utf8(true);
            default:
                return "<unsupported encoding " + std::to_string(encoding) + ">";
        }
    }

    void dump_frame(const std::string& id, pullstream::chunk& frame) {
        if (id[0] == 'T' && id != "TXXX" && frame.has_more()) {
            auto encoding = frame.read_byte();
            std::cout << id << ": " << read_text(frame, encoding) << "\n";
        } else if (id == "COMM" && frame.has_more(4)) {
            auto encoding = frame.read_byte();
            auto language = frame.read_ascii3();
            auto description = read_text(frame, encoding);
            std::cout << id << " [" << language << "] " << description << ": " << read_text(frame, encoding) << "\n";
        } else {
            std::cout << id << ": " << frame.remaining() << " bytes\n";
        }
        frame.skip();
    }
}

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file>\n";
        return 1;
    }

    try {
        pullstream::pull_stream stream;
        stream.load_file(argv[1]);

        if (!stream.scan_3bytes(ID3_MAGIC)) {
            std::cerr << "No ID3v2 tag found\n";
            return 1;
        }

        auto header = stream.create_chunk("ID3 header", 7);
        auto major = header.read_byte();
        auto revision = header.read_byte();
        auto flags = header.read_byte();
        auto tag_size = syncsafe(header.read_long());
        std::cout << "ID3v2." << int(major) << "." << int(revision) << " (" << tag_size << " bytes)\n";

        if (major < 3 || major > 4) {
            std::cerr << "Only ID3v2.3 and ID3v2.4 frames are supported\n";
            return 1;
        }

        auto tag = stream.create_chunk("ID3 tag", tag_size);
        if (flags & 0x40) {
            // extended header, its size field excludes itself in v2.3
            auto ext_size = tag.read_long();
            tag.skip(major == 4 ? syncsafe(ext_size) - 4 : ext_size);
        }

        while (tag.has_more(10)) {
            auto id = tag.read_ascii4();
            if (id[0] == '\0') {
                break;  // padding
            }
            auto size = tag.read_long();
            if (major == 4) {
                size = syncsafe(size);
            }
            tag.skip(2);  // frame flags
            if (size > tag.remaining()) {
                std::cerr << "Frame " << id << " overruns the tag\n";
                return 1;
            }

            auto frame = tag.create_chunk(id, size);
            dump_frame(id, frame);
        }
    } catch (const pullstream::pullstream_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
