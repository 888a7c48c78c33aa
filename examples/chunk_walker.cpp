/**
 * @file chunk_walker.cpp
 * @brief Prints the chunk tree of a big-endian IFF-85 style file
 *
 * Shows how nested chunks bound each level of the hierarchy. Every
 * chunk is "ID + 32-bit big-endian length + body", bodies of odd length
 * are followed by a pad byte, and FORM/LIST/CAT/PROP bodies start with a
 * type tag followed by more chunks.
 */

#include <pullstream/pull_stream.hh>
#include <pullstream/chunk.hh>
#include <pullstream/exceptions.hh>
#include <iostream>
#include <string>

namespace {

    bool is_container(const std::string& id) {
        return id == "FORM" || id == "LIST" || id == "CAT " || id == "PROP";
    }

    void walk(pullstream::chunk& parent, int depth) {
        const std::string indent(static_cast<std::size_t>(depth) * 2, ' ');

        while (parent.has_more(8)) {
            auto offset = parent.stream().tell();
            auto id = parent.read_ascii4();
            auto size = parent.read_long();

            // sub-chunks are only bounded by the file, so check against the parent here
            if (size > parent.remaining()) {
                std::cout << indent << id << " at offset " << offset << " claims " << size
                          << " bytes, only " << parent.remaining() << " left in " << parent.name() << "\n";
                parent.skip();
                return;
            }

            auto body = parent.create_chunk(id, size);
            std::cout << indent << id << " (" << size << " bytes)";

            if (is_container(id) && body.has_more(4)) {
                std::cout << " type " << body.read_ascii4() << "\n";
                walk(body, depth + 1);
            } else {
                std::cout << "\n";
            }
            body.skip();

            if ((size & 1) && parent.has_more()) {
                parent.skip(1);
            }
        }

        if (parent.has_more()) {
            std::cout << indent << parent.remaining() << " trailing bytes in " << parent.name() << "\n";
            parent.skip();
        }
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        std::cout << "Usage: " << argv[0] << " <file> [--trace]\n";
        std::cout << "\n";
        std::cout << "Lists the chunk hierarchy of an IFF-85 style file.\n";
        return 1;
    }

    pullstream::stream_options options;
    if (argc == 3 && std::string(argv[2]) == "--trace") {
        options.on_trace = pullstream::make_stderr_trace_handler();
    }

    try {
        pullstream::pull_stream stream(options);
        stream.load_file(argv[1]);

        std::cout << "Parsing: " << argv[1] << " (" << stream.max_position() << " bytes)\n";
        std::cout << "====================\n\n";

        auto file = stream.create_chunk(argv[1]);
        walk(file, 0);
    } catch (const pullstream::io_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const pullstream::boundary_error& e) {
        std::cerr << "Truncated file: " << e.what() << "\n";
        return 2;
    }

    return 0;
}
