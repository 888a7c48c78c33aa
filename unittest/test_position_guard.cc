//
// Created by igor on 06/09/2025.
//

#include <doctest/doctest.h>
#include <pullstream/pull_stream.hh>
#include <pullstream/chunk.hh>
#include <pullstream/exceptions.hh>
#include "test_utils.hh"

using namespace pullstream;

namespace {
    // Speculatively parse an ID3v2 header, leaving the stream untouched on failure
    bool try_parse_id3(chunk& c, std::uint8_t& version) {
        position_guard guard(c);
        try {
            if (c.read_ascii3() != "ID3") {
                return false;
            }
            version = c.read_byte();
            c.skip(6);
        } catch (const boundary_error&) {
            return false;
        }
        guard.commit();
        return true;
    }
}

TEST_CASE("position_guard - restores unless committed") {
    pull_stream stream;
    fill(stream, {1, 2, 3, 4});

    {
        position_guard guard(stream);
        CHECK(guard.saved_position() == 0);
        stream.skip(3);
    }
    CHECK(stream.tell() == 0);

    {
        position_guard guard(stream);
        stream.skip(3);
        guard.commit();
    }
    CHECK(stream.tell() == 3);
}

TEST_CASE("position_guard - restores on exception unwind") {
    pull_stream stream;
    fill(stream, {1, 2, 3});
    stream.skip(1);

    auto c = stream.create_chunk("c");
    CHECK_THROWS_AS([&] {
        position_guard guard(c);
        c.read_short();
        c.read_short();  // throws
        guard.commit();
    }(), boundary_error);
    CHECK(stream.tell() == 1);
}

TEST_CASE("position_guard - speculative parsing") {
    pull_stream stream;
    std::uint8_t version = 0;

    SUBCASE("matching header is consumed") {
        fill(stream, {'I', 'D', '3', 4, 0, 0, 0, 0, 0, 0, 'x'});
        auto c = stream.create_chunk("tag");
        CHECK(try_parse_id3(c, version));
        CHECK(version == 4);
        CHECK(stream.tell() == 10);
    }

    SUBCASE("wrong magic leaves the stream untouched") {
        fill(stream, {'T', 'A', 'G', 'x'});
        auto c = stream.create_chunk("tag");
        CHECK_FALSE(try_parse_id3(c, version));
        CHECK(stream.tell() == 0);
        CHECK(c.read_ascii3() == "TAG");
    }

    SUBCASE("truncated header leaves the stream untouched") {
        fill(stream, {'I', 'D', '3', 3, 0, 0});
        auto c = stream.create_chunk("tag");
        CHECK_FALSE(try_parse_id3(c, version));
        CHECK(stream.tell() == 0);
    }
}
