//
// Test that error messages carry enough context to locate the problem
//

#include <doctest/doctest.h>
#include <string>

#include <pullstream/pull_stream.hh>
#include <pullstream/chunk.hh>
#include <pullstream/exceptions.hh>
#include "test_utils.hh"

using namespace pullstream;

TEST_CASE("Error messages") {
    SUBCASE("stream short read - shows position, bound and size") {
        pull_stream stream;
        fill(stream, {1, 2, 3, 4, 5, 6, 7});
        stream.skip(5);

        try {
            stream.read_long();
            FAIL("Should have thrown exception");
        } catch (const boundary_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(msg.find("stream end boundary reached") != std::string::npos);
            CHECK(msg.find("position=5") != std::string::npos);
            CHECK(msg.find("bound=7") != std::string::npos);
            CHECK(msg.find("requested=4") != std::string::npos);
        }
    }

    SUBCASE("chunk short read - names the chunk") {
        pull_stream stream;
        fill(stream, {1, 2, 3, 4, 5, 6, 7, 8});
        auto c = stream.create_chunk("COMM", 3);

        try {
            c.read_long();
            FAIL("Should have thrown exception");
        } catch (const boundary_error& e) {
            std::string msg = e.what();
            INFO("Error message: " << msg);
            CHECK(msg.find("'COMM'") != std::string::npos);
            CHECK(msg.find("bound=3") != std::string::npos);
            CHECK(e.position() == 0);
            CHECK(e.bound() == 3);
            CHECK(e.requested() == 4);
        }
    }

    SUBCASE("unterminated strings - names the encoding") {
        pull_stream stream;
        fill(stream, {'a', 'b', 'c', 'd'});
        auto c = stream.create_chunk("TIT2");

        try {
            c.read_zstring_utf16();
            FAIL("Should have thrown exception");
        } catch (const boundary_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("UTF-16") != std::string::npos);
            CHECK(msg.find("'TIT2'") != std::string::npos);
            CHECK(e.position() == 0);
            CHECK(e.bound() == 4);
        }

        try {
            c.read_zstring_8859_1();
            FAIL("Should have thrown exception");
        } catch (const boundary_error& e) {
            CHECK(std::string(e.what()).find("ISO-8859-1") != std::string::npos);
        }

        try {
            c.read_zstring_utf8();
            FAIL("Should have thrown exception");
        } catch (const boundary_error& e) {
            CHECK(std::string(e.what()).find("UTF-8") != std::string::npos);
        }
    }

    SUBCASE("chunk past the stream end") {
        pull_stream stream;
        fill(stream, {1, 2, 3, 4});

        try {
            (void)stream.create_chunk("DATA", 100);
            FAIL("Should have thrown exception");
        } catch (const boundary_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("'DATA'") != std::string::npos);
            CHECK(msg.find("requested=100") != std::string::npos);
        }
    }

    SUBCASE("all errors derive from pullstream_error") {
        pull_stream stream;
        CHECK_THROWS_AS(stream.read_byte(), pullstream_error);
        CHECK_THROWS_AS(stream.load_file(test_file("missing.bin")), pullstream_error);
        CHECK_THROWS_AS(stream.read_byte(), std::runtime_error);
    }
}
