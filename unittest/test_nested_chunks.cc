//
// Test chunk hierarchies: every chunk shares the position of the root stream
//

#include <doctest/doctest.h>
#include <pullstream/pull_stream.hh>
#include <pullstream/chunk.hh>
#include <pullstream/exceptions.hh>
#include "test_utils.hh"

using namespace pullstream;

// FORM(14) { "TEST" CHNK(2) { AB CD } }
static std::vector<std::byte> nested_form() {
    return make_bytes({'F', 'O', 'R', 'M', 0, 0, 0, 14,
                       'T', 'E', 'S', 'T',
                       'C', 'H', 'N', 'K', 0, 0, 0, 2,
                       0xAB, 0xCD});
}

TEST_CASE("nested chunks - walking a container") {
    pull_stream stream;
    stream.populate(nested_form());
    auto file = stream.create_chunk("file");

    CHECK(file.read_ascii4() == "FORM");
    auto form = file.create_chunk("FORM", file.read_long());
    CHECK(form.read_ascii4() == "TEST");

    std::vector<std::string> ids;
    while (form.has_more(8)) {
        auto id = form.read_ascii4();
        auto body = form.create_chunk(id, form.read_long());
        ids.push_back(body.name());
        CHECK(body.read_short() == 0xABCD);
        CHECK_FALSE(body.has_more());
        body.skip();
    }

    CHECK(ids == std::vector<std::string>{"CHNK"});
    CHECK_FALSE(form.has_more());
    CHECK_FALSE(file.has_more());
}

TEST_CASE("nested chunks - siblings observe each other's reads") {
    pull_stream stream;
    fill(stream, {1, 2, 3, 4, 5, 6, 7, 8});

    auto a = stream.create_chunk("a", 4);
    auto b = stream.create_chunk("b", 6);
    CHECK(a.remaining() == 4);
    CHECK(b.remaining() == 6);

    CHECK(a.read_short() == 0x0102);
    CHECK(a.remaining() == 2);
    CHECK(b.remaining() == 4);

    CHECK(b.read_3bytes() == 0x030405);
    CHECK(stream.tell() == 5);
    // b moved the shared position past a's end
    CHECK(a.remaining() == 0);
    CHECK_FALSE(a.has_more());
    CHECK_THROWS_AS(a.read_byte(), boundary_error);
    CHECK(b.remaining() == 1);
}

TEST_CASE("nested chunks - raw stream reads advance chunks") {
    pull_stream stream;
    fill(stream, {1, 2, 3, 4});
    auto c = stream.create_chunk("c", 3);

    stream.skip(2);
    CHECK(c.remaining() == 1);
    CHECK(c.read_byte() == 3);
    CHECK_FALSE(c.has_more());
}

TEST_CASE("nested chunks - sub-chunks are not clamped to the parent") {
    pull_stream stream;
    fill(stream, {1, 2, 3, 4, 5, 6, 7, 8});
    auto parent = stream.create_chunk("parent", 2);

    // wider than the parent, still inside the buffer
    auto child = parent.create_chunk("child", 5);
    CHECK(child.max_position() == 5);
    CHECK(child.read_long() == 0x01020304u);
    CHECK(child.read_byte() == 5);
    CHECK_FALSE(parent.has_more());

    // the buffer end is the only hard limit
    CHECK_THROWS_AS((void)parent.create_chunk("past the end", 4), boundary_error);
    auto open = parent.create_chunk("open");
    CHECK(open.max_position() == 8);
    CHECK(open.remaining() == 3);
}

TEST_CASE("nested chunks - chunk created from a chunk starts at the shared position") {
    pull_stream stream;
    fill(stream, {0, 0, 0, 3, 'a', 'b', 'c', 0, 0, 0, 1, 'z'});
    auto file = stream.create_chunk("file");

    auto first = file.create_chunk("first", file.read_long());
    CHECK(first.read_string_8859_1() == "abc");
    auto second = file.create_chunk("second", file.read_long());
    CHECK(second.read_string_8859_1() == "z");
    CHECK_FALSE(file.has_more());
}
