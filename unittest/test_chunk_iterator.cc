//
// Signature validation and chunk-by-chunk traversal of PNG streams
//

#include <doctest/doctest.h>
#include <apng/chunk_iterator.hh>
#include <apng/byte_buffer.hh>
#include <apng/chunk_types.hh>
#include <apng/exceptions.hh>

#include <vector>

#include "test_utils.hh"

using namespace apng;

TEST_CASE("chunk_iterator - traversal") {
    auto png = make_png({
        make_chunk(chunk_id::IHDR, ihdr_payload()),
        make_chunk(chunk_id::tEXt, to_bytes("Comment hello")),
        make_chunk(chunk_id::IEND, {})
    });
    auto ss = make_stream(png);
    byte_buffer buf(ss, byte_order::big);

    chunk_iterator it(buf);
    std::vector<chunk_header> chunks;
    while (it.has_next()) {
        chunks.push_back(it.current());
        it.next();
    }
    CHECK(it.at_end());

    REQUIRE(chunks.size() == 3);
    CHECK(chunks[0].id == chunk_id::IHDR);
    CHECK(chunks[0].length == 13);
    CHECK(chunks[0].file_offset == 8);
    CHECK(chunks[0].payload_offset == 16);
    CHECK(chunks[0].end_offset() == 33);

    CHECK(chunks[1].id == chunk_id::tEXt);
    CHECK(chunks[1].file_offset == 33);

    CHECK(chunks[2].id == chunk_id::IEND);
    CHECK(chunks[2].length == 0);
    CHECK(chunks[2].end_offset() == png.size());
}

TEST_CASE("chunk_iterator - next ignores how much of the payload was read") {
    auto png = make_png({
        make_chunk(chunk_id::IDAT, bytes(100)),
        make_chunk(chunk_id::IEND, {})
    });
    auto ss = make_stream(png);
    byte_buffer buf(ss, byte_order::big);

    chunk_iterator it(buf);
    REQUIRE(it.has_next());
    CHECK(buf.position() == it.current().payload_offset);
    buf.read_raw(37);
    it.next();
    REQUIRE(it.has_next());
    CHECK(it.current().id == chunk_id::IEND);
}

TEST_CASE("chunk_iterator - errors") {
    SUBCASE("signature only") {
        auto ss = make_stream(make_png({}));
        byte_buffer buf(ss, byte_order::big);
        chunk_iterator it(buf);
        CHECK_FALSE(it.has_next());
    }

    SUBCASE("wrong signature") {
        auto png = make_png({make_chunk(chunk_id::IEND, {})});
        png[1] = std::byte{'Q'};
        auto ss = make_stream(png);
        byte_buffer buf(ss, byte_order::big);
        CHECK_THROWS_AS(chunk_iterator{buf}, parse_error);
    }

    SUBCASE("stream shorter than the signature") {
        auto ss = make_stream(bytes{std::byte{0x89}, std::byte{'P'}});
        byte_buffer buf(ss, byte_order::big);
        CHECK_THROWS_AS(chunk_iterator{buf}, truncation_error);
    }

    SUBCASE("truncated chunk header") {
        auto png = make_png({make_chunk(chunk_id::IEND, {})});
        png.resize(png.size() - 8);
        auto ss = make_stream(png);
        byte_buffer buf(ss, byte_order::big);
        CHECK_THROWS_AS(chunk_iterator{buf}, truncation_error);
    }

    SUBCASE("payload runs past the end") {
        auto png = make_png({make_chunk(chunk_id::IDAT, bytes(64))});
        png.resize(png.size() - 20);
        auto ss = make_stream(png);
        byte_buffer buf(ss, byte_order::big);
        chunk_iterator it(buf);
        REQUIRE(it.has_next());
        CHECK_THROWS_AS(it.next(), range_error);
    }

    SUBCASE("little endian buffer is rejected") {
        auto ss = make_stream(make_png({}));
        byte_buffer buf(ss, byte_order::little);
        CHECK_THROWS_AS(chunk_iterator{buf}, parse_error);
    }
}
