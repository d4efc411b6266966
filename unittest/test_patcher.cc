//
// Write pass: delay overrides and checksum re-derivation of frame control chunks
//

#include <doctest/doctest.h>
#include <apng/patcher.hh>
#include <apng/byte_buffer.hh>
#include <apng/chunk_types.hh>
#include <apng/crc32.hh>
#include <apng/walker.hh>

#include <vector>

#include "test_utils.hh"

using namespace apng;

namespace {
    struct animation {
        bytes png;
        std::vector<fctl_fields> frames;
    };

    animation three_frames() {
        animation a;
        for (std::uint32_t i = 0; i < 3; i++) {
            fctl_fields f;
            f.sequence_number = i * 2;
            f.x_offset = i;
            f.y_offset = 10 + i;
            f.delay_num = static_cast<std::uint16_t>(3 + i * 4);
            f.delay_den = 100;
            f.dispose_op = static_cast<std::uint8_t>(i % 3);
            f.blend_op = static_cast<std::uint8_t>(i % 2);
            a.frames.push_back(f);
        }

        a.png = make_png({
            make_chunk(chunk_id::IHDR, ihdr_payload()),
            make_chunk(chunk_id::acTL, actl_payload(3, 0)),
            make_chunk(chunk_id::fcTL, fctl_payload(a.frames[0])),
            make_chunk(chunk_id::IDAT, bytes(40, std::byte{0x11})),
            make_chunk(chunk_id::fcTL, fctl_payload(a.frames[1])),
            make_chunk(chunk_id::fdAT, bytes(44, std::byte{0x22})),
            make_chunk(chunk_id::fcTL, fctl_payload(a.frames[2])),
            make_chunk(chunk_id::fdAT, bytes(44, std::byte{0x33})),
            make_chunk(chunk_id::IEND, {})
        });
        return a;
    }

    frame_table walk_bytes(const bytes& png) {
        auto ss = make_stream(png);
        byte_buffer buf(ss, byte_order::big);
        return walk(buf);
    }

    bytes patch_bytes(const bytes& png, const patch_options& options) {
        auto frames = walk_bytes(png);
        auto ss = make_stream(png);
        byte_buffer buf(ss, byte_order::big);
        patch(buf, frames, options);
        return stream_bytes(ss);
    }
}

TEST_CASE("patcher - delay override rewrites every frame") {
    auto a = three_frames();
    auto before = walk_bytes(a.png);
    REQUIRE(before.size() == 3);

    patch_options options;
    options.delay = 10;
    auto out = patch_bytes(a.png, options);
    REQUIRE(out.size() == a.png.size());

    auto after = walk_bytes(out);
    REQUIRE(after.size() == 3);

    for (std::size_t i = 0; i < 3; i++) {
        CAPTURE(i);
        const auto& f = after[i].data;
        CHECK(after[i].offset == before[i].offset);
        CHECK(f.get_uint("delay_num") == 10);
        CHECK(f.get_uint("delay_den") == a.frames[i].delay_den);
        CHECK(f.get_uint("sequence_number") == a.frames[i].sequence_number);
        CHECK(f.get_uint("x_offset") == a.frames[i].x_offset);
        CHECK(f.get_uint("y_offset") == a.frames[i].y_offset);
        CHECK(f.get_uint("dispose_op") == a.frames[i].dispose_op);
        CHECK(f.get_uint("blend_op") == a.frames[i].blend_op);

        // CRC covers tag and the rewritten payload
        auto covered = slice(out, after[i].offset - 4, 4 + fctl_payload_size);
        CHECK(f.get_uint("crc") == crc32(covered));
        CHECK(f.get_uint("crc") != before[i].data.get_uint("crc"));
    }

    SUBCASE("bytes outside the frame control payloads are untouched") {
        std::vector<bool> touched(out.size(), false);
        for (const auto& frame : before) {
            for (std::size_t k = 0; k < fctl_payload_size + 4; k++) {
                touched[frame.offset + k] = true;
            }
        }
        for (std::size_t k = 0; k < out.size(); k++) {
            if (!touched[k]) {
                CAPTURE(k);
                CHECK(out[k] == a.png[k]);
            }
        }
    }

    SUBCASE("patched output passes strict verification") {
        auto ss = make_stream(out);
        byte_buffer buf(ss, byte_order::big);
        walk_options strict;
        strict.verify_checksums = true;
        CHECK_NOTHROW(walk(buf, strict));
    }
}

TEST_CASE("patcher - without override the file is unchanged") {
    auto a = three_frames();
    CHECK(patch_bytes(a.png, patch_options{}) == a.png);
}

TEST_CASE("patcher - override equal to the current delay keeps the CRC") {
    fctl_fields f;
    f.delay_num = 10;
    auto png = make_png({make_chunk(chunk_id::fcTL, fctl_payload(f)), make_chunk(chunk_id::IEND, {})});

    patch_options options;
    options.delay = 10;
    CHECK(patch_bytes(png, options) == png);
}

TEST_CASE("patcher - on_write sees the final record") {
    auto a = three_frames();
    auto frames = walk_bytes(a.png);

    std::vector<std::uint64_t> offsets;
    std::vector<record> written;

    patch_options options;
    options.delay = 0;
    options.on_write = [&](std::uint64_t offset, const record& r) {
        offsets.push_back(offset);
        written.push_back(r);
    };

    auto ss = make_stream(a.png);
    byte_buffer buf(ss, byte_order::big);
    patch(buf, frames, options);
    auto out = stream_bytes(ss);

    REQUIRE(written.size() == 3);
    for (std::size_t i = 0; i < 3; i++) {
        CHECK(offsets[i] == frames[i].offset);
        CHECK(written[i].get_uint("delay_num") == 0);
        CHECK(written[i].get_uint("crc") == be32_at(out, frames[i].offset + fctl_payload_size));
    }
}

TEST_CASE("patcher - offsets outside the stream") {
    auto a = three_frames();
    auto frames = walk_bytes(a.png);
    frames[1].offset = a.png.size() + 1;

    auto ss = make_stream(a.png);
    byte_buffer buf(ss, byte_order::big);
    CHECK_THROWS_AS(patch(buf, frames, patch_options{}), range_error);
}
