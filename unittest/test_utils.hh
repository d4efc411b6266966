#pragma once

#include <cstdint>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

#include <apng/byte_buffer.hh>
#include <apng/chunk_types.hh>
#include <apng/crc32.hh>
#include <apng/fourcc.hh>

// Helpers assembling small PNG streams in memory

inline void append_be32(apng::bytes& out, std::uint32_t value) {
    auto encoded = apng::byte_buffer::encode<std::uint32_t>(value, apng::byte_order::big);
    out.insert(out.end(), encoded.begin(), encoded.end());
}

inline apng::bytes to_bytes(const std::string& text) {
    apng::bytes out;
    for (char c : text) {
        out.push_back(static_cast<std::byte>(c));
    }
    return out;
}

inline apng::bytes make_chunk(const apng::fourcc& tag, const apng::bytes& payload) {
    apng::bytes out;
    append_be32(out, static_cast<std::uint32_t>(payload.size()));

    apng::bytes covered = tag.to_bytes();
    covered.insert(covered.end(), payload.begin(), payload.end());
    out.insert(out.end(), covered.begin(), covered.end());

    append_be32(out, apng::crc32(covered));
    return out;
}

inline apng::bytes ihdr_payload(std::uint32_t width = 32, std::uint32_t height = 16) {
    apng::bytes out;
    append_be32(out, width);
    append_be32(out, height);
    for (std::uint8_t b : {8, 6, 0, 0, 0}) {
        out.push_back(static_cast<std::byte>(b));
    }
    return out;
}

inline apng::bytes actl_payload(std::uint32_t frames, std::uint32_t plays) {
    apng::bytes out;
    append_be32(out, frames);
    append_be32(out, plays);
    return out;
}

struct fctl_fields {
    std::uint32_t sequence_number = 0;
    std::uint32_t width = 32;
    std::uint32_t height = 16;
    std::uint32_t x_offset = 0;
    std::uint32_t y_offset = 0;
    std::uint16_t delay_num = 1;
    std::uint16_t delay_den = 100;
    std::uint8_t dispose_op = 0;
    std::uint8_t blend_op = 0;
};

inline apng::bytes fctl_payload(const fctl_fields& f) {
    apng::bytes out;
    append_be32(out, f.sequence_number);
    append_be32(out, f.width);
    append_be32(out, f.height);
    append_be32(out, f.x_offset);
    append_be32(out, f.y_offset);
    auto num = apng::byte_buffer::encode<std::uint16_t>(f.delay_num, apng::byte_order::big);
    auto den = apng::byte_buffer::encode<std::uint16_t>(f.delay_den, apng::byte_order::big);
    out.insert(out.end(), num.begin(), num.end());
    out.insert(out.end(), den.begin(), den.end());
    out.push_back(static_cast<std::byte>(f.dispose_op));
    out.push_back(static_cast<std::byte>(f.blend_op));
    return out;
}

inline apng::bytes make_png(std::initializer_list<apng::bytes> chunks) {
    apng::bytes out;
    for (auto b : apng::png_signature) {
        out.push_back(static_cast<std::byte>(b));
    }
    for (const auto& chunk : chunks) {
        out.insert(out.end(), chunk.begin(), chunk.end());
    }
    return out;
}

inline std::stringstream make_stream(const apng::bytes& data) {
    std::string text(reinterpret_cast<const char*>(data.data()), data.size());
    return std::stringstream(text, std::ios::in | std::ios::out | std::ios::binary);
}

inline apng::bytes stream_bytes(const std::stringstream& stream) {
    return to_bytes(stream.str());
}

inline apng::bytes slice(const apng::bytes& data, std::size_t offset, std::size_t count) {
    return apng::bytes(data.begin() + static_cast<std::ptrdiff_t>(offset),
                       data.begin() + static_cast<std::ptrdiff_t>(offset + count));
}

inline std::uint32_t be32_at(const apng::bytes& data, std::size_t offset) {
    return apng::byte_buffer::decode<std::uint32_t>(slice(data, offset, 4), apng::byte_order::big);
}

inline std::uint16_t be16_at(const apng::bytes& data, std::size_t offset) {
    return apng::byte_buffer::decode<std::uint16_t>(slice(data, offset, 2), apng::byte_order::big);
}
