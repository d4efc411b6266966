//
// Read pass over a PNG stream.
//

#include <apng/walker.hh>
#include <apng/byte_buffer.hh>
#include <apng/chunk_iterator.hh>
#include <apng/chunk_types.hh>
#include <apng/crc32.hh>
#include <apng/exceptions.hh>

#include <algorithm>

namespace apng {

    namespace {
        constexpr std::size_t CRC_BLOCK_SIZE = 64 * 1024;

        // Leaves the buffer at the start of the payload
        void verify_checksum(byte_buffer& buf, const chunk_header& chunk) {
            buf.seek(chunk.payload_offset - 4);
            auto tag = buf.read_raw(4);
            std::uint32_t crc = update_crc32(0xFFFFFFFFu, tag.data(), tag.size());

            std::uint64_t remaining = chunk.length;
            while (remaining > 0) {
                auto block = buf.read_raw(static_cast<std::size_t>(std::min<std::uint64_t>(remaining, CRC_BLOCK_SIZE)));
                crc = update_crc32(crc, block.data(), block.size());
                remaining -= block.size();
            }
            crc ^= 0xFFFFFFFFu;

            auto stored = buf.read<std::uint32_t>();
            if (stored != crc) {
                THROW_CHECKSUM("CRC mismatch in chunk ", chunk.id, " at offset ", chunk.file_offset,
                               ": stored 0x", std::hex, stored, ", computed 0x", crc);
            }
            buf.seek(chunk.payload_offset);
        }

        // Payload length a schema expects; the schema includes the trailing CRC
        std::size_t payload_size(const schema& s) {
            return s.wire_size() - 4;
        }

        record read_sized(byte_buffer& buf, const chunk_header& chunk, const schema& s) {
            THROW_PARSE_IF(chunk.length != payload_size(s), "Chunk ", chunk.id, " at offset ", chunk.file_offset,
                           " has length ", chunk.length, ", expected ", payload_size(s));
            auto r = s.read(buf);
            r.set_tag(chunk.id);
            return r;
        }

        // Header records are informational; a non-standard length is reported, not fatal
        void report_header(byte_buffer& buf, const chunk_header& chunk, const schema& s,
                           const walk_options& options) {
            if (chunk.length != payload_size(s)) {
                if (options.on_warning) {
                    options.on_warning(chunk.file_offset, "header_size",
                                       build_error_msg("Chunk ", chunk.id, " has length ", chunk.length,
                                                       ", expected ", payload_size(s), "; not decoded"));
                }
                return;
            }
            auto r = s.read(buf);
            r.set_tag(chunk.id);
            options.on_header(r);
        }
    }

    frame_table walk(byte_buffer& buf, const walk_options& options) {
        frame_table frames;
        chunk_iterator it(buf);

        while (it.has_next()) {
            const auto& chunk = it.current();

            if (options.on_chunk) {
                options.on_chunk(chunk.file_offset, chunk.id, chunk.length);
            }

            const auto kind = classify(chunk.id);
            if (kind == chunk_kind::unknown) {
                THROW_UNKNOWN_CHUNK("Unhandled chunk ", chunk.id, " at offset ", chunk.file_offset);
            }
            if (options.verify_checksums) {
                verify_checksum(buf, chunk);
            }

            switch (kind) {
                case chunk_kind::frame_control:
                    frames.push_back({chunk.payload_offset, read_sized(buf, chunk, fctl_schema())});
                    break;
                case chunk_kind::skip:
                    if (options.on_header && chunk.id == chunk_id::IHDR) {
                        report_header(buf, chunk, ihdr_schema(), options);
                    } else if (options.on_header && chunk.id == chunk_id::acTL) {
                        report_header(buf, chunk, actl_schema(), options);
                    }
                    break;
                case chunk_kind::terminator:
                    return frames;
                case chunk_kind::unknown: // rejected above
                    break;
            }

            it.next();
        }

        return frames;
    }

} // namespace apng
