//
// PNG chunk header traversal.
//

#include <apng/chunk_iterator.hh>
#include <apng/byte_buffer.hh>
#include <apng/chunk_types.hh>
#include <apng/exceptions.hh>

#include <algorithm>

namespace apng {

    chunk_iterator::chunk_iterator(byte_buffer& buf)
        : m_buffer(buf), m_current{}, m_ended(false) {
        THROW_PARSE_IF(m_buffer.order() != byte_order::big,
                       "PNG chunks are big-endian, buffer uses ", m_buffer.order(), " byte order");

        auto sig = signature_schema().read(m_buffer).get_bytes("signature");
        bool valid = std::equal(sig.begin(), sig.end(), png_signature.begin(), png_signature.end(),
            [](std::byte a, std::uint8_t b) { return std::to_integer<std::uint8_t>(a) == b; });
        THROW_PARSE_UNLESS(valid, "Not a PNG stream: signature mismatch");

        if (!read_next_chunk()) {
            m_ended = true;
        }
    }

    void chunk_iterator::next() {
        if (m_ended) {
            return;
        }

        m_buffer.seek(m_current.end_offset());

        if (!read_next_chunk()) {
            m_ended = true;
        }
    }

    bool chunk_iterator::read_next_chunk() {
        if (m_buffer.eof()) {
            return false;
        }

        std::uint64_t start_pos = m_buffer.position();
        auto head = chunk_head_schema().read(m_buffer);

        m_current = {
            fourcc::from_bytes(head.get_bytes("type")),
            static_cast<std::uint32_t>(head.get_uint("length")),
            start_pos,
            m_buffer.position()
        };
        return true;
    }

} // namespace apng
