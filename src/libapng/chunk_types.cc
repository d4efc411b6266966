//
// Schemas of the chunks the walker understands.
//

#include <apng/chunk_types.hh>

#include <ostream>

namespace apng {

    chunk_kind classify(const fourcc& tag) noexcept {
        using namespace chunk_id;
        if (tag == fcTL) {
            return chunk_kind::frame_control;
        }
        if (tag == IEND) {
            return chunk_kind::terminator;
        }
        if (tag == IHDR || tag == acTL || tag == tRNS || tag == IDAT || tag == fdAT || tag == tEXt) {
            return chunk_kind::skip;
        }
        return chunk_kind::unknown;
    }

    std::ostream& operator<<(std::ostream& os, chunk_kind kind) {
        switch (kind) {
            case chunk_kind::skip:          return os << "skip";
            case chunk_kind::frame_control: return os << "frame_control";
            case chunk_kind::terminator:    return os << "terminator";
            case chunk_kind::unknown:       return os << "unknown";
        }
        return os;
    }

    const schema& signature_schema() {
        static const schema s = schema::make("signature")
            .raw("signature", png_signature.size())
            .build();
        return s;
    }

    const schema& chunk_head_schema() {
        static const schema s = schema::make("chunk_head")
            .field("length", field_type::uint32)
            .raw("type", 4)
            .build();
        return s;
    }

    const schema& checksum_schema() {
        static const schema s = schema::make("crc")
            .field("crc", field_type::uint32, &derive_checksum)
            .build();
        return s;
    }

    const schema& ihdr_schema() {
        static const schema s = schema::make("IHDR")
            .field("width",              field_type::uint32)
            .field("height",             field_type::uint32)
            .field("bit_depth",          field_type::uint8)
            .field("colour_type",        field_type::uint8)
            .field("compression_method", field_type::uint8)
            .field("filter_method",      field_type::uint8)
            .field("interlace_method",   field_type::uint8)
            .include(checksum_schema())
            .build();
        return s;
    }

    const schema& actl_schema() {
        static const schema s = schema::make("acTL")
            .field("num_frames", field_type::uint32)
            .field("num_plays",  field_type::uint32)
            .include(checksum_schema())
            .build();
        return s;
    }

    const schema& fctl_schema() {
        static const schema s = schema::make("fcTL")
            .field("sequence_number", field_type::uint32)
            .field("width",           field_type::uint32)
            .field("height",          field_type::uint32)
            .field("x_offset",        field_type::uint32)
            .field("y_offset",        field_type::uint32)
            .field("delay_num",       field_type::uint16)
            .field("delay_den",       field_type::uint16)
            .field("dispose_op",      field_type::uint8)
            .field("blend_op",        field_type::uint8)
            .include(checksum_schema())
            .build();
        return s;
    }

    const schema& fdat_head_schema() {
        static const schema s = schema::make("fdAT")
            .field("sequence_number", field_type::uint32)
            .build();
        return s;
    }

} // namespace apng
