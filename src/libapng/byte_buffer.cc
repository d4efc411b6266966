//
// byte_buffer: cursor bookkeeping and runtime type dispatch.
//

#include <algorithm>
#include <istream>
#include <limits>

#include <apng/byte_buffer.hh>

namespace apng {

    namespace {
        template<typename T>
        T narrow(const field_value& value, field_type type) {
            if constexpr (std::is_signed_v<T>) {
                const auto* v = std::get_if<std::int64_t>(&value);
                THROW_SCHEMA_IF(!v, "Field of type ", type, " expects a signed integer");
                if constexpr (sizeof(T) < sizeof(std::int64_t)) {
                    THROW_SCHEMA_IF(*v < std::numeric_limits<T>::min() || *v > std::numeric_limits<T>::max(),
                                    "Value ", *v, " does not fit into ", type);
                }
                return static_cast<T>(*v);
            } else {
                const auto* v = std::get_if<std::uint64_t>(&value);
                THROW_SCHEMA_IF(!v, "Field of type ", type, " expects an unsigned integer");
                if constexpr (sizeof(T) < sizeof(std::uint64_t)) {
                    THROW_SCHEMA_IF(*v > std::numeric_limits<T>::max(),
                                    "Value ", *v, " does not fit into ", type);
                }
                return static_cast<T>(*v);
            }
        }

        template<typename T>
        field_value widen(T value) {
            if constexpr (std::is_signed_v<T>) {
                return static_cast<std::int64_t>(value);
            } else {
                return static_cast<std::uint64_t>(value);
            }
        }

        template<typename T>
        bytes encode_as(const field_value& value, field_type type, byte_order bo) {
            return byte_buffer::encode<T>(narrow<T>(value, type), bo);
        }

        template<typename T>
        field_value decode_as(const bytes& data, byte_order bo) {
            return widen(byte_buffer::decode<T>(data, bo));
        }
    }

    byte_buffer::byte_buffer(std::iostream& stream, byte_order order)
        : m_stream(stream), m_order(order), m_position(0) {
        m_stream.clear();
        auto pos = m_stream.tellg();
        THROW_IO_IF(pos == std::streampos(-1), "Stream is not seekable");
        m_position = static_cast<std::uint64_t>(pos);
    }

    void byte_buffer::seek(std::uint64_t offset) {
        auto limit = size();
        if (offset > limit) {
            THROW_RANGE("Cannot seek to offset ", offset, " - stream size is only ", limit, " bytes");
        }
        m_position = offset;
    }

    void byte_buffer::step(std::int64_t delta) {
        auto limit = size();
        // Magnitude computed in unsigned arithmetic so INT64_MIN does not overflow
        if (delta < 0 && std::uint64_t{0} - static_cast<std::uint64_t>(delta) > m_position) {
            THROW_RANGE("Cannot step ", delta, " bytes back from offset ", m_position);
        }
        std::uint64_t target = m_position + static_cast<std::uint64_t>(delta);
        if (target > limit) {
            THROW_RANGE("Cannot step ", delta, " bytes from offset ", m_position,
                        " - stream size is only ", limit, " bytes");
        }
        m_position = target;
    }

    std::uint64_t byte_buffer::size() const {
        m_stream.clear();
        m_stream.seekg(0, std::ios_base::end);
        std::streampos end_pos = m_stream.tellg();
        THROW_IO_IF(end_pos == std::streampos(-1), "Failed to get stream size");
        return static_cast<std::uint64_t>(end_pos);
    }

    bool byte_buffer::eof() const {
        return m_position >= size();
    }

    bytes byte_buffer::read_raw(std::size_t n) {
        bytes out(n);
        if (n == 0) {
            return out;
        }

        m_stream.clear();
        m_stream.seekg(static_cast<std::streamoff>(m_position), std::ios_base::beg);
        THROW_IO_IF(m_stream.fail(), "Cannot position stream at offset ", m_position);

        m_stream.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(n));
        auto actual = static_cast<std::size_t>(m_stream.gcount());
        THROW_IO_IF(m_stream.bad(), "Stream read failed at offset ", m_position);
        if (actual != n) {
            THROW_TRUNCATION("Unexpected end of stream at offset ", m_position,
                             ": requested ", n, " bytes, got ", actual);
        }

        m_position += n;
        return out;
    }

    void byte_buffer::write_raw(const bytes& data, std::size_t n) {
        if (n == 0) {
            return;
        }

        bytes out(n);
        std::copy_n(data.begin(), std::min(n, data.size()), out.begin());

        m_stream.clear();
        m_stream.seekp(static_cast<std::streamoff>(m_position), std::ios_base::beg);
        THROW_IO_IF(m_stream.fail(), "Cannot position stream at offset ", m_position);

        m_stream.write(reinterpret_cast<const char*>(out.data()), static_cast<std::streamsize>(n));
        THROW_IO_IF(!m_stream, "Stream write of ", n, " bytes failed at offset ", m_position);

        m_position += n;
    }

    field_value byte_buffer::read_value(field_type type, std::size_t length) {
        return decode_value(type, length, read_raw(field_width(type, length)));
    }

    void byte_buffer::write_value(field_type type, std::size_t length, const field_value& value) {
        write_raw(encode_value(type, length, value), field_width(type, length));
    }

    bytes byte_buffer::encode_value(field_type type, std::size_t length, const field_value& value, byte_order bo) {
        switch (type) {
            case field_type::int8:   return encode_as<std::int8_t>(value, type, bo);
            case field_type::uint8:  return encode_as<std::uint8_t>(value, type, bo);
            case field_type::int16:  return encode_as<std::int16_t>(value, type, bo);
            case field_type::uint16: return encode_as<std::uint16_t>(value, type, bo);
            case field_type::int32:  return encode_as<std::int32_t>(value, type, bo);
            case field_type::uint32: return encode_as<std::uint32_t>(value, type, bo);
            case field_type::int64:  return encode_as<std::int64_t>(value, type, bo);
            case field_type::uint64: return encode_as<std::uint64_t>(value, type, bo);
            case field_type::raw_bytes: {
                const auto* data = std::get_if<bytes>(&value);
                THROW_SCHEMA_IF(!data, "Raw field expects a byte run");
                bytes out(length);
                std::copy_n(data->begin(), std::min(length, data->size()), out.begin());
                return out;
            }
        }
        THROW_SCHEMA("Unsupported field type ", static_cast<int>(type));
    }

    field_value byte_buffer::decode_value(field_type type, std::size_t length, const bytes& data, byte_order bo) {
        switch (type) {
            case field_type::int8:   return decode_as<std::int8_t>(data, bo);
            case field_type::uint8:  return decode_as<std::uint8_t>(data, bo);
            case field_type::int16:  return decode_as<std::int16_t>(data, bo);
            case field_type::uint16: return decode_as<std::uint16_t>(data, bo);
            case field_type::int32:  return decode_as<std::int32_t>(data, bo);
            case field_type::uint32: return decode_as<std::uint32_t>(data, bo);
            case field_type::int64:  return decode_as<std::int64_t>(data, bo);
            case field_type::uint64: return decode_as<std::uint64_t>(data, bo);
            case field_type::raw_bytes:
                if (data.size() < length) {
                    THROW_TRUNCATION("Raw field needs ", length, " bytes, got ", data.size());
                }
                return bytes(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(length));
        }
        THROW_SCHEMA("Unsupported field type ", static_cast<int>(type));
    }

} // namespace apng
