/**
 * @file byte_buffer.hh
 * @brief Seekable, endian-aware typed reader/writer over a byte stream
 */

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstring>
#include <type_traits>

#include <apng/exceptions.hh>
#include <apng/byte_order.hh>
#include <apng/field_value.hh>
#include <apng/export_apng.h>

namespace apng {

    /**
     * @class byte_buffer
     * @brief Typed access to a seekable stream
     *
     * The buffer owns the cursor for as long as it is in use: the logical
     * position is kept here and applied to both the get and put positions
     * of the stream before every transfer, so reads and writes may be
     * freely interleaved on the same std::iostream.
     *
     * Reading past the end throws truncation_error, seeking outside
     * [0, size()] throws range_error.
     */
    class APNG_EXPORT byte_buffer {
        public:
            explicit byte_buffer(std::iostream& stream, byte_order order = byte_order::native);

            byte_buffer(const byte_buffer&) = delete;
            byte_buffer& operator = (const byte_buffer&) = delete;

            [[nodiscard]] byte_order order() const { return m_order; }

            [[nodiscard]] std::uint64_t position() const { return m_position; }

            // Absolute move
            void seek(std::uint64_t offset);

            // Relative move, may be negative
            void step(std::int64_t delta);

            [[nodiscard]] std::uint64_t size() const;

            [[nodiscard]] bool eof() const;

            bytes read_raw(std::size_t n);

            /**
             * @brief Write exactly @p n bytes
             *
             * Longer input is truncated to @p n, shorter input is padded
             * with zero bytes.
             */
            void write_raw(const bytes& data, std::size_t n);
            void write_raw(const bytes& data) { write_raw(data, data.size()); }

            template<typename T>
            T read() {
                return read<T>(m_order);
            }

            template<typename T>
            T read(byte_order bo) {
                return decode<T>(read_raw(sizeof(T)), bo);
            }

            template<typename T>
            void write(T value) {
                write<T>(value, m_order);
            }

            template<typename T>
            void write(T value, byte_order bo) {
                write_raw(encode<T>(value, bo));
            }

            // Pure conversions, no stream interaction

            template<typename T>
            static bytes encode(T value, byte_order bo) {
                static_assert(is_byte_swappable_v<T>, "encode requires an integer of 1, 2, 4 or 8 bytes");
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                bytes out(sizeof(T));
                std::memcpy(out.data(), &value, sizeof(T));
                return out;
            }

            template<typename T>
            static T decode(const bytes& data, byte_order bo) {
                static_assert(is_byte_swappable_v<T>, "decode requires an integer of 1, 2, 4 or 8 bytes");
                if (data.size() < sizeof(T)) {
                    THROW_TRUNCATION("Cannot decode ", sizeof(T), " byte value from ", data.size(), " bytes");
                }
                T value;
                std::memcpy(&value, data.data(), sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return value;
            }

            template<typename T>
            bytes encode(T value) const {
                return encode<T>(value, m_order);
            }

            template<typename T>
            T decode(const bytes& data) const {
                return decode<T>(data, m_order);
            }

            // Runtime typed entry points, dispatched on field_type

            field_value read_value(field_type type, std::size_t length = 0);
            void write_value(field_type type, std::size_t length, const field_value& value);

            [[nodiscard]] bytes encode_value(field_type type, std::size_t length, const field_value& value) const {
                return encode_value(type, length, value, m_order);
            }

            [[nodiscard]] field_value decode_value(field_type type, std::size_t length, const bytes& data) const {
                return decode_value(type, length, data, m_order);
            }

            static bytes encode_value(field_type type, std::size_t length, const field_value& value, byte_order bo);
            static field_value decode_value(field_type type, std::size_t length, const bytes& data, byte_order bo);

        private:
            std::iostream& m_stream;
            byte_order m_order;
            std::uint64_t m_position;
    };

} // namespace apng
