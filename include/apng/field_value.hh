/**
 * @file field_value.hh
 * @brief Semantic field types and the values they decode to
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <variant>
#include <vector>
#include <apng/export_apng.h>

namespace apng {

    using bytes = std::vector<std::byte>;

    /**
     * @enum field_type
     * @brief Wire encoding of a single schema field
     *
     * Integer types are encoded with the byte order of the buffer they
     * are read from or written to. raw_bytes copies a fixed number of
     * bytes verbatim.
     */
    enum class field_type {
        int8,
        uint8,
        int16,
        uint16,
        int32,
        uint32,
        int64,
        uint64,
        raw_bytes
    };

    /**
     * @brief Decoded value of one field
     *
     * Signed integer fields hold std::int64_t, unsigned ones std::uint64_t
     * and raw fields the bytes themselves.
     */
    using field_value = std::variant<std::int64_t, std::uint64_t, bytes>;

    /**
     * @brief Number of bytes a field occupies on the wire
     * @param type Field type
     * @param length Byte count, only used by raw_bytes
     */
    APNG_EXPORT std::size_t field_width(field_type type, std::size_t length = 0) noexcept;

    APNG_EXPORT bool is_signed(field_type type) noexcept;

    APNG_EXPORT std::ostream& operator<<(std::ostream& os, field_type type);

    /**
     * @brief Human readable form of a value
     *
     * Integers print in decimal; byte runs print as text when printable
     * and as hex otherwise.
     */
    APNG_EXPORT std::string to_string(const field_value& value);

} // namespace apng
