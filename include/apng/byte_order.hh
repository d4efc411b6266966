/**
 * @file byte_order.hh
 * @brief Byte order (endianness) selection for typed reads and writes
 */

#pragma once

#include <ostream>

#include <apng/endian.hh>

namespace apng {
    /**
     * @enum byte_order
     * @brief Byte order (endianness) for reading/writing multi-byte values
     */
    enum class byte_order {
        native, ///< Whatever the host uses
        little, ///< Little-endian
        big     ///< Big-endian (PNG uses this throughout)
    };

    /**
     * @brief Check if given byte order matches the native system byte order
     * @param bo Byte order to check
     * @return True if the byte order matches the system's native byte order
     *
     * This is used to determine if byte swapping is needed when reading
     * or writing multi-byte values.
     */
    constexpr bool byte_order_native(byte_order bo) noexcept {
        switch (bo) {
            case byte_order::native:
                return true;
            case byte_order::little:
                return is_little_endian;
            case byte_order::big:
                return is_big_endian;
        }
        // make compiler happy
        return false;
    }

    inline std::ostream& operator<<(std::ostream& os, byte_order bo) {
        switch (bo) {
            case byte_order::native:
                return os << "native";
            case byte_order::little:
                return os << "little";
            case byte_order::big:
                return os << "big";
        }
        return os << "?";
    }
}
