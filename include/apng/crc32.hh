/**
 * @file crc32.hh
 * @brief CRC-32 as used by PNG chunk trailers
 *
 * Reflected polynomial 0xEDB88320, initial value 0xFFFFFFFF, final
 * XOR 0xFFFFFFFF (ISO 3309 / ITU-T V.42).
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>
#include <apng/export_apng.h>

namespace apng {

    /**
     * @brief Lookup table used by the CRC routines
     *
     * Built on first use and immutable afterwards.
     */
    APNG_EXPORT const std::array<std::uint32_t, 256>& crc32_table();

    /**
     * @brief Feed bytes into a running (pre-conditioned) CRC accumulator
     * @param crc Accumulator; start with 0xFFFFFFFF
     * @param data Bytes to process
     * @param length Number of bytes
     * @return Updated accumulator, not yet finalized
     */
    APNG_EXPORT std::uint32_t update_crc32(std::uint32_t crc, const void* data, std::size_t length) noexcept;

    /**
     * @brief CRC-32 of a byte range
     */
    APNG_EXPORT std::uint32_t crc32(const void* data, std::size_t length) noexcept;

    /**
     * @brief CRC-32 of the first @p length bytes of @p data
     *
     * @p length defaults to the whole vector and is clamped to its size.
     */
    APNG_EXPORT std::uint32_t crc32(const std::vector<std::byte>& data, std::size_t length);
    APNG_EXPORT std::uint32_t crc32(const std::vector<std::byte>& data);

} // namespace apng
