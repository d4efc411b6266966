/**
 * @file chunk_types.hh
 * @brief PNG/APNG chunk tags and the schemas of the records they carry
 */

#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>

#include <apng/export_apng.h>
#include <apng/fourcc.hh>
#include <apng/schema.hh>

namespace apng {

    namespace chunk_id {
        inline constexpr fourcc IHDR('I', 'H', 'D', 'R');
        inline constexpr fourcc acTL('a', 'c', 'T', 'L');
        inline constexpr fourcc tRNS('t', 'R', 'N', 'S');
        inline constexpr fourcc IDAT('I', 'D', 'A', 'T');
        inline constexpr fourcc fdAT('f', 'd', 'A', 'T');
        inline constexpr fourcc tEXt('t', 'E', 'X', 't');
        inline constexpr fourcc fcTL('f', 'c', 'T', 'L');
        inline constexpr fourcc IEND('I', 'E', 'N', 'D');
    }

    /// The eight bytes every PNG file starts with
    inline constexpr std::array<std::uint8_t, 8> png_signature = {
        0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
    };

    /// Payload size of an fcTL chunk
    inline constexpr std::uint32_t fctl_payload_size = 26;

    /**
     * @enum chunk_kind
     * @brief What the walker does with a chunk
     */
    enum class chunk_kind {
        skip,          ///< Known, payload is skipped undecoded
        frame_control, ///< fcTL, decoded and recorded
        terminator,    ///< IEND, skipped and ends the walk
        unknown        ///< No policy, fatal
    };

    APNG_EXPORT chunk_kind classify(const fourcc& tag) noexcept;

    APNG_EXPORT std::ostream& operator<<(std::ostream& os, chunk_kind kind);

    // signature: raw 8
    APNG_EXPORT const schema& signature_schema();

    // length: uint32, type: raw 4
    APNG_EXPORT const schema& chunk_head_schema();

    // crc: uint32, derived by derive_checksum on write
    APNG_EXPORT const schema& checksum_schema();

    // Image header + crc
    APNG_EXPORT const schema& ihdr_schema();

    // Animation control (frame and play counts) + crc
    APNG_EXPORT const schema& actl_schema();

    // Frame control (geometry, delay, dispose/blend) + crc
    APNG_EXPORT const schema& fctl_schema();

    /**
     * @brief Leading sequence number of an fdAT chunk
     *
     * The rest of the payload is compressed frame data and is never
     * decoded.
     */
    APNG_EXPORT const schema& fdat_head_schema();

} // namespace apng
