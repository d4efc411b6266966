/**
 * @file chunk_header.hh
 * @brief Chunk header structure for PNG files
 */

#pragma once

#include <cstdint>
#include <apng/fourcc.hh>

namespace apng {

    /**
     * @struct chunk_header
     * @brief Position and size of one chunk
     *
     * On the wire a chunk is length:u32be, type:4, payload:length,
     * crc:u32be. The CRC covers type and payload.
     */
    struct chunk_header {
        fourcc id;                          ///< Chunk type
        std::uint32_t length = 0;           ///< Payload size in bytes
        std::uint64_t file_offset = 0;      ///< Absolute offset of the length field
        std::uint64_t payload_offset = 0;   ///< Absolute offset of the first payload byte

        /// Offset of the trailing CRC
        [[nodiscard]] std::uint64_t crc_offset() const { return payload_offset + length; }

        /// Offset of the next chunk
        [[nodiscard]] std::uint64_t end_offset() const { return crc_offset() + 4; }
    };

} // namespace apng
