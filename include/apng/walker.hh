/**
 * @file walker.hh
 * @brief Read pass: collect the frame control records of an APNG stream
 */

#pragma once

#include <cstdint>
#include <vector>

#include <apng/export_apng.h>
#include <apng/options.hh>
#include <apng/record.hh>

namespace apng {

    class byte_buffer;

    /**
     * @struct frame_entry
     * @brief One fcTL record and where its payload starts
     */
    struct frame_entry {
        std::uint64_t offset = 0; ///< Absolute offset of the fcTL payload
        record data;              ///< Decoded fcTL fields, tagged 'fcTL'
    };

    using frame_table = std::vector<frame_entry>;

    /**
     * @brief Walk all chunks of a PNG stream and collect fcTL records
     *
     * Known chunks are skipped without decoding, fcTL chunks are decoded
     * (including their CRC) and appended to the table, IEND ends the walk.
     *
     * @param buf Big-endian buffer positioned at the PNG signature
     * @param options Walk options
     * @return Frame table in stream order
     * @throws unknown_chunk_error for any chunk type without a policy
     * @throws parse_error for a bad signature or an fcTL of the wrong size
     * @throws checksum_error on CRC mismatch when verify_checksums is set
     * @throws io_error (truncation_error, range_error) on short input
     */
    APNG_EXPORT frame_table walk(byte_buffer& buf, const walk_options& options = {});

} // namespace apng
