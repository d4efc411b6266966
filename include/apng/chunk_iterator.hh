/**
 * @file chunk_iterator.hh
 * @brief Sequential traversal of the chunks of a PNG stream
 */

#pragma once

#include <apng/chunk_header.hh>
#include <apng/export_apng.h>

namespace apng {

    class byte_buffer;

    /**
     * @class chunk_iterator
     * @brief Walks chunk headers of a PNG stream one by one
     *
     * Construction reads and validates the PNG signature and the first
     * chunk header. After a header is read the buffer sits at the start of
     * the chunk payload; consumers may read as much of it as they like,
     * next() always repositions at the following chunk.
     */
    class APNG_EXPORT chunk_iterator {
    public:
        /**
         * @param buf Big-endian buffer positioned at the signature
         * @throws parse_error if the signature does not match
         */
        explicit chunk_iterator(byte_buffer& buf);

        chunk_iterator(const chunk_iterator&) = delete;
        chunk_iterator& operator = (const chunk_iterator&) = delete;

        /**
         * @brief Get current chunk information
         */
        [[nodiscard]] const chunk_header& current() const { return m_current; }

        /**
         * @brief Advance to the next chunk
         * @throws range_error if the current chunk runs past the end of the stream
         * @throws truncation_error if the next header is cut short
         */
        void next();

        [[nodiscard]] bool has_next() const { return !m_ended; }
        [[nodiscard]] bool at_end() const { return m_ended; }

    private:
        // Read the chunk header at the current position
        bool read_next_chunk();

        byte_buffer& m_buffer;
        chunk_header m_current;
        bool m_ended;
    };

} // namespace apng
