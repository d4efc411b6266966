/**
 * @file options.hh
 * @brief Configuration of the walk, patch and file passes
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

#include <apng/fourcc.hh>
#include <apng/record.hh>

namespace apng {

    /**
     * @struct walk_options
     * @brief Controls the read pass over a container
     */
    struct walk_options {
        /**
         * @brief Compare every stored chunk CRC with its contents
         *
         * Off by default: the read pass trusts its input and only the
         * write pass guarantees integrity. When on, a mismatch throws
         * checksum_error.
         */
        bool verify_checksums = false;

        /**
         * @typedef chunk_handler
         * @param offset File offset of the chunk's length field
         * @param tag Chunk type
         * @param length Payload length
         */
        using chunk_handler = std::function<void(std::uint64_t offset, const fourcc& tag, std::uint32_t length)>;

        /// Called for every chunk before it is classified
        chunk_handler on_chunk;

        /**
         * @typedef record_handler
         * @brief Receives IHDR and acTL records decoded on request
         */
        using record_handler = std::function<void(const record& r)>;

        /// When set, IHDR and acTL are decoded and passed here instead of skipped
        record_handler on_header;

        /**
         * @typedef warning_handler
         * @param offset File offset of the chunk concerned
         * @param category Warning category (e.g. "header_size")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Non-fatal issues found during the walk
         *
         * A header chunk whose length does not match its schema is not
         * decoded and is reported here. Ignored when not set.
         */
        warning_handler on_warning;
    };

    /**
     * @struct patch_options
     * @brief Controls the write pass
     */
    struct patch_options {
        /// New delay numerator for every frame; unchanged when empty
        std::optional<std::uint16_t> delay;

        using write_handler = std::function<void(std::uint64_t offset, const record& r)>;

        /// Called before each frame control record is written
        write_handler on_write;
    };

    /**
     * @struct retime_options
     * @brief Options for processing one file end to end
     */
    struct retime_options {
        walk_options walk;
        patch_options patch;

        using message_handler = std::function<void(std::string_view message)>;

        /// Progress messages (backup creation, file copies)
        message_handler on_message;
    };

} // namespace apng
