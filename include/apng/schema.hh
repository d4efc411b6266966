/**
 * @file schema.hh
 * @brief Declarative binary schemas: ordered fields, composition and
 *        computed fields
 */

#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <apng/export_apng.h>
#include <apng/byte_order.hh>
#include <apng/field_value.hh>
#include <apng/record.hh>

namespace apng {

    class byte_buffer;
    class schema;

    /**
     * @struct write_context
     * @brief What a before-write hook may consult besides the record
     */
    struct write_context {
        const schema& owner;  ///< Schema performing the encode/write
        byte_order order;     ///< Byte order of the output
    };

    /**
     * @typedef before_write_hook
     * @brief Recomputes a field from the rest of the record on the write path
     *
     * Receives the candidate value and a snapshot of the record in which
     * every preceding hooked field already holds its final value.
     */
    using before_write_hook = field_value (*)(const field_value& candidate,
                                              const record& snapshot,
                                              const write_context& ctx);

    /**
     * @struct field_descriptor
     * @brief One named field of a schema
     */
    struct field_descriptor {
        std::string name;
        field_type type = field_type::uint8;
        std::size_t length = 0;                  ///< Byte count of raw fields
        before_write_hook before_write = nullptr;

        [[nodiscard]] bool raw() const { return type == field_type::raw_bytes; }
        [[nodiscard]] std::size_t width() const { return field_width(type, length); }
    };

    /**
     * @enum hook_mode
     * @brief Whether encode applies before-write hooks
     */
    enum class hook_mode {
        run,
        skip
    };

    /**
     * @typedef encoded_record
     * @brief Wire bytes of each field, in schema order
     */
    using encoded_record = std::vector<std::pair<std::string, bytes>>;

    // Concatenation of all encoded fields
    APNG_EXPORT bytes flatten(const encoded_record& encoded);

    /**
     * @class schema
     * @brief Immutable ordered list of field descriptors
     *
     * Field order is read order, write order and checksum coverage order.
     * Schemas are assembled once through schema::make() and never change
     * afterwards.
     */
    class APNG_EXPORT schema {
    public:
        class builder;

        /**
         * @brief Start building a schema
         * @param name Name used in diagnostics
         */
        static builder make(std::string name);

        [[nodiscard]] const std::string& name() const { return m_name; }
        [[nodiscard]] const std::vector<field_descriptor>& fields() const { return m_fields; }

        // Total number of bytes the schema occupies on the wire
        [[nodiscard]] std::size_t wire_size() const;

        /**
         * @brief Decode one record from the buffer's current position
         *
         * Raw fields are copied verbatim; numeric fields are decoded with
         * the buffer's byte order.
         */
        [[nodiscard]] record read(byte_buffer& buf) const;

        /**
         * @brief Encode a record without touching any stream
         * @param r Record to encode
         * @param order Byte order of numeric fields
         * @param hooks hook_mode::skip encodes the values exactly as given
         */
        [[nodiscard]] encoded_record encode(const record& r, byte_order order,
                                            hook_mode hooks = hook_mode::run) const;

        /**
         * @brief Write a record at the buffer's current position
         *
         * Hooks run first, then the fields are written in order. Nothing
         * is written if any field fails to encode.
         */
        void write(byte_buffer& buf, const record& r) const;

        /**
         * @brief Apply every before-write hook in field order
         * @return Copy of @p r holding the values that would be written
         */
        [[nodiscard]] record finalize(const record& r, byte_order order) const;

    private:
        schema(std::string name, std::vector<field_descriptor> fields);

        std::string m_name;
        std::vector<field_descriptor> m_fields;
    };

    class APNG_EXPORT schema::builder {
    public:
        explicit builder(std::string name) : m_name(std::move(name)) {}

        builder& field(std::string name, field_type type, before_write_hook hook = nullptr);
        builder& raw(std::string name, std::size_t length);

        // Append all fields of another schema
        builder& include(const schema& other);

        /**
         * @throws schema_error on duplicate field names or zero-length raw fields
         */
        [[nodiscard]] schema build() const;

    private:
        std::string m_name;
        std::vector<field_descriptor> m_fields;
    };

    /**
     * @brief Before-write hook computing a PNG chunk CRC
     *
     * Encodes the snapshot with hooks skipped, drops the trailing four
     * bytes (the checksum field itself) and returns CRC-32 over the
     * snapshot's chunk tag followed by the remaining bytes.
     *
     * @throws schema_error if the snapshot carries no chunk tag
     */
    APNG_EXPORT field_value derive_checksum(const field_value& candidate,
                                            const record& snapshot,
                                            const write_context& ctx);

} // namespace apng
