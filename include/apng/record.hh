/**
 * @file record.hh
 * @brief Decoded chunk record: ordered named field values
 */

#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <apng/export_apng.h>
#include <apng/field_value.hh>
#include <apng/fourcc.hh>

namespace apng {

    /**
     * @class record
     * @brief Field values of one decoded record, in declaration order
     *
     * A record may carry the tag of the chunk it was read from. The tag
     * is metadata, not a field: schemas never read or write it, but
     * checksum derivation covers it.
     */
    class APNG_EXPORT record {
        public:
            using entry = std::pair<std::string, field_value>;
            using const_iterator = std::vector<entry>::const_iterator;

            record() = default;
            explicit record(fourcc tag) : m_tag(tag) {}

            [[nodiscard]] const std::optional<fourcc>& tag() const { return m_tag; }
            void set_tag(fourcc tag) { m_tag = tag; }

            [[nodiscard]] bool contains(std::string_view name) const;

            /**
             * @brief Value of a field
             * @throws schema_error if the record has no such field
             */
            [[nodiscard]] const field_value& get(std::string_view name) const;

            [[nodiscard]] std::uint64_t get_uint(std::string_view name) const;
            [[nodiscard]] std::int64_t get_int(std::string_view name) const;
            [[nodiscard]] const bytes& get_bytes(std::string_view name) const;

            // Replaces an existing value in place or appends a new field
            void set(std::string_view name, field_value value);

            [[nodiscard]] std::size_t size() const { return m_fields.size(); }
            [[nodiscard]] bool empty() const { return m_fields.empty(); }

            [[nodiscard]] const_iterator begin() const { return m_fields.begin(); }
            [[nodiscard]] const_iterator end() const { return m_fields.end(); }

            bool operator==(const record& other) const;
            bool operator!=(const record& other) const { return !(*this == other); }

        private:
            std::optional<fourcc> m_tag;
            std::vector<entry> m_fields;
    };

    // {tag: 'fcTL', name: value, ...}
    APNG_EXPORT std::ostream& operator<<(std::ostream& os, const record& r);

} // namespace apng
