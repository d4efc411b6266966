//
// schema: read, encode and write records field by field.
//

#include <apng/schema.hh>
#include <apng/byte_buffer.hh>
#include <apng/crc32.hh>
#include <apng/exceptions.hh>

#include <algorithm>
#include <iterator>
#include <numeric>

namespace apng {

    namespace {
        field_value zero_value(const field_descriptor& f) {
            if (f.raw()) {
                return bytes(f.length);
            }
            if (is_signed(f.type)) {
                return std::int64_t{0};
            }
            return std::uint64_t{0};
        }
    }

    bytes flatten(const encoded_record& encoded) {
        bytes out;
        for (const auto& [name, data] : encoded) {
            out.insert(out.end(), data.begin(), data.end());
        }
        return out;
    }

    schema::schema(std::string name, std::vector<field_descriptor> fields)
        : m_name(std::move(name)), m_fields(std::move(fields)) {}

    schema::builder schema::make(std::string name) {
        return builder(std::move(name));
    }

    std::size_t schema::wire_size() const {
        return std::accumulate(m_fields.begin(), m_fields.end(), std::size_t{0},
            [](std::size_t acc, const field_descriptor& f) { return acc + f.width(); });
    }

    record schema::read(byte_buffer& buf) const {
        record result;
        for (const auto& f : m_fields) {
            result.set(f.name, buf.read_value(f.type, f.length));
        }
        return result;
    }

    record schema::finalize(const record& r, byte_order order) const {
        record snapshot = r;
        write_context ctx{*this, order};
        for (const auto& f : m_fields) {
            if (!f.before_write) {
                continue;
            }
            field_value candidate = snapshot.contains(f.name) ? snapshot.get(f.name) : zero_value(f);
            snapshot.set(f.name, candidate);
            snapshot.set(f.name, f.before_write(candidate, snapshot, ctx));
        }
        return snapshot;
    }

    encoded_record schema::encode(const record& r, byte_order order, hook_mode hooks) const {
        const record source = hooks == hook_mode::run ? finalize(r, order) : r;

        encoded_record result;
        result.reserve(m_fields.size());
        for (const auto& f : m_fields) {
            try {
                result.emplace_back(f.name, byte_buffer::encode_value(f.type, f.length, source.get(f.name), order));
            } catch (const schema_error& e) {
                THROW_SCHEMA(m_name, ".", f.name, ": ", e.what());
            }
        }
        return result;
    }

    void schema::write(byte_buffer& buf, const record& r) const {
        auto encoded = encode(r, buf.order());
        for (const auto& [name, data] : encoded) {
            buf.write_raw(data);
        }
    }

    schema::builder& schema::builder::field(std::string name, field_type type, before_write_hook hook) {
        THROW_SCHEMA_IF(type == field_type::raw_bytes, "Field '", name, "' of ", m_name,
                        " must be declared with raw() to give its length");
        m_fields.push_back(field_descriptor{std::move(name), type, 0, hook});
        return *this;
    }

    schema::builder& schema::builder::raw(std::string name, std::size_t length) {
        m_fields.push_back(field_descriptor{std::move(name), field_type::raw_bytes, length, nullptr});
        return *this;
    }

    schema::builder& schema::builder::include(const schema& other) {
        m_fields.insert(m_fields.end(), other.fields().begin(), other.fields().end());
        return *this;
    }

    schema schema::builder::build() const {
        for (auto it = m_fields.begin(); it != m_fields.end(); ++it) {
            THROW_SCHEMA_IF(it->raw() && it->length == 0, "Raw field '", it->name, "' of ", m_name, " has no length");
            bool duplicate = std::any_of(std::next(it), m_fields.end(), [&](const field_descriptor& f) {
                return f.name == it->name;
            });
            THROW_SCHEMA_IF(duplicate, "Schema ", m_name, " declares field '", it->name, "' twice");
        }
        return schema(m_name, m_fields);
    }

    field_value derive_checksum(const field_value&, const record& snapshot, const write_context& ctx) {
        THROW_SCHEMA_IF(!snapshot.tag(), "Cannot derive checksum for ", ctx.owner.name(),
                        ": record carries no chunk tag");

        auto wire = flatten(ctx.owner.encode(snapshot, ctx.order, hook_mode::skip));
        THROW_SCHEMA_IF(wire.size() < 4, "Schema ", ctx.owner.name(), " is too short to carry a checksum");

        auto tag = snapshot.tag()->to_bytes();
        std::uint32_t crc = update_crc32(0xFFFFFFFFu, tag.data(), tag.size());
        crc = update_crc32(crc, wire.data(), wire.size() - 4);
        return std::uint64_t{crc ^ 0xFFFFFFFFu};
    }

} // namespace apng
