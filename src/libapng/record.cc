//
// record: ordered name -> value storage.
//

#include <apng/record.hh>
#include <apng/exceptions.hh>

#include <algorithm>
#include <ostream>

namespace apng {

    namespace {
        template<typename Fields>
        auto find_field(Fields& fields, std::string_view name) {
            return std::find_if(fields.begin(), fields.end(), [name](const auto& e) {
                return e.first == name;
            });
        }
    }

    bool record::contains(std::string_view name) const {
        return find_field(m_fields, name) != m_fields.end();
    }

    const field_value& record::get(std::string_view name) const {
        auto it = find_field(m_fields, name);
        THROW_SCHEMA_IF(it == m_fields.end(), "Record has no field '", name, "'");
        return it->second;
    }

    std::uint64_t record::get_uint(std::string_view name) const {
        const auto* v = std::get_if<std::uint64_t>(&get(name));
        THROW_SCHEMA_IF(!v, "Field '", name, "' is not an unsigned integer");
        return *v;
    }

    std::int64_t record::get_int(std::string_view name) const {
        const auto* v = std::get_if<std::int64_t>(&get(name));
        THROW_SCHEMA_IF(!v, "Field '", name, "' is not a signed integer");
        return *v;
    }

    const bytes& record::get_bytes(std::string_view name) const {
        const auto* v = std::get_if<bytes>(&get(name));
        THROW_SCHEMA_IF(!v, "Field '", name, "' is not a byte run");
        return *v;
    }

    void record::set(std::string_view name, field_value value) {
        auto it = find_field(m_fields, name);
        if (it != m_fields.end()) {
            it->second = std::move(value);
        } else {
            m_fields.emplace_back(std::string(name), std::move(value));
        }
    }

    bool record::operator==(const record& other) const {
        return m_tag == other.m_tag && m_fields == other.m_fields;
    }

    std::ostream& operator<<(std::ostream& os, const record& r) {
        os << '{';
        if (r.tag()) {
            os << "tag: " << *r.tag();
            if (!r.empty()) {
                os << ", ";
            }
        }
        bool first = true;
        for (const auto& [name, value] : r) {
            if (!first) {
                os << ", ";
            }
            first = false;
            os << name << ": " << to_string(value);
        }
        return os << '}';
    }

} // namespace apng
