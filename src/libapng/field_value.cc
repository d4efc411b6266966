//
// Helpers for field types and decoded values.
//

#include <apng/field_value.hh>

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace apng {

    std::size_t field_width(field_type type, std::size_t length) noexcept {
        switch (type) {
            case field_type::int8:
            case field_type::uint8:
                return 1;
            case field_type::int16:
            case field_type::uint16:
                return 2;
            case field_type::int32:
            case field_type::uint32:
                return 4;
            case field_type::int64:
            case field_type::uint64:
                return 8;
            case field_type::raw_bytes:
                return length;
        }
        return 0;
    }

    bool is_signed(field_type type) noexcept {
        return type == field_type::int8 || type == field_type::int16 ||
               type == field_type::int32 || type == field_type::int64;
    }

    std::ostream& operator<<(std::ostream& os, field_type type) {
        switch (type) {
            case field_type::int8:      return os << "int8";
            case field_type::uint8:     return os << "uint8";
            case field_type::int16:     return os << "int16";
            case field_type::uint16:    return os << "uint16";
            case field_type::int32:     return os << "int32";
            case field_type::uint32:    return os << "uint32";
            case field_type::int64:     return os << "int64";
            case field_type::uint64:    return os << "uint64";
            case field_type::raw_bytes: return os << "bytes";
        }
        return os << "unknown";
    }

    std::string to_string(const field_value& value) {
        if (const auto* s = std::get_if<std::int64_t>(&value)) {
            return std::to_string(*s);
        }
        if (const auto* u = std::get_if<std::uint64_t>(&value)) {
            return std::to_string(*u);
        }

        const auto& data = std::get<bytes>(value);
        bool printable = std::all_of(data.begin(), data.end(), [](std::byte b) {
            auto c = std::to_integer<unsigned>(b);
            return c >= 32 && c <= 126;
        });

        std::ostringstream oss;
        if (printable) {
            oss << '"';
            for (auto b : data) {
                oss << static_cast<char>(std::to_integer<unsigned>(b));
            }
            oss << '"';
        } else {
            oss << "0x" << std::hex << std::setfill('0');
            for (auto b : data) {
                oss << std::setw(2) << std::to_integer<unsigned>(b);
            }
        }
        return oss.str();
    }

} // namespace apng
