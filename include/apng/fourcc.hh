//
// Four character chunk type tags.
//
#pragma once
#include <array>
#include <cstddef>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <stdexcept>
#include <ostream>
#include <iomanip>

namespace apng {
    struct fourcc {
        std::array<char, 4> b{' ', ' ', ' ', ' '};

        // Default constructor - creates "    " (four spaces)
        constexpr fourcc() = default;

        // Constructor from 4 individual chars
        constexpr fourcc(char c0, char c1, char c2, char c3)
            : b{ c0, c1, c2, c3 } {}

        // Constructor from string_view with padding (runtime)
        explicit fourcc(std::string_view sv) : b{' ', ' ', ' ', ' '} {
            std::copy_n(sv.begin(), std::min(sv.size(), size_t(4)), b.begin());
        }

        // Constructor from C-string with padding (runtime)
        fourcc(const char* str) : fourcc(std::string_view(str)) {}

        // Constructor from raw bytes (no padding)
        static fourcc from_bytes(const void* data) {
            fourcc result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        // Constructor from a byte run as read from a raw schema field
        static fourcc from_bytes(const std::vector<std::byte>& data) {
            if (data.size() != 4) {
                throw std::invalid_argument("FourCC requires exactly 4 bytes");
            }
            return from_bytes(data.data());
        }

        // Convert to string
        [[nodiscard]] std::string to_string() const {
            return {b.data(), 4};
        }

        // Wire representation
        [[nodiscard]] std::vector<std::byte> to_bytes() const {
            std::vector<std::byte> out(4);
            std::memcpy(out.data(), b.data(), 4);
            return out;
        }

        // Comparison operators
        bool operator==(const fourcc& o) const { return b == o.b; }
        bool operator!=(const fourcc& o) const { return !(*this == o); }

        // Stream output
        friend std::ostream& operator<<(std::ostream& os, const fourcc& f) {
            auto flags = os.flags();
            auto fill = os.fill();
            os << '\'';
            for (char c : f.b) {
                if (c >= 32 && c <= 126) {
                    os << c;
                } else {
                    // Escape non-printable characters
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(static_cast<unsigned char>(c));
                }
            }
            os << '\'';
            os.flags(flags);
            os.fill(fill);
            return os;
        }
    };

    // Hash function
    struct fourcc_hash {
        std::size_t operator()(const fourcc& f) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, f.b.data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for compile-time fourcc creation
    constexpr fourcc operator""_4cc(const char* str, std::size_t len) {
        if (len > 4) {
            throw std::invalid_argument("FourCC literal must be 4 characters or less");
        }
        return {
            len > 0 ? str[0] : ' ',
            len > 1 ? str[1] : ' ',
            len > 2 ? str[2] : ' ',
            len > 3 ? str[3] : ' '
        };
    }
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<apng::fourcc> {
        std::size_t operator()(const apng::fourcc& f) const noexcept {
            return apng::fourcc_hash{}(f);
        }
    };
}
