//
// Table driven CRC-32 as given in annex D of the W3C PNG recommendation.
//

#include <apng/crc32.hh>
#include <algorithm>

namespace apng {

    namespace {
        constexpr std::uint32_t POLYNOMIAL = 0xEDB88320u;

        std::array<std::uint32_t, 256> make_table() {
            std::array<std::uint32_t, 256> table{};
            for (std::uint32_t n = 0; n < 256; n++) {
                std::uint32_t c = n;
                for (int k = 0; k < 8; k++) {
                    c = (c & 1) ? (POLYNOMIAL ^ (c >> 1)) : (c >> 1);
                }
                table[n] = c;
            }
            return table;
        }
    }

    const std::array<std::uint32_t, 256>& crc32_table() {
        static const std::array<std::uint32_t, 256> table = make_table();
        return table;
    }

    std::uint32_t update_crc32(std::uint32_t crc, const void* data, std::size_t length) noexcept {
        const auto& table = crc32_table();
        const auto* p = static_cast<const unsigned char*>(data);
        for (std::size_t n = 0; n < length; n++) {
            crc = table[(crc ^ p[n]) & 0xFF] ^ (crc >> 8);
        }
        return crc;
    }

    std::uint32_t crc32(const void* data, std::size_t length) noexcept {
        return update_crc32(0xFFFFFFFFu, data, length) ^ 0xFFFFFFFFu;
    }

    std::uint32_t crc32(const std::vector<std::byte>& data, std::size_t length) {
        return crc32(data.data(), std::min(length, data.size()));
    }

    std::uint32_t crc32(const std::vector<std::byte>& data) {
        return crc32(data.data(), data.size());
    }

} // namespace apng
