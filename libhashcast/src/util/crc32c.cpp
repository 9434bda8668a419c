#include <hashcast/util/crc32c.h>
#include <array>

namespace hashcast::util {

    namespace {

        // Reflected polynomial for CRC32C
        constexpr std::uint32_t kPoly = 0x82F63B78u;

        const std::array<std::uint32_t, 256>& table() {
            static const std::array<std::uint32_t, 256> t = [] {
                std::array<std::uint32_t, 256> out{};
                for (std::uint32_t i = 0; i < 256; ++i) {
                    std::uint32_t c = i;
                    for (int k = 0; k < 8; ++k) {
                        c = (c & 1u) ? (c >> 1) ^ kPoly : (c >> 1);
                    }
                    out[i] = c;
                }
                return out;
            }();
            return t;
        }

    } // namespace

    std::uint32_t crc32c_update(std::uint32_t state, std::span<const std::byte> data) noexcept {
        const auto& T = table();
        std::uint32_t crc = state;
        for (std::byte b : data) {
            crc = T[(crc ^ std::to_integer<std::uint8_t>(b)) & 0xFFu] ^ (crc >> 8);
        }
        return crc;
    }

    std::uint32_t crc32c(std::span<const std::byte> data) noexcept {
        return crc32c_finish(crc32c_update(crc32c_init(), data));
    }

    std::uint32_t crc32c(std::string_view s) noexcept {
        const auto* ptr = reinterpret_cast<const std::byte*>(s.data());
        return crc32c(std::span<const std::byte>(ptr, s.size()));
    }

} // namespace hashcast::util
