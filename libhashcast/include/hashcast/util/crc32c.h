#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace hashcast::util {

    // CRC32C (Castagnoli), used as the packet payload trailer.
    std::uint32_t crc32c(std::span<const std::byte> data) noexcept;
    std::uint32_t crc32c(std::string_view s) noexcept;

    // Incremental API (init -> update* -> finish)
    inline constexpr std::uint32_t crc32c_init() noexcept { return 0xFFFF'FFFFu; }
    std::uint32_t crc32c_update(std::uint32_t state, std::span<const std::byte> data) noexcept;
    inline constexpr std::uint32_t crc32c_finish(std::uint32_t state) noexcept { return state ^ 0xFFFF'FFFFu; }

} // namespace hashcast::util
