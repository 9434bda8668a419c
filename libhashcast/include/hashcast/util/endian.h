#pragma once
#include <cstddef>
#include <cstdint>
#include <span>

namespace hashcast::util::endian {

    // ----- Write (little-endian) -----
    inline void write_u16_le(std::span<std::byte> out, std::uint16_t v) noexcept {
        if (out.size() < 2) return;
        out[0] = std::byte{ static_cast<unsigned char>(v & 0xFFu) };
        out[1] = std::byte{ static_cast<unsigned char>((v >> 8) & 0xFFu) };
    }

    inline void write_u32_le(std::span<std::byte> out, std::uint32_t v) noexcept {
        if (out.size() < 4) return;
        for (std::size_t i = 0; i < 4; ++i) {
            out[i] = std::byte{ static_cast<unsigned char>((v >> (8 * i)) & 0xFFu) };
        }
    }

    inline void write_u64_le(std::span<std::byte> out, std::uint64_t v) noexcept {
        if (out.size() < 8) return;
        for (std::size_t i = 0; i < 8; ++i) {
            out[i] = std::byte{ static_cast<unsigned char>((v >> (8 * i)) & 0xFFu) };
        }
    }

    // ----- Read (little-endian) -----
    inline std::uint16_t read_u16_le(std::span<const std::byte> in) noexcept {
        if (in.size() < 2) return 0;
        const auto b0 = std::to_integer<unsigned>(in[0]);
        const auto b1 = std::to_integer<unsigned>(in[1]);
        return static_cast<std::uint16_t>(b0 | (b1 << 8));
    }

    inline std::uint32_t read_u32_le(std::span<const std::byte> in) noexcept {
        if (in.size() < 4) return 0;
        std::uint32_t v = 0;
        for (std::size_t i = 0; i < 4; ++i) {
            v |= static_cast<std::uint32_t>(std::to_integer<unsigned>(in[i])) << (8 * i);
        }
        return v;
    }

    inline std::uint64_t read_u64_le(std::span<const std::byte> in) noexcept {
        if (in.size() < 8) return 0;
        std::uint64_t v = 0;
        for (std::size_t i = 0; i < 8; ++i) {
            v |= static_cast<std::uint64_t>(std::to_integer<unsigned>(in[i])) << (8 * i);
        }
        return v;
    }

} // namespace hashcast::util::endian
