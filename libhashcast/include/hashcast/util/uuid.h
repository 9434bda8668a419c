#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <hashcast/sim/rng.h>
#include <hashcast/util/hex.h>

namespace hashcast::util {

    // UUID v4 seeded from steady_clock + address entropy.
    // Not cryptographic; used for metrics run ids.
    inline std::string uuid_v4() {
        using clock = std::chrono::steady_clock;
        auto now = static_cast<std::uint64_t>(clock::now().time_since_epoch().count());

        const void* self = static_cast<const void*>(&now);
        now ^= reinterpret_cast<std::uintptr_t>(self) * 0x9E3779B97F4A7C15ull;

        hashcast::sim::XorShift32 rng(static_cast<std::uint32_t>(now ^ (now >> 32)));

        std::array<std::byte, 16> b{};
        for (auto& v : b) v = std::byte{ static_cast<unsigned char>(rng.next_u32() & 0xFF) };

        // Version 4, variant 10xx
        b[6] = (b[6] & std::byte{ 0x0F }) | std::byte{ 0x40 };
        b[8] = (b[8] & std::byte{ 0x3F }) | std::byte{ 0x80 };

        const std::string h = to_hex(std::span<const std::byte>(b.data(), b.size()));
        return h.substr(0, 8) + '-' + h.substr(8, 4) + '-' + h.substr(12, 4) + '-' +
            h.substr(16, 4) + '-' + h.substr(20, 12);
    }

} // namespace hashcast::util
