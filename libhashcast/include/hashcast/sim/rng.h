#pragma once
#include <cstdint>
#include <limits>

namespace hashcast::sim {

    // Small deterministic xorshift32 generator (portable across platforms).
    // Satisfies UniformRandomBitGenerator so it can drive std::shuffle.
    struct XorShift32 {
        using result_type = std::uint32_t;

        std::uint32_t state;
        explicit XorShift32(std::uint32_t seed) : state(seed ? seed : 0xA3C59AC3u) {}

        static constexpr result_type min() noexcept { return 1u; }
        static constexpr result_type max() noexcept { return std::numeric_limits<result_type>::max(); }

        std::uint32_t next_u32() noexcept {
            std::uint32_t x = state;
            x ^= x << 13;
            x ^= x >> 17;
            x ^= x << 5;
            state = x;
            return x;
        }

        result_type operator()() noexcept { return next_u32(); }

        // Uniform in [0,1)
        double next_unit() noexcept {
            // Top 24 bits -> 1/2^24 resolution
            return (next_u32() >> 8) * (1.0 / 16777216.0);
        }
    };

} // namespace hashcast::sim
