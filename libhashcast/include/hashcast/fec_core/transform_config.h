#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>

namespace hashcast::fec_core {

    // wirehair codes messages of 2..64000 blocks; one source block is one wirehair message.
    inline constexpr std::uint32_t k_min_coded_symbols = 2;
    inline constexpr std::uint32_t k_max_source_symbols = 64000;
    inline constexpr std::uint32_t k_default_max_source_symbols = k_max_source_symbols;
    inline constexpr std::uint32_t k_max_source_blocks = 255;

    // How a transfer of F bytes is cut into Z source blocks of T-byte symbols.
    // Kt = ceil(F/T), Z = ceil(Kt/max_source_symbols); the first (Kt mod Z)
    // blocks carry ceil(Kt/Z) symbols and the rest floor(Kt/Z).
    class TransformConfig {
    public:
        // Throws std::invalid_argument when F == 0, T == 0, max_source_symbols
        // is outside [1..64000] or more than 255 blocks would be needed.
        static TransformConfig for_transfer(std::uint64_t transfer_length,
            std::uint16_t symbol_size,
            std::uint32_t max_source_symbols = k_default_max_source_symbols);

        // Rebuilds a config received out-of-band; nullopt if the fields are inconsistent.
        static std::optional<TransformConfig> from_fields(std::uint64_t transfer_length,
            std::uint16_t symbol_size,
            std::uint8_t source_blocks,
            std::uint32_t max_source_symbols);

        std::uint64_t transfer_length() const noexcept { return transfer_length_; }
        std::uint16_t symbol_size() const noexcept { return symbol_size_; }
        std::uint8_t source_blocks() const noexcept { return source_blocks_; }
        std::uint32_t max_source_symbols() const noexcept { return max_source_symbols_; }
        std::uint64_t total_source_symbols() const noexcept { return total_symbols_; }

        // Source symbol count K of block sbn (0 when sbn is out of range).
        std::uint32_t source_symbols(std::uint8_t sbn) const noexcept;

        // Index of the block's first symbol within the whole transfer.
        std::uint64_t first_symbol(std::uint8_t sbn) const noexcept;

        // Symbols of the wirehair message behind block sbn: K, or 2 when K == 1.
        // ESIs K..N-1 are zero padding known to both sides; repair ESIs start at N.
        std::uint32_t coded_symbols(std::uint8_t sbn) const noexcept;

        bool operator==(const TransformConfig&) const = default;

    private:
        TransformConfig() = default;

        std::uint64_t transfer_length_{ 0 };
        std::uint16_t symbol_size_{ 0 };
        std::uint8_t source_blocks_{ 0 };
        std::uint32_t max_source_symbols_{ 0 };
        std::uint64_t total_symbols_{ 0 };
        std::uint32_t large_symbols_{ 0 };  // KL
        std::uint32_t small_symbols_{ 0 };  // KS
        std::uint32_t large_blocks_{ 0 };   // ZL
    };

} // namespace hashcast::fec_core
