#include <hashcast/fec_core/transform_config.h>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace hashcast::fec_core {

    namespace {

        std::uint64_t ceil_div(std::uint64_t a, std::uint64_t b) noexcept {
            return (a + b - 1) / b;
        }

    } // namespace

    TransformConfig TransformConfig::for_transfer(std::uint64_t transfer_length,
        std::uint16_t symbol_size,
        std::uint32_t max_source_symbols)
    {
        if (transfer_length == 0) {
            throw std::invalid_argument("TransformConfig: transfer length must be > 0");
        }
        if (symbol_size == 0) {
            throw std::invalid_argument("TransformConfig: symbol size must be > 0");
        }
        if (max_source_symbols == 0 || max_source_symbols > k_max_source_symbols) {
            throw std::invalid_argument("TransformConfig: max source symbols must be in [1.." +
                std::to_string(k_max_source_symbols) + "]");
        }

        const std::uint64_t kt = ceil_div(transfer_length, symbol_size);
        const std::uint64_t z = ceil_div(kt, max_source_symbols);
        if (z > k_max_source_blocks) {
            throw std::invalid_argument("TransformConfig: transfer needs " + std::to_string(z) +
                " source blocks (max " + std::to_string(k_max_source_blocks) + ")");
        }

        TransformConfig c;
        c.transfer_length_ = transfer_length;
        c.symbol_size_ = symbol_size;
        c.source_blocks_ = static_cast<std::uint8_t>(z);
        c.max_source_symbols_ = max_source_symbols;
        c.total_symbols_ = kt;
        c.large_symbols_ = static_cast<std::uint32_t>(ceil_div(kt, z));
        c.small_symbols_ = static_cast<std::uint32_t>(kt / z);
        c.large_blocks_ = static_cast<std::uint32_t>(kt - c.small_symbols_ * z);
        return c;
    }

    std::optional<TransformConfig> TransformConfig::from_fields(std::uint64_t transfer_length,
        std::uint16_t symbol_size,
        std::uint8_t source_blocks,
        std::uint32_t max_source_symbols)
    {
        try {
            auto c = for_transfer(transfer_length, symbol_size, max_source_symbols);
            if (c.source_blocks() != source_blocks) return std::nullopt;
            return c;
        }
        catch (const std::invalid_argument&) {
            return std::nullopt;
        }
    }

    std::uint32_t TransformConfig::source_symbols(std::uint8_t sbn) const noexcept {
        if (sbn >= source_blocks_) return 0;
        return sbn < large_blocks_ ? large_symbols_ : small_symbols_;
    }

    std::uint64_t TransformConfig::first_symbol(std::uint8_t sbn) const noexcept {
        if (sbn <= large_blocks_) return static_cast<std::uint64_t>(sbn) * large_symbols_;
        return static_cast<std::uint64_t>(large_blocks_) * large_symbols_ +
            static_cast<std::uint64_t>(sbn - large_blocks_) * small_symbols_;
    }

    std::uint32_t TransformConfig::coded_symbols(std::uint8_t sbn) const noexcept {
        const std::uint32_t k = source_symbols(sbn);
        if (k == 0) return 0;
        return std::max(k, k_min_coded_symbols);
    }

} // namespace hashcast::fec_core
