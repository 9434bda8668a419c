#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include <hashcast/fec_core/packet.h>
#include <hashcast/fec_core/transform_config.h>

namespace hashcast::pipeline {

    struct GeneratorConfig {
        std::uint16_t symbol_size{ 128 };
        std::uint32_t repair_per_block{ 10 };
        std::uint32_t max_source_symbols{ fec_core::k_default_max_source_symbols };
    };

    enum class generator_warning : std::uint8_t {
        zero_redundancy, // repair_per_block == 0: any loss is fatal
    };

    // Full packet stream for one transfer plus the config the decoder needs.
    struct GeneratedStream {
        fec_core::TransformConfig config;
        std::vector<fec_core::EncodingPacket> packets;
        std::vector<generator_warning> warnings;

        std::size_t source_count{ 0 };
        std::size_t repair_count{ 0 };
    };

    std::string describe(generator_warning w);

    // Drives the encoder once per transfer. Output order is block-major:
    // source symbols in ESI order, then the block's repair symbols.
    class PacketGenerator {
    public:
        explicit PacketGenerator(GeneratorConfig cfg) : cfg_(cfg) {}

        // Throws std::invalid_argument on an empty buffer, symbol_size == 0 or a
        // transfer the block partition cannot hold.
        GeneratedStream generate(std::span<const std::byte> buffer) const;

        const GeneratorConfig& config() const noexcept { return cfg_; }

    private:
        GeneratorConfig cfg_;
    };

} // namespace hashcast::pipeline
