#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include <hashcast/fec_core/packet.h>
#include <hashcast/fec_core/transform_config.h>
#include <hashcast/fec_core/wirehair_handle.h>

namespace hashcast::fec_core {

    // Systematic fountain encoder over one transfer: one wirehair encoder per
    // source block. Source symbols are the zero-padded input cut into
    // symbol_size chunks; repair symbols can be drawn without bound.
    class Encoder {
    public:
        // Throws std::invalid_argument on empty data or an unusable symbol size (see TransformConfig),
        // std::runtime_error if wirehair rejects a block.
        Encoder(std::span<const std::byte> data,
            std::uint16_t symbol_size,
            std::uint32_t max_source_symbols = k_default_max_source_symbols);

        const TransformConfig& config() const noexcept { return cfg_; }

        // All source symbols of block sbn, ESI 0..K-1.
        std::vector<EncodingPacket> source_packets(std::uint8_t sbn) const;

        // `count` repair symbols of block sbn, ESI N..N+count-1 (N = coded_symbols(sbn)).
        // Throws std::invalid_argument if sbn is out of range or the ESIs would overflow u32.
        std::vector<EncodingPacket> repair_packets(std::uint8_t sbn, std::uint32_t count) const;

        // Whole stream, block-major: each block's source symbols then its repair symbols.
        std::vector<EncodingPacket> encoded_packets(std::uint32_t repair_per_block) const;

    private:
        EncodingPacket encode_symbol(std::uint8_t sbn, std::uint32_t esi) const;

        TransformConfig cfg_;
        // Per block: coded_symbols * symbol_size bytes. wirehair reads the
        // source symbols from here, so it lives as long as the codecs.
        std::vector<std::vector<std::byte>> messages_;
        std::vector<CodecHandle> codecs_;
    };

} // namespace hashcast::fec_core
