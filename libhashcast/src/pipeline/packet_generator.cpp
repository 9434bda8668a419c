#include <hashcast/pipeline/packet_generator.h>
#include <hashcast/fec_core/encoder.h>
#include <stdexcept>

namespace hashcast::pipeline {

    std::string describe(generator_warning w) {
        switch (w) {
        case generator_warning::zero_redundancy:
            return "repair_per_block is 0: no loss tolerance, every source packet must arrive";
        }
        return "unknown warning";
    }

    GeneratedStream PacketGenerator::generate(std::span<const std::byte> buffer) const {
        if (buffer.empty()) {
            throw std::invalid_argument("PacketGenerator: buffer is empty");
        }
        if (cfg_.symbol_size == 0) {
            throw std::invalid_argument("PacketGenerator: symbol_size must be > 0");
        }

        const fec_core::Encoder enc(buffer, cfg_.symbol_size, cfg_.max_source_symbols);
        auto packets = enc.encoded_packets(cfg_.repair_per_block);

        GeneratedStream out{ enc.config(), std::move(packets), {} };
        out.source_count = static_cast<std::size_t>(out.config.total_source_symbols());
        out.repair_count = out.packets.size() - out.source_count;
        if (cfg_.repair_per_block == 0) {
            out.warnings.push_back(generator_warning::zero_redundancy);
        }
        return out;
    }

} // namespace hashcast::pipeline
