#include <hashcast/fec_core/encoder.h>
#include <algorithm>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>

namespace hashcast::fec_core {

    Encoder::Encoder(std::span<const std::byte> data,
        std::uint16_t symbol_size,
        std::uint32_t max_source_symbols)
        : cfg_(TransformConfig::for_transfer(data.size(), symbol_size, max_source_symbols))
    {
        ensure_wirehair();

        const std::size_t T = cfg_.symbol_size();
        messages_.reserve(cfg_.source_blocks());
        codecs_.reserve(cfg_.source_blocks());

        for (std::uint8_t sbn = 0; sbn < cfg_.source_blocks(); ++sbn) {
            const std::size_t off = static_cast<std::size_t>(cfg_.first_symbol(sbn)) * T;
            const std::size_t len = std::min<std::size_t>(cfg_.source_symbols(sbn) * T, data.size() - off);

            auto& msg = messages_.emplace_back(static_cast<std::size_t>(cfg_.coded_symbols(sbn)) * T, std::byte{ 0 });
            const auto src = data.subspan(off, len);
            std::copy(src.begin(), src.end(), msg.begin());

            CodecHandle codec(wirehair_encoder_create(nullptr, msg.data(), msg.size(), static_cast<std::uint32_t>(T)));
            if (!codec) {
                throw std::runtime_error("wirehair_encoder_create failed for block " + std::to_string(sbn));
            }
            codecs_.push_back(std::move(codec));
        }
    }

    EncodingPacket Encoder::encode_symbol(std::uint8_t sbn, std::uint32_t esi) const {
        std::vector<std::byte> sym(cfg_.symbol_size());
        std::uint32_t written = 0;
        const WirehairResult r = wirehair_encode(codecs_[sbn].get(), esi,
            sym.data(), static_cast<std::uint32_t>(sym.size()), &written);
        if (r != Wirehair_Success) {
            throw wirehair_error("wirehair_encode", r);
        }
        // Every message is a whole number of symbols, so `written` is always T.
        return EncodingPacket(PayloadId{ sbn, esi }, std::move(sym));
    }

    std::vector<EncodingPacket> Encoder::source_packets(std::uint8_t sbn) const {
        if (sbn >= cfg_.source_blocks()) {
            throw std::invalid_argument("Encoder: source block " + std::to_string(sbn) + " out of range");
        }
        const std::uint32_t K = cfg_.source_symbols(sbn);

        std::vector<EncodingPacket> out;
        out.reserve(K);
        for (std::uint32_t j = 0; j < K; ++j) out.push_back(encode_symbol(sbn, j));
        return out;
    }

    std::vector<EncodingPacket> Encoder::repair_packets(std::uint8_t sbn, std::uint32_t count) const {
        if (sbn >= cfg_.source_blocks()) {
            throw std::invalid_argument("Encoder: source block " + std::to_string(sbn) + " out of range");
        }
        const std::uint32_t N = cfg_.coded_symbols(sbn);
        if (count > std::numeric_limits<std::uint32_t>::max() - N) {
            throw std::invalid_argument("Encoder: " + std::to_string(count) + " repair symbols overflow the ESI range");
        }

        std::vector<EncodingPacket> out;
        out.reserve(count);
        for (std::uint32_t r = 0; r < count; ++r) out.push_back(encode_symbol(sbn, N + r));
        return out;
    }

    std::vector<EncodingPacket> Encoder::encoded_packets(std::uint32_t repair_per_block) const {
        std::vector<EncodingPacket> out;
        out.reserve(static_cast<std::size_t>(cfg_.total_source_symbols()) +
            static_cast<std::size_t>(repair_per_block) * cfg_.source_blocks());

        for (std::uint8_t sbn = 0; sbn < cfg_.source_blocks(); ++sbn) {
            auto src = source_packets(sbn);
            auto rep = repair_packets(sbn, repair_per_block);
            std::move(src.begin(), src.end(), std::back_inserter(out));
            std::move(rep.begin(), rep.end(), std::back_inserter(out));
        }
        return out;
    }

} // namespace hashcast::fec_core
