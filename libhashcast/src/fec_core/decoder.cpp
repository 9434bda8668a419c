#include <hashcast/fec_core/decoder.h>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace hashcast::fec_core {

    // ---------------- BlockDecoder ----------------

    BlockDecoder::BlockDecoder(std::uint32_t source_symbols, std::uint32_t coded_symbols, std::uint16_t symbol_size)
        : K_(source_symbols), N_(coded_symbols), T_(symbol_size)
    {
        ensure_wirehair();
        codec_.reset(wirehair_decoder_create(nullptr, static_cast<std::uint64_t>(N_) * T_, T_));
        if (!codec_) {
            throw std::runtime_error("wirehair_decoder_create failed for " + std::to_string(N_) + " symbols");
        }

        const std::vector<std::byte> zeros(T_, std::byte{ 0 });
        for (std::uint32_t esi = K_; esi < N_; ++esi) {
            seen_.insert(esi);
            if (feed(esi, zeros)) recover();
        }
    }

    bool BlockDecoder::feed(std::uint32_t esi, std::span<const std::byte> data) {
        const WirehairResult r = wirehair_decode(codec_.get(), esi, data.data(), static_cast<std::uint32_t>(data.size()));
        if (r == Wirehair_NeedMore) return false;
        if (r == Wirehair_Success) return true;
        throw wirehair_error("wirehair_decode", r);
    }

    void BlockDecoder::recover() {
        std::vector<std::byte> message(static_cast<std::size_t>(N_) * T_);
        WirehairResult r = wirehair_recover(codec_.get(), message.data(), message.size());
        if (r != Wirehair_Success) throw wirehair_error("wirehair_recover", r);

        // Keep the codec as an encoder so surplus packets can be checked.
        r = wirehair_decoder_becomes_encoder(codec_.get());
        if (r != Wirehair_Success) throw wirehair_error("wirehair_decoder_becomes_encoder", r);

        message.resize(static_cast<std::size_t>(K_) * T_);
        solution_ = std::move(message);
        solved_ = true;
    }

    symbol_status BlockDecoder::add(std::uint32_t esi, std::span<const std::byte> data) {
        if (solved_) return symbol_status::redundant;
        if (!seen_.insert(esi).second) return symbol_status::duplicate;
        if (feed(esi, data)) recover();
        return symbol_status::accepted;
    }

    std::vector<std::byte> BlockDecoder::regenerate(std::uint32_t esi) const {
        if (!solved_) {
            throw std::logic_error("BlockDecoder: regenerate requires a solved block");
        }
        std::vector<std::byte> out(T_);
        std::uint32_t written = 0;
        const WirehairResult r = wirehair_encode(codec_.get(), esi, out.data(), static_cast<std::uint32_t>(out.size()), &written);
        if (r != Wirehair_Success) throw wirehair_error("wirehair_encode", r);
        return out;
    }

    // ---------------- Decoder ----------------

    Decoder::Decoder(TransformConfig cfg) : cfg_(cfg) {
        blocks_.reserve(cfg_.source_blocks());
        for (std::uint8_t sbn = 0; sbn < cfg_.source_blocks(); ++sbn) {
            blocks_.emplace_back(cfg_.source_symbols(sbn), cfg_.coded_symbols(sbn), cfg_.symbol_size());
        }
    }

    bool Decoder::well_formed(const EncodingPacket& packet) const noexcept {
        return packet.payload_id().source_block_number < cfg_.source_blocks() &&
            packet.data().size() == cfg_.symbol_size();
    }

    std::optional<std::vector<std::byte>> Decoder::decode(const EncodingPacket& packet) {
        if (result_) return result_;

        if (!well_formed(packet)) {
            ++rejected_;
            return std::nullopt;
        }

        auto& block = blocks_[packet.payload_id().source_block_number];
        switch (block.add(packet.payload_id().encoding_symbol_id, packet.data())) {
        case symbol_status::accepted:
            ++accepted_;
            if (block.solved() && ++solved_blocks_ == blocks_.size()) {
                assemble();
                return result_;
            }
            break;
        case symbol_status::duplicate:
            ++duplicates_;
            break;
        case symbol_status::redundant:
            ++redundant_;
            break;
        }
        return std::nullopt;
    }

    void Decoder::assemble() {
        std::vector<std::byte> out;
        out.reserve(static_cast<std::size_t>(cfg_.total_source_symbols()) * cfg_.symbol_size());
        for (const auto& b : blocks_) {
            const auto s = b.solution();
            out.insert(out.end(), s.begin(), s.end());
        }
        // Drop the padding of the last symbol.
        out.resize(static_cast<std::size_t>(cfg_.transfer_length()));
        result_ = std::move(out);
    }

    bool Decoder::is_consistent(const EncodingPacket& packet) const {
        if (!result_) {
            throw std::logic_error("Decoder: is_consistent requires a completed decode");
        }
        if (!well_formed(packet)) return false;

        const auto expect = blocks_[packet.payload_id().source_block_number].regenerate(packet.payload_id().encoding_symbol_id);
        return std::equal(expect.begin(), expect.end(), packet.data().begin(), packet.data().end());
    }

} // namespace hashcast::fec_core
