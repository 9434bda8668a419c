#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <span>
#include <vector>
#include <hashcast/fec_core/packet.h>
#include <hashcast/fec_core/transform_config.h>
#include <hashcast/fec_core/wirehair_handle.h>

namespace hashcast::fec_core {

    enum class symbol_status : std::uint8_t {
        accepted,   // handed to the block's decoder
        duplicate,  // ESI already seen
        redundant,  // block already solved
    };

    // One wirehair decoder for one source block. The zero padding symbols of
    // a short block are fed at construction.
    class BlockDecoder {
    public:
        // Throws std::runtime_error if wirehair cannot create the decoder.
        BlockDecoder(std::uint32_t source_symbols, std::uint32_t coded_symbols, std::uint16_t symbol_size);

        // data.size() == symbol_size is the caller's check.
        symbol_status add(std::uint32_t esi, std::span<const std::byte> data);

        bool solved() const noexcept { return solved_; }
        std::uint32_t source_symbols() const noexcept { return K_; }
        std::uint32_t coded_symbols() const noexcept { return N_; }

        // Valid once solved(): K * symbol_size bytes.
        std::span<const std::byte> solution() const noexcept { return { solution_.data(), solution_.size() }; }

        // Once solved(): the symbol the encoder emits for `esi`.
        std::vector<std::byte> regenerate(std::uint32_t esi) const;

    private:
        bool feed(std::uint32_t esi, std::span<const std::byte> data);
        void recover();

        std::uint32_t K_;
        std::uint32_t N_;
        std::uint16_t T_;
        CodecHandle codec_;
        std::set<std::uint32_t> seen_;
        bool solved_{ false };
        std::vector<std::byte> solution_;
    };

    // Decoding session for a whole transfer.
    class Decoder {
    public:
        explicit Decoder(TransformConfig cfg);

        // Feed one packet. Returns the reconstructed transfer once every block
        // is solved (and on every later call). Malformed packets are counted
        // and ignored.
        std::optional<std::vector<std::byte>> decode(const EncodingPacket& packet);

        bool complete() const noexcept { return result_.has_value(); }

        // After complete(): does the packet agree with the decoded data?
        // Throws std::logic_error before completion. Malformed packets are inconsistent.
        bool is_consistent(const EncodingPacket& packet) const;

        const TransformConfig& config() const noexcept { return cfg_; }
        std::size_t accepted_packets() const noexcept { return accepted_; }
        std::size_t duplicate_packets() const noexcept { return duplicates_; }
        std::size_t redundant_packets() const noexcept { return redundant_; }
        std::size_t rejected_packets() const noexcept { return rejected_; }

    private:
        bool well_formed(const EncodingPacket& packet) const noexcept;
        void assemble();

        TransformConfig cfg_;
        std::vector<BlockDecoder> blocks_;
        std::size_t solved_blocks_{ 0 };
        std::optional<std::vector<std::byte>> result_;

        std::size_t accepted_{ 0 };
        std::size_t duplicates_{ 0 };
        std::size_t redundant_{ 0 };
        std::size_t rejected_{ 0 };
    };

} // namespace hashcast::fec_core
