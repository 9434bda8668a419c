#pragma once
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <vector>
#include <hashcast/fec_core/packet.h>
#include <hashcast/fec_core/transform_config.h>
#include <hashcast/protocol/wire.h>
#include <hashcast/util/crc32c.h>
#include <hashcast/util/endian.h>

namespace hashcast::protocol {

    struct WireSizes {
        static constexpr std::size_t kPacketHeader = sizeof(PacketHeader); // 8
        static constexpr std::size_t kConfig = sizeof(ConfigRecord);       // 16
        static constexpr std::size_t kCrcTrailer = 4;                      // u32 LE
    };

    inline std::size_t encoded_packet_size(std::size_t symbol_len) noexcept {
        return WireSizes::kPacketHeader + symbol_len + WireSizes::kCrcTrailer;
    }

    // Layout (LE):
    //   version u8 | sbn u8 | symbol_len u16 | esi u32
    //   symbol bytes
    //   CRC32C(symbol) u32
    // Returns false if OUT is too small or the symbol does not fit u16.
    inline bool write_packet(std::span<std::byte> out, const fec_core::EncodingPacket& packet) noexcept {
        using namespace hashcast::util::endian;
        const auto data = packet.data();
        if (data.size() > 0xFFFFu) return false;
        if (out.size() < encoded_packet_size(data.size())) return false;

        out[0] = std::byte{ k_wire_version };
        out[1] = std::byte{ packet.payload_id().source_block_number };
        write_u16_le(out.subspan(2, 2), static_cast<std::uint16_t>(data.size()));
        write_u32_le(out.subspan(4, 4), packet.payload_id().encoding_symbol_id);

        if (!data.empty()) std::memcpy(out.data() + WireSizes::kPacketHeader, data.data(), data.size());
        write_u32_le(out.subspan(WireSizes::kPacketHeader + data.size(), 4), util::crc32c(data));
        return true;
    }

    inline std::vector<std::byte> encode_packet(const fec_core::EncodingPacket& packet) {
        std::vector<std::byte> buf(encoded_packet_size(packet.data().size()));
        if (!write_packet(std::span<std::byte>(buf.data(), buf.size()), packet)) return {};
        return buf;
    }

    // Parse one packet; nullopt on short input, unknown version or CRC mismatch.
    inline std::optional<fec_core::EncodingPacket> decode_packet(std::span<const std::byte> in) {
        using namespace hashcast::util::endian;
        if (in.size() < WireSizes::kPacketHeader + WireSizes::kCrcTrailer) return std::nullopt;
        if (std::to_integer<std::uint8_t>(in[0]) != k_wire_version) return std::nullopt;

        const auto sbn = std::to_integer<std::uint8_t>(in[1]);
        const std::uint16_t len = read_u16_le(in.subspan(2, 2));
        const std::uint32_t esi = read_u32_le(in.subspan(4, 4));
        if (in.size() < encoded_packet_size(len)) return std::nullopt;

        const auto data = in.subspan(WireSizes::kPacketHeader, len);
        const std::uint32_t crc = read_u32_le(in.subspan(WireSizes::kPacketHeader + len, 4));
        if (util::crc32c(data) != crc) return std::nullopt;

        return fec_core::EncodingPacket(fec_core::PayloadId{ sbn, esi }, std::vector<std::byte>(data.begin(), data.end()));
    }

    // Layout (LE): version u8 | source_blocks u8 | symbol_size u16 | max_source_symbols u32 | transfer_length u64
    inline std::vector<std::byte> encode_config(const fec_core::TransformConfig& cfg) {
        using namespace hashcast::util::endian;
        std::vector<std::byte> out(WireSizes::kConfig);
        const std::span<std::byte> s(out.data(), out.size());
        s[0] = std::byte{ k_wire_version };
        s[1] = std::byte{ cfg.source_blocks() };
        write_u16_le(s.subspan(2, 2), cfg.symbol_size());
        write_u32_le(s.subspan(4, 4), cfg.max_source_symbols());
        write_u64_le(s.subspan(8, 8), cfg.transfer_length());
        return out;
    }

    // nullopt on short input, unknown version or fields that do not describe a valid partition.
    inline std::optional<fec_core::TransformConfig> decode_config(std::span<const std::byte> in) {
        using namespace hashcast::util::endian;
        if (in.size() < WireSizes::kConfig) return std::nullopt;
        if (std::to_integer<std::uint8_t>(in[0]) != k_wire_version) return std::nullopt;
        return fec_core::TransformConfig::from_fields(read_u64_le(in.subspan(8, 8)),
            read_u16_le(in.subspan(2, 2)),
            std::to_integer<std::uint8_t>(in[1]),
            read_u32_le(in.subspan(4, 4)));
    }

} // namespace hashcast::protocol
