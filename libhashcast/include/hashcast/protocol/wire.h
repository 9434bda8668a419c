#pragma once
#include <cstdint>
#include <type_traits>

namespace hashcast::protocol {

    // Wire format version for packets and transform configs.
    inline constexpr std::uint8_t k_wire_version = 1;

#pragma pack(push, 1)
    // Precedes every serialized EncodingPacket.
    struct PacketHeader {
        std::uint8_t  version;     // = k_wire_version
        std::uint8_t  sbn;         // source block number
        std::uint16_t symbol_len;  // payload bytes (== config symbol size)
        std::uint32_t esi;         // encoding symbol id
    };
    static_assert(std::is_trivially_copyable_v<PacketHeader>, "PacketHeader must be POD");
    static_assert(sizeof(PacketHeader) == 8, "PacketHeader size should be stable (8B)");

    // Out-of-band transform configuration.
    struct ConfigRecord {
        std::uint8_t  version;            // = k_wire_version
        std::uint8_t  source_blocks;      // Z
        std::uint16_t symbol_size;        // T
        std::uint32_t max_source_symbols; // partition limit used by the encoder
        std::uint64_t transfer_length;    // F
    };
    static_assert(sizeof(ConfigRecord) == 16, "ConfigRecord size should be stable (16B)");
#pragma pack(pop)

} // namespace hashcast::protocol
