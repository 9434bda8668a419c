#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace hashcast::fec_core {

    // (source block number, encoding symbol id). ESI < K are source symbols; repair ESIs start at
    // TransformConfig::coded_symbols(sbn).
    struct PayloadId {
        std::uint8_t source_block_number{ 0 };
        std::uint32_t encoding_symbol_id{ 0 };

        bool operator==(const PayloadId&) const = default;
    };

    // One encoded symbol plus its identifier. Only meaningful together with the TransformConfig.
    class EncodingPacket {
    public:
        EncodingPacket(PayloadId id, std::vector<std::byte> data)
            : id_(id), data_(std::move(data)) {
        }

        const PayloadId& payload_id() const noexcept { return id_; }
        std::span<const std::byte> data() const noexcept { return { data_.data(), data_.size() }; }

        bool operator==(const EncodingPacket&) const = default;

    private:
        PayloadId id_;
        std::vector<std::byte> data_;
    };

} // namespace hashcast::fec_core
