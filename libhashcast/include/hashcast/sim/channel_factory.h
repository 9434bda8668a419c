#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <hashcast/sim/channel.h>

namespace hashcast::sim {

    enum class channel_kind : std::uint8_t {
        shuffle,   // uniform shuffle, drop loss_count
        burst,     // drop loss_count consecutive packets from burst_start
        bernoulli, // independent loss with p_loss, then reorder
        gilbert,   // Good/Bad Markov loss entering Bad with p_loss, then reorder
    };

    std::optional<channel_kind> parse_channel_kind(std::string_view text) noexcept;

    // True for the channels that drop an exact packet count; the others are
    // driven by p_loss alone.
    bool uses_loss_count(channel_kind kind) noexcept;

    struct ChannelOptions {
        channel_kind kind{ channel_kind::shuffle };
        std::size_t loss_count{ 0 };
        double p_loss{ 0.1 };
        std::size_t burst_start{ 0 };
        std::uint32_t seed{ 1 };
    };

    std::unique_ptr<LossPolicy> make_channel(const ChannelOptions& opt);

} // namespace hashcast::sim
