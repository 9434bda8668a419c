#include <hashcast/sim/channel_factory.h>
#include <hashcast/sim/loss.h>

namespace hashcast::sim {

    namespace {
        // Reordering draws from its own stream so it does not mirror the loss pattern.
        constexpr std::uint32_t k_reorder_seed_mix = 0x5bd1e995u;
    } // namespace

    std::optional<channel_kind> parse_channel_kind(std::string_view text) noexcept {
        if (text == "shuffle") return channel_kind::shuffle;
        if (text == "burst") return channel_kind::burst;
        if (text == "bernoulli") return channel_kind::bernoulli;
        if (text == "gilbert") return channel_kind::gilbert;
        return std::nullopt;
    }

    bool uses_loss_count(channel_kind kind) noexcept {
        return kind == channel_kind::shuffle || kind == channel_kind::burst;
    }

    std::unique_ptr<LossPolicy> make_channel(const ChannelOptions& opt) {
        switch (opt.kind) {
        case channel_kind::shuffle:
            return std::make_unique<ShuffleTruncateLoss>(opt.loss_count, opt.seed);
        case channel_kind::burst:
            return std::make_unique<BurstLoss>(opt.burst_start, opt.loss_count);
        case channel_kind::bernoulli:
            return std::make_unique<ReorderingChannel>(
                std::make_unique<BernoulliLoss>(opt.p_loss, opt.seed), opt.seed ^ k_reorder_seed_mix);
        case channel_kind::gilbert: {
            // Enter Bad with p_loss, stay a few packets, lose most of them there.
            const GilbertElliottParams ge{ opt.p_loss, 0.3, 0.9 };
            return std::make_unique<ReorderingChannel>(
                std::make_unique<GilbertElliottLoss>(ge, opt.seed), opt.seed ^ k_reorder_seed_mix);
        }
        }
        return nullptr;
    }

} // namespace hashcast::sim
