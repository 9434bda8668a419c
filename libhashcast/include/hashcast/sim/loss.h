#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <hashcast/sim/channel.h>
#include <hashcast/sim/rng.h>

namespace hashcast::sim {

    // Uniform shuffle, then drop loss_count packets off the end.
    // Survivors: max(0, N - loss_count), in shuffled order.
    class ShuffleTruncateLoss final : public LossPolicy {
    public:
        ShuffleTruncateLoss(std::size_t loss_count, std::uint32_t seed)
            : loss_count_(loss_count), rng_(seed) {
        }

        PacketStream transmit(PacketStream stream) override;
        const char* name() const noexcept override { return "shuffle-truncate"; }
        std::string describe() const override;

    private:
        std::size_t loss_count_;
        XorShift32 rng_;
    };

    // Deterministic fixture: drop the packets at the given stream indices, keep order.
    class IndexDropLoss final : public LossPolicy {
    public:
        explicit IndexDropLoss(std::vector<std::size_t> indices) : indices_(std::move(indices)) {}

        PacketStream transmit(PacketStream stream) override;
        const char* name() const noexcept override { return "index-drop"; }
        std::string describe() const override;

    private:
        std::vector<std::size_t> indices_;
    };

    // Drop `length` consecutive packets starting at `start` (clamped to the stream).
    class BurstLoss final : public LossPolicy {
    public:
        BurstLoss(std::size_t start, std::size_t length) : start_(start), length_(length) {}

        PacketStream transmit(PacketStream stream) override;
        const char* name() const noexcept override { return "burst"; }
        std::string describe() const override;

    private:
        std::size_t start_;
        std::size_t length_;
    };

    // Independent loss with probability p_loss per packet.
    class BernoulliLoss final : public LossPolicy {
    public:
        BernoulliLoss(double p_loss, std::uint32_t seed) : p_loss_(p_loss), rng_(seed) {}

        bool drop() noexcept;
        PacketStream transmit(PacketStream stream) override;
        const char* name() const noexcept override { return "bernoulli"; }
        std::string describe() const override;

    private:
        double p_loss_; // clamped to [0,1] on use
        XorShift32 rng_;
    };

    // Gilbert-Elliott: two-state Markov chain (Good/Bad), loss only in Bad.
    struct GilbertElliottParams {
        double p_g_to_b{ 0.0 };
        double p_b_to_g{ 0.0 };
        double p_loss_bad{ 0.0 };
    };

    class GilbertElliottLoss final : public LossPolicy {
    public:
        GilbertElliottLoss(GilbertElliottParams params, std::uint32_t seed) : p_(params), rng_(seed) {}

        bool drop() noexcept;
        bool in_bad_state() const noexcept { return bad_; }
        PacketStream transmit(PacketStream stream) override;
        const char* name() const noexcept override { return "gilbert-elliott"; }
        std::string describe() const override;

    private:
        GilbertElliottParams p_;
        XorShift32 rng_;
        bool bad_{ false };
    };

    // Applies the wrapped policy, then uniformly reorders the survivors.
    class ReorderingChannel final : public LossPolicy {
    public:
        ReorderingChannel(std::unique_ptr<LossPolicy> inner, std::uint32_t seed)
            : inner_(std::move(inner)), rng_(seed) {
        }

        PacketStream transmit(PacketStream stream) override;
        const char* name() const noexcept override { return "reordering"; }
        std::string describe() const override;

    private:
        std::unique_ptr<LossPolicy> inner_;
        XorShift32 rng_;
    };

} // namespace hashcast::sim
