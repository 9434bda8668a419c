#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include <hashcast/fec_core/decoder.h>
#include <hashcast/fec_core/packet.h>
#include <hashcast/fec_core/transform_config.h>
#include <hashcast/pipeline/errors.h>

namespace hashcast::pipeline {

    enum class reconstruct_policy : std::uint8_t {
        stop_at_first_success, // discard the rest unfed
        drain_and_verify,      // check the rest against the decoded data
    };

    enum class reconstructor_state : std::uint8_t {
        idle,
        feeding,
        succeeded,
        exhausted,
    };

    struct ReconstructionResult {
        pipeline::outcome outcome{ pipeline::outcome::insufficient_redundancy };
        std::optional<std::vector<std::byte>> data;
        std::size_t packets_fed{ 0 };          // packets given to the decoder before success/exhaustion
        std::size_t packets_unused{ 0 };       // survivors never fed
        std::size_t inconsistent_packets{ 0 }; // drain_and_verify only
    };

    // Feeds packets one at a time into a decoding session.
    // idle -> feeding -> succeeded | exhausted. The first success is final.
    class IncrementalReconstructor {
    public:
        explicit IncrementalReconstructor(fec_core::TransformConfig cfg,
            reconstruct_policy policy = reconstruct_policy::stop_at_first_success);

        // Feed one packet. Returns the new state. Throws std::logic_error once a terminal state is reached.
        reconstructor_state feed(const fec_core::EncodingPacket& packet);

        // Declare the supply exhausted. No-op after success.
        reconstructor_state finish() noexcept;

        // Drive a whole surviving set and produce the outcome. One run per
        // reconstructor: throws std::logic_error when already terminal.
        ReconstructionResult run(const std::vector<fec_core::EncodingPacket>& surviving);

        reconstructor_state state() const noexcept { return state_; }
        bool terminal() const noexcept {
            return state_ == reconstructor_state::succeeded || state_ == reconstructor_state::exhausted;
        }
        std::size_t packets_fed() const noexcept { return fed_; }
        const fec_core::Decoder& decoder() const noexcept { return decoder_; }

        // Success data; empty unless state() == succeeded.
        const std::optional<std::vector<std::byte>>& data() const noexcept { return data_; }

        // Length mismatch between decoded data and the config's transfer length.
        bool length_mismatch() const noexcept { return length_mismatch_; }

    private:
        fec_core::TransformConfig cfg_;
        reconstruct_policy policy_;
        fec_core::Decoder decoder_;
        reconstructor_state state_{ reconstructor_state::idle };
        std::size_t fed_{ 0 };
        std::optional<std::vector<std::byte>> data_;
        bool length_mismatch_{ false };
    };

} // namespace hashcast::pipeline
