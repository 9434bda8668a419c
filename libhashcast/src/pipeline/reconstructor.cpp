#include <hashcast/pipeline/reconstructor.h>
#include <stdexcept>

namespace hashcast::pipeline {

    IncrementalReconstructor::IncrementalReconstructor(fec_core::TransformConfig cfg, reconstruct_policy policy)
        : cfg_(cfg), policy_(policy), decoder_(cfg) {
    }

    reconstructor_state IncrementalReconstructor::feed(const fec_core::EncodingPacket& packet) {
        if (terminal()) {
            throw std::logic_error("IncrementalReconstructor: feed after terminal state");
        }
        state_ = reconstructor_state::feeding;
        ++fed_;

        auto out = decoder_.decode(packet);
        if (!out) return state_;

        length_mismatch_ = out->size() != cfg_.transfer_length();
        data_ = std::move(out);
        state_ = reconstructor_state::succeeded;
        return state_;
    }

    reconstructor_state IncrementalReconstructor::finish() noexcept {
        if (!terminal()) state_ = reconstructor_state::exhausted;
        return state_;
    }

    ReconstructionResult IncrementalReconstructor::run(const std::vector<fec_core::EncodingPacket>& surviving) {
        if (terminal()) {
            throw std::logic_error("IncrementalReconstructor: run after terminal state");
        }
        ReconstructionResult r;

        std::size_t i = 0;
        for (; i < surviving.size() && !terminal(); ++i) {
            feed(surviving[i]);
        }
        finish();
        r.packets_fed = fed_;

        if (state_ == reconstructor_state::exhausted) {
            r.outcome = outcome::insufficient_redundancy;
            return r;
        }

        if (policy_ == reconstruct_policy::drain_and_verify) {
            for (; i < surviving.size(); ++i) {
                if (!decoder_.is_consistent(surviving[i])) ++r.inconsistent_packets;
            }
        }
        else {
            r.packets_unused = surviving.size() - i;
        }

        r.data = data_;
        r.outcome = (length_mismatch_ || r.inconsistent_packets > 0) ? outcome::integrity_fault : outcome::recovered;
        return r;
    }

} // namespace hashcast::pipeline
