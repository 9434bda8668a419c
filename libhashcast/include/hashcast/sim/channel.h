#pragma once
#include <string>
#include <vector>
#include <hashcast/fec_core/packet.h>

namespace hashcast::sim {

    using PacketStream = std::vector<fec_core::EncodingPacket>;

    // Fault injector between generator and reconstructor.
    // transmit() must return a subset of its input (any order) without
    // inventing packets or touching their contents.
    class LossPolicy {
    public:
        virtual ~LossPolicy() = default;

        virtual PacketStream transmit(PacketStream stream) = 0;

        // Short human-readable name for logs and metrics.
        virtual const char* name() const noexcept = 0;

        // Name plus the parameters that drive this policy, e.g. "bernoulli p_loss=0.1".
        virtual std::string describe() const = 0;
    };

} // namespace hashcast::sim
