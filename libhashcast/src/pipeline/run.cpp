#include <hashcast/pipeline/run.h>
#include <hashcast/pipeline/verifier.h>
#include <hashcast/sim/loss.h>

namespace hashcast::pipeline {

    RunReport run_pipeline(std::span<const Record> records,
        const RunConfig& cfg,
        sim::LossPolicy& channel,
        RunObserver* observer)
    {
        RunObserver noop;
        RunObserver& obs = observer ? *observer : noop;

        const auto buffer = assemble(records, cfg.record_length);
        obs.on_assembled(buffer);

        const PacketGenerator gen(GeneratorConfig{ cfg.symbol_size, cfg.repair_per_block, cfg.max_source_symbols });
        auto stream = gen.generate(buffer);
        obs.on_generated(stream);

        RunReport rep;
        rep.config = stream.config;
        rep.warnings = stream.warnings;
        rep.packets_generated = stream.packets.size();
        rep.source_packets = stream.source_count;
        rep.repair_packets = stream.repair_count;

        auto surviving = channel.transmit(std::move(stream.packets));
        rep.packets_surviving = surviving.size();
        obs.on_transmitted(rep.packets_generated, surviving);

        IncrementalReconstructor rec(stream.config, cfg.policy);
        auto result = rec.run(surviving);
        obs.on_reconstructed(result);

        rep.outcome = result.outcome;
        rep.packets_fed = result.packets_fed;
        rep.packets_unused = result.packets_unused;
        rep.inconsistent_packets = result.inconsistent_packets;

        if (result.outcome == outcome::insufficient_redundancy) return rep;
        if (result.outcome == outcome::integrity_fault) {
            rep.detail = rec.length_mismatch()
                ? "decoded length differs from transfer length"
                : std::to_string(result.inconsistent_packets) + " surplus packets disagree with the decoded data";
            return rep;
        }

        try {
            auto v = verify(records, *result.data, cfg.record_length);
            rep.recovered = std::move(v.records);
            rep.mismatched = std::move(v.mismatched);
            if (!v.ok()) {
                rep.outcome = outcome::integrity_fault;
                rep.detail = v.count_mismatch ? "recovered record count differs from input"
                    : std::to_string(rep.mismatched.size()) + " recovered records differ from input";
            }
        }
        catch (const IntegrityFault& e) {
            rep.outcome = outcome::integrity_fault;
            rep.detail = e.what();
        }
        return rep;
    }

    RunReport run_pipeline(std::span<const Record> records, const RunConfig& cfg, RunObserver* observer) {
        sim::ShuffleTruncateLoss channel(cfg.loss_count, cfg.seed);
        return run_pipeline(records, cfg, channel, observer);
    }

} // namespace hashcast::pipeline
