#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <hashcast/fec_core/transform_config.h>
#include <hashcast/pipeline/errors.h>
#include <hashcast/pipeline/packet_generator.h>
#include <hashcast/pipeline/reconstructor.h>
#include <hashcast/pipeline/source_assembler.h>
#include <hashcast/sim/channel.h>

namespace hashcast::pipeline {

    // Explicit parameters of one run (all runtime, nothing compiled in).
    struct RunConfig {
        std::size_t record_length{ k_default_record_length };
        std::uint16_t symbol_size{ 128 };
        std::uint32_t repair_per_block{ 10 };
        std::size_t loss_count{ 8 };
        std::uint32_t seed{ 1 };
        std::uint32_t max_source_symbols{ fec_core::k_default_max_source_symbols };
        reconstruct_policy policy{ reconstruct_policy::stop_at_first_success };
    };

    struct RunReport {
        pipeline::outcome outcome{ pipeline::outcome::insufficient_redundancy };
        std::optional<fec_core::TransformConfig> config;
        std::vector<generator_warning> warnings;

        std::size_t packets_generated{ 0 };
        std::size_t source_packets{ 0 };
        std::size_t repair_packets{ 0 };
        std::size_t packets_surviving{ 0 };
        std::size_t packets_fed{ 0 };
        std::size_t packets_unused{ 0 };
        std::size_t inconsistent_packets{ 0 };

        std::vector<Record> recovered;        // filled on success
        std::vector<std::size_t> mismatched;  // record indices that differ from the input
        std::string detail;                   // integrity fault description

        std::size_t packets_lost() const noexcept { return packets_generated - packets_surviving; }
        bool ok() const noexcept { return outcome == pipeline::outcome::recovered; }
    };

    // Progress hooks; default no-ops. The library itself never prints.
    class RunObserver {
    public:
        virtual ~RunObserver() = default;
        virtual void on_assembled(std::span<const std::byte> /*buffer*/) {}
        virtual void on_generated(const GeneratedStream& /*stream*/) {}
        virtual void on_transmitted(std::size_t /*sent*/, const sim::PacketStream& /*surviving*/) {}
        virtual void on_reconstructed(const ReconstructionResult& /*result*/) {}
    };

    // records -> assemble -> generate -> channel -> reconstruct -> verify.
    // Throws MalformedRecord (nothing downstream runs) and std::invalid_argument for bad parameters.
    RunReport run_pipeline(std::span<const Record> records,
        const RunConfig& cfg,
        sim::LossPolicy& channel,
        RunObserver* observer = nullptr);

    // Same, with the default shuffle-and-truncate channel seeded from cfg.seed.
    RunReport run_pipeline(std::span<const Record> records, const RunConfig& cfg, RunObserver* observer = nullptr);

} // namespace hashcast::pipeline
