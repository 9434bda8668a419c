// apps/hashcast_demo/main.cpp
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <hashcast/version.h>
#include <hashcast/metrics/csv.h>
#include <hashcast/metrics/schema.h>
#include <hashcast/pipeline/run.h>
#include <hashcast/pipeline/source_assembler.h>
#include <hashcast/sim/channel_factory.h>
#include <hashcast/util/hex.h>
#include <hashcast/util/uuid.h>

using namespace hashcast;
using namespace hashcast::pipeline;
namespace po = boost::program_options;

namespace {

    // Exit codes
    constexpr int k_exit_recovered = 0;
    constexpr int k_exit_insufficient = 1;
    constexpr int k_exit_usage = 2;
    constexpr int k_exit_integrity = 3;

    const std::vector<std::string> k_sample_hashes = {
        "2f8bce2a7a4f7e4d8b8c8d8e8f909192939495969798999a9b9c9d9e9fa0a1a2",
        "a1a2a3a4b1b2b3b4c1c2c3c4d1d2d3d4e1e2e3e4f1f2f3f40102030405060708",
        "11223344556677889900aabbccddeeff11223344556677889900aabbccddeeff",
    };

    std::uint64_t now_ms() {
        using namespace std::chrono;
        return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
    }

    std::string hex_of(std::span<const std::byte> b) { return util::to_hex(b); }

    // Console progress + CSV event rows.
    class DemoObserver final : public RunObserver {
    public:
        DemoObserver(metrics::CsvWriter* csv, std::size_t preview) : csv_(csv), preview_(preview) {}

        void on_assembled(std::span<const std::byte> buffer) override {
            std::cout << "Total data: " << buffer.size() << " bytes\n";
            event("assembled", "bytes", buffer.size());
        }

        void on_generated(const GeneratedStream& s) override {
            for (auto w : s.warnings) {
                std::cerr << "warning: " << describe(w) << "\n";
                event("warning", describe(w), 0);
            }
            std::cout << "Source blocks: " << static_cast<int>(s.config.source_blocks())
                << ", source symbols: " << s.source_count << "\n";
            std::cout << "Generated " << s.packets.size() << " total packets ("
                << s.source_count << " source + " << s.repair_count << " repair)\n\n";
            event("generated", "packets", s.packets.size());

            const std::size_t n = std::min(preview_, s.packets.size());
            for (std::size_t i = 0; i < n; ++i) {
                const auto& p = s.packets[i];
                const auto head = p.data().first(std::min<std::size_t>(8, p.data().size()));
                std::cout << "Packet " << (i < 10 ? " " : "") << i
                    << " | SBN " << static_cast<int>(p.payload_id().source_block_number)
                    << " ESI " << p.payload_id().encoding_symbol_id
                    << " | " << hex_of(head) << "...\n";
            }
        }

        void on_transmitted(std::size_t sent, const sim::PacketStream& surviving) override {
            std::cout << "\nLost " << (sent - surviving.size()) << " packets -> "
                << surviving.size() << " remaining\n";
            event("transmitted", "surviving", surviving.size());
        }

        void on_reconstructed(const ReconstructionResult& r) override {
            if (r.outcome != outcome::insufficient_redundancy && r.packets_unused > 0) {
                std::cout << "Early reconstruction after " << r.packets_fed << " packets ("
                    << r.packets_unused << " left unfed)\n";
            }
            event("reconstructed", std::string(to_string(r.outcome)), r.packets_fed);
        }

    private:
        void event(const std::string& name, const std::string& detail, std::size_t value) {
            if (!csv_) return;
            csv_->add_row({ std::to_string(now_ms()), "demo", name, detail, std::to_string(value) });
        }

        metrics::CsvWriter* csv_;
        std::size_t preview_;
    };

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> hashes;
    std::string config_path;
    std::string policy_s = "stop";
    std::string channel_s = "shuffle";
    std::string metrics_dir = "metrics";
    std::size_t record_len = k_default_record_length;
    int symbol_size = 128;
    int repair = 10;
    std::size_t loss = 8;
    std::uint32_t seed = 0;
    double p_loss = 0.1;
    std::size_t burst_start = 0;
    std::size_t preview = 8;

    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help")
        ("version,v", "Show version")
        ("config", po::value<std::string>(&config_path), "INI-style file with any of the options below")
        ("hash", po::value<std::vector<std::string>>(&hashes)->composing(), "Hex record (repeatable); defaults to 3 sample hashes")
        ("record-len", po::value<std::size_t>(&record_len)->default_value(record_len), "Record length in bytes")
        ("symbol-size", po::value<int>(&symbol_size)->default_value(symbol_size), "Symbol size in bytes (1..65535)")
        ("repair", po::value<int>(&repair)->default_value(repair), "Repair symbols per source block")
        ("loss", po::value<std::size_t>(&loss)->default_value(loss), "Simulated lost packets (shuffle/burst channels)")
        ("seed", po::value<std::uint32_t>(&seed), "Channel RNG seed (random if omitted)")
        ("channel", po::value<std::string>(&channel_s)->default_value(channel_s), "shuffle | burst | bernoulli | gilbert")
        ("p-loss", po::value<double>(&p_loss)->default_value(p_loss), "Loss (bernoulli) or Good->Bad (gilbert) probability")
        ("burst-start", po::value<std::size_t>(&burst_start)->default_value(0), "First dropped index for --channel burst")
        ("policy", po::value<std::string>(&policy_s)->default_value(policy_s), "stop (first success wins) | drain (verify surplus packets)")
        ("preview", po::value<std::size_t>(&preview)->default_value(preview), "Packets to preview")
        ("metrics-dir", po::value<std::string>(&metrics_dir)->default_value(metrics_dir), "Directory for the run CSV (empty disables)")
        ;

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("config")) {
            std::ifstream in(vm["config"].as<std::string>());
            if (!in) {
                std::cerr << "error: cannot open --config " << vm["config"].as<std::string>() << "\n";
                return k_exit_usage;
            }
            // Command-line values stored first take precedence.
            po::store(po::parse_config_file(in, desc), vm);
        }
        po::notify(vm);
    }
    catch (const std::exception& e) {
        std::cerr << "arg error: " << e.what() << "\n\n" << desc << "\n";
        return k_exit_usage;
    }

    if (vm.count("help")) {
        std::cout << "hashcast_demo " << hashcast::version_banner() << "\n" << desc << "\n";
        return k_exit_recovered;
    }
    if (vm.count("version")) {
        std::cout << hashcast::version() << "\n";
        return k_exit_recovered;
    }
    if (symbol_size <= 0 || symbol_size > 0xFFFF) {
        std::cerr << "error: --symbol-size must be in 1..65535\n";
        return k_exit_usage;
    }
    if (repair < 0) {
        std::cerr << "error: --repair must be >= 0\n";
        return k_exit_usage;
    }
    if (policy_s != "stop" && policy_s != "drain") {
        std::cerr << "error: --policy must be stop or drain\n";
        return k_exit_usage;
    }
    if (hashes.empty()) hashes = k_sample_hashes;
    if (!vm.count("seed")) seed = std::random_device{}();

    RunConfig cfg;
    cfg.record_length = record_len;
    cfg.symbol_size = static_cast<std::uint16_t>(symbol_size);
    cfg.repair_per_block = static_cast<std::uint32_t>(repair);
    cfg.loss_count = loss;
    cfg.seed = seed;
    cfg.policy = policy_s == "drain" ? reconstruct_policy::drain_and_verify : reconstruct_policy::stop_at_first_success;

    const auto kind = sim::parse_channel_kind(channel_s);
    if (!kind) {
        std::cerr << "error: unknown --channel " << channel_s << "\n";
        return k_exit_usage;
    }
    if (!sim::uses_loss_count(*kind) && !vm["loss"].defaulted()) {
        std::cerr << "error: --loss does not apply to --channel " << channel_s << "; use --p-loss\n";
        return k_exit_usage;
    }
    auto channel = sim::make_channel({ *kind, cfg.loss_count, p_loss, burst_start, cfg.seed });

    std::cout << "=== hashcast " << hashcast::version() << ": hash batch FEC demo ===\n\n";
    std::cout << "Symbol size: " << cfg.symbol_size << " bytes\n";
    std::cout << "Repair packets per block: " << cfg.repair_per_block << "\n";
    std::cout << "Channel: " << channel->describe() << " (seed " << cfg.seed << ")\n\n";

    // ---- Metrics ----
    metrics::CsvWriter m(metrics::schema_version);
    const auto run_id = util::uuid_v4();
    m.set_run_uuid(run_id);
    m.set_header(metrics::run_event_header());
    auto save_metrics = [&](const std::string& summary) {
        m.finish_with_summary(summary);
        if (metrics_dir.empty()) return;
        const auto path = std::filesystem::path(metrics_dir) / ("demo_" + run_id + ".csv");
        if (!m.save_to_file(path)) std::cerr << "warning: could not write " << path.string() << "\n";
    };

    std::vector<Record> records;
    try {
        records = parse_hex_records(hashes, cfg.record_length);
    }
    catch (const MalformedRecord& e) {
        std::cerr << "error: " << e.what() << "\n";
        save_metrics(std::string("malformed_record: ") + e.what());
        return k_exit_usage;
    }
    for (std::size_t i = 0; i < records.size(); ++i) {
        std::cout << "Original hash " << (i + 1) << ": " << hex_of(records[i]) << "\n";
    }
    std::cout << "\n";

    DemoObserver obs(&m, preview);
    RunReport rep;
    try {
        rep = run_pipeline(records, cfg, *channel, &obs);
    }
    catch (const MalformedRecord& e) {
        std::cerr << "error: " << e.what() << "\n";
        save_metrics(std::string("malformed_record: ") + e.what());
        return k_exit_usage;
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n";
        save_metrics(std::string("invalid_argument: ") + e.what());
        return k_exit_usage;
    }

    switch (rep.outcome) {
    case outcome::recovered:
        std::cout << "\nFULL SUCCESS! Recovered " << rep.recovered.size() * cfg.record_length << " bytes\n\n";
        for (std::size_t i = 0; i < rep.recovered.size(); ++i) {
            std::cout << "Recovered hash " << (i + 1) << ": " << hex_of(rep.recovered[i]) << "\n";
        }
        save_metrics("recovered");
        return k_exit_recovered;

    case outcome::insufficient_redundancy:
        std::cout << "\nFailed: need more packets (" << rep.packets_surviving << " of "
            << rep.packets_generated << " arrived; increase --repair or lower --loss).\n";
        save_metrics("insufficient_redundancy");
        return k_exit_insufficient;

    case outcome::integrity_fault:
        std::cerr << "\nintegrity fault: " << rep.detail << "\n";
        save_metrics("integrity_fault: " + rep.detail);
        return k_exit_integrity;
    }
    return k_exit_integrity;
}
