// apps/hashcast_sweep/main.cpp
// Empirical loss tolerance: success rate per (repair_per_block, loss_count) cell.
#include <cstddef>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <hashcast/version.h>
#include <hashcast/metrics/csv.h>
#include <hashcast/metrics/schema.h>
#include <hashcast/pipeline/run.h>
#include <hashcast/sim/rng.h>
#include <hashcast/util/uuid.h>

using namespace hashcast;
using namespace hashcast::pipeline;
namespace po = boost::program_options;

static std::vector<Record> make_records(std::size_t count, std::size_t len, std::uint32_t seed) {
    sim::XorShift32 rng(seed);
    std::vector<Record> out(count, Record(len));
    for (auto& r : out) {
        for (auto& b : r) b = std::byte{ static_cast<unsigned char>(rng.next_u32() & 0xFF) };
    }
    return out;
}

int main(int argc, char** argv) {
    std::size_t records = 3;
    std::size_t record_len = k_default_record_length;
    int symbol_size = 32;
    std::vector<int> repairs;
    int max_loss = 12;
    int trials = 200;
    std::uint32_t seed = 2025u;
    std::string out_path = "metrics/sweep.csv";

    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help")
        ("version,v", "Show version")
        ("records", po::value<std::size_t>(&records)->default_value(records), "Records per transfer")
        ("record-len", po::value<std::size_t>(&record_len)->default_value(record_len), "Record length in bytes")
        ("symbol-size", po::value<int>(&symbol_size)->default_value(symbol_size), "Symbol size in bytes")
        ("repair", po::value<std::vector<int>>(&repairs)->multitoken(), "Repair counts to sweep (default 0 1 2 4 8)")
        ("max-loss", po::value<int>(&max_loss)->default_value(max_loss), "Sweep loss counts 0..max-loss")
        ("trials", po::value<int>(&trials)->default_value(trials), "Trials per cell")
        ("seed", po::value<std::uint32_t>(&seed)->default_value(seed), "Base seed")
        ("out", po::value<std::string>(&out_path)->default_value(out_path), "CSV output path")
        ;

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }
    catch (const std::exception& e) {
        std::cerr << "arg error: " << e.what() << "\n\n" << desc << "\n";
        return 2;
    }

    if (vm.count("help")) {
        std::cout << "hashcast_sweep " << hashcast::version_banner() << "\n" << desc << "\n";
        return 0;
    }
    if (vm.count("version")) {
        std::cout << hashcast::version() << "\n";
        return 0;
    }
    if (repairs.empty()) repairs = { 0, 1, 2, 4, 8 };
    if (records == 0 || record_len == 0 || symbol_size <= 0 || symbol_size > 0xFFFF || max_loss < 0 || trials <= 0) {
        std::cerr << "error: invalid sweep parameters\n";
        return 2;
    }
    for (int r : repairs) {
        if (r < 0) { std::cerr << "error: --repair values must be >= 0\n"; return 2; }
    }

    const auto input = make_records(records, record_len, seed);

    metrics::CsvWriter m(metrics::schema_version);
    m.set_run_uuid(util::uuid_v4());
    m.set_header(metrics::sweep_header());

    std::cout << "repair  loss  success\n";
    for (int r : repairs) {
        int tolerated = -1; // largest loss with every trial recovered
        for (int loss = 0; loss <= max_loss; ++loss) {
            RunConfig cfg;
            cfg.record_length = record_len;
            cfg.symbol_size = static_cast<std::uint16_t>(symbol_size);
            cfg.repair_per_block = static_cast<std::uint32_t>(r);
            cfg.loss_count = static_cast<std::size_t>(loss);

            int ok = 0;
            std::size_t total = 0;
            try {
                for (int t = 0; t < trials; ++t) {
                    cfg.seed = seed ^ ((static_cast<std::uint32_t>(r) * 1000u + static_cast<std::uint32_t>(loss)) * 7919u + static_cast<std::uint32_t>(t));
                    const auto rep = run_pipeline(input, cfg);
                    total = rep.packets_generated;
                    if (rep.ok()) ++ok;
                    else if (rep.outcome == outcome::integrity_fault) {
                        std::cerr << "integrity fault at repair=" << r << " loss=" << loss << ": " << rep.detail << "\n";
                    }
                }
            }
            catch (const std::exception& e) {
                std::cerr << "error: " << e.what() << "\n";
                m.finish_with_summary(std::string("error: ") + e.what());
                m.save_to_file(out_path);
                return 2;
            }

            const double rate = static_cast<double>(ok) / trials;
            if (ok == trials && tolerated == loss - 1) tolerated = loss;
            std::cout << std::setw(6) << r << std::setw(6) << loss << "  " << std::fixed << std::setprecision(3) << rate << "\n";
            m.add_row({ std::to_string(r), std::to_string(loss), std::to_string(total),
                std::to_string(trials), std::to_string(ok), std::to_string(rate) });
        }
        std::cout << "repair=" << r << " tolerates loss <= " << tolerated << "\n\n";
    }

    m.finish_with_summary("ok");
    if (!m.save_to_file(out_path)) {
        std::cerr << "warning: could not write " << out_path << "\n";
    }
    return 0;
}
