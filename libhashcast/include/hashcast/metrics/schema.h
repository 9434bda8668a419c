#pragma once
#include <string>
#include <vector>

namespace hashcast::metrics {

    // Bump when columns/semantics change.
    inline constexpr int schema_version = 2;

    // One row per pipeline event in hashcast_demo.
    inline std::vector<std::string> run_event_header() {
        return { "ts_ms","app","event","detail","value" };
    }

    // One row per (repair, loss) cell in hashcast_sweep.
    inline std::vector<std::string> sweep_header() {
        return { "repair_per_block","loss_count","packets_total","trials","recovered","success_rate" };
    }

} // namespace hashcast::metrics
