#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Whitelist.hpp"

namespace bluegate {

struct BackendConfig {
    int web_port = 5001;
    std::chrono::milliseconds connection_timeout{10000};
    std::chrono::milliseconds probe_timeout{5000};
    // How long stop_scan waits for a consumer to acknowledge cancellation.
    std::chrono::milliseconds scan_grace{2000};
    // Pause between discovery cycles of the simulated radio.
    std::chrono::milliseconds scan_interval{5000};
    size_t log_capacity = 200;
    size_t observer_queue_capacity = 256;
    size_t status_log_count = 100;
    size_t initial_log_count = 50;
    bool restrict_connect_to_whitelist = false;

    // Path of the JSON file the whitelist is persisted to.
    std::string whitelist_path = "bluetooth_config.json";
    std::string fleet_path;
    uint64_t sim_seed = 0;

    // Seeds the whitelist when no persisted list exists yet.
    std::vector<WhitelistEntry> default_whitelist;
};

BackendConfig default_config();

// Applies recognized keys of a config object on top of cfg.
void apply_config_json(BackendConfig& cfg, const nlohmann::json& j);

// Loads path on top of the defaults. Missing file: defaults. Malformed file:
// logged, defaults kept.
BackendConfig load_config(const std::string& path);

// -c/--config, then $BLUEGATE_CONFIG, then bluetooth_config.json
std::string resolve_config_path(const std::string& cli_path);

nlohmann::json config_to_json(const BackendConfig& cfg);

} // namespace bluegate
