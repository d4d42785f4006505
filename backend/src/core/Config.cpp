#include "core/Config.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace bluegate {

BackendConfig default_config() {
    BackendConfig cfg;
    cfg.default_whitelist = {
        {"11:22:33:44:55:66", "Device 2"},
        {"77:88:99:AA:BB:CC", "Device 3"},
    };
    return cfg;
}

// "<key>" is in seconds, "<key>_ms" in milliseconds; the latter wins.
static void read_duration(const json& j, const char* key, std::chrono::milliseconds& out) {
    std::string ms_key = std::string(key) + "_ms";
    if (j.contains(ms_key) && j[ms_key].is_number()) {
        out = std::chrono::milliseconds((int64_t)j[ms_key].get<double>());
        return;
    }
    if (j.contains(key) && j[key].is_number()) {
        double seconds = j[key].get<double>();
        if (std::isfinite(seconds) && seconds >= 0.0) {
            out = std::chrono::milliseconds((int64_t)std::llround(seconds * 1000.0));
        }
    }
}

static void read_size(const json& j, const char* key, size_t& out) {
    if (j.contains(key) && j[key].is_number_integer() && j[key].get<int64_t>() > 0) {
        out = (size_t)j[key].get<int64_t>();
    }
}

void apply_config_json(BackendConfig& cfg, const json& j) {
    if (!j.is_object()) return;

    if (j.contains("web_port") && j["web_port"].is_number_integer()) cfg.web_port = j["web_port"].get<int>();
    read_duration(j, "connection_timeout", cfg.connection_timeout);
    read_duration(j, "probe_timeout", cfg.probe_timeout);
    read_duration(j, "scan_grace", cfg.scan_grace);
    read_duration(j, "scan_interval", cfg.scan_interval);
    read_size(j, "log_capacity", cfg.log_capacity);
    read_size(j, "observer_queue_capacity", cfg.observer_queue_capacity);
    read_size(j, "status_log_count", cfg.status_log_count);
    read_size(j, "initial_log_count", cfg.initial_log_count);
    cfg.restrict_connect_to_whitelist = j.value("restrict_connect_to_whitelist", cfg.restrict_connect_to_whitelist);
    cfg.fleet_path = j.value("fleet_path", cfg.fleet_path);
    if (j.contains("sim_seed") && j["sim_seed"].is_number_unsigned()) cfg.sim_seed = j["sim_seed"].get<uint64_t>();

    // Legacy files listed bare addresses.
    if (j.contains("valid_devices") && j["valid_devices"].is_array()) {
        cfg.default_whitelist = j["valid_devices"].get<std::vector<WhitelistEntry>>();
    } else if (j.contains("valid_mac_addresses") && j["valid_mac_addresses"].is_array()) {
        cfg.default_whitelist.clear();
        for (const auto& a : j["valid_mac_addresses"]) {
            if (a.is_string()) cfg.default_whitelist.push_back({a.get<std::string>(), a.get<std::string>()});
        }
    }
}

BackendConfig load_config(const std::string& path) {
    BackendConfig cfg = default_config();
    cfg.whitelist_path = path;

    std::ifstream f(path);
    if (!f) {
        std::cout << "Config: " << path << " not found, using defaults" << std::endl;
        return cfg;
    }
    try {
        json j = json::parse(f);
        apply_config_json(cfg, j);
        std::cout << "Config: loaded " << path << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Config: failed to parse " << path << ": " << e.what() << " (using defaults)" << std::endl;
        cfg = default_config();
        cfg.whitelist_path = path;
    }
    return cfg;
}

std::string resolve_config_path(const std::string& cli_path) {
    if (!cli_path.empty()) return cli_path;
    const char* env = std::getenv("BLUEGATE_CONFIG");
    if (env && *env) return std::string(env);
    return "bluetooth_config.json";
}

json config_to_json(const BackendConfig& cfg) {
    return {
        {"web_port", cfg.web_port},
        {"connection_timeout_ms", cfg.connection_timeout.count()},
        {"probe_timeout_ms", cfg.probe_timeout.count()},
        {"scan_grace_ms", cfg.scan_grace.count()},
        {"scan_interval_ms", cfg.scan_interval.count()},
        {"log_capacity", cfg.log_capacity},
        {"observer_queue_capacity", cfg.observer_queue_capacity},
        {"status_log_count", cfg.status_log_count},
        {"initial_log_count", cfg.initial_log_count},
        {"restrict_connect_to_whitelist", cfg.restrict_connect_to_whitelist},
        {"fleet_path", cfg.fleet_path},
        {"sim_seed", cfg.sim_seed}
    };
}

} // namespace bluegate
