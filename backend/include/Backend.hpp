#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "CommandResult.hpp"
#include "ConnectionOrchestrator.hpp"
#include "DeviceRegistry.hpp"
#include "ScanController.hpp"
#include "Whitelist.hpp"
#include "WhitelistStore.hpp"
#include "core/Config.hpp"
#include "core/EventBroadcaster.hpp"
#include "core/LogBuffer.hpp"
#include "radio/IRadioAdapter.hpp"

namespace bluegate {

// Command surface of the service. Owns every component; the radio is borrowed
// and must outlive the Backend.
class Backend {
public:
    Backend(const BackendConfig& cfg, IRadioAdapter& radio);
    ~Backend();

    Backend(const Backend&) = delete;
    Backend& operator=(const Backend&) = delete;

    bool start();
    // Stops both scan modes and waits for background probes.
    void stop();
    bool running() const { return running_.load(); }

    CommandResult start_scan(ScanMode mode);
    // std::nullopt stops both modes.
    CommandResult stop_scan(std::optional<ScanMode> mode);
    CommandResult connect_device(const std::string& address);
    CommandResult disconnect_device(const std::string& address);
    BulkResult connect_all();
    BulkResult disconnect_all();
    CommandResult add_to_whitelist(const std::string& address, const std::string& name);
    CommandResult remove_from_whitelist(const std::string& address);
    CommandResult update_whitelist(const std::vector<WhitelistEntry>& entries);
    nlohmann::json get_status() const;
    CommandResult clear_logs();

    // New observer channel; its first event is always initial_data.
    std::shared_ptr<Subscription> subscribe();
    void unsubscribe(const std::shared_ptr<Subscription>& sub);

    const BackendConfig& config() const { return config_; }
    DeviceRegistry& registry() { return registry_; }
    Whitelist& whitelist() { return whitelist_; }
    LogBuffer& log() { return log_; }
    EventBroadcaster& broadcaster() { return broadcaster_; }

private:
    nlohmann::json device_lists() const;
    nlohmann::json stats() const;
    std::string uptime() const;
    void publish_device_if_known(const std::string& address);
    void launch_probe(const std::string& address);
    void reap_probes();

    BackendConfig config_;
    IRadioAdapter& radio_;
    WhitelistStore store_;
    Whitelist whitelist_;
    LogBuffer log_;
    EventBroadcaster broadcaster_;
    DeviceRegistry registry_;
    ScanController scans_;
    ConnectionOrchestrator orchestrator_;

    std::chrono::steady_clock::time_point started_at_;
    std::atomic<bool> running_{false};

    struct Probe {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex probes_m_;
    std::vector<Probe> probes_;
};

} // namespace bluegate
