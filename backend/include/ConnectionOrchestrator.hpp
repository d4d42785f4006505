#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "CommandResult.hpp"
#include "core/SingleFlight.hpp"
#include "radio/IRadioAdapter.hpp"

namespace bluegate {

class DeviceRegistry;
class Whitelist;
class EventBroadcaster;
class LogBuffer;

enum class ConnectionState { Idle, ConnectingBulk };

const char* to_string(ConnectionState state);

struct OrchestratorOptions {
    std::chrono::milliseconds connect_timeout{10000};
    // Refuse connect_one for addresses outside the whitelist.
    bool restrict_to_whitelist = false;
};

// Connects and disconnects registered devices, one at a time per address and
// at most one bulk sweep at a time.
class ConnectionOrchestrator {
public:
    ConnectionOrchestrator(IRadioAdapter& radio, DeviceRegistry& registry, Whitelist& whitelist,
                           EventBroadcaster& broadcaster, LogBuffer& log,
                           OrchestratorOptions options = {});

    ConnectionOrchestrator(const ConnectionOrchestrator&) = delete;
    ConnectionOrchestrator& operator=(const ConnectionOrchestrator&) = delete;

    CommandResult connect_one(const std::string& address);
    CommandResult disconnect_one(const std::string& address);

    // Sweep every whitelisted, registered device. Fails with Busy when a
    // sweep is already running.
    BulkResult connect_all();
    BulkResult disconnect_all();

    ConnectionState connection_state() const;

private:
    struct Attempt;

    std::shared_ptr<std::mutex> device_lock(const std::string& address);
    CommandResult run_attempt(const std::string& address, bool connect);
    BulkResult sweep(bool connect);
    void publish_connection_status(bool connecting, const char* operation);

    IRadioAdapter& radio_;
    DeviceRegistry& registry_;
    Whitelist& whitelist_;
    EventBroadcaster& broadcaster_;
    LogBuffer& log_;
    OrchestratorOptions options_;

    SingleFlight bulk_guard_;

    std::mutex locks_m_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> device_locks_;
};

} // namespace bluegate
