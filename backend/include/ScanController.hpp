#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "radio/IRadioAdapter.hpp"

namespace bluegate {

class DeviceRegistry;
class Whitelist;
class EventBroadcaster;
class LogBuffer;

enum class ScanMode { Authorized, All };
enum class ScanState { Idle, ScanningAuthorized, ScanningAll, ScanningBoth };

const char* to_string(ScanMode mode);
const char* to_string(ScanState state);
std::optional<ScanMode> parse_scan_mode(const std::string& s);

// Drives discovery for the two independent scan modes. Each active mode
// owns one discovery stream and one consumer thread.
class ScanController {
public:
    ScanController(IRadioAdapter& radio, DeviceRegistry& registry, Whitelist& whitelist,
                   EventBroadcaster& broadcaster, LogBuffer& log,
                   std::chrono::milliseconds grace = std::chrono::milliseconds(2000));
    ~ScanController();

    ScanController(const ScanController&) = delete;
    ScanController& operator=(const ScanController&) = delete;

    // Returns false if the mode was already running (no-op).
    // Throws errors::Error(CapabilityFailure) when discovery cannot start.
    bool start(ScanMode mode);
    // Returns false if the mode was not running.
    bool stop(ScanMode mode);
    void stop_all();

    bool is_active(ScanMode mode) const;
    ScanState state() const;

    // How long a consumer blocks on its stream before re-checking its flag.
    // Consumers started afterwards pick it up.
    void set_poll_interval(std::chrono::milliseconds interval) { poll_ms_.store(interval.count()); }

private:
    struct Worker {
        std::atomic<bool> active{false};
        std::thread thread;
        std::shared_ptr<DiscoveryStream> stream;
        std::mutex exit_m;
        std::condition_variable exit_cv;
        bool exited = true;
    };

    Worker& worker(ScanMode mode);
    const Worker& worker(ScanMode mode) const;
    void run_consumer(ScanMode mode, std::shared_ptr<DiscoveryStream> stream);
    void on_sighting(ScanMode mode, const Sighting& s);
    void on_stream_failure(ScanMode mode, const std::string& what);
    void join_if_exited(Worker& w, std::chrono::milliseconds wait);
    void publish_status(ScanMode mode, bool scanning);

    IRadioAdapter& radio_;
    DeviceRegistry& registry_;
    Whitelist& whitelist_;
    EventBroadcaster& broadcaster_;
    LogBuffer& log_;
    std::chrono::milliseconds grace_;
    std::atomic<int64_t> poll_ms_{200};

    // Serializes start/stop; consumers never take it.
    std::mutex control_m_;
    Worker authorized_;
    Worker all_;
};

} // namespace bluegate
