#include "ScanController.hpp"
#include "DeviceEvents.hpp"
#include "DeviceRegistry.hpp"
#include "Whitelist.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/EventBroadcaster.hpp"
#include "core/LogBuffer.hpp"
#include <iostream>

namespace bluegate {

const char* to_string(ScanMode mode) {
    return mode == ScanMode::Authorized ? "authorized" : "all";
}

const char* to_string(ScanState state) {
    switch (state) {
        case ScanState::Idle: return "Idle";
        case ScanState::ScanningAuthorized: return "ScanningAuthorized";
        case ScanState::ScanningAll: return "ScanningAll";
        case ScanState::ScanningBoth: return "ScanningBoth";
    }
    return "Idle";
}

std::optional<ScanMode> parse_scan_mode(const std::string& s) {
    if (s == "authorized") return ScanMode::Authorized;
    if (s == "all") return ScanMode::All;
    return std::nullopt;
}

ScanController::ScanController(IRadioAdapter& radio, DeviceRegistry& registry, Whitelist& whitelist,
                               EventBroadcaster& broadcaster, LogBuffer& log,
                               std::chrono::milliseconds grace)
: radio_(radio), registry_(registry), whitelist_(whitelist), broadcaster_(broadcaster), log_(log), grace_(grace) {}

ScanController::~ScanController() {
    stop_all();
    for (Worker* w : {&authorized_, &all_}) {
        if (w->thread.joinable()) w->thread.join();
    }
}

ScanController::Worker& ScanController::worker(ScanMode mode) {
    return mode == ScanMode::Authorized ? authorized_ : all_;
}

const ScanController::Worker& ScanController::worker(ScanMode mode) const {
    return mode == ScanMode::Authorized ? authorized_ : all_;
}

bool ScanController::is_active(ScanMode mode) const {
    return worker(mode).active.load();
}

ScanState ScanController::state() const {
    bool a = authorized_.active.load();
    bool b = all_.active.load();
    if (a && b) return ScanState::ScanningBoth;
    if (a) return ScanState::ScanningAuthorized;
    if (b) return ScanState::ScanningAll;
    return ScanState::Idle;
}

void ScanController::join_if_exited(Worker& w, std::chrono::milliseconds wait) {
    if (!w.thread.joinable()) return;
    bool exited;
    {
        std::unique_lock<std::mutex> lk(w.exit_m);
        exited = w.exit_cv.wait_for(lk, wait, [&w]() { return w.exited; });
    }
    if (exited) w.thread.join();
}

bool ScanController::start(ScanMode mode) {
    std::lock_guard<std::mutex> lk(control_m_);
    Worker& w = worker(mode);
    if (w.active.load()) return false;

    // A consumer that stopped on its own (failure, or a stop past its grace)
    // still has to be reaped before the slot is reused.
    if (w.thread.joinable()) w.thread.join();

    std::shared_ptr<DiscoveryStream> stream;
    try {
        stream = radio_.open_discovery();
    } catch (const errors::Error& e) {
        log_.error(std::string("Failed to start ") + to_string(mode) + " scan: " + e.what());
        publish_status(mode, false);
        throw;
    } catch (const std::exception& e) {
        log_.error(std::string("Failed to start ") + to_string(mode) + " scan: " + e.what());
        publish_status(mode, false);
        throw errors::Error(errors::ErrorKind::CapabilityFailure, e.what());
    }

    w.stream = stream;
    {
        std::lock_guard<std::mutex> elk(w.exit_m);
        w.exited = false;
    }
    w.active.store(true);
    w.thread = std::thread([this, mode, stream]() { run_consumer(mode, stream); });

    log_.info(mode == ScanMode::Authorized ? "Authorized device scan started" : "Full device scan started");
    publish_status(mode, true);
    return true;
}

bool ScanController::stop(ScanMode mode) {
    std::lock_guard<std::mutex> lk(control_m_);
    Worker& w = worker(mode);
    bool was_active = w.active.exchange(false);
    if (w.stream) w.stream->cancel();
    join_if_exited(w, grace_);
    if (w.thread.joinable()) {
        std::cerr << "ScanController: " << to_string(mode)
                  << " consumer did not acknowledge cancellation within grace period" << std::endl;
    }
    if (was_active) {
        log_.info(mode == ScanMode::Authorized ? "Authorized device scan stopped" : "Full device scan stopped");
        publish_status(mode, false);
    }
    return was_active;
}

void ScanController::stop_all() {
    stop(ScanMode::Authorized);
    stop(ScanMode::All);
}

void ScanController::run_consumer(ScanMode mode, std::shared_ptr<DiscoveryStream> stream) {
    Worker& w = worker(mode);
    const std::chrono::milliseconds poll(poll_ms_.load());
    while (w.active.load()) {
        std::optional<Sighting> s;
        try {
            s = stream->next(poll);
        } catch (const std::exception& e) {
            on_stream_failure(mode, e.what());
            break;
        }
        if (!s) continue;
        // A sighting handed out before cancellation is still applied in full.
        on_sighting(mode, *s);
    }
    {
        std::lock_guard<std::mutex> elk(w.exit_m);
        w.exited = true;
    }
    w.exit_cv.notify_all();
}

void ScanController::on_sighting(ScanMode mode, const Sighting& s) {
    if (s.address.empty()) return;
    std::optional<std::string> alias = whitelist_.name_of(s.address);
    if (mode == ScanMode::Authorized && !alias) return;

    bool is_new = false;
    const bool authorized_scope = mode == ScanMode::Authorized;
    Device d = registry_.upsert(s, [&](const Device& committed) {
        broadcaster_.publish(make_device_list_event(make_view(committed, alias), authorized_scope));
    }, &is_new);

    if (is_new) {
        std::string label = alias ? *alias : (d.name.empty() ? "Device " + d.address.substr(d.address.size() > 5 ? d.address.size() - 5 : 0) : d.name);
        std::string rssi = d.rssi ? std::to_string(*d.rssi) : "n/a";
        log_.info(std::string(alias ? "Authorized device found: " : "Device detected: ") + d.address +
                  " (" + label + ") - RSSI: " + rssi, d.address);
    }
}

void ScanController::on_stream_failure(ScanMode mode, const std::string& what) {
    Worker& w = worker(mode);
    // Only report if no stop() raced us to the flag.
    if (!w.active.exchange(false)) return;
    log_.error(std::string("Error during ") + to_string(mode) + " scan, scan stopped: " + what);
    publish_status(mode, false);
}

void ScanController::publish_status(ScanMode mode, bool scanning) {
    Event ev;
    ev.type = events::SCANNING_STATUS;
    ev.data = {
        {"mode", to_string(mode)},
        {"is_scanning", scanning},
        {"scan_state", to_string(state())}
    };
    broadcaster_.publish(ev);
}

} // namespace bluegate
