#include "Backend.hpp"
#include "DeviceEvents.hpp"
#include "core/BuildInfo.hpp"
#include "core/ErrorCatalog.hpp"
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace bluegate {

using errors::ErrorKind;

namespace {

std::vector<WhitelistEntry> initial_whitelist(const WhitelistStore& store, const BackendConfig& cfg, bool& persisted) {
    persisted = false;
    try {
        auto loaded = store.load();
        if (loaded) {
            persisted = true;
            return *loaded;
        }
    } catch (const std::exception& e) {
        std::cerr << "Backend: failed to load whitelist from " << store.path() << ": " << e.what()
                  << " (using defaults)" << std::endl;
    }
    return cfg.default_whitelist;
}

} // namespace

Backend::Backend(const BackendConfig& cfg, IRadioAdapter& radio)
: config_(cfg),
  radio_(radio),
  store_(cfg.whitelist_path),
  log_(cfg.log_capacity),
  broadcaster_(cfg.observer_queue_capacity),
  scans_(radio, registry_, whitelist_, broadcaster_, log_, cfg.scan_grace),
  orchestrator_(radio, registry_, whitelist_, broadcaster_, log_,
                OrchestratorOptions{ cfg.connection_timeout, cfg.restrict_connect_to_whitelist }),
  started_at_(std::chrono::steady_clock::now())
{
    bool persisted = false;
    whitelist_.replace(initial_whitelist(store_, config_, persisted));

    log_.set_on_append([this](const LogEntry& entry) {
        Event ev;
        ev.type = events::LOG_UPDATE;
        ev.data = entry;
        ev.address = entry.device_address;
        broadcaster_.publish(ev);
    });

    whitelist_.set_on_change([this](const std::vector<WhitelistEntry>& entries) {
        if (!store_.save(entries)) {
            log_.error("Failed to persist whitelist to " + store_.path());
        }
        Event ev;
        ev.type = events::WHITELIST_UPDATE;
        ev.data = { {"whitelist", entries} };
        broadcaster_.publish(ev);
    });

    if (!persisted) {
        if (!store_.save(whitelist_.all())) {
            std::cerr << "Backend: could not write initial whitelist to " << store_.path() << std::endl;
        }
    }
}

Backend::~Backend() { stop(); }

bool Backend::start() {
    if (running_.exchange(true)) return false;
    started_at_ = std::chrono::steady_clock::now();
    log_.info("BlueGate backend started (radio: " + radio_.name() + ", " +
              std::to_string(whitelist_.size()) + " whitelisted device(s))");
    return true;
}

void Backend::stop() {
    bool was_running = running_.exchange(false);
    scans_.stop_all();

    std::vector<Probe> probes;
    {
        std::lock_guard<std::mutex> lk(probes_m_);
        probes.swap(probes_);
    }
    for (auto& p : probes) {
        if (p.thread.joinable()) p.thread.join();
    }
    if (was_running) std::cout << "Backend: stopped" << std::endl;
}

CommandResult Backend::start_scan(ScanMode mode) {
    const std::string label = mode == ScanMode::Authorized ? "Authorized device scan" : "Full device scan";
    try {
        if (!scans_.start(mode)) return CommandResult::ok(label + " already running");
    } catch (const errors::Error& e) {
        return CommandResult::fail(e.kind(), e.what());
    }
    return CommandResult::ok(label + " started");
}

CommandResult Backend::stop_scan(std::optional<ScanMode> mode) {
    if (!mode) {
        scans_.stop_all();
        return CommandResult::ok("All scans stopped");
    }
    const std::string label = *mode == ScanMode::Authorized ? "Authorized device scan" : "Full device scan";
    if (!scans_.stop(*mode)) return CommandResult::ok(label + " was not running");
    return CommandResult::ok(label + " stopped");
}

CommandResult Backend::connect_device(const std::string& address) {
    return orchestrator_.connect_one(address);
}

CommandResult Backend::disconnect_device(const std::string& address) {
    return orchestrator_.disconnect_one(address);
}

BulkResult Backend::connect_all() {
    return orchestrator_.connect_all();
}

BulkResult Backend::disconnect_all() {
    return orchestrator_.disconnect_all();
}

void Backend::publish_device_if_known(const std::string& address) {
    auto d = registry_.get(address);
    if (!d) return;
    auto alias = whitelist_.name_of(address);
    broadcaster_.publish(make_device_list_event(make_view(*d, alias), true));
}

CommandResult Backend::add_to_whitelist(const std::string& address, const std::string& name) {
    // No name given: keep what the device advertises, else its address.
    std::string label = name;
    if (label.empty()) {
        auto known = registry_.get(address);
        label = (known && !known->name.empty()) ? known->name : address;
    }
    bool inserted;
    try {
        inserted = whitelist_.add(address, label);
    } catch (const std::invalid_argument& e) {
        log_.warning(std::string("Rejected whitelist entry: ") + e.what());
        return CommandResult{ false, e.what(), std::nullopt };
    }
    log_.info(std::string(inserted ? "Added " : "Updated ") + label + " (" + address + ") in whitelist", address);
    publish_device_if_known(address);
    if (!registry_.contains(address)) launch_probe(address);
    return CommandResult::ok(std::string(inserted ? "Added " : "Updated ") + label + " in whitelist");
}

CommandResult Backend::remove_from_whitelist(const std::string& address) {
    if (!whitelist_.remove(address)) {
        std::string msg = errors::format_device_error(ErrorKind::NotFound, address, errors::D2120_NOT_WHITELISTED);
        log_.warning(msg, address);
        return CommandResult::fail(ErrorKind::NotFound, msg);
    }
    log_.info("Removed " + address + " from whitelist", address);
    publish_device_if_known(address);
    return CommandResult::ok("Removed " + address + " from whitelist");
}

CommandResult Backend::update_whitelist(const std::vector<WhitelistEntry>& entries) {
    try {
        whitelist_.replace(entries);
    } catch (const std::invalid_argument& e) {
        log_.warning(std::string("Rejected whitelist update: ") + e.what());
        return CommandResult{ false, e.what(), std::nullopt };
    }
    log_.info("Whitelist updated (" + std::to_string(whitelist_.size()) + " device(s))");
    for (const auto& e : whitelist_.all()) {
        if (!registry_.contains(e.address)) launch_probe(e.address);
    }
    return CommandResult::ok("Whitelist updated");
}

void Backend::reap_probes() {
    auto it = probes_.begin();
    while (it != probes_.end()) {
        if (it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = probes_.erase(it);
        } else {
            ++it;
        }
    }
}

void Backend::launch_probe(const std::string& address) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lk(probes_m_);
    reap_probes();
    probes_.push_back(Probe{ std::thread([this, address, done]() {
        try {
            auto found = radio_.probe(address, config_.probe_timeout);
            if (found) {
                auto alias = whitelist_.name_of(address);
                registry_.upsert(*found, [&](const Device& d) {
                    broadcaster_.publish(make_device_list_event(make_view(d, alias), true));
                });
                log_.info("Whitelisted device found: " + address, address);
            } else {
                log_.info("Whitelisted device " + address + " not in range", address);
            }
        } catch (const std::exception& e) {
            log_.error("Probe for " + address + " failed: " + e.what(), address);
        }
        done->store(true);
    }), done });
}

CommandResult Backend::clear_logs() {
    log_.clear();
    // Observers replace their log view on this entry.
    log_.info("Logs cleared");
    return CommandResult::ok("Logs cleared");
}

nlohmann::json Backend::device_lists() const {
    std::unordered_map<std::string, std::string> aliases;
    for (const auto& e : whitelist_.all()) aliases.emplace(e.address, e.name);

    nlohmann::json authorized = nlohmann::json::array();
    nlohmann::json all = nlohmann::json::array();
    for (const auto& d : registry_.list()) {
        auto it = aliases.find(d.address);
        std::optional<std::string> alias;
        if (it != aliases.end()) alias = it->second;
        DeviceView view = make_view(d, alias);
        if (view.is_authorized) authorized.push_back(view);
        all.push_back(view);
    }
    return { {"authorized", authorized}, {"all", all} };
}

std::string Backend::uptime() const {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_at_).count();
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%lld:%02lld:%02lld",
                  (long long)(secs / 3600), (long long)((secs / 60) % 60), (long long)(secs % 60));
    return buf;
}

nlohmann::json Backend::stats() const {
    auto whitelist = whitelist_.all();
    auto devices = registry_.list();
    size_t detected = 0, connected = 0, all_connected = 0;
    for (const auto& d : devices) {
        bool authorized = std::any_of(whitelist.begin(), whitelist.end(),
                                      [&](const WhitelistEntry& e) { return e.address == d.address; });
        if (authorized) ++detected;
        if (d.connected) {
            ++all_connected;
            if (authorized) ++connected;
        }
    }
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_at_).count();
    return {
        {"valid_addresses_count", whitelist.size()},
        {"detected_devices", detected},
        {"all_devices_count", devices.size()},
        {"connected_devices", connected},
        {"all_connected_devices", all_connected},
        {"uptime", uptime()},
        {"uptime_s", secs},
        {"dropped_events", broadcaster_.total_dropped()}
    };
}

nlohmann::json Backend::get_status() const {
    return {
        {"scan_state", to_string(scans_.state())},
        {"is_scanning", scans_.is_active(ScanMode::Authorized)},
        {"is_scanning_all", scans_.is_active(ScanMode::All)},
        {"connection_state", to_string(orchestrator_.connection_state())},
        {"is_connecting", orchestrator_.connection_state() == ConnectionState::ConnectingBulk},
        {"devices", device_lists()},
        {"whitelist", whitelist_.all()},
        {"stats", stats()},
        {"recent_logs", log_.tail(config_.status_log_count)},
        {"build", BuildInfo::current()}
    };
}

std::shared_ptr<Subscription> Backend::subscribe() {
    // Subscribe first so nothing committed after the snapshot is missed.
    auto sub = broadcaster_.subscribe();
    Event ev;
    ev.type = events::INITIAL_DATA;
    ev.data = {
        {"scan_state", to_string(scans_.state())},
        {"is_scanning", scans_.is_active(ScanMode::Authorized)},
        {"is_scanning_all", scans_.is_active(ScanMode::All)},
        {"connection_state", to_string(orchestrator_.connection_state())},
        {"devices", device_lists()},
        {"whitelist", whitelist_.all()},
        {"stats", stats()},
        {"logs", log_.tail(config_.initial_log_count)}
    };
    sub->push_front(std::move(ev));
    return sub;
}

void Backend::unsubscribe(const std::shared_ptr<Subscription>& sub) {
    broadcaster_.unsubscribe(sub);
}

} // namespace bluegate
