#include "DeviceRegistry.hpp"
#include "core/ErrorCatalog.hpp"
#include <algorithm>

namespace bluegate {

DeviceRegistry::DeviceRegistry() {}

Device& DeviceRegistry::require(const std::string& address) {
    auto it = devices.find(address);
    if (it == devices.end()) {
        throw errors::Error(errors::ErrorKind::NotFound,
                            errors::format_device_error(errors::ErrorKind::NotFound, address,
                                                        errors::D2100_NOT_DISCOVERED));
    }
    return it->second;
}

Device DeviceRegistry::upsert(const Sighting& s, const CommitHook& on_commit, bool* created) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    auto it = devices.find(s.address);
    if (created) *created = it == devices.end();
    if (it == devices.end()) {
        Device d;
        d.address = s.address;
        d.first_seen = s.seen_at;
        it = devices.emplace(s.address, std::move(d)).first;
        order.push_back(s.address);
    }
    Device& d = it->second;
    if (!s.name.empty()) d.name = s.name;
    if (s.rssi) d.rssi = s.rssi;
    d.last_seen = std::max(d.last_seen, s.seen_at);
    if (on_commit) on_commit(d);
    return d;
}

std::optional<Device> DeviceRegistry::get(const std::string& address) const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    auto it = devices.find(address);
    if (it == devices.end()) return std::nullopt;
    return it->second;
}

bool DeviceRegistry::contains(const std::string& address) const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return devices.count(address) > 0;
}

std::vector<Device> DeviceRegistry::list() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    std::vector<Device> out;
    out.reserve(order.size());
    for (const auto& addr : order) out.push_back(devices.at(addr));
    return out;
}

size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return devices.size();
}

size_t DeviceRegistry::connected_count() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return (size_t)std::count_if(devices.begin(), devices.end(),
                                 [](const auto& p) { return p.second.connected; });
}

Device DeviceRegistry::set_connected(const std::string& address, bool connected, const CommitHook& on_commit) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    Device& d = require(address);
    d.connected = connected;
    d.connection_attempts = 0;
    // Any attempt still waiting on the radio is superseded.
    d.generation += 1;
    d.last_seen = std::max(d.last_seen, Clock::now());
    if (on_commit) on_commit(d);
    return d;
}

uint64_t DeviceRegistry::begin_attempt(const std::string& address, bool counts_as_connect) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    Device& d = require(address);
    d.generation += 1;
    if (counts_as_connect) d.connection_attempts += 1;
    return d.generation;
}

std::optional<Device> DeviceRegistry::apply_result(const std::string& address, uint64_t generation, bool connected,
                                                   const CommitHook& on_commit) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    Device& d = require(address);
    if (d.generation != generation) return std::nullopt;
    d.connected = connected;
    d.connection_attempts = 0;
    d.last_seen = std::max(d.last_seen, Clock::now());
    if (on_commit) on_commit(d);
    return d;
}

void DeviceRegistry::invalidate(const std::string& address, uint64_t generation) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    auto it = devices.find(address);
    if (it == devices.end()) return;
    if (it->second.generation == generation) it->second.generation += 1;
}

} // namespace bluegate
