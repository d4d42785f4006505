#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace bluegate {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline int64_t to_ms(TimePoint t) {
    return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

/**
 * @brief One observation of a peripheral during discovery.
 *
 * An empty name or a missing rssi means the radio had nothing to report for
 * that field; neither overwrites known values when merged into a Device.
 */
struct Sighting {
    std::string address;
    std::string name;
    std::optional<int> rssi;
    TimePoint seen_at = Clock::now();
};

/**
 * @brief Registry record for a peripheral seen at least once.
 *
 * Authorization is deliberately absent: it is derived from the Whitelist
 * whenever a view is built (see DeviceView).
 */
struct Device {
    std::string address;
    std::string name;
    std::optional<int> rssi;
    TimePoint first_seen{};
    TimePoint last_seen{};
    bool connected = false;
    int connection_attempts = 0;
    // Bumped at the start of every connect/disconnect attempt.
    uint64_t generation = 0;
};

/** @brief Device as shown to observers, with derived authorization. */
struct DeviceView {
    Device device;
    bool is_authorized = false;
    // Whitelist friendly name, when authorized.
    std::string alias;
};

inline void to_json(nlohmann::json& j, const DeviceView& v) {
    const Device& d = v.device;
    j = nlohmann::json{
        {"address", d.address},
        {"name", (!v.alias.empty() ? v.alias : d.name)},
        {"advertised_name", d.name},
        {"rssi", nullptr},
        {"first_seen_ms", to_ms(d.first_seen)},
        {"last_seen_ms", to_ms(d.last_seen)},
        {"connected", d.connected},
        {"connection_attempts", d.connection_attempts},
        {"is_authorized", v.is_authorized}
    };
    if (d.rssi) j["rssi"] = *d.rssi;
}

} // namespace bluegate
