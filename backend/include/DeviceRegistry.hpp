#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "Device.hpp"

namespace bluegate {

// Append-and-update history of every device ever seen. Records are never
// removed; readers always get copies.
class DeviceRegistry {
public:
    // Runs with the registry lock held, right after a mutation commits.
    using CommitHook = std::function<void(const Device&)>;

    DeviceRegistry();

    // Merge a sighting into the record for its address, creating it if needed.
    // *created is set under the same lock, so exactly one caller sees true.
    Device upsert(const Sighting& s, const CommitHook& on_commit = nullptr, bool* created = nullptr);

    std::optional<Device> get(const std::string& address) const;
    bool contains(const std::string& address) const;

    // Snapshot of all records in first-seen order.
    std::vector<Device> list() const;

    size_t size() const;
    size_t connected_count() const;

    // Throws errors::Error(NotFound) for unknown addresses.
    Device set_connected(const std::string& address, bool connected, const CommitHook& on_commit = nullptr);

    // Start a new connect/disconnect attempt; returns its generation.
    uint64_t begin_attempt(const std::string& address, bool counts_as_connect);

    // Apply an attempt's outcome if the attempt is still current.
    // Returns std::nullopt when the generation is stale.
    std::optional<Device> apply_result(const std::string& address, uint64_t generation, bool connected,
                                       const CommitHook& on_commit = nullptr);

    // Retire an attempt so that any later result for it is stale.
    void invalidate(const std::string& address, uint64_t generation);

private:
    Device& require(const std::string& address);

    std::unordered_map<std::string, Device> devices;
    std::vector<std::string> order;
    mutable std::mutex registry_mutex;
};

} // namespace bluegate
