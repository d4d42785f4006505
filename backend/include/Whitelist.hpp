#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace bluegate {

struct WhitelistEntry {
    std::string address;
    std::string name;
};

inline bool operator==(const WhitelistEntry& a, const WhitelistEntry& b) {
    return a.address == b.address && a.name == b.name;
}

inline void to_json(nlohmann::json& j, const WhitelistEntry& e) {
    j = nlohmann::json{ {"address", e.address}, {"name", e.name} };
}

inline void from_json(const nlohmann::json& j, WhitelistEntry& e) {
    e.address = j.value("address", "");
    e.name = j.value("name", e.address);
}

// Authorized addresses in insertion order. Small and rarely mutated, so a
// vector scan is fine.
class Whitelist {
public:
    // Called after every effective mutation, before the mutating call returns.
    using ChangeHook = std::function<void(const std::vector<WhitelistEntry>&)>;

    explicit Whitelist(std::vector<WhitelistEntry> initial = {});

    void set_on_change(ChangeHook hook);

    bool contains(const std::string& address) const;
    std::optional<std::string> name_of(const std::string& address) const;

    // Adds a new entry or renames an existing one in place.
    // Returns true when the address was not present before.
    bool add(const std::string& address, const std::string& name);
    bool remove(const std::string& address);
    void replace(const std::vector<WhitelistEntry>& entries);

    std::vector<WhitelistEntry> all() const;
    size_t size() const;

private:
    static void insert_or_rename(std::vector<WhitelistEntry>& v, const WhitelistEntry& e);
    void notify(const std::vector<WhitelistEntry>& snapshot);

    std::vector<WhitelistEntry> entries_;
    ChangeHook on_change_;
    mutable std::mutex m_;
    // Serializes mutations with their hook call so the persisted order matches.
    std::mutex write_m_;
};

} // namespace bluegate
