#include "WhitelistStore.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace bluegate {

WhitelistStore::WhitelistStore(std::string path) : path_(std::move(path)) {}

std::optional<std::vector<WhitelistEntry>> WhitelistStore::load() const {
    std::ifstream f(path_);
    if (!f) return std::nullopt;

    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("whitelist file " + path_ + " is not valid JSON: " + e.what());
    }
    if (!j.is_object()) return std::nullopt;

    if (j.contains("valid_devices") && j["valid_devices"].is_array()) {
        std::vector<WhitelistEntry> out;
        for (const auto& item : j["valid_devices"]) {
            if (!item.is_object()) continue;
            auto e = item.get<WhitelistEntry>();
            if (!e.address.empty()) out.push_back(std::move(e));
        }
        return out;
    }
    if (j.contains("valid_mac_addresses") && j["valid_mac_addresses"].is_array()) {
        std::vector<WhitelistEntry> out;
        for (const auto& a : j["valid_mac_addresses"]) {
            if (a.is_string() && !a.get<std::string>().empty()) out.push_back({a.get<std::string>(), a.get<std::string>()});
        }
        return out;
    }
    return std::nullopt;
}

bool WhitelistStore::save(const std::vector<WhitelistEntry>& entries) {
    std::lock_guard<std::mutex> lk(io_m_);
    try {
        json doc = json::object();
        {
            std::ifstream in(path_);
            if (in) {
                try {
                    json existing = json::parse(in);
                    if (existing.is_object()) doc = std::move(existing);
                } catch (const json::parse_error& e) {
                    std::cerr << "WhitelistStore: replacing unreadable " << path_ << ": " << e.what() << std::endl;
                }
            }
        }
        doc["valid_devices"] = entries;
        doc.erase("valid_mac_addresses");

        std::filesystem::path target(path_);
        if (target.has_parent_path()) std::filesystem::create_directories(target.parent_path());
        std::filesystem::path tmp = target;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::out | std::ios::trunc);
            if (!out) {
                std::cerr << "WhitelistStore: cannot open " << tmp.string() << " for writing" << std::endl;
                return false;
            }
            out << doc.dump(2) << "\n";
            out.flush();
            if (!out) {
                std::cerr << "WhitelistStore: write to " << tmp.string() << " failed" << std::endl;
                return false;
            }
        }
        std::filesystem::rename(tmp, target);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "WhitelistStore: save failed: " << e.what() << std::endl;
        return false;
    }
}

} // namespace bluegate
