#include "Whitelist.hpp"
#include "core/ErrorCatalog.hpp"
#include <algorithm>
#include <stdexcept>

namespace bluegate {

Whitelist::Whitelist(std::vector<WhitelistEntry> initial) {
    for (const auto& e : initial) {
        if (e.address.empty()) continue;
        insert_or_rename(entries_, e);
    }
}

void Whitelist::set_on_change(ChangeHook hook) {
    std::lock_guard<std::mutex> wl(write_m_);
    on_change_ = std::move(hook);
}

void Whitelist::insert_or_rename(std::vector<WhitelistEntry>& v, const WhitelistEntry& e) {
    auto it = std::find_if(v.begin(), v.end(), [&](const WhitelistEntry& x) { return x.address == e.address; });
    if (it == v.end()) {
        v.push_back(e);
    } else {
        it->name = e.name;
    }
}

void Whitelist::notify(const std::vector<WhitelistEntry>& snapshot) {
    if (on_change_) on_change_(snapshot);
}

bool Whitelist::contains(const std::string& address) const {
    std::lock_guard<std::mutex> lk(m_);
    return std::any_of(entries_.begin(), entries_.end(), [&](const WhitelistEntry& e) { return e.address == address; });
}

std::optional<std::string> Whitelist::name_of(const std::string& address) const {
    std::lock_guard<std::mutex> lk(m_);
    for (const auto& e : entries_) {
        if (e.address == address) return e.name;
    }
    return std::nullopt;
}

bool Whitelist::add(const std::string& address, const std::string& name) {
    if (address.empty()) throw std::invalid_argument(errors::D2400_EMPTY_ADDRESS);
    const std::string label = name.empty() ? address : name;

    std::lock_guard<std::mutex> wl(write_m_);
    std::vector<WhitelistEntry> snapshot;
    bool inserted = false;
    {
        std::lock_guard<std::mutex> lk(m_);
        auto it = std::find_if(entries_.begin(), entries_.end(), [&](const WhitelistEntry& e) { return e.address == address; });
        if (it == entries_.end()) {
            entries_.push_back({address, label});
            inserted = true;
        } else if (it->name == label) {
            return false;
        } else {
            it->name = label;
        }
        snapshot = entries_;
    }
    notify(snapshot);
    return inserted;
}

bool Whitelist::remove(const std::string& address) {
    std::lock_guard<std::mutex> wl(write_m_);
    std::vector<WhitelistEntry> snapshot;
    {
        std::lock_guard<std::mutex> lk(m_);
        auto it = std::find_if(entries_.begin(), entries_.end(), [&](const WhitelistEntry& e) { return e.address == address; });
        if (it == entries_.end()) return false;
        entries_.erase(it);
        snapshot = entries_;
    }
    notify(snapshot);
    return true;
}

void Whitelist::replace(const std::vector<WhitelistEntry>& entries) {
    std::vector<WhitelistEntry> next;
    for (const auto& e : entries) {
        if (e.address.empty()) throw std::invalid_argument(errors::D2400_EMPTY_ADDRESS);
        insert_or_rename(next, { e.address, e.name.empty() ? e.address : e.name });
    }

    std::lock_guard<std::mutex> wl(write_m_);
    {
        std::lock_guard<std::mutex> lk(m_);
        entries_ = next;
    }
    notify(next);
}

std::vector<WhitelistEntry> Whitelist::all() const {
    std::lock_guard<std::mutex> lk(m_);
    return entries_;
}

size_t Whitelist::size() const {
    std::lock_guard<std::mutex> lk(m_);
    return entries_.size();
}

} // namespace bluegate
