/*
src/core/LogBuffer.cpp
Bounded operational log shown to observers. Every entry is also echoed to
the process log so headless runs keep a record.
*/
#include "core/LogBuffer.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace bluegate {

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

static std::string clock_string(TimePoint t) {
    std::time_t tt = Clock::to_time_t(t);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::ostringstream out;
    out << std::setfill('0') << std::setw(2) << tm.tm_hour << ":" << std::setw(2) << tm.tm_min << ":" << std::setw(2) << tm.tm_sec;
    return out.str();
}

void to_json(nlohmann::json& j, const LogEntry& e) {
    j = nlohmann::json{
        {"timestamp", clock_string(e.timestamp)},
        {"ts_ms", to_ms(e.timestamp)},
        {"level", to_string(e.level)},
        {"message", e.message},
        {"device_address", nullptr}
    };
    if (e.device_address) j["device_address"] = *e.device_address;
}

LogBuffer::LogBuffer(size_t capacity) : capacity_(std::max<size_t>(1, capacity)) {}

void LogBuffer::set_on_append(AppendHook hook) {
    std::lock_guard<std::mutex> lock(mu_);
    on_append_ = std::move(hook);
}

void LogBuffer::set_mirror(bool enabled) {
    std::lock_guard<std::mutex> lock(mu_);
    mirror_ = enabled;
}

void LogBuffer::append(LogLevel level, const std::string& message, const std::optional<std::string>& device_address) {
    LogEntry e;
    e.timestamp = Clock::now();
    e.level = level;
    e.message = message;
    e.device_address = device_address;

    std::lock_guard<std::mutex> lock(mu_);
    entries_.push_back(e);
    while (entries_.size() > capacity_) entries_.pop_front();

    if (mirror_) {
        auto& os = (level == LogLevel::Warning || level == LogLevel::Error) ? std::cerr : std::cout;
        os << clock_string(e.timestamp) << " - " << to_string(level) << " - " << message;
        if (device_address) os << " [" << *device_address << "]";
        os << std::endl;
    }
    // Under the lock so observers see log_update in append order.
    if (on_append_) on_append_(e);
}

void LogBuffer::info(const std::string& message, const std::optional<std::string>& device_address) {
    append(LogLevel::Info, message, device_address);
}

void LogBuffer::warning(const std::string& message, const std::optional<std::string>& device_address) {
    append(LogLevel::Warning, message, device_address);
}

void LogBuffer::error(const std::string& message, const std::optional<std::string>& device_address) {
    append(LogLevel::Error, message, device_address);
}

void LogBuffer::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    entries_.clear();
}

std::vector<LogEntry> LogBuffer::list() const {
    std::lock_guard<std::mutex> lock(mu_);
    return std::vector<LogEntry>(entries_.begin(), entries_.end());
}

std::vector<LogEntry> LogBuffer::tail(size_t max) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto begin = (entries_.size() > max) ? entries_.end() - (std::ptrdiff_t)max : entries_.begin();
    return std::vector<LogEntry>(begin, entries_.end());
}

size_t LogBuffer::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
}

} // namespace bluegate
