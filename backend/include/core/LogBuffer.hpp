#pragma once
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Device.hpp"

namespace bluegate {

enum class LogLevel { Debug, Info, Warning, Error };

const char* to_string(LogLevel level);

struct LogEntry {
    TimePoint timestamp;
    LogLevel level = LogLevel::Info;
    std::string message;
    std::optional<std::string> device_address;
};

void to_json(nlohmann::json& j, const LogEntry& e);

// Fixed-capacity operational log. Appending past capacity evicts the oldest
// entry.
class LogBuffer {
public:
    // Invoked for every appended entry, in append order.
    using AppendHook = std::function<void(const LogEntry&)>;

    explicit LogBuffer(size_t capacity = 200);

    void set_on_append(AppendHook hook);
    // Echo entries to stdout/stderr (on by default).
    void set_mirror(bool enabled);

    void append(LogLevel level, const std::string& message,
                const std::optional<std::string>& device_address = std::nullopt);
    void info(const std::string& message, const std::optional<std::string>& device_address = std::nullopt);
    void warning(const std::string& message, const std::optional<std::string>& device_address = std::nullopt);
    void error(const std::string& message, const std::optional<std::string>& device_address = std::nullopt);

    void clear();

    // Oldest first.
    std::vector<LogEntry> list() const;
    std::vector<LogEntry> tail(size_t max) const;

    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mu_;
    std::deque<LogEntry> entries_;
    AppendHook on_append_;
    bool mirror_ = true;
};

} // namespace bluegate
