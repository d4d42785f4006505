#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/ErrorCatalog.hpp"

namespace bluegate {

struct CommandResult {
    bool success = false;
    std::string message;
    std::optional<errors::ErrorKind> error;

    static CommandResult ok(std::string message) {
        return { true, std::move(message), std::nullopt };
    }
    static CommandResult fail(errors::ErrorKind kind, std::string message) {
        return { false, std::move(message), kind };
    }
};

struct DeviceOutcome {
    std::string address;
    bool success = false;
    std::string message;
    std::optional<errors::ErrorKind> error;
};

struct BulkResult {
    bool success = false;
    std::string message;
    std::optional<errors::ErrorKind> error;
    std::vector<DeviceOutcome> results;
};

inline void to_json(nlohmann::json& j, const CommandResult& r) {
    j = nlohmann::json{ {"success", r.success}, {"message", r.message} };
    if (r.error) j["error"] = errors::to_string(*r.error);
}

inline void to_json(nlohmann::json& j, const DeviceOutcome& o) {
    j = nlohmann::json{ {"address", o.address}, {"success", o.success} };
    if (!o.message.empty()) j["message"] = o.message;
    if (o.error) j["error"] = errors::to_string(*o.error);
}

inline void to_json(nlohmann::json& j, const BulkResult& r) {
    j = nlohmann::json{ {"success", r.success}, {"message", r.message}, {"results", r.results} };
    if (r.error) j["error"] = errors::to_string(*r.error);
}

} // namespace bluegate
