#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace bluegate::errors {

// Error kinds surfaced by the core. NotFound/Busy/Unauthorized are caller
// errors; CapabilityFailure/Timeout come from the radio.
enum class ErrorKind {
    NotFound,
    Busy,
    Unauthorized,
    CapabilityFailure,
    Timeout
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Busy: return "Busy";
        case ErrorKind::Unauthorized: return "Unauthorized";
        case ErrorKind::CapabilityFailure: return "CapabilityFailure";
        case ErrorKind::Timeout: return "Timeout";
    }
    return "Unknown";
}

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// 2100-2199: device / connection errors
inline constexpr int E2100_DEVICE_NOT_FOUND = 2100;
inline constexpr int E2110_BULK_BUSY = 2110;
inline constexpr int E2120_UNAUTHORIZED = 2120;
inline constexpr int E2130_RADIO_FAILURE = 2130;
inline constexpr int E2140_TIMEOUT = 2140;
// 2400-2499: WebSocket / control channel errors
inline constexpr int E2400_CONTROL_REJECTED = 2400;
inline constexpr int E2410_SESSION_DROPPED = 2410;

inline int code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return E2100_DEVICE_NOT_FOUND;
        case ErrorKind::Busy: return E2110_BULK_BUSY;
        case ErrorKind::Unauthorized: return E2120_UNAUTHORIZED;
        case ErrorKind::CapabilityFailure: return E2130_RADIO_FAILURE;
        case ErrorKind::Timeout: return E2140_TIMEOUT;
    }
    return E2400_CONTROL_REJECTED;
}

inline constexpr const char* MSG_E2400_CONTROL_REJECTED_PREFIX = "Error 2400: Control message rejected: ";
inline constexpr const char* MSG_E2410_SESSION_DROPPED = "Error 2410: WebSocket session dropped unexpectedly";

// Catalogued detail strings for device operations.
inline constexpr const char* D2100_NOT_DISCOVERED = "device has not been discovered";
inline constexpr const char* D2110_BULK_IN_FLIGHT = "a bulk connect/disconnect is already in progress";
inline constexpr const char* D2120_NOT_WHITELISTED = "device is not in the whitelist";
inline constexpr const char* D2130_SCAN_UNAVAILABLE = "radio discovery unavailable";
inline constexpr const char* D2140_CONNECT_TIMEOUT = "connect timed out";
inline constexpr const char* D2140_DISCONNECT_TIMEOUT = "disconnect timed out";

// Catalogued detail strings for E2400.
inline constexpr const char* D2400_INVALID_REQUEST = "invalid request";
inline constexpr const char* D2400_RPC_MISSING_ID = "rpc request missing id";
inline constexpr const char* D2400_RPC_MISSING_METHOD = "rpc request missing method";
inline constexpr const char* D2400_RPC_UNKNOWN_METHOD = "unknown rpc method";
inline constexpr const char* D2400_MISSING_ADDRESS = "missing params.address";
inline constexpr const char* D2400_INVALID_MODE = "params.mode must be authorized, all or both";
inline constexpr const char* D2400_DEVICES_NOT_ARRAY = "params.devices must be array";
inline constexpr const char* D2400_EMPTY_ADDRESS = "address must not be empty";

inline std::string code_string(int code) {
    return std::to_string(code);
}

inline std::string format_E2400_control_rejected(std::string_view detail) {
    std::string out;
    out.reserve(std::char_traits<char>::length(MSG_E2400_CONTROL_REJECTED_PREFIX) + detail.size());
    out.append(MSG_E2400_CONTROL_REJECTED_PREFIX);
    if (detail.empty()) {
        out.append(D2400_INVALID_REQUEST);
    } else {
        out.append(detail.data(), detail.size());
    }
    return out;
}

inline std::string format_device_error(ErrorKind kind, std::string_view address, std::string_view detail) {
    std::string out = "Error " + code_string(code_for(kind)) + ": ";
    out.append(address.data(), address.size());
    out.append(": ");
    out.append(detail.data(), detail.size());
    return out;
}

} // namespace bluegate::errors
