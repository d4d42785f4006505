#include "ControlProtocol.hpp"
#include "Backend.hpp"
#include "core/ErrorCatalog.hpp"
#include <iostream>
#include <stdexcept>

namespace bluegate {

namespace {

std::string require_address(const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("address") || !params["address"].is_string()) {
        throw std::invalid_argument(errors::D2400_MISSING_ADDRESS);
    }
    std::string address = params["address"].get<std::string>();
    if (address.empty()) throw std::invalid_argument(errors::D2400_EMPTY_ADDRESS);
    return address;
}

} // namespace

ControlProtocol::ControlProtocol(Backend& b)
: backend(b) {}

const std::vector<std::string>& ControlProtocol::methods() {
    static const std::vector<std::string> names = {
        "start_scan", "stop_scan", "connect_device", "disconnect_device",
        "connect_all", "disconnect_all", "add_to_whitelist", "remove_from_whitelist",
        "update_whitelist", "get_status", "clear_logs"
    };
    return names;
}

nlohmann::json ControlProtocol::build_event_message(const Event& ev) {
    return {
        {"type", "event"},
        {"event", ev.type},
        {"data", ev.data}
    };
}

nlohmann::json ControlProtocol::build_error_reply(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"type", "rpc_result"},
        {"id", id},
        {"ok", false},
        {"error", { {"code", code}, {"message", message} }}
    };
}

nlohmann::json ControlProtocol::handle_text(const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return build_error_reply(nullptr, errors::E2400_CONTROL_REJECTED,
                                 errors::format_E2400_control_rejected(errors::D2400_INVALID_REQUEST));
    }
    return handle(j);
}

nlohmann::json ControlProtocol::handle(const nlohmann::json& request) {
    if (!request.is_object() || request.value("type", std::string{}) != "rpc") {
        return build_error_reply(nullptr, errors::E2400_CONTROL_REJECTED,
                                 errors::format_E2400_control_rejected(errors::D2400_INVALID_REQUEST));
    }
    if (!request.contains("id")) {
        return build_error_reply(nullptr, errors::E2400_CONTROL_REJECTED,
                                 errors::format_E2400_control_rejected(errors::D2400_RPC_MISSING_ID));
    }
    const nlohmann::json id = request["id"];
    if (!request.contains("method") || !request["method"].is_string()) {
        return build_error_reply(id, errors::E2400_CONTROL_REJECTED,
                                 errors::format_E2400_control_rejected(errors::D2400_RPC_MISSING_METHOD));
    }
    const std::string method = request["method"].get<std::string>();
    const nlohmann::json params = request.contains("params") ? request["params"] : nlohmann::json::object();

    try {
        nlohmann::json result = dispatch(method, params);
        return {
            {"type", "rpc_result"},
            {"id", id},
            {"ok", true},
            {"result", result}
        };
    } catch (const std::invalid_argument& e) {
        return build_error_reply(id, errors::E2400_CONTROL_REJECTED,
                                 errors::format_E2400_control_rejected(e.what()));
    } catch (const nlohmann::json::exception& e) {
        return build_error_reply(id, errors::E2400_CONTROL_REJECTED,
                                 errors::format_E2400_control_rejected(e.what()));
    } catch (const std::exception& e) {
        std::cerr << "ControlProtocol: " << method << " failed: " << e.what() << std::endl;
        return build_error_reply(id, errors::E2400_CONTROL_REJECTED,
                                 errors::format_E2400_control_rejected(e.what()));
    }
}

nlohmann::json ControlProtocol::dispatch(const std::string& method, const nlohmann::json& params) {
    if (method == "start_scan") {
        std::string mode = params.value("mode", std::string("authorized"));
        auto m = parse_scan_mode(mode);
        if (!m) throw std::invalid_argument(errors::D2400_INVALID_MODE);
        return backend.start_scan(*m);
    }
    if (method == "stop_scan") {
        std::string mode = params.value("mode", std::string("both"));
        if (mode == "both") return backend.stop_scan(std::nullopt);
        auto m = parse_scan_mode(mode);
        if (!m) throw std::invalid_argument(errors::D2400_INVALID_MODE);
        return backend.stop_scan(*m);
    }
    if (method == "connect_device") return backend.connect_device(require_address(params));
    if (method == "disconnect_device") return backend.disconnect_device(require_address(params));
    if (method == "connect_all") return backend.connect_all();
    if (method == "disconnect_all") return backend.disconnect_all();
    if (method == "add_to_whitelist") {
        std::string address = require_address(params);
        return backend.add_to_whitelist(address, params.value("name", std::string{}));
    }
    if (method == "remove_from_whitelist") return backend.remove_from_whitelist(require_address(params));
    if (method == "update_whitelist") {
        if (!params.is_object() || !params.contains("devices") || !params["devices"].is_array()) {
            throw std::invalid_argument(errors::D2400_DEVICES_NOT_ARRAY);
        }
        auto entries = params["devices"].get<std::vector<WhitelistEntry>>();
        return backend.update_whitelist(entries);
    }
    if (method == "get_status") return backend.get_status();
    if (method == "clear_logs") return backend.clear_logs();
    throw std::invalid_argument(std::string(errors::D2400_RPC_UNKNOWN_METHOD) + ": " + method);
}

} // namespace bluegate
