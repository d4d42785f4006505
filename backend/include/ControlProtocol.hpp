#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "core/EventBroadcaster.hpp"

namespace bluegate {

class Backend;

// JSON framing of the control channel.
//   request: {"type":"rpc","id":ID,"method":M,"params":{...}}
//   reply:   {"type":"rpc_result","id":ID,"ok":true,"result":{...}}
//            {"type":"rpc_result","id":ID,"ok":false,"error":{"code":N,"message":S}}
//   push:    {"type":"event","event":NAME,"data":{...}}
class ControlProtocol {
public:
    explicit ControlProtocol(Backend& backend);

    // Never throws; malformed requests become ok=false replies.
    nlohmann::json handle(const nlohmann::json& request);
    // Parses text first; unparseable text becomes an ok=false reply.
    nlohmann::json handle_text(const std::string& text);

    static nlohmann::json build_event_message(const Event& ev);
    static nlohmann::json build_error_reply(const nlohmann::json& id, int code, const std::string& message);

    static const std::vector<std::string>& methods();

private:
    nlohmann::json dispatch(const std::string& method, const nlohmann::json& params);

    Backend& backend;
};

} // namespace bluegate
