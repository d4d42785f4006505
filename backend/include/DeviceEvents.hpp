#pragma once
#include <string>
#include "Device.hpp"
#include "core/EventBroadcaster.hpp"

namespace bluegate {

// Per-device list delta. scope is "authorized" or "all".
inline Event make_device_list_event(const DeviceView& view, bool authorized_scope) {
    Event ev;
    ev.type = authorized_scope ? events::DEVICES_UPDATE : events::ALL_DEVICES_UPDATE;
    ev.data = { {"scope", authorized_scope ? "authorized" : "all"}, {"device", view} };
    ev.address = view.device.address;
    return ev;
}

inline Event make_link_event(const DeviceView& view) {
    Event ev;
    ev.type = view.device.connected ? events::DEVICE_CONNECTED : events::DEVICE_DISCONNECTED;
    ev.data = {
        {"device_address", view.device.address},
        {"device_name", !view.alias.empty() ? view.alias : view.device.name},
        {"device", view}
    };
    ev.address = view.device.address;
    return ev;
}

inline DeviceView make_view(const Device& d, const std::optional<std::string>& alias) {
    DeviceView v;
    v.device = d;
    v.is_authorized = alias.has_value();
    if (alias) v.alias = *alias;
    return v;
}

} // namespace bluegate
