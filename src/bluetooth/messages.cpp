#include "podbridge/bluetooth/messages.hpp"

#include <utility>

namespace podbridge::bluetooth::messages {

namespace {

Json optional_int(const std::optional<int>& value) {
    return value ? Json(*value) : Json(nullptr);
}

}  // namespace

std::string serialize(const Json& message) {
    return message.dump(-1, ' ', false, Json::error_handler_t::replace);
}

Json device(const Device& device, bool is_online) {
    return Json{
        {"mac", device.mac},
        {"name", device.name},
        {"rssi", device.rssi},
        {"is_connected", device.is_connected},
        {"paired", device.paired},
        {"trusted", device.trusted},
        {"is_online", is_online},
        {"battery", optional_int(device.battery)},
    };
}

Json system_status(const SystemStatus& status) {
    return Json{
        {"type", "system-status"},
        {"bluetooth_connected", status.bluetooth_connected},
        {"bluetooth_powered", status.bluetooth_powered},
        {"devices_count", status.devices_count},
        {"connected_device", status.connected_device ? *status.connected_device : Json(nullptr)},
        {"is_scanning", status.is_scanning},
    };
}

Json devices_list(std::vector<Json> devices) {
    return Json{
        {"type", "devices-list"},
        {"devices", Json(std::move(devices))},
    };
}

Json device_event(std::string_view type, Json device) {
    return Json{
        {"type", std::string(type)},
        {"device", std::move(device)},
    };
}

Json device_removed(const std::string& mac) {
    return Json{
        {"type", "device-removed"},
        {"mac", mac},
    };
}

Json scan_started() {
    return Json{{"type", "scan-started"}};
}

Json scan_stopped() {
    return Json{{"type", "scan-stopped"}};
}

Json output(const std::string& data) {
    return Json{
        {"type", "output"},
        {"data", data},
    };
}

Json pong() {
    return Json{{"type", "pong"}};
}

Json power_changed(bool powered, bool is_scanning) {
    return Json{
        {"type", "bluetooth-power-changed"},
        {"powered", powered},
        {"is_scanning", is_scanning},
    };
}

Json battery_updated(const Device& device) {
    return Json{
        {"type", "device-battery-updated"},
        {"device",
         {
             {"mac", device.mac},
             {"name", device.name},
             {"battery", optional_int(device.battery)},
         }},
    };
}

Json auto_reconnect(std::string_view phase, const std::string& mac, const std::string& name,
                    std::optional<std::string> error) {
    Json message{
        {"type", std::string(phase)},
        {"device",
         {
             {"mac", mac},
             {"name", name},
         }},
    };
    if (error) {
        message["error"] = *error;
    }
    return message;
}

}  // namespace podbridge::bluetooth::messages
