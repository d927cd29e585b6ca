#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "podbridge/bluetooth/device.hpp"

namespace podbridge::bluetooth::messages {

using Json = nlohmann::json;

// Wire form of an outbound message. Invalid UTF-8 from the control tool is
// replaced with U+FFFD instead of failing.
std::string serialize(const Json& message);

Json device(const Device& device, bool is_online);

struct SystemStatus {
    bool bluetooth_connected{false};
    bool bluetooth_powered{true};
    std::size_t devices_count{0};
    std::optional<Json> connected_device;
    bool is_scanning{false};
};

Json system_status(const SystemStatus& status);
Json devices_list(std::vector<Json> devices);

// device-found, device-connected, device-disconnected, device-updated
Json device_event(std::string_view type, Json device);
Json device_removed(const std::string& mac);
Json scan_started();
Json scan_stopped();
Json output(const std::string& data);
Json pong();
Json power_changed(bool powered, bool is_scanning);
Json battery_updated(const Device& device);

// auto-reconnect-started, auto-reconnect-success, auto-reconnect-failed
Json auto_reconnect(std::string_view phase, const std::string& mac, const std::string& name,
                    std::optional<std::string> error = std::nullopt);

}  // namespace podbridge::bluetooth::messages
