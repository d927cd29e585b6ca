#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace podbridge::bluetooth {

constexpr int kDefaultRssi = -70;

struct Device {
    std::string mac;
    std::string name;
    int rssi{kDefaultRssi};
    bool paired{false};
    bool trusted{false};
    bool is_connected{false};
    std::optional<int> battery;
    // Zero means never seen.
    std::chrono::system_clock::time_point last_seen{};
};

// Derived, never stored.
bool is_online(const Device& device, std::chrono::system_clock::time_point now,
               std::chrono::milliseconds offline_threshold);

// Canonical form is six uppercase hex pairs separated by ':'. Accepts '-' as
// separator on input; anything else yields nullopt.
std::optional<std::string> normalize_mac(std::string_view text);

}  // namespace podbridge::bluetooth
