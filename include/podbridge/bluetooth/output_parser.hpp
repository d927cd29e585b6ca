#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace podbridge::bluetooth {

struct DeviceAnnouncement {
    std::string mac;
    std::string raw_name;
};

struct ConnectionChange {
    std::string mac;
    bool connected{false};
};

struct DeviceLost {
    std::string mac;
};

struct ConnectionFailure {};

using OutputEvent = std::variant<DeviceAnnouncement, ConnectionChange, DeviceLost, ConnectionFailure>;

// Reassembles lines from arbitrary output chunks of the control tool and
// turns the recognizable ones into events. Unrecognized lines are dropped.
class OutputParser {
public:
    static constexpr std::size_t kMaxPendingBytes = 64 * 1024;

    std::vector<OutputEvent> feed(std::string_view chunk);
    // Parses whatever partial line is still buffered.
    std::vector<OutputEvent> flush();
    void reset();

    const std::string& pending() const { return pending_; }

    static std::string strip_ansi(std::string_view text);
    static std::optional<OutputEvent> parse_line(std::string_view line);

private:
    std::string pending_;
};

// Fields of an `info <mac>` block. Absent fields stay unset.
struct DeviceInfo {
    std::optional<bool> connected;
    std::optional<bool> paired;
    std::optional<bool> trusted;
    std::optional<int> rssi;
    std::optional<int> battery;
};

DeviceInfo parse_device_info(std::string_view output);
// "Powered: yes|no" from `show`.
std::optional<bool> parse_powered(std::string_view output);
// "Battery Percentage: 0x5a (90)"; values outside 0..100 are ignored.
std::optional<int> parse_battery(std::string_view output);

// Length of `bytes` without a trailing multi-byte UTF-8 sequence that is
// cut short. Malformed bytes are not held back.
std::size_t complete_utf8_prefix(std::string_view bytes);

}  // namespace podbridge::bluetooth
