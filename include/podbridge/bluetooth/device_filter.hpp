#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "podbridge/bluetooth/device.hpp"

namespace podbridge::bluetooth {

// Individual rejection predicates. Each takes an already trimmed name.
namespace filter_rules {

bool is_blank(std::string_view name);
bool is_rssi_fragment(std::string_view name);
bool is_low_energy_marker(std::string_view name);
bool is_beacon_or_mesh(std::string_view name);
bool is_mac_lookalike(std::string_view name);
bool is_advertisement_field(std::string_view name);

}  // namespace filter_rules

// Reads "RSSI: 0xffffffc4 (-60)" or "RSSI: -60" style fragments.
std::optional<int> extract_rssi(std::string_view text);

class DeviceFilter {
public:
    struct Rule {
        std::string name;
        std::function<bool(std::string_view)> rejects;
    };

    struct Classification {
        bool accepted{false};
        std::string name;
        int rssi{kDefaultRssi};
        // Set when the raw text carried a signal reading, accepted or not.
        std::optional<int> rssi_reading;
        // Name of the rule that rejected the announcement, empty on accept.
        std::string rule;
    };

    DeviceFilter();
    explicit DeviceFilter(const std::vector<std::string>& le_vendor_patterns);

    Classification classify(std::string_view raw_name) const;

    const std::vector<Rule>& rules() const { return rules_; }

    static std::vector<std::string> default_le_vendor_patterns();

private:
    std::vector<Rule> rules_;
};

}  // namespace podbridge::bluetooth
