#include "podbridge/bluetooth/device_filter.hpp"

#include <cctype>
#include <regex>
#include <stdexcept>
#include <utility>

namespace podbridge::bluetooth {

namespace {

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

bool search(std::string_view text, const std::regex& pattern) {
    return std::regex_search(text.begin(), text.end(), pattern);
}

}  // namespace

namespace filter_rules {

bool is_blank(std::string_view name) {
    return trim(name).empty();
}

bool is_rssi_fragment(std::string_view name) {
    static const std::regex kPattern(R"(^RSSI:)", kIcase);
    return search(name, kPattern);
}

bool is_low_energy_marker(std::string_view name) {
    static const std::regex kPattern(R"(\bB?LE\b)", kIcase);
    return name.substr(0, 3) == "LE_" || search(name, kPattern);
}

bool is_beacon_or_mesh(std::string_view name) {
    static const std::regex kPattern(R"(\b(Beacon|Mesh)\b)", kIcase);
    return search(name, kPattern);
}

bool is_mac_lookalike(std::string_view name) {
    static const std::regex kPattern(R"(^[0-9A-Fa-f]{2}([-:_])(?:[0-9A-Fa-f]{2}\1){4}[0-9A-Fa-f]{2}$)");
    return search(name, kPattern);
}

bool is_advertisement_field(std::string_view name) {
    static const std::regex kPattern(R"(^(ManufacturerData\.(Key|Value)|TxPower):)", kIcase);
    return search(name, kPattern);
}

}  // namespace filter_rules

std::optional<int> extract_rssi(std::string_view text) {
    static const std::regex kHexWithDecimal(R"(RSSI:\s*0x[0-9a-fA-F]+\s*\((-?\d+)\))", kIcase);
    static const std::regex kPlain(R"(RSSI:\s*(-?\d+))", kIcase);

    std::match_results<std::string_view::const_iterator> match;
    if (std::regex_search(text.begin(), text.end(), match, kHexWithDecimal) ||
        std::regex_search(text.begin(), text.end(), match, kPlain)) {
        try {
            return std::stoi(match[1].str());
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::vector<std::string> DeviceFilter::default_le_vendor_patterns() {
    return {
        R"(^Mi\s?(Band|Scale|Fit))",
        R"(^Fitbit)",
        R"(^Tile\b)",
        R"(^AirTag)",
        R"(^Galaxy\s?Fit)",
        R"(^Amazfit)",
        R"(^WHOOP)",
        R"(^Oura)",
    };
}

DeviceFilter::DeviceFilter() : DeviceFilter(default_le_vendor_patterns()) {}

DeviceFilter::DeviceFilter(const std::vector<std::string>& le_vendor_patterns) {
    std::vector<std::regex> vendor_patterns;
    vendor_patterns.reserve(le_vendor_patterns.size());
    for (const auto& pattern : le_vendor_patterns) {
        try {
            vendor_patterns.emplace_back(pattern, kIcase);
        } catch (const std::regex_error& ex) {
            throw std::runtime_error("Invalid low-energy vendor pattern '" + pattern + "': " + ex.what());
        }
    }

    rules_ = {
        {"blank-name", filter_rules::is_blank},
        {"rssi-fragment", filter_rules::is_rssi_fragment},
        {"low-energy-marker", filter_rules::is_low_energy_marker},
        {"beacon-or-mesh", filter_rules::is_beacon_or_mesh},
        {"low-energy-vendor",
         [patterns = std::move(vendor_patterns)](std::string_view name) {
             for (const auto& pattern : patterns) {
                 if (search(name, pattern)) {
                     return true;
                 }
             }
             return false;
         }},
        {"mac-lookalike", filter_rules::is_mac_lookalike},
        {"advertisement-field", filter_rules::is_advertisement_field},
    };
}

DeviceFilter::Classification DeviceFilter::classify(std::string_view raw_name) const {
    Classification result;
    const auto name = trim(raw_name);
    result.name = std::string(name);
    result.rssi_reading = extract_rssi(name);

    for (const auto& rule : rules_) {
        if (rule.rejects(name)) {
            result.rule = rule.name;
            return result;
        }
    }

    result.accepted = true;
    result.rssi = result.rssi_reading.value_or(kDefaultRssi);
    return result;
}

}  // namespace podbridge::bluetooth
