#include "podbridge/bluetooth/device_filter.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using podbridge::bluetooth::DeviceFilter;
using podbridge::bluetooth::extract_rssi;
namespace rules = podbridge::bluetooth::filter_rules;

TEST_CASE("Filter rejects low-energy and noise names with the matching rule", "[filter]") {
    const DeviceFilter filter;

    struct Case {
        std::string raw;
        std::string rule;
    };
    const std::vector<Case> cases = {
        {"", "blank-name"},
        {"   ", "blank-name"},
        {"RSSI: 0xffffffc4 (-60)", "rssi-fragment"},
        {"rssi: -72", "rssi-fragment"},
        {"LE_Band", "low-energy-marker"},
        {"Headset LE", "low-energy-marker"},
        {"My BLE Tag", "low-energy-marker"},
        {"Kitchen Beacon", "beacon-or-mesh"},
        {"mesh node 4", "beacon-or-mesh"},
        {"Mi Band 5", "low-energy-vendor"},
        {"MiScale", "low-energy-vendor"},
        {"Fitbit Charge", "low-energy-vendor"},
        {"Tile", "low-energy-vendor"},
        {"oura ring", "low-energy-vendor"},
        {"AA-BB-CC-DD-EE-FF", "mac-lookalike"},
        {"aa:bb:cc:dd:ee:ff", "mac-lookalike"},
        {"ManufacturerData.Key: 0x004c", "advertisement-field"},
        {"TxPower: 4", "advertisement-field"},
    };

    for (const auto& c : cases) {
        const auto result = filter.classify(c.raw);
        INFO("name: '" << c.raw << "'");
        CHECK_FALSE(result.accepted);
        CHECK(result.rule == c.rule);
    }
}

TEST_CASE("Filter accepts ordinary speaker names", "[filter]") {
    const DeviceFilter filter;

    const auto result = filter.classify("  JBL Flip 6 ");
    REQUIRE(result.accepted);
    CHECK(result.name == "JBL Flip 6");
    CHECK(result.rssi == -70);
    CHECK(result.rule.empty());

    CHECK(filter.classify("Sony WH-1000XM4 (Living Room)").accepted);
    CHECK(filter.classify("Bose: SoundLink").accepted);
    CHECK(filter.classify("Tiles Speaker").accepted);
    CHECK(filter.classify("ALEXA Echo").accepted);
}

TEST_CASE("Filter rule order decides which rule reports", "[filter]") {
    const DeviceFilter filter;
    // Both an RSSI fragment and a beacon; the earlier rule wins.
    CHECK(filter.classify("RSSI: -50 Beacon").rule == "rssi-fragment");
    CHECK(filter.rules().size() == 7);
    CHECK(filter.rules().front().name == "blank-name");
    CHECK(filter.rules().back().name == "advertisement-field");
}

TEST_CASE("Filter extracts RSSI readings before rejecting", "[filter]") {
    const DeviceFilter filter;

    const auto hex = filter.classify("RSSI: 0xffffffc4 (-60)");
    CHECK_FALSE(hex.accepted);
    REQUIRE(hex.rssi_reading.has_value());
    CHECK(*hex.rssi_reading == -60);

    CHECK(extract_rssi("RSSI: -81") == -81);
    CHECK(extract_rssi("RSSI: 0x0000004 (4)") == 4);
    CHECK_FALSE(extract_rssi("Speaker").has_value());
}

TEST_CASE("Filter uses configured vendor patterns", "[filter]") {
    const DeviceFilter filter({"^Acme"});

    CHECK(filter.classify("ACME Tracker").rule == "low-energy-vendor");
    CHECK(filter.classify("Mi Band 5").accepted);

    REQUIRE_THROWS_AS(DeviceFilter({"(unclosed"}), std::runtime_error);
}

TEST_CASE("Filter predicates are usable on their own", "[filter]") {
    CHECK(rules::is_mac_lookalike("00_11_22_33_44_55"));
    CHECK_FALSE(rules::is_mac_lookalike("00:11-22:33:44:55"));
    CHECK(rules::is_low_energy_marker("LE_anything"));
    CHECK_FALSE(rules::is_low_energy_marker("Alex's Speaker"));
    CHECK(rules::is_beacon_or_mesh("BEACON"));
    CHECK_FALSE(rules::is_beacon_or_mesh("Meshell"));
    CHECK(rules::is_advertisement_field("ManufacturerData.Value: 01 02"));
    CHECK(rules::is_blank("\t"));
}
