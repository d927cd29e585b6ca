#include "podbridge/bluetooth/output_parser.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <variant>

using namespace podbridge::bluetooth;

TEST_CASE("Parser reassembles lines split across chunks", "[parser]") {
    OutputParser parser;

    auto events = parser.feed("[NEW] Device 00:11:22:33:44:56 JBL ");
    CHECK(events.empty());
    CHECK(parser.pending() == "[NEW] Device 00:11:22:33:44:56 JBL ");

    events = parser.feed("Flip 6\n[NEW] Device AA:BB:CC:DD:EE:FF Soundbar\r\n[bluetooth]# ");
    REQUIRE(events.size() == 2);
    const auto* first = std::get_if<DeviceAnnouncement>(&events[0]);
    REQUIRE(first != nullptr);
    CHECK(first->mac == "00:11:22:33:44:56");
    CHECK(first->raw_name == "JBL Flip 6");
    const auto* second = std::get_if<DeviceAnnouncement>(&events[1]);
    REQUIRE(second != nullptr);
    CHECK(second->raw_name == "Soundbar");
    CHECK(parser.pending() == "[bluetooth]# ");
}

TEST_CASE("Parser strips colour codes and prompts", "[parser]") {
    CHECK(OutputParser::strip_ansi("\x1b[0;92mNEW\x1b[0m") == "NEW");
    CHECK(OutputParser::strip_ansi("[0;94m[bluetooth][0m# ") == "[bluetooth]# ");
    CHECK(OutputParser::strip_ansi("\x01\x1b[0;94m\x02[bluetooth]\x01\x1b[0m\x02# ") == "[bluetooth]# ");

    const auto event = OutputParser::parse_line(
        "\r\x1b[K[bluetooth]# [\x1b[0;92mNEW\x1b[0m] Device 00:11:22:33:44:57 Kitchen (2): Speaker");
    REQUIRE(event.has_value());
    const auto* announcement = std::get_if<DeviceAnnouncement>(&*event);
    REQUIRE(announcement != nullptr);
    CHECK(announcement->mac == "00:11:22:33:44:57");
    CHECK(announcement->raw_name == "Kitchen (2): Speaker");
}

TEST_CASE("Parser classifies change, removal and failure lines", "[parser]") {
    SECTION("connection changes") {
        const auto yes = OutputParser::parse_line("[CHG] Device 00:11:22:33:44:56 Connected: yes");
        REQUIRE(yes.has_value());
        const auto* change = std::get_if<ConnectionChange>(&*yes);
        REQUIRE(change != nullptr);
        CHECK(change->connected);

        const auto no = OutputParser::parse_line("[JBL Flip 6]# [CHG] Device 00:11:22:33:44:56 Connected: no");
        REQUIRE(no.has_value());
        REQUIRE(std::holds_alternative<ConnectionChange>(*no));
        CHECK_FALSE(std::get<ConnectionChange>(*no).connected);
    }

    SECTION("removal") {
        const auto lost = OutputParser::parse_line("[DEL] Device 00:11:22:33:44:56 JBL Flip 6");
        REQUIRE(lost.has_value());
        REQUIRE(std::holds_alternative<DeviceLost>(*lost));
        CHECK(std::get<DeviceLost>(*lost).mac == "00:11:22:33:44:56");
    }

    SECTION("rssi changes count as sightings") {
        const auto rssi = OutputParser::parse_line("[CHG] Device 00:11:22:33:44:56 RSSI: 0xffffffc4 (-60)");
        REQUIRE(rssi.has_value());
        const auto* announcement = std::get_if<DeviceAnnouncement>(&*rssi);
        REQUIRE(announcement != nullptr);
        CHECK(announcement->raw_name == "RSSI: 0xffffffc4 (-60)");
    }

    SECTION("other property changes are dropped") {
        CHECK_FALSE(OutputParser::parse_line("[CHG] Device 00:11:22:33:44:56 ServicesResolved: yes").has_value());
        CHECK_FALSE(OutputParser::parse_line("[CHG] Device 00:11:22:33:44:56 Paired: yes").has_value());
    }

    SECTION("connection failure") {
        const auto failure = OutputParser::parse_line("Failed to connect: org.bluez.Error.Failed");
        REQUIRE(failure.has_value());
        CHECK(std::holds_alternative<ConnectionFailure>(*failure));
    }

    SECTION("unrelated lines") {
        CHECK_FALSE(OutputParser::parse_line("Discovery started").has_value());
        CHECK_FALSE(OutputParser::parse_line("[bluetooth]# ").has_value());
        CHECK_FALSE(OutputParser::parse_line("Device 00:11:22:33:44 too short").has_value());
    }

    SECTION("info headers are not announcements") {
        CHECK_FALSE(OutputParser::parse_line("Device 00:11:22:33:44:56 (public)").has_value());
        CHECK_FALSE(OutputParser::parse_line("Device 00:11:22:33:44:56 (random)").has_value());
        CHECK_FALSE(OutputParser::parse_line("Device 00:11:22:33:44:56 not available").has_value());
        CHECK(OutputParser::parse_line("[NEW] Device 00:11:22:33:44:56 (public)").has_value());
    }
}

TEST_CASE("Parser discards oversized unterminated output", "[parser]") {
    OutputParser parser;
    const std::string blob(OutputParser::kMaxPendingBytes + 1, 'x');
    CHECK(parser.feed(blob).empty());
    CHECK(parser.pending().empty());

    auto events = parser.feed("Device 00:11:22:33:44:56 Speaker\n");
    CHECK(events.size() == 1);
}

TEST_CASE("Parser flushes a trailing partial line", "[parser]") {
    OutputParser parser;
    CHECK(parser.feed("Device 00:11:22:33:44:56 Speaker").empty());
    auto events = parser.flush();
    REQUIRE(events.size() == 1);
    CHECK(std::holds_alternative<DeviceAnnouncement>(events.front()));
    CHECK(parser.pending().empty());
}

TEST_CASE("Info helpers read device and controller state", "[parser]") {
    const std::string info = R"(Device 00:11:22:33:44:56 (public)
	Name: JBL Flip 6
	Paired: yes
	Trusted: no
	Connected: yes
	RSSI: -58
	Battery Percentage: 0x5a (90)
)";
    const auto parsed = parse_device_info(info);
    CHECK(parsed.connected == true);
    CHECK(parsed.paired == true);
    CHECK(parsed.trusted == false);
    CHECK(parsed.rssi == -58);
    CHECK(parsed.battery == 90);

    CHECK(parse_battery("Battery Percentage: 0xff (255)") == std::nullopt);
    CHECK(parse_battery("Name: speaker") == std::nullopt);

    CHECK(parse_powered("Controller 00:1A:7D:DA:71:13\n\tPowered: no\n") == false);
    CHECK(parse_powered("\tPowered: yes") == true);
    CHECK_FALSE(parse_powered("No default controller available").has_value());
}

TEST_CASE("Cut-short UTF-8 sequences are held back", "[parser]") {
    CHECK(complete_utf8_prefix("") == 0);
    CHECK(complete_utf8_prefix("Speaker") == 7);
    CHECK(complete_utf8_prefix("Bj\xC3") == 2);
    CHECK(complete_utf8_prefix("Bj\xC3\xB6") == 4);
    CHECK(complete_utf8_prefix("\xE2\x82") == 0);
    CHECK(complete_utf8_prefix("\xE2\x82\xAC") == 3);
    CHECK(complete_utf8_prefix("a\xF0\x9F\x8E") == 1);
    CHECK(complete_utf8_prefix("\x80\x80") == 2);
}
