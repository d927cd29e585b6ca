#include "podbridge/bluetooth/event_broadcaster.hpp"
#include "podbridge/bluetooth/messages.hpp"

#include <catch2/catch.hpp>

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using nlohmann::json;
using podbridge::bluetooth::Device;
using podbridge::bluetooth::EventBroadcaster;
using podbridge::bluetooth::EventSubscriber;
namespace messages = podbridge::bluetooth::messages;

namespace {

class RecordingSubscriber : public EventSubscriber {
public:
    void deliver(std::shared_ptr<const std::string> message) override { received.push_back(json::parse(*message)); }
    bool is_open() const override { return open; }

    std::vector<std::string> types() const {
        std::vector<std::string> result;
        for (const auto& message : received) {
            result.push_back(message.at("type").get<std::string>());
        }
        return result;
    }

    bool open{true};
    std::vector<json> received;
};

}  // namespace

TEST_CASE("Broadcaster replays the snapshot to new subscribers", "[broadcaster]") {
    EventBroadcaster broadcaster;
    int provider_calls = 0;
    broadcaster.set_snapshot_provider([&] {
        ++provider_calls;
        messages::SystemStatus status;
        status.devices_count = 1;
        return std::vector<json>{messages::system_status(status), messages::devices_list({json{{"mac", "X"}}})};
    });

    auto early = std::make_shared<RecordingSubscriber>();
    broadcaster.subscribe(early);
    REQUIRE(early->types() == std::vector<std::string>{"system-status", "devices-list"});
    CHECK(early->received[0].at("devices_count") == 1);
    CHECK(early->received[0].at("connected_device").is_null());

    broadcaster.publish(messages::scan_started());

    auto late = std::make_shared<RecordingSubscriber>();
    broadcaster.subscribe(late);
    CHECK(late->types() == std::vector<std::string>{"system-status", "devices-list"});
    CHECK(early->types() == std::vector<std::string>{"system-status", "devices-list", "scan-started"});
    CHECK(provider_calls == 2);

    SECTION("replay on request") {
        broadcaster.replay(*early);
        CHECK(early->received.size() == 5);
    }
}

TEST_CASE("Broadcaster delivers events in publish order", "[broadcaster]") {
    EventBroadcaster broadcaster;
    auto subscriber = std::make_shared<RecordingSubscriber>();
    broadcaster.subscribe(subscriber);
    CHECK(subscriber->received.empty());

    broadcaster.publish(messages::scan_started());
    broadcaster.publish(messages::device_removed("00:11:22:33:44:56"));
    broadcaster.publish(messages::scan_stopped());

    CHECK(subscriber->types() == std::vector<std::string>{"scan-started", "device-removed", "scan-stopped"});
    CHECK(subscriber->received[1].at("mac") == "00:11:22:33:44:56");
}

TEST_CASE("Broadcaster delivers output that is not valid UTF-8", "[broadcaster]") {
    EventBroadcaster broadcaster;
    auto subscriber = std::make_shared<RecordingSubscriber>();
    broadcaster.subscribe(subscriber);

    REQUIRE_NOTHROW(broadcaster.publish(messages::output("Bj\xC3")));
    REQUIRE(subscriber->received.size() == 1);
    CHECK(subscriber->received.front().at("data") == "Bj\xEF\xBF\xBD");

    CHECK(messages::serialize(json{{"name", "Bj\xC3\xB6rn"}}) == "{\"name\":\"Bj\xC3\xB6rn\"}");
}

TEST_CASE("Broadcaster skips closed subscribers and forgets dropped ones", "[broadcaster]") {
    EventBroadcaster broadcaster;
    auto open = std::make_shared<RecordingSubscriber>();
    auto closed = std::make_shared<RecordingSubscriber>();
    closed->open = false;
    auto dropped = std::make_shared<RecordingSubscriber>();

    broadcaster.subscribe(open);
    broadcaster.subscribe(closed);
    broadcaster.subscribe(dropped);
    CHECK(broadcaster.subscriber_count() == 3);

    dropped.reset();
    CHECK(broadcaster.subscriber_count() == 2);

    broadcaster.publish(messages::pong());
    CHECK(open->received.size() == 1);
    CHECK(closed->received.empty());
}

TEST_CASE("Broadcaster stops delivering after unsubscribe", "[broadcaster]") {
    EventBroadcaster broadcaster;
    auto subscriber = std::make_shared<RecordingSubscriber>();
    const auto id = broadcaster.subscribe(subscriber);

    broadcaster.unsubscribe(id);
    broadcaster.publish(messages::pong());

    CHECK(subscriber->received.empty());
    CHECK(broadcaster.subscriber_count() == 0);
}

TEST_CASE("Event messages carry the documented fields", "[messages]") {
    Device device;
    device.mac = "00:11:22:33:44:56";
    device.name = "JBL Flip 6";
    device.rssi = -60;
    device.paired = true;
    device.is_connected = true;

    const auto view = messages::device(device, true);
    CHECK(view.at("mac") == "00:11:22:33:44:56");
    CHECK(view.at("rssi") == -60);
    CHECK(view.at("is_online") == true);
    CHECK(view.at("battery").is_null());

    const auto found = messages::device_event("device-found", view);
    CHECK(found.at("type") == "device-found");
    CHECK(found.at("device").at("name") == "JBL Flip 6");

    device.battery = 75;
    const auto battery = messages::battery_updated(device);
    CHECK(battery.at("type") == "device-battery-updated");
    CHECK(battery.at("device").at("battery") == 75);

    const auto power = messages::power_changed(false, false);
    CHECK(power.at("type") == "bluetooth-power-changed");
    CHECK(power.at("powered") == false);

    const auto started = messages::auto_reconnect("auto-reconnect-started", device.mac, device.name);
    CHECK_FALSE(started.contains("error"));
    const auto failed = messages::auto_reconnect("auto-reconnect-failed", device.mac, device.name, "timeout");
    CHECK(failed.at("error") == "timeout");

    CHECK(messages::output("Discovery started\n").at("data") == "Discovery started\n");
}
