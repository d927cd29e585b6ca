#include "podbridge/bluetooth/bluetooth_controller.hpp"

#include <regex>
#include <system_error>
#include <utility>

#include "podbridge/bluetooth/messages.hpp"
#include "podbridge/util/logging.hpp"

namespace podbridge::bluetooth {

namespace {

using Json = nlohmann::json;

constexpr const char* kStillInitializing = "Bluetooth is still initializing";

DeviceFilter make_filter(const FilterSettings& settings) {
    if (settings.le_vendor_patterns) {
        return DeviceFilter(*settings.le_vendor_patterns);
    }
    return DeviceFilter();
}

std::string preview(std::string_view text, std::size_t limit = 100) {
    std::string out(text.substr(0, limit));
    for (auto& ch : out) {
        if (ch == '\n' || ch == '\r') {
            ch = ' ';
        }
    }
    return out;
}

bool reconnect_succeeded(const std::string& output) {
    static const std::regex pattern(R"(Connection successful|Already connected)", std::regex::icase);
    return std::regex_search(OutputParser::strip_ansi(output), pattern);
}

}  // namespace

ApiResult ApiResult::success(nlohmann::json payload) {
    ApiResult result;
    result.payload = std::move(payload);
    return result;
}

ApiResult ApiResult::failure(std::string error) {
    ApiResult result;
    result.ok = false;
    result.error = std::move(error);
    return result;
}

BluetoothController::BluetoothController(boost::asio::io_context& io_context, const BridgeConfig& config,
                                         DeviceStore& store, EventBroadcaster& broadcaster,
                                         DeviceRegistry::Clock clock)
    : io_context_(io_context),
      settings_(config.bluetooth),
      removal_policy_(config.storage.removal_policy),
      store_(store),
      broadcaster_(broadcaster),
      filter_(make_filter(config.filter)),
      registry_(store_, filter_, config.bluetooth.offline_threshold, std::move(clock)),
      supervisor_(io_context, config.bluetooth.executable, config.bluetooth.args, config.bluetooth.stop_grace),
      queue_(io_context, supervisor_, config.bluetooth.timeouts, config.bluetooth.queue_gap),
      init_timer_(io_context),
      reconnect_timer_(io_context),
      battery_timer_(io_context) {
    supervisor_.set_output_handler([this](std::string_view chunk) { handle_output(chunk); });
    supervisor_.set_diagnostic_handler([](std::string_view chunk) {
        util::log::warn("[bluetooth] stderr: " + preview(chunk, 200));
    });
    supervisor_.set_exit_handler([this](int status) { handle_exit(status); });
}

BluetoothController::~BluetoothController() {
    supervisor_.set_exit_handler(nullptr);
    supervisor_.set_output_handler(nullptr);
    supervisor_.stop();
}

bool BluetoothController::initialize() {
    if (supervisor_.is_running()) {
        util::log::info("[bluetooth] Restarting control tool");
    }

    parser_.reset();
    output_carry_.clear();
    try {
        supervisor_.start();
    } catch (const std::system_error& ex) {
        util::log::error(std::string("[bluetooth] Failed to start control tool: ") + ex.what());
        state_ = connectivity::Disconnected{};
        broadcast(system_status_event());
        return false;
    }

    state_ = connectivity::Initializing{};
    const auto session = ++session_;
    util::log::info("[bluetooth] Control tool started, waiting for it to settle");

    init_timer_.expires_after(settings_.init_delay);
    init_timer_.async_wait([this, session](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        finish_initialization(session);
    });
    return true;
}

void BluetoothController::shutdown() {
    ++session_;
    init_timer_.cancel();
    reconnect_timer_.cancel();
    stop_battery_polling();
    supervisor_.stop();
}

void BluetoothController::finish_initialization(std::uint64_t session) {
    if (session != session_) {
        return;
    }
    const auto loaded = registry_.load_persisted();
    util::log::info("[database] Loaded " + std::to_string(loaded) + " paired device(s)");

    refresh_state(session, [this, session](bool powered) {
        if (session != session_ || !std::holds_alternative<connectivity::Initializing>(state_)) {
            return;
        }
        state_ = connectivity::Ready{powered, connectivity::Ready::Activity::Idle};

        for (const auto& event : snapshot_events()) {
            broadcast(event);
        }
        util::log::info("[bluetooth] Initial state broadcast complete");

        if (registry_.connected_mac()) {
            start_battery_polling();
        }
        if (settings_.auto_reconnect) {
            attempt_auto_reconnect(session);
        }
    });
}

void BluetoothController::refresh_state(std::uint64_t session, std::function<void(bool powered)> done) {
    util::log::info("[bluetooth] Refreshing Bluetooth state");
    submit("show", settings_.timeouts.command, [this, session, done = std::move(done)](CommandReply reply) {
        if (session != session_) {
            return;
        }
        bool powered = true;
        if (reply.ok()) {
            if (auto parsed = parse_powered(reply.output)) {
                powered = *parsed;
                util::log::info(std::string("[bluetooth] Bluetooth is powered ") + (powered ? "on" : "off"));
            }
        } else {
            util::log::warn("[bluetooth] Could not read controller state: " + *reply.error);
        }

        auto macs = std::make_shared<std::vector<std::string>>();
        for (const auto& device : registry_.snapshot()) {
            if (device.paired) {
                macs->push_back(device.mac);
            }
        }
        refresh_device(session, std::move(macs), 0, [done, powered] { done(powered); });
    });
}

void BluetoothController::refresh_device(std::uint64_t session, std::shared_ptr<std::vector<std::string>> macs,
                                         std::size_t index, std::function<void()> done) {
    if (session != session_) {
        return;
    }
    if (index >= macs->size()) {
        done();
        return;
    }

    const auto mac = (*macs)[index];
    submit("info " + mac, settings_.timeouts.info,
           [this, session, macs, index, mac, done = std::move(done)](CommandReply reply) {
               if (session != session_) {
                   return;
               }
               if (!reply.ok()) {
                   util::log::warn("[bluetooth] Could not get info for " + mac + ": " + *reply.error);
               } else {
                   const auto info = parse_device_info(reply.output);
                   if (info.connected) {
                       registry_.set_connected(mac, *info.connected);
                       if (*info.connected) {
                           util::log::info("[bluetooth] Device is connected: " + mac);
                           registry_.set_battery(mac, info.battery);
                       }
                   }
                   if (info.paired && *info.paired) {
                       registry_.set_paired(mac, true);
                   }
                   if (info.trusted && *info.trusted) {
                       registry_.set_trusted(mac, true);
                   }
               }
               refresh_device(session, macs, index + 1, done);
           });
}

void BluetoothController::attempt_auto_reconnect(std::uint64_t session) {
    if (registry_.connected_mac()) {
        util::log::info("[bluetooth] Already connected, skipping auto-reconnect");
        return;
    }

    std::optional<DeviceRecord> last;
    try {
        last = store_.last_connected();
    } catch (const std::exception& ex) {
        util::log::error(std::string("[database] Failed to read last connected device: ") + ex.what());
        return;
    }
    if (!last) {
        util::log::info("[bluetooth] No last connected device, skipping auto-reconnect");
        return;
    }

    const auto mac = last->mac;
    const auto name = last->name;
    util::log::info("[bluetooth] Attempting auto-reconnect to " + name + " (" + mac + ")");
    broadcast(messages::auto_reconnect("auto-reconnect-started", mac, name));

    reconnect_timer_.expires_after(settings_.reconnect_delay);
    reconnect_timer_.async_wait([this, session, mac, name](const boost::system::error_code& ec) {
        if (ec || session != session_) {
            return;
        }
        connect(mac, false, [this, mac, name](ApiResult result) {
            if (!result.ok) {
                util::log::warn("[bluetooth] Auto-reconnect error: " + result.error);
                broadcast(messages::auto_reconnect("auto-reconnect-failed", mac, name, result.error));
                return;
            }
            const auto output = result.payload.value("output", std::string());
            if (reconnect_succeeded(output)) {
                util::log::info("[bluetooth] Auto-reconnect successful: " + name);
                broadcast(messages::auto_reconnect("auto-reconnect-success", mac, name));
            } else {
                util::log::warn("[bluetooth] Auto-reconnect failed: " + name);
                broadcast(messages::auto_reconnect("auto-reconnect-failed", mac, name, std::string("Connection failed")));
            }
        });
    });
}

void BluetoothController::handle_output(std::string_view chunk) {
    queue_.capture(chunk);
    std::string text = std::exchange(output_carry_, std::string());
    text.append(chunk.data(), chunk.size());
    const auto complete = complete_utf8_prefix(text);
    output_carry_ = text.substr(complete);
    text.resize(complete);
    if (!text.empty()) {
        broadcast(messages::output(text));
    }
    for (const auto& event : parser_.feed(chunk)) {
        handle_event(event);
    }
}

void BluetoothController::handle_event(const OutputEvent& event) {
    if (const auto* announcement = std::get_if<DeviceAnnouncement>(&event)) {
        handle_announcement(*announcement);
    } else if (const auto* change = std::get_if<ConnectionChange>(&event)) {
        handle_connection_change(*change);
    } else if (const auto* lost = std::get_if<DeviceLost>(&event)) {
        handle_device_lost(*lost);
    } else if (std::holds_alternative<ConnectionFailure>(event)) {
        handle_connection_failure();
    }
}

void BluetoothController::handle_announcement(const DeviceAnnouncement& announcement) {
    const auto outcome = registry_.apply_announcement(announcement);
    if (outcome.kind == DeviceRegistry::AnnouncementOutcome::Kind::Found && outcome.device) {
        broadcast(messages::device_event("device-found", device_json(*outcome.device)));
    }
}

void BluetoothController::handle_connection_change(const ConnectionChange& change) {
    util::log::info("[connection] Device " + change.mac + (change.connected ? " connected" : " disconnected"));

    auto outcome = registry_.set_connected(change.mac, change.connected);
    if (!outcome) {
        util::log::info("[connection] Device " + change.mac + " is unknown, ignoring connection change");
        return;
    }
    if (outcome->loaded_from_store) {
        broadcast(messages::device_event("device-found", device_json(outcome->device)));
    }
    for (const auto& displaced : outcome->displaced) {
        broadcast(messages::device_event("device-disconnected", device_json(displaced)));
    }

    if (!change.connected) {
        if (!registry_.connected_mac()) {
            stop_battery_polling();
        }
        broadcast(messages::device_event("device-disconnected", device_json(outcome->device)));
        return;
    }

    try {
        store_.set_last_connected(change.mac);
    } catch (const std::exception& ex) {
        util::log::error(std::string("[database] Failed to update last connected device: ") + ex.what());
    }
    broadcast(messages::device_event("device-connected", device_json(outcome->device)));
    fetch_battery(change.mac);
    start_battery_polling();
    auto_stop_scan();
}

void BluetoothController::handle_device_lost(const DeviceLost& lost) {
    auto device = registry_.mark_lost(lost.mac);
    if (!device) {
        return;
    }
    util::log::info("[devices] Device went offline: " + lost.mac);
    if (!registry_.connected_mac()) {
        stop_battery_polling();
    }
    broadcast(messages::device_event("device-updated", device_json(*device)));
}

void BluetoothController::handle_connection_failure() {
    util::log::info("[connection] Failed to connect message detected");
    auto device = registry_.clear_connection();
    stop_battery_polling();
    if (device) {
        broadcast(messages::device_event("device-disconnected", device_json(*device)));
    }
}

void BluetoothController::handle_exit(int status) {
    util::log::warn("[bluetooth] Control tool exited with status " + std::to_string(status));
    state_ = connectivity::Disconnected{status};
    ++session_;
    init_timer_.cancel();
    reconnect_timer_.cancel();
    stop_battery_polling();
    registry_.disconnect_all();
    parser_.reset();
    output_carry_.clear();
    queue_.abort_all("bluetoothctl process exited");
    broadcast(system_status_event());
}

void BluetoothController::auto_stop_scan() {
    if (!is_scanning(state_) || !registry_.connected_mac()) {
        return;
    }
    util::log::info("[scan] Auto-stopping scan after a successful connection");
    set_activity(connectivity::Ready::Activity::Idle);
    broadcast(messages::scan_stopped());
    submit("scan off", std::nullopt, [](CommandReply reply) {
        if (!reply.ok()) {
            util::log::error("[scan] Failed to auto-stop scan: " + *reply.error);
        }
    });
}

void BluetoothController::start_battery_polling() {
    if (battery_polling_ || !registry_.connected_mac()) {
        return;
    }
    util::log::info("[battery] Starting battery polling");
    battery_polling_ = true;
    schedule_battery_poll();
}

void BluetoothController::stop_battery_polling() {
    if (!battery_polling_) {
        return;
    }
    util::log::info("[battery] Stopping battery polling");
    battery_polling_ = false;
    battery_timer_.cancel();
}

void BluetoothController::schedule_battery_poll() {
    battery_timer_.expires_after(settings_.battery_poll_interval);
    battery_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !battery_polling_) {
            return;
        }
        auto mac = registry_.connected_mac();
        if (!mac) {
            stop_battery_polling();
            return;
        }
        fetch_battery(*mac);
        schedule_battery_poll();
    });
}

void BluetoothController::fetch_battery(const std::string& mac) {
    submit("info " + mac, settings_.timeouts.info, [this, mac](CommandReply reply) {
        if (!reply.ok()) {
            util::log::error("[battery] Failed to fetch battery for " + mac + ": " + *reply.error);
            return;
        }
        const auto level = parse_battery(reply.output);
        if (!registry_.set_battery(mac, level)) {
            return;
        }
        util::log::info("[battery] Device " + mac + " battery: " +
                        (level ? std::to_string(*level) + "%" : std::string("not available")));
        if (auto device = registry_.get(mac)) {
            broadcast(messages::battery_updated(*device));
        }
    });
}

void BluetoothController::set_power(bool on, ApiHandler handler) {
    if (auto error = ready_error()) {
        handler(ApiResult::failure(*error));
        return;
    }
    const std::string command = std::string("power ") + (on ? "on" : "off");
    submit(command, std::nullopt, [this, on, command, handler = std::move(handler)](CommandReply reply) {
        if (!reply.ok()) {
            handler(ApiResult::failure(*reply.error));
            return;
        }
        if (auto* ready = std::get_if<connectivity::Ready>(&state_)) {
            ready->powered = on;
            if (!on) {
                ready->activity = connectivity::Ready::Activity::Idle;
                registry_.disconnect_all();
                stop_battery_polling();
            }
        }
        broadcast(messages::power_changed(on, is_scanning(state_)));
        handler(ApiResult::success(Json{
            {"command", command},
            {"output", reply.output},
            {"powered", on},
        }));
    });
}

void BluetoothController::set_scan(bool on, ApiHandler handler) {
    if (auto error = ready_error()) {
        handler(ApiResult::failure(*error));
        return;
    }

    if (on) {
        util::log::info("[scan] Starting scan");
        for (const auto& mac : registry_.begin_scan_session()) {
            broadcast(messages::device_removed(mac));
        }
        set_activity(connectivity::Ready::Activity::Scanning);
        broadcast(messages::scan_started());
    } else {
        util::log::info("[scan] Stopping scan");
        set_activity(connectivity::Ready::Activity::Idle);
        broadcast(messages::scan_stopped());
    }

    const std::string command = on ? "scan bredr" : "scan off";
    submit(command, std::nullopt, [this, command, handler = std::move(handler)](CommandReply reply) {
        if (!reply.ok()) {
            handler(ApiResult::failure(*reply.error));
            return;
        }
        handler(ApiResult::success(Json{
            {"command", command},
            {"output", reply.output},
            {"is_scanning", is_scanning(state_)},
        }));
    });
}

void BluetoothController::pair(const std::string& mac, ApiHandler handler) {
    simple_command("pair " + mac, settings_.timeouts.pair, std::move(handler),
                   [this, mac](const CommandReply&) { registry_.set_paired(mac, true); });
}

void BluetoothController::trust(const std::string& mac, ApiHandler handler) {
    simple_command("trust " + mac, settings_.timeouts.trust, std::move(handler),
                   [this, mac](const CommandReply&) { registry_.set_trusted(mac, true); });
}

void BluetoothController::connect(const std::string& mac, bool full_sequence, ApiHandler handler) {
    const std::string connect_command = "connect " + mac;
    auto finish = [this, connect_command, full_sequence, handler = std::move(handler)](Json sequence) {
        submit(connect_command, settings_.timeouts.pair,
               [connect_command, full_sequence, sequence, handler](CommandReply reply) mutable {
                   if (!reply.ok()) {
                       handler(ApiResult::failure(*reply.error));
                       return;
                   }
                   util::log::info("[connect] Connect result: " + preview(reply.output));
                   Json payload{
                       {"command", connect_command},
                       {"output", reply.output},
                   };
                   if (full_sequence) {
                       sequence["connect"] = reply.output;
                       payload["sequence"] = std::move(sequence);
                   }
                   handler(ApiResult::success(std::move(payload)));
               });
    };

    if (!full_sequence) {
        finish(Json::object());
        return;
    }

    util::log::info("[connect] Starting full connection sequence for " + mac);
    const auto step = settings_.sequence_step_delay;
    submit("pair " + mac, settings_.timeouts.pair, [this, mac, step, finish](CommandReply pair_reply) {
        Json sequence{{"pair", nullptr}, {"trust", nullptr}, {"connect", nullptr}};
        if (pair_reply.ok()) {
            util::log::info("[connect] Pair result: " + preview(pair_reply.output));
            registry_.set_paired(mac, true);
            sequence["pair"] = pair_reply.output;
        } else {
            util::log::info("[connect] Pair failed (may already be paired): " + *pair_reply.error);
        }

        after(step, [this, mac, step, finish, sequence]() mutable {
            submit("trust " + mac, settings_.timeouts.trust,
                   [this, mac, step, finish, sequence](CommandReply trust_reply) mutable {
                       if (trust_reply.ok()) {
                           util::log::info("[connect] Trust result: " + preview(trust_reply.output));
                           registry_.set_trusted(mac, true);
                           sequence["trust"] = trust_reply.output;
                       } else {
                           util::log::info("[connect] Trust failed: " + *trust_reply.error);
                       }
                       after(step, [finish, sequence]() { finish(sequence); });
                   });
        });
    });
}

void BluetoothController::disconnect(const std::string& mac, ApiHandler handler) {
    simple_command("disconnect " + mac, settings_.timeouts.command, std::move(handler));
}

void BluetoothController::remove(const std::string& mac, ApiHandler handler) {
    simple_command("remove " + mac, settings_.timeouts.command, std::move(handler),
                   [this, mac](const CommandReply&) {
                       registry_.remove(mac, removal_policy_);
                       if (!registry_.connected_mac()) {
                           stop_battery_polling();
                       }
                       util::log::info("[devices] Removed " + mac + " (record " + to_string(removal_policy_) + ")");
                       broadcast(messages::device_removed(mac));
                   });
}

void BluetoothController::info(const std::string& mac, ApiHandler handler) {
    const std::string command = "info " + mac;
    submit(command, std::nullopt, [this, mac, command, handler = std::move(handler)](CommandReply reply) {
        if (!reply.ok()) {
            handler(ApiResult::failure(*reply.error));
            return;
        }
        const auto parsed = parse_device_info(reply.output);
        if (parsed.rssi) {
            registry_.update_rssi(mac, *parsed.rssi);
        }

        Json device_payload;
        if (auto device = registry_.get(mac)) {
            if (device->is_connected && registry_.set_battery(mac, parsed.battery)) {
                device = registry_.get(mac);
            }
            device_payload = device_json(*device);
        } else {
            device_payload = Json{
                {"mac", mac},
                {"name", "Unknown"},
                {"rssi", parsed.rssi.value_or(kDefaultRssi)},
                {"is_connected", false},
                {"battery", parsed.battery ? Json(*parsed.battery) : Json(nullptr)},
            };
        }
        handler(ApiResult::success(Json{
            {"command", command},
            {"output", reply.output},
            {"device", std::move(device_payload)},
        }));
    });
}

void BluetoothController::battery(const std::string& mac, ApiHandler handler) {
    submit("info " + mac, std::nullopt, [this, mac, handler = std::move(handler)](CommandReply reply) {
        if (!reply.ok()) {
            handler(ApiResult::failure(*reply.error));
            return;
        }
        const auto level = parse_battery(reply.output);
        auto device = registry_.get(mac);
        if (device && device->is_connected && registry_.set_battery(mac, level)) {
            if (auto updated = registry_.get(mac)) {
                broadcast(messages::battery_updated(*updated));
            }
        }
        handler(ApiResult::success(Json{
            {"mac", mac},
            {"battery", level ? Json(*level) : Json(nullptr)},
            {"supported", level.has_value()},
        }));
    });
}

void BluetoothController::raw_command(const std::string& command, ApiHandler handler) {
    if (command.find_first_of("\r\n") != std::string::npos) {
        handler(ApiResult::failure("Command must be a single line"));
        return;
    }
    simple_command(command, queue_.timeout_for(command), std::move(handler));
}

Json BluetoothController::devices() const {
    Json list = Json::array();
    for (const auto& device : registry_.snapshot()) {
        list.push_back(device_json(device));
    }
    const auto count = list.size();
    return Json{
        {"devices", std::move(list)},
        {"device_count", count},
    };
}

Json BluetoothController::status() const {
    auto connected = registry_.connected_device();
    return Json{
        {"is_connected", connected.has_value()},
        {"is_scanning", is_scanning(state_)},
        {"bluetooth_powered", is_powered(state_)},
        {"state", std::string(state_name(state_))},
        {"device", connected ? device_json(*connected) : Json(nullptr)},
    };
}

Json BluetoothController::health() const {
    return Json{
        {"status", "ok"},
        {"bluetooth_connected", process_alive(state_)},
        {"bluetooth_powered", is_powered(state_)},
        {"devices_count", registry_.size()},
        {"is_scanning", is_scanning(state_)},
    };
}

std::vector<Json> BluetoothController::snapshot_events() const {
    std::vector<Json> events;
    events.push_back(system_status_event());
    const auto devices = registry_.snapshot();
    if (!devices.empty()) {
        std::vector<Json> list;
        list.reserve(devices.size());
        for (const auto& device : devices) {
            list.push_back(device_json(device));
        }
        events.push_back(messages::devices_list(std::move(list)));
    }
    return events;
}

void BluetoothController::submit(std::string command, std::optional<std::chrono::milliseconds> timeout,
                                 std::function<void(CommandReply)> handler) {
    if (timeout) {
        queue_.submit(std::move(command), *timeout, std::move(handler));
    } else {
        queue_.submit(std::move(command), std::move(handler));
    }
}

void BluetoothController::after(std::chrono::milliseconds delay, std::function<void()> fn) {
    auto timer = std::make_shared<boost::asio::steady_timer>(io_context_, delay);
    timer->async_wait([timer, fn = std::move(fn)](const boost::system::error_code& ec) {
        if (!ec) {
            fn();
        }
    });
}

void BluetoothController::simple_command(const std::string& command, std::chrono::milliseconds timeout,
                                         ApiHandler handler, std::function<void(const CommandReply&)> on_success) {
    submit(command, timeout,
           [command, handler = std::move(handler), on_success = std::move(on_success)](CommandReply reply) {
               if (!reply.ok()) {
                   handler(ApiResult::failure(*reply.error));
                   return;
               }
               if (on_success) {
                   on_success(reply);
               }
               handler(ApiResult::success(Json{
                   {"command", command},
                   {"output", reply.output},
               }));
           });
}

std::optional<std::string> BluetoothController::ready_error() const {
    if (!process_alive(state_)) {
        return std::string(CommandQueue::kNotConnected);
    }
    if (!is_ready(state_)) {
        return std::string(kStillInitializing);
    }
    return std::nullopt;
}

void BluetoothController::set_activity(connectivity::Ready::Activity activity) {
    if (auto* ready = std::get_if<connectivity::Ready>(&state_)) {
        ready->activity = activity;
    }
}

Json BluetoothController::device_json(const Device& device) const {
    return messages::device(device, registry_.is_online(device));
}

Json BluetoothController::system_status_event() const {
    messages::SystemStatus status;
    status.bluetooth_connected = process_alive(state_);
    status.bluetooth_powered = is_powered(state_);
    status.devices_count = registry_.size();
    if (auto connected = registry_.connected_device()) {
        status.connected_device = device_json(*connected);
    }
    status.is_scanning = is_scanning(state_);
    return messages::system_status(status);
}

void BluetoothController::broadcast(const Json& event) {
    broadcaster_.publish(event);
}

}  // namespace podbridge::bluetooth
