#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include "podbridge/bluetooth/command_queue.hpp"
#include "podbridge/bluetooth/connectivity_state.hpp"
#include "podbridge/bluetooth/device_filter.hpp"
#include "podbridge/bluetooth/device_registry.hpp"
#include "podbridge/bluetooth/device_store.hpp"
#include "podbridge/bluetooth/event_broadcaster.hpp"
#include "podbridge/bluetooth/output_parser.hpp"
#include "podbridge/bluetooth/process_supervisor.hpp"
#include "podbridge/util/config_loader.hpp"

namespace podbridge::bluetooth {

struct ApiResult {
    bool ok{true};
    nlohmann::json payload = nlohmann::json::object();
    std::string error;

    static ApiResult success(nlohmann::json payload);
    static ApiResult failure(std::string error);
};

using ApiHandler = std::function<void(ApiResult)>;

// Service facade over the control tool: owns the child process, the command
// queue and the device registry, and publishes every state change.
// All methods must be called on the io_context thread.
class BluetoothController {
public:
    BluetoothController(boost::asio::io_context& io_context, const BridgeConfig& config, DeviceStore& store,
                        EventBroadcaster& broadcaster,
                        DeviceRegistry::Clock clock = [] { return std::chrono::system_clock::now(); });
    ~BluetoothController();

    BluetoothController(const BluetoothController&) = delete;
    BluetoothController& operator=(const BluetoothController&) = delete;

    // Spawns the tool, terminating a running instance first, and goes through
    // the initializing phase again. Returns false when the spawn failed; the
    // failure is logged and published as a status event.
    bool initialize();
    void shutdown();

    void set_power(bool on, ApiHandler handler);
    void set_scan(bool on, ApiHandler handler);
    void pair(const std::string& mac, ApiHandler handler);
    void trust(const std::string& mac, ApiHandler handler);
    void connect(const std::string& mac, bool full_sequence, ApiHandler handler);
    void disconnect(const std::string& mac, ApiHandler handler);
    void remove(const std::string& mac, ApiHandler handler);
    void info(const std::string& mac, ApiHandler handler);
    void battery(const std::string& mac, ApiHandler handler);
    void raw_command(const std::string& command, ApiHandler handler);

    nlohmann::json devices() const;
    nlohmann::json status() const;
    nlohmann::json health() const;
    // system-status, followed by devices-list when any device is known.
    std::vector<nlohmann::json> snapshot_events() const;

    const ConnectivityState& state() const { return state_; }
    const DeviceRegistry& registry() const { return registry_; }
    bool battery_polling() const { return battery_polling_; }
    std::optional<pid_t> tool_pid() const { return supervisor_.pid(); }

private:
    void handle_output(std::string_view chunk);
    void handle_event(const OutputEvent& event);
    void handle_announcement(const DeviceAnnouncement& announcement);
    void handle_connection_change(const ConnectionChange& change);
    void handle_device_lost(const DeviceLost& lost);
    void handle_connection_failure();
    void handle_exit(int status);

    void finish_initialization(std::uint64_t session);
    void refresh_state(std::uint64_t session, std::function<void(bool powered)> done);
    void refresh_device(std::uint64_t session, std::shared_ptr<std::vector<std::string>> macs, std::size_t index,
                        std::function<void()> done);
    void attempt_auto_reconnect(std::uint64_t session);
    void auto_stop_scan();

    void start_battery_polling();
    void stop_battery_polling();
    void schedule_battery_poll();
    void fetch_battery(const std::string& mac);

    void submit(std::string command, std::optional<std::chrono::milliseconds> timeout,
                std::function<void(CommandReply)> handler);
    void after(std::chrono::milliseconds delay, std::function<void()> fn);
    void simple_command(const std::string& command, std::chrono::milliseconds timeout, ApiHandler handler,
                        std::function<void(const CommandReply&)> on_success = nullptr);
    std::optional<std::string> ready_error() const;
    void set_activity(connectivity::Ready::Activity activity);

    nlohmann::json device_json(const Device& device) const;
    nlohmann::json system_status_event() const;
    void broadcast(const nlohmann::json& event);

    boost::asio::io_context& io_context_;
    BluetoothSettings settings_;
    RemovalPolicy removal_policy_;
    DeviceStore& store_;
    EventBroadcaster& broadcaster_;
    DeviceFilter filter_;
    DeviceRegistry registry_;
    ProcessSupervisor supervisor_;
    CommandQueue queue_;
    OutputParser parser_;
    // Tail of the last chunk that ends inside a UTF-8 sequence.
    std::string output_carry_;

    ConnectivityState state_{connectivity::Uninitialized{}};
    boost::asio::steady_timer init_timer_;
    boost::asio::steady_timer reconnect_timer_;
    boost::asio::steady_timer battery_timer_;
    bool battery_polling_{false};
    std::uint64_t session_{0};
};

}  // namespace podbridge::bluetooth
