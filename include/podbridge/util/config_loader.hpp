#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace podbridge {

enum class RemovalPolicy {
    KeepRecord,
    DeleteRecord,
};

struct ServerSettings {
    std::string host{"0.0.0.0"};
    std::uint16_t port{8080};
};

struct CommandTimeouts {
    std::chrono::milliseconds command{5000};
    std::chrono::milliseconds pair{10000};
    std::chrono::milliseconds scan{2000};
    std::chrono::milliseconds trust{5000};
    std::chrono::milliseconds info{2000};
};

struct BluetoothSettings {
    std::string executable{"bluetoothctl"};
    std::vector<std::string> args;
    bool auto_start{true};
    bool auto_reconnect{true};
    CommandTimeouts timeouts{};
    std::chrono::milliseconds queue_gap{100};
    std::chrono::milliseconds init_delay{1000};
    std::chrono::milliseconds reconnect_delay{2000};
    std::chrono::milliseconds sequence_step_delay{500};
    std::chrono::milliseconds battery_poll_interval{60000};
    std::chrono::milliseconds offline_threshold{30000};
    std::chrono::milliseconds stop_grace{1000};
};

struct FilterSettings {
    // Unset keeps the built-in vendor list.
    std::optional<std::vector<std::string>> le_vendor_patterns;
};

struct StorageSettings {
    std::string path{"state/bluetooth_devices.json"};
    RemovalPolicy removal_policy{RemovalPolicy::KeepRecord};
};

struct BridgeConfig {
    ServerSettings server{};
    BluetoothSettings bluetooth{};
    FilterSettings filter{};
    StorageSettings storage{};
    std::string log_level{"info"};
};

BridgeConfig load_config(const std::string& path);
BridgeConfig parse_config(const std::string& yaml_text);

RemovalPolicy parse_removal_policy(const std::string& value);
std::string to_string(RemovalPolicy policy);

}  // namespace podbridge
