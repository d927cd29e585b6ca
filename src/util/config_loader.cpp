#include "podbridge/util/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace podbridge {

namespace {

template <typename T>
T scalar_or_throw(const YAML::Node& node, const std::string& field) {
    if (!node.IsScalar()) {
        throw std::runtime_error("Field '" + field + "' must be a scalar");
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception& ex) {
        throw std::runtime_error("Field '" + field + "' has an invalid value: " + ex.what());
    }
}

template <typename T>
void read_scalar(const YAML::Node& parent, const char* key, const std::string& prefix, T& out) {
    if (auto node = parent[key]; node) {
        out = scalar_or_throw<T>(node, prefix + key);
    }
}

void read_millis(const YAML::Node& parent, const char* key, const std::string& prefix,
                 std::chrono::milliseconds& out) {
    if (auto node = parent[key]; node) {
        const auto value = scalar_or_throw<long long>(node, prefix + key);
        if (value < 0) {
            throw std::runtime_error("Field '" + prefix + key + "' must not be negative");
        }
        out = std::chrono::milliseconds(value);
    }
}

std::vector<std::string> string_list(const YAML::Node& node, const std::string& field) {
    if (!node.IsSequence()) {
        throw std::runtime_error("Field '" + field + "' must be a sequence");
    }
    std::vector<std::string> values;
    values.reserve(node.size());
    for (const auto& item : node) {
        values.push_back(scalar_or_throw<std::string>(item, field + "[]"));
    }
    return values;
}

void apply_server(const YAML::Node& node, ServerSettings& server) {
    read_scalar(node, "host", "server.", server.host);
    if (auto port_node = node["port"]; port_node) {
        const auto port = scalar_or_throw<int>(port_node, "server.port");
        if (port <= 0 || port > std::numeric_limits<std::uint16_t>::max()) {
            throw std::runtime_error("Field 'server.port' must be between 1 and 65535");
        }
        server.port = static_cast<std::uint16_t>(port);
    }
}

void apply_bluetooth(const YAML::Node& node, BluetoothSettings& bt) {
    const std::string prefix = "bluetooth.";
    read_scalar(node, "executable", prefix, bt.executable);
    if (auto args = node["args"]; args) {
        bt.args = string_list(args, prefix + "args");
    }
    read_scalar(node, "auto_start", prefix, bt.auto_start);
    read_scalar(node, "auto_reconnect", prefix, bt.auto_reconnect);

    if (auto timeouts = node["timeouts_ms"]; timeouts) {
        if (!timeouts.IsMap()) {
            throw std::runtime_error("Field 'bluetooth.timeouts_ms' must be a map");
        }
        const std::string tprefix = prefix + "timeouts_ms.";
        read_millis(timeouts, "command", tprefix, bt.timeouts.command);
        read_millis(timeouts, "pair", tprefix, bt.timeouts.pair);
        read_millis(timeouts, "scan", tprefix, bt.timeouts.scan);
        read_millis(timeouts, "trust", tprefix, bt.timeouts.trust);
        read_millis(timeouts, "info", tprefix, bt.timeouts.info);
    }

    read_millis(node, "queue_gap_ms", prefix, bt.queue_gap);
    read_millis(node, "init_delay_ms", prefix, bt.init_delay);
    read_millis(node, "reconnect_delay_ms", prefix, bt.reconnect_delay);
    read_millis(node, "sequence_step_delay_ms", prefix, bt.sequence_step_delay);
    read_millis(node, "battery_poll_ms", prefix, bt.battery_poll_interval);
    read_millis(node, "offline_threshold_ms", prefix, bt.offline_threshold);
    read_millis(node, "stop_grace_ms", prefix, bt.stop_grace);

    if (bt.executable.empty()) {
        throw std::runtime_error("Field 'bluetooth.executable' must not be empty");
    }
}

BridgeConfig from_root(const YAML::Node& root) {
    BridgeConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Configuration root must be a map");
    }

    if (auto server = root["server"]; server) {
        apply_server(server, config.server);
    }
    if (auto bluetooth = root["bluetooth"]; bluetooth) {
        apply_bluetooth(bluetooth, config.bluetooth);
    }
    if (auto filter = root["filter"]; filter) {
        if (auto patterns = filter["le_vendor_patterns"]; patterns) {
            config.filter.le_vendor_patterns = string_list(patterns, "filter.le_vendor_patterns");
        }
    }
    if (auto storage = root["storage"]; storage) {
        read_scalar(storage, "path", "storage.", config.storage.path);
        if (auto policy = storage["removal_policy"]; policy) {
            config.storage.removal_policy =
                parse_removal_policy(scalar_or_throw<std::string>(policy, "storage.removal_policy"));
        }
    }
    if (auto logging = root["logging"]; logging) {
        read_scalar(logging, "level", "logging.", config.log_level);
    }
    return config;
}

}  // namespace

BridgeConfig load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& ex) {
        throw std::runtime_error("Failed to load config '" + path + "': " + ex.what());
    }
    return from_root(root);
}

BridgeConfig parse_config(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& ex) {
        throw std::runtime_error(std::string("Failed to parse config: ") + ex.what());
    }
    return from_root(root);
}

RemovalPolicy parse_removal_policy(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lowered == "keep") {
        return RemovalPolicy::KeepRecord;
    }
    if (lowered == "delete") {
        return RemovalPolicy::DeleteRecord;
    }
    throw std::runtime_error("Unknown removal policy '" + value + "' (expected keep or delete)");
}

std::string to_string(RemovalPolicy policy) {
    return policy == RemovalPolicy::DeleteRecord ? "delete" : "keep";
}

}  // namespace podbridge
