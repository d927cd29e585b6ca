#include "podbridge/bluetooth/device_store.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <utility>

#include <nlohmann/json.hpp>

#include "podbridge/bluetooth/device.hpp"
#include "podbridge/util/logging.hpp"

namespace podbridge::bluetooth {

namespace {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;

std::int64_t to_unix(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

Clock::time_point from_unix(std::int64_t seconds) {
    return Clock::time_point(std::chrono::seconds(seconds));
}

json to_json(const DeviceRecord& record) {
    return json{
        {"mac_address", record.mac},
        {"name", record.name},
        {"rssi", record.rssi},
        {"paired", record.paired},
        {"trusted", record.trusted},
        {"last_connected", record.last_connected},
        {"last_seen", to_unix(record.last_seen)},
        {"created_at", to_unix(record.created_at)},
    };
}

DeviceRecord from_json(const json& node) {
    DeviceRecord record;
    const auto raw_mac = node.at("mac_address").get<std::string>();
    auto mac = normalize_mac(raw_mac);
    if (!mac) {
        throw std::runtime_error("Invalid MAC address in device store: " + raw_mac);
    }
    record.mac = *mac;
    record.name = node.value("name", "");
    record.rssi = node.value("rssi", kDefaultRssi);
    record.paired = node.value("paired", false);
    record.trusted = node.value("trusted", false);
    record.last_connected = node.value("last_connected", false);
    record.last_seen = from_unix(node.value("last_seen", std::int64_t{0}));
    record.created_at = from_unix(node.value("created_at", std::int64_t{0}));
    return record;
}

}  // namespace

JsonDeviceStore::JsonDeviceStore(std::filesystem::path storage_path)
    : storage_path_(std::move(storage_path)) {}

void JsonDeviceStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();

    if (!std::filesystem::exists(storage_path_)) {
        return;
    }

    std::ifstream input(storage_path_);
    if (!input) {
        throw std::runtime_error("Failed to open device store: " + storage_path_.string());
    }

    json root;
    try {
        input >> root;
    } catch (const json::exception& ex) {
        throw std::runtime_error("Device store is not valid JSON (" + storage_path_.string() + "): " + ex.what());
    }
    if (!root.is_array()) {
        throw std::runtime_error("Device store JSON must be an array");
    }

    for (const auto& entry : root) {
        auto record = from_json(entry);
        auto key = record.mac;
        records_.insert_or_assign(std::move(key), std::move(record));
    }
    util::log::info("[database] Loaded " + std::to_string(records_.size()) + " device records");
}

std::optional<DeviceRecord> JsonDeviceStore::get(const std::string& mac) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(mac);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void JsonDeviceStore::insert(const DeviceRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = records_.try_emplace(record.mac, record);
    if (!inserted) {
        throw DuplicateDeviceError(record.mac);
    }
    if (it->second.created_at == Clock::time_point{}) {
        it->second.created_at = Clock::now();
    }
    save_locked();
}

bool JsonDeviceStore::refresh(const std::string& mac, int rssi, Clock::time_point seen) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(mac);
    if (it == records_.end()) {
        return false;
    }
    it->second.rssi = rssi;
    it->second.last_seen = seen;
    save_locked();
    return true;
}

bool JsonDeviceStore::set_paired(const std::string& mac, bool paired) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(mac);
    if (it == records_.end()) {
        return false;
    }
    it->second.paired = paired;
    it->second.last_seen = Clock::now();
    save_locked();
    return true;
}

bool JsonDeviceStore::set_trusted(const std::string& mac, bool trusted) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(mac);
    if (it == records_.end()) {
        return false;
    }
    it->second.trusted = trusted;
    it->second.last_seen = Clock::now();
    save_locked();
    return true;
}

bool JsonDeviceStore::set_last_connected(const std::string& mac) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(mac);
    if (it == records_.end()) {
        return false;
    }
    for (auto& [_, record] : records_) {
        record.last_connected = false;
    }
    it->second.last_connected = true;
    it->second.last_seen = Clock::now();
    save_locked();
    return true;
}

std::optional<DeviceRecord> JsonDeviceStore::last_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [_, record] : records_) {
        if (record.last_connected && record.paired) {
            return record;
        }
    }
    return std::nullopt;
}

std::vector<DeviceRecord> JsonDeviceStore::paired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceRecord> result;
    for (const auto& [_, record] : records_) {
        if (record.paired) {
            result.push_back(record);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const DeviceRecord& a, const DeviceRecord& b) { return a.created_at < b.created_at; });
    return result;
}

bool JsonDeviceStore::remove(const std::string& mac) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.erase(mac) == 0) {
        return false;
    }
    save_locked();
    return true;
}

std::size_t JsonDeviceStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

void JsonDeviceStore::save_locked() const {
    json root = json::array();
    std::vector<const DeviceRecord*> ordered;
    ordered.reserve(records_.size());
    for (const auto& [_, record] : records_) {
        ordered.push_back(&record);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const DeviceRecord* a, const DeviceRecord* b) { return a->mac < b->mac; });
    for (const auto* record : ordered) {
        root.push_back(to_json(*record));
    }

    const auto parent = storage_path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    std::ofstream output(storage_path_);
    if (!output) {
        throw std::runtime_error("Failed to write device store: " + storage_path_.string());
    }
    output << root.dump(2, ' ', false, json::error_handler_t::replace);
}

}  // namespace podbridge::bluetooth
