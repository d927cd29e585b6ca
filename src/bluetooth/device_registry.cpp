#include "podbridge/bluetooth/device_registry.hpp"

#include <algorithm>
#include <utility>

#include "podbridge/util/logging.hpp"

namespace podbridge::bluetooth {

namespace {

template <typename Fn>
void store_write(const char* what, const std::string& mac, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& ex) {
        util::log::error(std::string("[database] Failed to ") + what + " for " + mac + ": " + ex.what());
    }
}

std::optional<DeviceRecord> store_read(const DeviceStore& store, const std::string& mac) {
    try {
        return store.get(mac);
    } catch (const std::exception& ex) {
        util::log::error("[database] Failed to read device " + mac + ": " + ex.what());
        return std::nullopt;
    }
}

}  // namespace

DeviceRegistry::DeviceRegistry(DeviceStore& store, const DeviceFilter& filter,
                               std::chrono::milliseconds offline_threshold, Clock clock)
    : store_(store), filter_(filter), offline_threshold_(offline_threshold), clock_(std::move(clock)) {}

Device DeviceRegistry::from_record(const DeviceRecord& record) {
    Device device;
    device.mac = record.mac;
    device.name = record.name;
    device.rssi = record.rssi;
    device.paired = record.paired;
    device.trusted = record.trusted;
    device.last_seen = record.last_seen;
    return device;
}

void DeviceRegistry::remember_reading_locked(const std::string& mac, int rssi,
                                             std::chrono::system_clock::time_point now) {
    for (auto it = pending_rssi_.begin(); it != pending_rssi_.end();) {
        if (now - it->second.seen > offline_threshold_) {
            it = pending_rssi_.erase(it);
        } else {
            ++it;
        }
    }
    if (pending_rssi_.size() >= kMaxPendingReadings && pending_rssi_.count(mac) == 0) {
        return;
    }
    pending_rssi_[mac] = PendingReading{rssi, now};
}

Device& DeviceRegistry::insert_locked(Device device) {
    auto key = device.mac;
    auto [it, inserted] = devices_.try_emplace(std::move(key));
    if (inserted) {
        it->second.sequence = next_sequence_++;
    }
    it->second.device = std::move(device);
    return it->second.device;
}

DeviceRegistry::AnnouncementOutcome DeviceRegistry::apply_announcement(const DeviceAnnouncement& announcement) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    const auto& mac = announcement.mac;
    const auto reading = extract_rssi(announcement.raw_name);

    AnnouncementOutcome outcome;
    auto record = store_read(store_, mac);
    auto it = devices_.find(mac);

    if (it != devices_.end()) {
        auto& device = it->second.device;
        if (reading) {
            device.rssi = *reading;
        }
        device.last_seen = now;
        if (record) {
            store_write("refresh device", mac, [&] { store_.refresh(mac, device.rssi, now); });
        }
        outcome.kind = AnnouncementOutcome::Kind::Updated;
        outcome.bypassed_filter = record.has_value();
        outcome.device = device;
        return outcome;
    }

    if (record) {
        // Known devices skip the filter; their announcement text is not stable across sessions.
        auto device = from_record(*record);
        if (reading) {
            device.rssi = *reading;
        }
        device.last_seen = now;
        pending_rssi_.erase(mac);
        store_write("refresh device", mac, [&] { store_.refresh(mac, device.rssi, now); });
        outcome.kind = AnnouncementOutcome::Kind::Found;
        outcome.bypassed_filter = true;
        outcome.device = insert_locked(std::move(device));
        util::log::info("[devices] Found known device " + mac + " (" + record->name + ")");
        return outcome;
    }

    auto classification = filter_.classify(announcement.raw_name);
    if (!classification.accepted) {
        if (classification.rssi_reading) {
            remember_reading_locked(mac, *classification.rssi_reading, now);
        }
        util::log::debug("[devices] Skipping " + mac + " '" + classification.name + "' (" +
                         classification.rule + ")");
        outcome.kind = AnnouncementOutcome::Kind::Rejected;
        outcome.rule = std::move(classification.rule);
        return outcome;
    }

    Device device;
    device.mac = mac;
    device.name = classification.name;
    device.rssi = classification.rssi;
    if (!classification.rssi_reading) {
        if (auto pending = pending_rssi_.find(mac);
            pending != pending_rssi_.end() && now - pending->second.seen <= offline_threshold_) {
            device.rssi = pending->second.rssi;
        }
    }
    pending_rssi_.erase(mac);
    device.last_seen = now;

    DeviceRecord new_record;
    new_record.mac = mac;
    new_record.name = device.name;
    new_record.rssi = device.rssi;
    new_record.last_seen = now;
    new_record.created_at = now;
    try {
        store_.insert(new_record);
        util::log::info("[database] Added new device " + mac + " (" + device.name + ")");
    } catch (const DuplicateDeviceError&) {
        // Stored concurrently; the record already exists.
    } catch (const std::exception& ex) {
        util::log::error("[database] Failed to insert device " + mac + ": " + ex.what());
    }

    outcome.kind = AnnouncementOutcome::Kind::Found;
    outcome.device = insert_locked(std::move(device));
    util::log::info("[devices] Found " + mac + " (" + outcome.device->name + ")");
    return outcome;
}

std::optional<DeviceRegistry::ConnectionOutcome> DeviceRegistry::set_connected(const std::string& mac,
                                                                              bool connected) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();

    ConnectionOutcome outcome;
    auto it = devices_.find(mac);
    Device* device = nullptr;
    if (it != devices_.end()) {
        device = &it->second.device;
    } else {
        auto record = store_read(store_, mac);
        if (!record) {
            return std::nullopt;
        }
        device = &insert_locked(from_record(*record));
        outcome.loaded_from_store = true;
    }

    if (connected) {
        for (auto& [other_mac, entry] : devices_) {
            if (other_mac != mac && entry.device.is_connected) {
                entry.device.is_connected = false;
                entry.device.battery.reset();
                outcome.displaced.push_back(entry.device);
            }
        }
        device->is_connected = true;
        device->last_seen = now;
        connected_mac_ = mac;
    } else {
        device->is_connected = false;
        device->battery.reset();
        if (connected_mac_ == mac) {
            connected_mac_.reset();
        }
    }

    outcome.device = *device;
    return outcome;
}

std::optional<Device> DeviceRegistry::clear_connection() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_mac_) {
        return std::nullopt;
    }
    auto it = devices_.find(*connected_mac_);
    connected_mac_.reset();
    if (it == devices_.end()) {
        return std::nullopt;
    }
    it->second.device.is_connected = false;
    it->second.device.battery.reset();
    return it->second.device;
}

void DeviceRegistry::disconnect_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [_, entry] : devices_) {
        entry.device.is_connected = false;
        entry.device.battery.reset();
    }
    connected_mac_.reset();
}

std::optional<Device> DeviceRegistry::mark_lost(const std::string& mac) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(mac);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    auto& device = it->second.device;
    device.last_seen = {};
    device.is_connected = false;
    device.battery.reset();
    if (connected_mac_ == mac) {
        connected_mac_.reset();
    }
    return device;
}

bool DeviceRegistry::remove(const std::string& mac, RemovalPolicy policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool removed = devices_.erase(mac) > 0;
    pending_rssi_.erase(mac);
    if (connected_mac_ == mac) {
        connected_mac_.reset();
    }
    if (policy == RemovalPolicy::DeleteRecord) {
        store_write("delete device", mac, [&] { store_.remove(mac); });
    }
    return removed;
}

std::vector<std::string> DeviceRegistry::begin_scan_session() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> dropped;
    for (auto it = devices_.begin(); it != devices_.end();) {
        const auto& device = it->second.device;
        if (!device.is_connected && !store_read(store_, device.mac)) {
            dropped.push_back(device.mac);
            it = devices_.erase(it);
        } else {
            ++it;
        }
    }
    pending_rssi_.clear();
    return dropped;
}

std::size_t DeviceRegistry::load_persisted() {
    std::vector<DeviceRecord> records;
    try {
        records = store_.paired();
    } catch (const std::exception& ex) {
        util::log::error(std::string("[database] Failed to load paired devices: ") + ex.what());
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t loaded = 0;
    for (const auto& record : records) {
        if (devices_.count(record.mac) != 0) {
            continue;
        }
        insert_locked(from_record(record));
        ++loaded;
        util::log::info("[database] Loaded paired device " + record.mac + " (" + record.name + ")");
    }
    return loaded;
}

void DeviceRegistry::set_paired(const std::string& mac, bool paired) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = devices_.find(mac); it != devices_.end()) {
        it->second.device.paired = paired;
    }
    store_write("update paired flag", mac, [&] { store_.set_paired(mac, paired); });
}

void DeviceRegistry::set_trusted(const std::string& mac, bool trusted) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = devices_.find(mac); it != devices_.end()) {
        it->second.device.trusted = trusted;
    }
    store_write("update trusted flag", mac, [&] { store_.set_trusted(mac, trusted); });
}

bool DeviceRegistry::set_battery(const std::string& mac, std::optional<int> battery) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(mac);
    if (it == devices_.end() || it->second.device.battery == battery) {
        return false;
    }
    it->second.device.battery = battery;
    return true;
}

void DeviceRegistry::update_rssi(const std::string& mac, int rssi) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = devices_.find(mac); it != devices_.end()) {
        it->second.device.rssi = rssi;
    }
}

std::optional<Device> DeviceRegistry::get(const std::string& mac) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(mac);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second.device;
}

std::vector<Device> DeviceRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<const Entry*> ordered;
    ordered.reserve(devices_.size());
    for (const auto& [_, entry] : devices_) {
        ordered.push_back(&entry);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const Entry* a, const Entry* b) { return a->sequence < b->sequence; });

    std::vector<Device> result;
    result.reserve(ordered.size());
    for (const auto* entry : ordered) {
        result.push_back(entry->device);
    }
    return result;
}

std::optional<Device> DeviceRegistry::connected_device() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_mac_) {
        return std::nullopt;
    }
    auto it = devices_.find(*connected_mac_);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second.device;
}

std::optional<std::string> DeviceRegistry::connected_mac() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_mac_;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

std::size_t DeviceRegistry::pending_readings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_rssi_.size();
}

bool DeviceRegistry::is_online(const Device& device) const {
    return bluetooth::is_online(device, clock_(), offline_threshold_);
}

bool DeviceRegistry::is_online(const std::string& mac) const {
    auto device = get(mac);
    return device && is_online(*device);
}

}  // namespace podbridge::bluetooth
