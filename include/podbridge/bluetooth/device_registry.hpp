#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "podbridge/bluetooth/device.hpp"
#include "podbridge/bluetooth/device_filter.hpp"
#include "podbridge/bluetooth/device_store.hpp"
#include "podbridge/bluetooth/output_parser.hpp"
#include "podbridge/util/config_loader.hpp"

namespace podbridge::bluetooth {

// Session view of every device seen since start-up, merged with the durable
// records of the device store. At most one device is connected at a time.
class DeviceRegistry {
public:
    // Upper bound on signal readings kept for devices that have not been
    // named yet.
    static constexpr std::size_t kMaxPendingReadings = 256;

    using Clock = std::function<std::chrono::system_clock::time_point()>;

    struct AnnouncementOutcome {
        enum class Kind {
            Found,
            Updated,
            Rejected,
        };

        Kind kind{Kind::Rejected};
        std::optional<Device> device;
        // Rejecting rule, empty unless kind is Rejected.
        std::string rule;
        bool bypassed_filter{false};
    };

    struct ConnectionOutcome {
        Device device;
        // The device entered the session because of this change.
        bool loaded_from_store{false};
        // Devices that lost their connected flag to keep a single active sink.
        std::vector<Device> displaced;
    };

    DeviceRegistry(DeviceStore& store, const DeviceFilter& filter, std::chrono::milliseconds offline_threshold,
                   Clock clock = [] { return std::chrono::system_clock::now(); });

    AnnouncementOutcome apply_announcement(const DeviceAnnouncement& announcement);

    std::optional<ConnectionOutcome> set_connected(const std::string& mac, bool connected);
    // Clears the current connection, returning the device that held it.
    std::optional<Device> clear_connection();
    void disconnect_all();
    std::optional<Device> mark_lost(const std::string& mac);

    bool remove(const std::string& mac, RemovalPolicy policy);
    // Drops session-only devices; returns their MAC addresses.
    std::vector<std::string> begin_scan_session();
    // Loads paired records that are not in the session yet; returns how many.
    std::size_t load_persisted();

    void set_paired(const std::string& mac, bool paired);
    void set_trusted(const std::string& mac, bool trusted);
    // Returns true when the stored level changed.
    bool set_battery(const std::string& mac, std::optional<int> battery);
    void update_rssi(const std::string& mac, int rssi);

    std::optional<Device> get(const std::string& mac) const;
    std::vector<Device> snapshot() const;
    std::optional<Device> connected_device() const;
    std::optional<std::string> connected_mac() const;
    std::size_t size() const;
    std::size_t pending_readings() const;

    bool is_online(const Device& device) const;
    bool is_online(const std::string& mac) const;

    std::chrono::milliseconds offline_threshold() const { return offline_threshold_; }
    std::chrono::system_clock::time_point now() const { return clock_(); }

private:
    struct Entry {
        Device device;
        std::uint64_t sequence{0};
    };

    struct PendingReading {
        int rssi{0};
        std::chrono::system_clock::time_point seen;
    };

    Device& insert_locked(Device device);
    void remember_reading_locked(const std::string& mac, int rssi, std::chrono::system_clock::time_point now);
    static Device from_record(const DeviceRecord& record);

    DeviceStore& store_;
    const DeviceFilter& filter_;
    const std::chrono::milliseconds offline_threshold_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> devices_;
    std::unordered_map<std::string, PendingReading> pending_rssi_;
    std::optional<std::string> connected_mac_;
    std::uint64_t next_sequence_{0};
};

}  // namespace podbridge::bluetooth
