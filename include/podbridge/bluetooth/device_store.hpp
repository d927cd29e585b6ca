#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace podbridge::bluetooth {

struct DeviceRecord {
    std::string mac;
    std::string name;
    int rssi{-70};
    bool paired{false};
    bool trusted{false};
    bool last_connected{false};
    std::chrono::system_clock::time_point last_seen{};
    std::chrono::system_clock::time_point created_at{};
};

class DuplicateDeviceError : public std::runtime_error {
public:
    explicit DuplicateDeviceError(const std::string& mac)
        : std::runtime_error("Device already stored: " + mac) {}
};

// Durable device records keyed by canonical MAC address.
class DeviceStore {
public:
    virtual ~DeviceStore() = default;

    virtual std::optional<DeviceRecord> get(const std::string& mac) const = 0;
    // Throws DuplicateDeviceError when the MAC is already present.
    virtual void insert(const DeviceRecord& record) = 0;
    // Updates rssi and last-seen of an existing record; returns false when absent.
    virtual bool refresh(const std::string& mac, int rssi, std::chrono::system_clock::time_point seen) = 0;
    virtual bool set_paired(const std::string& mac, bool paired) = 0;
    virtual bool set_trusted(const std::string& mac, bool trusted) = 0;
    // Marks one device as last connected and clears the flag everywhere else.
    virtual bool set_last_connected(const std::string& mac) = 0;
    virtual std::optional<DeviceRecord> last_connected() const = 0;
    virtual std::vector<DeviceRecord> paired() const = 0;
    virtual bool remove(const std::string& mac) = 0;
};

// Persists the `bluetooth_devices` records as a JSON array, rewritten after
// every change.
class JsonDeviceStore : public DeviceStore {
public:
    explicit JsonDeviceStore(std::filesystem::path storage_path);

    void load();

    std::optional<DeviceRecord> get(const std::string& mac) const override;
    void insert(const DeviceRecord& record) override;
    bool refresh(const std::string& mac, int rssi, std::chrono::system_clock::time_point seen) override;
    bool set_paired(const std::string& mac, bool paired) override;
    bool set_trusted(const std::string& mac, bool trusted) override;
    bool set_last_connected(const std::string& mac) override;
    std::optional<DeviceRecord> last_connected() const override;
    std::vector<DeviceRecord> paired() const override;
    bool remove(const std::string& mac) override;

    std::size_t size() const;

private:
    void save_locked() const;

    std::filesystem::path storage_path_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, DeviceRecord> records_;
};

}  // namespace podbridge::bluetooth
