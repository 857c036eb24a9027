#pragma once
#include "Device.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tvlink {

/** @brief Caller-side device store. The discovery/dispatch core never calls it. */
class IDeviceStore {
public:
    virtual ~IDeviceStore() = default;
    virtual std::vector<Device> list() const = 0;
    // False when another id already owns the device's IP.
    virtual bool upsert(const Device& device) = 0;
    virtual bool remove(const std::string& id) = 0;
    virtual std::optional<Device> find(const std::string& id) const = 0;
};

/**
 * @brief In-memory, mutex-guarded store persisted as a JSON array.
 */
class DeviceRegistry : public IDeviceStore {
public:
    DeviceRegistry() = default;

    std::vector<Device> list() const override;
    bool upsert(const Device& device) override;
    bool remove(const std::string& id) override;
    std::optional<Device> find(const std::string& id) const override;
    std::optional<Device> find_by_ip(const std::string& ip) const;

    // Apply a function to each registered device (thread-safe)
    void for_each_device(const std::function<void(const Device&)>& fn) const;

    nlohmann::json to_json() const;

    // A missing file loads as empty. Throws std::runtime_error on malformed content.
    void load(const std::string& path);
    // Throws std::runtime_error if the file cannot be written.
    void save(const std::string& path) const;

private:
    std::vector<Device> devices_;
    mutable std::mutex registry_mutex_;
};

} // namespace tvlink
