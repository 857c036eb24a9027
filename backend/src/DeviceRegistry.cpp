#include "DeviceRegistry.hpp"
#include "core/ErrorCatalog.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace tvlink {

std::vector<Device> DeviceRegistry::list() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return devices_;
}

bool DeviceRegistry::upsert(const Device& device) {
    if (device.id.empty()) throw std::runtime_error(errors::D3410_MALFORMED_DEVICE);
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (const auto& d : devices_) {
        if (d.ip == device.ip && d.id != device.id) {
            std::cerr << "DeviceRegistry: " << device.ip << " already registered as " << d.id << std::endl;
            return false;
        }
    }
    auto it = std::find_if(devices_.begin(), devices_.end(), [&](const Device& d) { return d.id == device.id; });
    if (it != devices_.end()) {
        *it = device;
    } else {
        devices_.push_back(device);
    }
    return true;
}

bool DeviceRegistry::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = std::remove_if(devices_.begin(), devices_.end(), [&](const Device& d) { return d.id == id; });
    if (it == devices_.end()) return false;
    devices_.erase(it, devices_.end());
    return true;
}

std::optional<Device> DeviceRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (const auto& d : devices_) {
        if (d.id == id) return d;
    }
    return std::nullopt;
}

std::optional<Device> DeviceRegistry::find_by_ip(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (const auto& d : devices_) {
        if (d.ip == ip) return d;
    }
    return std::nullopt;
}

void DeviceRegistry::for_each_device(const std::function<void(const Device&)>& fn) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (const auto& d : devices_) fn(d);
}

json DeviceRegistry::to_json() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    json out = json::array();
    for (const auto& d : devices_) out.push_back(d);
    return out;
}

void DeviceRegistry::load(const std::string& path) {
    std::vector<Device> loaded;
    if (std::filesystem::exists(path)) {
        std::ifstream f(path);
        if (!f) throw std::runtime_error(std::string(errors::D3410_MALFORMED_DEVICE) + ": cannot open " + path);
        json j = json::parse(f, nullptr, false);
        if (j.is_discarded() || !j.is_array()) {
            throw std::runtime_error(std::string(errors::D3410_MALFORMED_DEVICE) + ": " + path);
        }
        for (const auto& entry : j) loaded.push_back(entry.get<Device>());
    }
    std::lock_guard<std::mutex> lock(registry_mutex_);
    devices_ = std::move(loaded);
}

void DeviceRegistry::save(const std::string& path) const {
    const json j = to_json();
    // replaced by rename once fully written
    const std::string tmp = path + ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f) throw std::runtime_error("DeviceRegistry: cannot write " + tmp);
        f << j.dump(2) << "\n";
        if (!f) throw std::runtime_error("DeviceRegistry: write failed for " + tmp);
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) throw std::runtime_error("DeviceRegistry: cannot replace " + path + ": " + ec.message());
}

} // namespace tvlink
