#include "discovery/Probe.hpp"

namespace tvlink {

namespace {

std::string url_for(const std::string& address, uint16_t port, const std::string& path) {
    return "http://" + address + ":" + std::to_string(port) + path;
}

} // namespace

Probe::Probe(const BrandRegistry& registry, net::IPortProber& prober, net::IHttpClient& http)
    : registry_(registry), prober_(prober), http_(http) {}

ProbeResult Probe::run(const std::string& address,
                       std::chrono::milliseconds connect_timeout,
                       std::chrono::milliseconds fingerprint_timeout) {
    ProbeResult result;
    result.address = address;

    for (uint16_t port : registry_.scan_ports()) {
        if (!prober_.try_connect(address, port, connect_timeout)) continue;
        result.success = true;
        result.port = port;
        break;
    }
    if (!result.success) return result;

    if (auto brand = fingerprint(address, result.port, fingerprint_timeout)) {
        result.brand = *brand;
        result.protocol = registry_.default_protocol(*brand);
    }
    return result;
}

std::optional<Brand> Probe::fingerprint(const std::string& address, uint16_t port, std::chrono::milliseconds timeout) {
    for (const BrandProfile* profile : registry_.fingerprint_order()) {
        auto res = http_.get(url_for(address, port, profile->fingerprint_path), timeout);
        if (res.completed() && res.code == 200) return profile->brand;
    }
    return std::nullopt;
}

bool Probe::validate(const Device& device,
                     std::chrono::milliseconds connect_timeout,
                     std::chrono::milliseconds fingerprint_timeout) {
    if (!prober_.try_connect(device.ip, device.port, connect_timeout)) return false;

    const BrandProfile* profile = registry_.find(device.brand);
    if (!profile || profile->fingerprint_path.empty()) return true;

    auto res = http_.get(url_for(device.ip, device.port, profile->fingerprint_path), fingerprint_timeout);
    return res.completed() && res.code == 200;
}

} // namespace tvlink
