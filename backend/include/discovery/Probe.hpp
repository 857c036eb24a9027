#pragma once
#include "BrandRegistry.hpp"
#include "Device.hpp"
#include "net/HttpClient.hpp"
#include "net/PortProber.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace tvlink {

struct ProbeResult {
    std::string address;
    uint16_t port = 0;                 // first accepting port, 0 when none
    Brand brand = Brand::Unknown;
    Protocol protocol = Protocol::Unknown;
    bool success = false;              // some candidate port accepted a connection

    bool identified() const { return success && brand != Brand::Unknown; }
};

/**
 * @brief Per-host classifier: bounded TCP connects over the scan ports, then HTTP fingerprints.
 *
 * Probing one host is sequential. Failures never throw; they show up as `success == false`
 * or an unidentified brand.
 */
class Probe {
public:
    Probe(const BrandRegistry& registry, net::IPortProber& prober, net::IHttpClient& http);

    // Each scan port is tried once; the first to accept within `connect_timeout` is fingerprinted.
    ProbeResult run(const std::string& address,
                    std::chrono::milliseconds connect_timeout,
                    std::chrono::milliseconds fingerprint_timeout);

    // First brand (in fingerprint precedence) whose identification endpoint answers HTTP 200.
    std::optional<Brand> fingerprint(const std::string& address, uint16_t port, std::chrono::milliseconds timeout);

    // Connect to the device port, then confirm with the brand's fingerprint endpoint if it has one.
    bool validate(const Device& device,
                  std::chrono::milliseconds connect_timeout,
                  std::chrono::milliseconds fingerprint_timeout);

private:
    const BrandRegistry& registry_;
    net::IPortProber& prober_;
    net::IHttpClient& http_;
};

} // namespace tvlink
