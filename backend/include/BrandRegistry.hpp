#pragma once
#include "Device.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tvlink {

enum class Transport {
    Http,        // one request per command
    Persistent   // frame written over a ConnectionManager-owned socket
};

/** @brief A fully built vendor request, ready for the transport layer. */
struct WireRequest {
    Transport transport = Transport::Http;
    uint16_t port = 0;
    std::string target;   // HTTP path, or the socket's channel path for Persistent
    std::string body;     // empty for path-only requests
};

struct CommandContext {
    const Device& device;
    const std::string& logical;
    const std::string& code;        // translated vendor code
    const nlohmann::json& payload;  // null when the caller supplied none
    uint64_t sequence;              // per-dispatcher message counter
};

// Returns nullopt when the payload does not fit the command.
using PayloadBuilder = std::function<std::optional<WireRequest>(const CommandContext&)>;

/**
 * @brief One row of the brand table: ports, identification endpoint, command map and payload shape.
 *
 * Adding a brand means adding a profile; neither Probe nor ProtocolDispatcher branches on Brand.
 */
struct BrandProfile {
    Brand brand = Brand::Unknown;
    Protocol protocol = Protocol::Unknown;
    std::vector<uint16_t> ports;

    std::string fingerprint_path;    // empty: brand is never identified by discovery
    std::string status_path;         // empty: no status endpoint
    uint16_t status_port = 0;        // 0: use the device port

    std::map<std::string, std::string> commands;  // logical name -> vendor code
    bool forwards_any = false;       // untranslated pass-through (generic fallback)
    PayloadBuilder build;
};

/**
 * @brief Static brand -> {protocol, ports, fingerprint, command table, payload builder} mapping.
 *
 * Constructed with the built-in vendor table. `add` and `set_scan_ports` are for set-up only;
 * the registry must not be mutated while discovery or dispatch is using it.
 */
class BrandRegistry {
public:
    BrandRegistry();

    const BrandProfile* find(Brand brand) const;
    // Profile that handles `brand`; nullptr for Protocol::Unknown or an unregistered brand.
    // A protocol other than the brand's default still resolves to the brand's profile.
    // Brand::Unknown resolves to the generic fallback.
    const BrandProfile* resolve(Brand brand, Protocol protocol) const;
    const BrandProfile& fallback() const { return fallback_; }

    std::optional<std::string> translate(const BrandProfile& profile, const std::string& logical) const;
    std::optional<std::string> translate(Brand brand, const std::string& logical) const;

    Protocol default_protocol(Brand brand) const;

    // Ports tried, in order, against each discovery candidate.
    const std::vector<uint16_t>& scan_ports() const { return scan_ports_; }
    void set_scan_ports(std::vector<uint16_t> ports) { scan_ports_ = std::move(ports); }

    // Profiles with a fingerprint endpoint, most specific path first.
    std::vector<const BrandProfile*> fingerprint_order() const;

    // Replaces the profile for the same brand, if any.
    void add(BrandProfile profile);

    std::vector<std::string> logical_commands(Brand brand) const;

private:
    std::vector<BrandProfile> profiles_;
    std::vector<Brand> fingerprint_order_;
    std::vector<uint16_t> scan_ports_;
    BrandProfile fallback_;
};

} // namespace tvlink
