#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace tvlink {

/** @brief Vendor family. Each brand has exactly one default Protocol in the BrandRegistry. */
enum class Brand {
    Samsung,
    LG,
    Sony,
    Philips,
    Roku,
    TCL,
    Hisense,
    Xiaomi,
    AndroidTV,
    Unknown
};

/** @brief Transport dialect used to deliver commands. */
enum class Protocol {
    Http,       // request/response
    WebSocket,  // persistent full-duplex socket
    Ecp,        // path-based external control protocol
    Unknown
};

std::string brand_name(Brand b);
std::string protocol_name(Protocol p);
// Unrecognised names (and the legacy "tvbrand.<name>" form) map to Unknown.
Brand parse_brand(const std::string& s);
Protocol parse_protocol(const std::string& s);
// Transport the vendor speaks out of the box; used when a record names no protocol.
Protocol native_protocol(Brand b);

/**
 * @brief A registered or discovered display device.
 *
 * `id` is assigned once at creation and never changes. The core only produces and
 * consumes transient copies; ownership of the records lies with the caller's store.
 */
struct Device {
    std::string id;
    std::string name;
    std::string ip;
    uint16_t port = 8080;
    Brand brand = Brand::Unknown;
    Protocol protocol = Protocol::Http;
    std::string mac_address;
    std::string model;
    bool online = false;
    bool paired = false;
    int64_t last_seen_ms = 0;
    int64_t last_command_ms = 0;
    std::optional<std::string> auth_token;
};

// Random 32-char hex identity.
std::string make_device_id();
int64_t now_ms();

void to_json(nlohmann::json& j, const Device& d);
// Throws std::runtime_error when `id` or `ip` is missing or `port` is not 1-65535.
void from_json(const nlohmann::json& j, Device& d);

} // namespace tvlink
