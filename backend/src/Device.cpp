#include "Device.hpp"
#include "core/ErrorCatalog.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <random>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace tvlink {

namespace {

const std::array<std::pair<Brand, const char*>, 10> kBrandNames{{
    {Brand::Samsung, "samsung"},
    {Brand::LG, "lg"},
    {Brand::Sony, "sony"},
    {Brand::Philips, "philips"},
    {Brand::Roku, "roku"},
    {Brand::TCL, "tcl"},
    {Brand::Hisense, "hisense"},
    {Brand::Xiaomi, "xiaomi"},
    {Brand::AndroidTV, "androidtv"},
    {Brand::Unknown, "unknown"},
}};

const std::array<std::pair<Protocol, const char*>, 4> kProtocolNames{{
    {Protocol::Http, "http"},
    {Protocol::WebSocket, "websocket"},
    {Protocol::Ecp, "ecp"},
    {Protocol::Unknown, "unknown"},
}};

std::string normalize(const std::string& raw, const std::string& legacy_prefix) {
    std::string s = raw;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s.rfind(legacy_prefix, 0) == 0) s = s.substr(legacy_prefix.size());
    return s;
}

uint16_t parse_port(const json& p) {
    int64_t v = 0;
    if (p.is_number_integer()) {
        v = p.get<int64_t>();
    } else if (p.is_string()) {
        const std::string text = p.get<std::string>();
        std::size_t used = 0;
        try {
            v = std::stoll(text, &used);
        } catch (const std::exception&) {
            throw std::runtime_error(errors::D3410_MALFORMED_DEVICE);
        }
        if (used != text.size()) throw std::runtime_error(errors::D3410_MALFORMED_DEVICE);
    } else {
        throw std::runtime_error(errors::D3410_MALFORMED_DEVICE);
    }
    if (v < 1 || v > 65535) throw std::runtime_error(errors::D3410_MALFORMED_DEVICE);
    return static_cast<uint16_t>(v);
}

} // namespace

std::string brand_name(Brand b) {
    for (const auto& [brand, name] : kBrandNames) {
        if (brand == b) return name;
    }
    return "unknown";
}

std::string protocol_name(Protocol p) {
    for (const auto& [proto, name] : kProtocolNames) {
        if (proto == p) return name;
    }
    return "unknown";
}

Brand parse_brand(const std::string& s) {
    const std::string n = normalize(s, "tvbrand.");
    for (const auto& [brand, name] : kBrandNames) {
        if (n == name) return brand;
    }
    return Brand::Unknown;
}

Protocol native_protocol(Brand b) {
    switch (b) {
    case Brand::Samsung:
    case Brand::LG:
        return Protocol::WebSocket;
    case Brand::Roku:
        return Protocol::Ecp;
    default:
        return Protocol::Http;
    }
}

Protocol parse_protocol(const std::string& s) {
    const std::string n = normalize(s, "tvprotocol.");
    for (const auto& [proto, name] : kProtocolNames) {
        if (n == name) return proto;
    }
    // Older records used "roku" for the ECP dialect.
    if (n == "roku") return Protocol::Ecp;
    return Protocol::Unknown;
}

std::string make_device_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(32);
    for (int i = 0; i < 32; ++i) out.push_back(hex[(rng() >> ((i % 8) * 8)) & 0xF]);
    return out;
}

int64_t now_ms() {
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

void to_json(json& j, const Device& d) {
    j = json{
        {"id", d.id},
        {"name", d.name},
        {"ip", d.ip},
        {"port", d.port},
        {"brand", brand_name(d.brand)},
        {"protocol", protocol_name(d.protocol)},
        {"mac_address", d.mac_address},
        {"model", d.model},
        {"online", d.online},
        {"paired", d.paired},
        {"last_seen_ms", d.last_seen_ms},
        {"last_command_ms", d.last_command_ms}
    };
    if (d.auth_token) j["auth_token"] = *d.auth_token;
}

void from_json(const json& j, Device& d) {
    if (!j.is_object()) throw std::runtime_error(errors::D3410_MALFORMED_DEVICE);
    d.id = j.value("id", std::string{});
    d.ip = j.value("ip", std::string{});
    if (d.id.empty() || d.ip.empty()) throw std::runtime_error(errors::D3410_MALFORMED_DEVICE);

    d.name = j.value("name", std::string{});
    d.port = j.contains("port") ? parse_port(j["port"]) : 8080;
    d.brand = parse_brand(j.value("brand", std::string("unknown")));
    d.protocol = j.contains("protocol") ? parse_protocol(j.value("protocol", std::string{})) : native_protocol(d.brand);
    d.mac_address = j.value("mac_address", std::string{});
    d.model = j.value("model", std::string{});
    d.online = j.value("online", false);
    d.paired = j.value("paired", false);
    d.last_seen_ms = j.value("last_seen_ms", int64_t{0});
    d.last_command_ms = j.value("last_command_ms", int64_t{0});
    if (j.contains("auth_token") && j["auth_token"].is_string()) {
        d.auth_token = j["auth_token"].get<std::string>();
    } else {
        d.auth_token.reset();
    }
}

} // namespace tvlink
