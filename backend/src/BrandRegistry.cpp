#include "BrandRegistry.hpp"

#include <algorithm>
#include <utility>

using json = nlohmann::json;

namespace tvlink {

namespace {

constexpr const char* kClientName = "tvlink";

WireRequest http_post(uint16_t port, std::string target, std::string body) {
    WireRequest req;
    req.transport = Transport::Http;
    req.port = port;
    req.target = std::move(target);
    req.body = std::move(body);
    return req;
}

// ---- payload builders -------------------------------------------------------

std::optional<WireRequest> build_samsung(const CommandContext& ctx) {
    json frame = {
        {"method", "ms.remote.control"},
        {"params", {
            {"Cmd", "Click"},
            {"DataOfCmd", ctx.code},
            {"Option", "false"},
            {"TypeOfRemote", "SendRemoteKey"}
        }}
    };
    WireRequest req;
    req.transport = Transport::Persistent;
    req.port = 8001;
    req.target = "/api/v2/channels/samsung.remote.control";
    req.body = frame.dump();
    return req;
}

std::optional<WireRequest> build_lg(const CommandContext& ctx) {
    json frame = {
        {"type", "request"},
        {"id", "ssap_" + std::to_string(ctx.sequence)},
        {"uri", "ssap://" + ctx.code}
    };
    WireRequest req;
    req.transport = Transport::Persistent;
    req.port = 3000;
    req.target = "/";
    req.body = frame.dump();
    return req;
}

std::optional<WireRequest> build_sony(const CommandContext& ctx) {
    json body = {
        {"method", "actRegister"},
        {"params", json::array({
            {{"clientid", kClientName}, {"nickname", kClientName}, {"level", "private"}},
            json::array({{{"value", ctx.code}, {"function", "ircc"}}})
        })},
        {"id", 1},
        {"version", "1.0"}
    };
    return http_post(ctx.device.port, "/sony/IRCC", body.dump());
}

std::optional<WireRequest> build_philips(const CommandContext& ctx) {
    if (ctx.logical == "set_volume") {
        if (!ctx.payload.is_number_integer()) return std::nullopt;
        const auto level = ctx.payload.get<int64_t>();
        if (level < 0 || level > 100) return std::nullopt;
        return http_post(1925, "/6/audio/volume", json{{"current", level}, {"muted", false}}.dump());
    }
    return http_post(1925, "/6/input/key", json{{"key", ctx.code}}.dump());
}

std::optional<WireRequest> build_roku(const CommandContext& ctx) {
    if (ctx.logical == "launch_app") {
        std::string app;
        if (ctx.payload.is_string()) {
            app = ctx.payload.get<std::string>();
        } else if (ctx.payload.is_number_unsigned()) {
            app = std::to_string(ctx.payload.get<uint64_t>());
        }
        if (app.empty() || app.find_first_of("/?# ") != std::string::npos) return std::nullopt;
        return http_post(8060, "/launch/" + app, "");
    }
    return http_post(8060, "/keypress/" + ctx.code, "");
}

std::optional<WireRequest> build_android_key(const CommandContext& ctx) {
    return http_post(ctx.device.port, "/v1/projects/androidtv/key", json{{"key", ctx.code}}.dump());
}

std::optional<WireRequest> build_generic(const CommandContext& ctx) {
    return http_post(ctx.device.port, "/api/command", json{{"command", ctx.logical}}.dump());
}

// ---- command tables ---------------------------------------------------------

const std::map<std::string, std::string> kSamsungKeys{
    {"power", "KEY_POWER"},
    {"volume_up", "KEY_VOLUP"},
    {"volume_down", "KEY_VOLDOWN"},
    {"mute", "KEY_MUTE"},
    {"channel_up", "KEY_CHUP"},
    {"channel_down", "KEY_CHDOWN"},
    {"home", "KEY_HOME"},
    {"back", "KEY_RETURN"},
    {"up", "KEY_UP"},
    {"down", "KEY_DOWN"},
    {"left", "KEY_LEFT"},
    {"right", "KEY_RIGHT"},
    {"enter", "KEY_ENTER"},
    {"menu", "KEY_MENU"},
};

// ssap URIs (without the scheme)
const std::map<std::string, std::string> kLgUris{
    {"power", "system/turnOff"},
    {"volume_up", "audio/volumeUp"},
    {"volume_down", "audio/volumeDown"},
    {"mute", "audio/setMute"},
    {"channel_up", "tv/channelUp"},
    {"channel_down", "tv/channelDown"},
    {"home", "system.launcher/home"},
    {"back", "system.launcher/back"},
    {"up", "system.launcher/up"},
    {"down", "system.launcher/down"},
    {"left", "system.launcher/left"},
    {"right", "system.launcher/right"},
    {"enter", "system.launcher/enter"},
    {"menu", "system.launcher/menu"},
};

// IRCC codes
const std::map<std::string, std::string> kSonyCodes{
    {"power", "AAAAAQAAAAEAAAAVAw=="},
    {"volume_up", "AAAAAQAAAAEAAAASAw=="},
    {"volume_down", "AAAAAQAAAAEAAAATAw=="},
    {"mute", "AAAAAQAAAAEAAAAUAw=="},
    {"channel_up", "AAAAAQAAAAEAAAAQAw=="},
    {"channel_down", "AAAAAQAAAAEAAAARAw=="},
    {"home", "AAAAAQAAAAEAAABgAw=="},
    {"back", "AAAAAgAAAJcAAAAjAw=="},
    {"up", "AAAAAQAAAAEAAAB0Aw=="},
    {"down", "AAAAAQAAAAEAAAB1Aw=="},
    {"left", "AAAAAQAAAAEAAAA0Aw=="},
    {"right", "AAAAAQAAAAEAAAAzAw=="},
    {"enter", "AAAAAQAAAAEAAABlAw=="},
    {"menu", "AAAAAgAAAJcAAAA2Aw=="},
};

const std::map<std::string, std::string> kPhilipsKeys{
    {"power", "Standby"},
    {"volume_up", "VolumeUp"},
    {"volume_down", "VolumeDown"},
    {"mute", "Mute"},
    {"channel_up", "ChannelStepUp"},
    {"channel_down", "ChannelStepDown"},
    {"home", "Home"},
    {"back", "Back"},
    {"up", "CursorUp"},
    {"down", "CursorDown"},
    {"left", "CursorLeft"},
    {"right", "CursorRight"},
    {"enter", "Confirm"},
    {"menu", "Options"},
    {"set_volume", "audio/volume"},
};

const std::map<std::string, std::string> kRokuKeys{
    {"power", "Power"},
    {"volume_up", "VolumeUp"},
    {"volume_down", "VolumeDown"},
    {"mute", "VolumeMute"},
    {"channel_up", "ChannelUp"},
    {"channel_down", "ChannelDown"},
    {"home", "Home"},
    {"back", "Back"},
    {"up", "Up"},
    {"down", "Down"},
    {"left", "Left"},
    {"right", "Right"},
    {"enter", "Select"},
    {"menu", "Info"},
    {"launch_app", "launch"},
};

const std::map<std::string, std::string> kAndroidKeys{
    {"power", "KEYCODE_POWER"},
    {"volume_up", "KEYCODE_VOLUME_UP"},
    {"volume_down", "KEYCODE_VOLUME_DOWN"},
    {"mute", "KEYCODE_VOLUME_MUTE"},
    {"channel_up", "KEYCODE_CHANNEL_UP"},
    {"channel_down", "KEYCODE_CHANNEL_DOWN"},
    {"home", "KEYCODE_HOME"},
    {"back", "KEYCODE_BACK"},
    {"up", "KEYCODE_DPAD_UP"},
    {"down", "KEYCODE_DPAD_DOWN"},
    {"left", "KEYCODE_DPAD_LEFT"},
    {"right", "KEYCODE_DPAD_RIGHT"},
    {"enter", "KEYCODE_DPAD_CENTER"},
    {"menu", "KEYCODE_MENU"},
};

BrandProfile android_family(Brand brand, std::vector<uint16_t> ports) {
    BrandProfile p;
    p.brand = brand;
    p.protocol = Protocol::Http;
    p.ports = std::move(ports);
    p.commands = kAndroidKeys;
    p.build = build_android_key;
    return p;
}

} // namespace

BrandRegistry::BrandRegistry() {
    scan_ports_ = {8080, 8001, 3000, 1925, 8060, 55000, 7345, 36669};

    BrandProfile philips;
    philips.brand = Brand::Philips;
    philips.protocol = Protocol::Http;
    philips.ports = {1925};
    philips.fingerprint_path = "/6/system";
    philips.status_path = "/6/system";
    philips.status_port = 1925;
    philips.commands = kPhilipsKeys;
    philips.build = build_philips;
    add(std::move(philips));

    BrandProfile roku;
    roku.brand = Brand::Roku;
    roku.protocol = Protocol::Ecp;
    roku.ports = {8060};
    roku.fingerprint_path = "/query/device-info";
    roku.status_path = "/query/device-info";
    roku.status_port = 8060;
    roku.commands = kRokuKeys;
    roku.build = build_roku;
    add(std::move(roku));

    BrandProfile samsung;
    samsung.brand = Brand::Samsung;
    samsung.protocol = Protocol::WebSocket;
    samsung.ports = {8001, 8080};
    samsung.fingerprint_path = "/api/v2/";
    samsung.status_path = "/api/v2/";
    samsung.status_port = 8001;
    samsung.commands = kSamsungKeys;
    samsung.build = build_samsung;
    add(std::move(samsung));

    BrandProfile sony;
    sony.brand = Brand::Sony;
    sony.protocol = Protocol::Http;
    sony.ports = {80, 8080};
    sony.fingerprint_path = "/sony/";
    sony.status_path = "/sony/system";
    sony.commands = kSonyCodes;
    sony.build = build_sony;
    add(std::move(sony));

    // "/" answers on nearly anything, so it is tried last.
    BrandProfile lg;
    lg.brand = Brand::LG;
    lg.protocol = Protocol::WebSocket;
    lg.ports = {3000, 3001};
    lg.fingerprint_path = "/";
    lg.status_path = "/";
    lg.status_port = 3000;
    lg.commands = kLgUris;
    lg.build = build_lg;
    add(std::move(lg));

    add(android_family(Brand::TCL, {7345}));
    add(android_family(Brand::Hisense, {36895}));
    add(android_family(Brand::Xiaomi, {6095}));
    add(android_family(Brand::AndroidTV, {8080, 9080}));

    fallback_.brand = Brand::Unknown;
    fallback_.protocol = Protocol::Http;
    fallback_.forwards_any = true;
    fallback_.build = build_generic;
}

void BrandRegistry::add(BrandProfile profile) {
    const Brand brand = profile.brand;
    const bool fingerprinted = !profile.fingerprint_path.empty();
    auto it = std::find_if(profiles_.begin(), profiles_.end(), [brand](const BrandProfile& p) { return p.brand == brand; });
    if (it != profiles_.end()) {
        *it = std::move(profile);
    } else {
        profiles_.push_back(std::move(profile));
    }

    auto ord = std::find(fingerprint_order_.begin(), fingerprint_order_.end(), brand);
    if (fingerprinted && ord == fingerprint_order_.end()) {
        fingerprint_order_.push_back(brand);
    } else if (!fingerprinted && ord != fingerprint_order_.end()) {
        fingerprint_order_.erase(ord);
    }
}

const BrandProfile* BrandRegistry::find(Brand brand) const {
    for (const auto& p : profiles_) {
        if (p.brand == brand) return &p;
    }
    return nullptr;
}

const BrandProfile* BrandRegistry::resolve(Brand brand, Protocol protocol) const {
    if (protocol == Protocol::Unknown) return nullptr;
    // A record may carry an edited protocol; the brand still decides the transport.
    if (brand == Brand::Unknown) return &fallback_;
    return find(brand);
}

std::optional<std::string> BrandRegistry::translate(const BrandProfile& profile, const std::string& logical) const {
    auto it = profile.commands.find(logical);
    if (it != profile.commands.end()) return it->second;
    if (profile.forwards_any && !logical.empty()) return logical;
    return std::nullopt;
}

std::optional<std::string> BrandRegistry::translate(Brand brand, const std::string& logical) const {
    const BrandProfile* p = brand == Brand::Unknown ? &fallback_ : find(brand);
    if (!p) return std::nullopt;
    return translate(*p, logical);
}

Protocol BrandRegistry::default_protocol(Brand brand) const {
    if (brand == Brand::Unknown) return fallback_.protocol;
    const BrandProfile* p = find(brand);
    return p ? p->protocol : Protocol::Unknown;
}

std::vector<const BrandProfile*> BrandRegistry::fingerprint_order() const {
    std::vector<const BrandProfile*> out;
    out.reserve(fingerprint_order_.size());
    for (Brand b : fingerprint_order_) {
        if (const BrandProfile* p = find(b)) out.push_back(p);
    }
    return out;
}

std::vector<std::string> BrandRegistry::logical_commands(Brand brand) const {
    std::vector<std::string> out;
    const BrandProfile* p = brand == Brand::Unknown ? &fallback_ : find(brand);
    if (!p) return out;
    for (const auto& [name, code] : p->commands) out.push_back(name);
    return out;
}

} // namespace tvlink
