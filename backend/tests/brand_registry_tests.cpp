#include <gtest/gtest.h>
#include "BrandRegistry.hpp"
#include <nlohmann/json.hpp>

using nlohmann::json;
using namespace tvlink;

namespace {

const std::vector<std::string> kUniversal = {
    "power", "volume_up", "volume_down", "mute", "channel_up", "channel_down", "home",
    "back", "up", "down", "left", "right", "enter", "menu"
};

Device device_of(Brand brand, Protocol protocol, uint16_t port = 8080) {
    Device d;
    d.id = "dev";
    d.ip = "192.168.1.40";
    d.port = port;
    d.brand = brand;
    d.protocol = protocol;
    return d;
}

std::optional<WireRequest> build(const BrandRegistry& reg, const Device& d, const std::string& logical,
                                 const json& payload = nullptr, uint64_t seq = 1) {
    const BrandProfile* p = reg.resolve(d.brand, d.protocol);
    if (!p) return std::nullopt;
    auto code = reg.translate(*p, logical);
    if (!code) return std::nullopt;
    const CommandContext ctx{d, logical, *code, payload, seq};
    return p->build(ctx);
}

} // namespace

TEST(BrandRegistry, DefaultProtocolPerBrand) {
    BrandRegistry reg;
    EXPECT_EQ(reg.default_protocol(Brand::Samsung), Protocol::WebSocket);
    EXPECT_EQ(reg.default_protocol(Brand::LG), Protocol::WebSocket);
    EXPECT_EQ(reg.default_protocol(Brand::Sony), Protocol::Http);
    EXPECT_EQ(reg.default_protocol(Brand::Philips), Protocol::Http);
    EXPECT_EQ(reg.default_protocol(Brand::Roku), Protocol::Ecp);
    EXPECT_EQ(reg.default_protocol(Brand::TCL), Protocol::Http);
    EXPECT_EQ(reg.default_protocol(Brand::AndroidTV), Protocol::Http);
    EXPECT_EQ(reg.default_protocol(Brand::Unknown), Protocol::Http);
}

TEST(BrandRegistry, ScanPortsAndFingerprintOrder) {
    BrandRegistry reg;
    const std::vector<uint16_t> expected{8080, 8001, 3000, 1925, 8060, 55000, 7345, 36669};
    EXPECT_EQ(reg.scan_ports(), expected);

    std::vector<Brand> order;
    for (const auto* p : reg.fingerprint_order()) order.push_back(p->brand);
    EXPECT_EQ(order, (std::vector<Brand>{Brand::Philips, Brand::Roku, Brand::Samsung, Brand::Sony, Brand::LG}));
    EXPECT_EQ(reg.find(Brand::Philips)->fingerprint_path, "/6/system");
    EXPECT_EQ(reg.find(Brand::Roku)->fingerprint_path, "/query/device-info");
}

TEST(BrandRegistry, EveryBrandMapsUniversalCommands) {
    BrandRegistry reg;
    for (Brand b : {Brand::Samsung, Brand::LG, Brand::Sony, Brand::Philips, Brand::Roku,
                    Brand::TCL, Brand::Hisense, Brand::Xiaomi, Brand::AndroidTV}) {
        for (const auto& cmd : kUniversal) {
            EXPECT_TRUE(reg.translate(b, cmd).has_value()) << brand_name(b) << " lacks " << cmd;
        }
    }
}

TEST(BrandRegistry, TranslatesVendorCodes) {
    BrandRegistry reg;
    EXPECT_EQ(reg.translate(Brand::Philips, "power"), std::optional<std::string>("Standby"));
    EXPECT_EQ(reg.translate(Brand::Philips, "volume_up"), std::optional<std::string>("VolumeUp"));
    EXPECT_EQ(reg.translate(Brand::Samsung, "volume_up"), std::optional<std::string>("KEY_VOLUP"));
    EXPECT_EQ(reg.translate(Brand::Roku, "enter"), std::optional<std::string>("Select"));
}

TEST(BrandRegistry, UnmappedCommandIsAbsent) {
    BrandRegistry reg;
    EXPECT_FALSE(reg.translate(Brand::Samsung, "launch_app").has_value());
    EXPECT_FALSE(reg.translate(Brand::Philips, "teleport").has_value());
    EXPECT_FALSE(reg.translate(Brand::Roku, "set_volume").has_value());
}

TEST(BrandRegistry, ResolveRejectsOnlyUnknownProtocol) {
    BrandRegistry reg;
    EXPECT_EQ(reg.resolve(Brand::Philips, Protocol::Unknown), nullptr);
    EXPECT_EQ(reg.resolve(Brand::Unknown, Protocol::Unknown), nullptr);
    ASSERT_NE(reg.resolve(Brand::Roku, Protocol::Ecp), nullptr);
    EXPECT_EQ(reg.resolve(Brand::Unknown, Protocol::Http), &reg.fallback());
    EXPECT_EQ(reg.resolve(Brand::Unknown, Protocol::WebSocket), &reg.fallback());
}

TEST(BrandRegistry, EditedProtocolKeepsBrandProfile) {
    BrandRegistry reg;
    EXPECT_EQ(reg.resolve(Brand::Samsung, Protocol::Http), reg.find(Brand::Samsung));
    const BrandProfile* sony = reg.resolve(Brand::Sony, Protocol::WebSocket);
    ASSERT_NE(sony, nullptr);
    EXPECT_EQ(sony->brand, Brand::Sony);
    EXPECT_EQ(sony->protocol, Protocol::Http);
}

TEST(BrandRegistry, FallbackForwardsLogicalName) {
    BrandRegistry reg;
    EXPECT_EQ(reg.translate(Brand::Unknown, "whatever_key"), std::optional<std::string>("whatever_key"));

    auto req = build(reg, device_of(Brand::Unknown, Protocol::Http, 9000), "power");
    ASSERT_TRUE(req);
    EXPECT_EQ(req->transport, Transport::Http);
    EXPECT_EQ(req->port, 9000);
    EXPECT_EQ(req->target, "/api/command");
    EXPECT_EQ(json::parse(req->body), (json{{"command", "power"}}));
}

TEST(BrandRegistry, SamsungFrame) {
    BrandRegistry reg;
    auto req = build(reg, device_of(Brand::Samsung, Protocol::WebSocket), "volume_up");
    ASSERT_TRUE(req);
    EXPECT_EQ(req->transport, Transport::Persistent);
    EXPECT_EQ(req->port, 8001);
    EXPECT_EQ(req->target, "/api/v2/channels/samsung.remote.control");
    const json expected = {
        {"method", "ms.remote.control"},
        {"params", {{"Cmd", "Click"}, {"DataOfCmd", "KEY_VOLUP"}, {"Option", "false"}, {"TypeOfRemote", "SendRemoteKey"}}}
    };
    EXPECT_EQ(json::parse(req->body), expected);
}

TEST(BrandRegistry, LgFrameCarriesSequenceId) {
    BrandRegistry reg;
    auto req = build(reg, device_of(Brand::LG, Protocol::WebSocket), "volume_down", nullptr, 42);
    ASSERT_TRUE(req);
    EXPECT_EQ(req->port, 3000);
    auto j = json::parse(req->body);
    EXPECT_EQ(j["type"], "request");
    EXPECT_EQ(j["id"], "ssap_42");
    EXPECT_EQ(j["uri"], "ssap://audio/volumeDown");
}

TEST(BrandRegistry, SonyIrccEnvelope) {
    BrandRegistry reg;
    auto req = build(reg, device_of(Brand::Sony, Protocol::Http, 80), "mute");
    ASSERT_TRUE(req);
    EXPECT_EQ(req->port, 80);
    EXPECT_EQ(req->target, "/sony/IRCC");
    auto j = json::parse(req->body);
    EXPECT_EQ(j["method"], "actRegister");
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["version"], "1.0");
    EXPECT_EQ(j["params"][1][0]["value"], "AAAAAQAAAAEAAAAUAw==");
    EXPECT_EQ(j["params"][1][0]["function"], "ircc");
}

TEST(BrandRegistry, PhilipsKeyAndVolume) {
    BrandRegistry reg;
    const Device tv = device_of(Brand::Philips, Protocol::Http, 1925);

    auto key = build(reg, tv, "power");
    ASSERT_TRUE(key);
    EXPECT_EQ(key->port, 1925);
    EXPECT_EQ(key->target, "/6/input/key");
    EXPECT_EQ(json::parse(key->body), (json{{"key", "Standby"}}));

    auto vol = build(reg, tv, "set_volume", 25);
    ASSERT_TRUE(vol);
    EXPECT_EQ(vol->target, "/6/audio/volume");
    EXPECT_EQ(json::parse(vol->body), (json{{"current", 25}, {"muted", false}}));

    EXPECT_FALSE(build(reg, tv, "set_volume", 150));
    EXPECT_FALSE(build(reg, tv, "set_volume", "loud"));
    EXPECT_FALSE(build(reg, tv, "set_volume"));
}

TEST(BrandRegistry, RokuPathOnlyRequests) {
    BrandRegistry reg;
    const Device tv = device_of(Brand::Roku, Protocol::Ecp, 8060);

    auto key = build(reg, tv, "home");
    ASSERT_TRUE(key);
    EXPECT_EQ(key->port, 8060);
    EXPECT_EQ(key->target, "/keypress/Home");
    EXPECT_TRUE(key->body.empty());

    auto app = build(reg, tv, "launch_app", "12");
    ASSERT_TRUE(app);
    EXPECT_EQ(app->target, "/launch/12");
    EXPECT_FALSE(build(reg, tv, "launch_app", "../etc"));
    EXPECT_FALSE(build(reg, tv, "launch_app"));
}

TEST(BrandRegistry, AndroidFamilyUsesDevicePort) {
    BrandRegistry reg;
    auto req = build(reg, device_of(Brand::TCL, Protocol::Http, 7345), "enter");
    ASSERT_TRUE(req);
    EXPECT_EQ(req->port, 7345);
    EXPECT_EQ(req->target, "/v1/projects/androidtv/key");
    EXPECT_EQ(json::parse(req->body), (json{{"key", "KEYCODE_DPAD_CENTER"}}));
    EXPECT_TRUE(reg.find(Brand::TCL)->fingerprint_path.empty());
}

TEST(BrandRegistry, AddingAProfileIsADataChange) {
    BrandRegistry reg;
    BrandProfile hisense = *reg.find(Brand::Hisense);
    hisense.fingerprint_path = "/api/hisense";
    hisense.commands["input"] = "KEYCODE_TV_INPUT";
    reg.add(hisense);

    auto order = reg.fingerprint_order();
    ASSERT_FALSE(order.empty());
    EXPECT_EQ(order.back()->brand, Brand::Hisense);
    EXPECT_EQ(reg.translate(Brand::Hisense, "input"), std::optional<std::string>("KEYCODE_TV_INPUT"));
}
