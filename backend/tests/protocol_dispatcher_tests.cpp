#include <gtest/gtest.h>
#include "BrandRegistry.hpp"
#include "dispatch/ConnectionManager.hpp"
#include "dispatch/ProtocolDispatcher.hpp"
#include "fakes.hpp"

#include <chrono>
#include <set>
#include <thread>
#include <nlohmann/json.hpp>

using nlohmann::json;
using namespace tvlink;
using tvlink::fakes::FakeHttpClient;
using tvlink::fakes::FakeSocketConnector;

namespace {

constexpr std::chrono::milliseconds kTimeout{200};

Device make_tv(const std::string& id, const std::string& ip, uint16_t port, Brand brand, Protocol protocol) {
    Device d;
    d.id = id;
    d.name = id;
    d.ip = ip;
    d.port = port;
    d.brand = brand;
    d.protocol = protocol;
    return d;
}

struct DispatcherFixture : public ::testing::Test {
    BrandRegistry registry;
    FakeHttpClient http;
    FakeSocketConnector connector;
    ConnectionManager connections{connector, kTimeout};
    ProtocolDispatcher dispatcher{registry, connections, http, kTimeout};

    const Device philips = make_tv("philips", "192.168.1.11", 1925, Brand::Philips, Protocol::Http);
    const Device samsung = make_tv("samsung", "192.168.1.20", 8001, Brand::Samsung, Protocol::WebSocket);
    const Device lg = make_tv("lg", "192.168.1.21", 3000, Brand::LG, Protocol::WebSocket);
    const Device roku = make_tv("roku", "192.168.1.22", 8060, Brand::Roku, Protocol::Ecp);
};

} // namespace

TEST_F(DispatcherFixture, PhilipsPowerPostsStandby) {
    auto out = dispatcher.send(philips, {"power"});
    EXPECT_TRUE(out.delivered());
    EXPECT_EQ(out.status, CommandStatus::Delivered);

    auto posts = http.posts();
    ASSERT_EQ(posts.size(), 1u);
    EXPECT_EQ(posts[0].url, "http://192.168.1.11:1925/6/input/key");
    EXPECT_EQ(json::parse(posts[0].body), (json{{"key", "Standby"}}));
}

TEST_F(DispatcherFixture, SamsungReusesOneConnection) {
    EXPECT_TRUE(dispatcher.send(samsung, {"volume_up"}).delivered());
    EXPECT_TRUE(dispatcher.send(samsung, {"volume_up"}).delivered());

    EXPECT_EQ(connector.connects(), 1);
    EXPECT_EQ(connections.state("samsung"), ConnectionState::Established);
    auto frames = connector.frames();
    ASSERT_EQ(frames.size(), 2u);
    auto j = json::parse(frames[0]);
    EXPECT_EQ(j["method"], "ms.remote.control");
    EXPECT_EQ(j["params"]["DataOfCmd"], "KEY_VOLUP");
    EXPECT_EQ(j["params"]["Cmd"], "Click");

    auto eps = connector.endpoints();
    ASSERT_EQ(eps.size(), 1u);
    EXPECT_EQ(eps[0].host, "192.168.1.20");
    EXPECT_EQ(eps[0].port, 8001);
    EXPECT_EQ(eps[0].target, "/api/v2/channels/samsung.remote.control");
    EXPECT_TRUE(http.posts().empty());
}

TEST_F(DispatcherFixture, UnknownProtocolRejectedWithoutNetwork) {
    Device tv = philips;
    tv.protocol = Protocol::Unknown;
    auto out = dispatcher.send(tv, {"power"});
    EXPECT_EQ(out.status, CommandStatus::Rejected);
    EXPECT_EQ(out.code, errors::E3200_UNSUPPORTED_PROTOCOL);
    EXPECT_EQ(out.reason, "unsupported protocol");
    EXPECT_EQ(http.calls(), 0u);
    EXPECT_EQ(connector.connects(), 0);
}

TEST_F(DispatcherFixture, EditedProtocolStillUsesBrandTransport) {
    Device sony = make_tv("sony", "192.168.1.30", 80, Brand::Sony, Protocol::WebSocket);
    EXPECT_TRUE(dispatcher.send(sony, {"power"}).delivered());
    ASSERT_EQ(http.posts().size(), 1u);
    EXPECT_EQ(http.posts()[0].url, "http://192.168.1.30:80/sony/IRCC");
    EXPECT_EQ(connector.connects(), 0);

    Device tv = samsung;
    tv.protocol = Protocol::Http;
    EXPECT_TRUE(dispatcher.send(tv, {"power"}).delivered());
    EXPECT_EQ(connector.connects(), 1);
    EXPECT_EQ(connections.state("samsung"), ConnectionState::Established);
    EXPECT_EQ(http.posts().size(), 1u);
}

TEST_F(DispatcherFixture, RecordWithoutProtocolDispatches) {
    const json record = {{"id", "lg2"}, {"ip", "192.168.1.40"}, {"port", 3000}, {"brand", "lg"}};
    const Device tv = record.get<Device>();
    EXPECT_EQ(tv.protocol, Protocol::WebSocket);
    EXPECT_TRUE(dispatcher.send(tv, {"mute"}).delivered());
    ASSERT_EQ(connector.frames().size(), 1u);
    EXPECT_EQ(json::parse(connector.frames()[0])["uri"], "ssap://audio/setMute");
}

TEST_F(DispatcherFixture, UnmappedCommandRejectedWithoutNetwork) {
    for (const Device* tv : {&philips, &samsung, &lg, &roku}) {
        auto out = dispatcher.send(*tv, {"self_destruct"});
        EXPECT_EQ(out.status, CommandStatus::Rejected) << tv->id;
        EXPECT_EQ(out.code, errors::E3210_UNSUPPORTED_COMMAND);
        EXPECT_EQ(out.reason, "unsupported command for brand");
    }
    EXPECT_EQ(http.calls(), 0u);
    EXPECT_EQ(connector.connects(), 0);
}

TEST_F(DispatcherFixture, InvalidPayloadRejectedWithoutNetwork) {
    auto out = dispatcher.send(philips, {"set_volume", "loud"});
    EXPECT_EQ(out.status, CommandStatus::Rejected);
    EXPECT_EQ(out.code, errors::E3220_INVALID_PAYLOAD);
    EXPECT_EQ(http.calls(), 0u);

    EXPECT_TRUE(dispatcher.send(philips, {"set_volume", 30}).delivered());
    ASSERT_EQ(http.posts().size(), 1u);
    EXPECT_EQ(http.posts()[0].url, "http://192.168.1.11:1925/6/audio/volume");
}

TEST_F(DispatcherFixture, HttpErrorStatusIsTransportError) {
    http.set_post_default({500, "oops", ""});
    auto out = dispatcher.send(philips, {"mute"});
    EXPECT_EQ(out.status, CommandStatus::TransportError);
    EXPECT_EQ(out.code, errors::E3110_HTTP_STATUS);
    EXPECT_EQ(out.reason, "could not reach device: device responded with HTTP 500");
}

TEST_F(DispatcherFixture, UnreachableIsTransportError) {
    http.set_post_default({0, "", "connection timed out"});
    auto out = dispatcher.send(philips, {"mute"});
    EXPECT_EQ(out.status, CommandStatus::TransportError);
    EXPECT_EQ(out.code, errors::E3100_UNREACHABLE);
    EXPECT_EQ(out.reason, "could not reach device: connection timed out");
}

TEST_F(DispatcherFixture, ConnectFailureIsTransportError) {
    connector.fail_connect(true);
    auto out = dispatcher.send(samsung, {"power"});
    EXPECT_EQ(out.status, CommandStatus::TransportError);
    EXPECT_EQ(out.code, errors::E3120_PERSISTENT_CONNECT);
    EXPECT_EQ(out.reason.rfind(errors::MSG_UNREACHABLE_PREFIX, 0), 0u);
    EXPECT_EQ(connections.state("samsung"), ConnectionState::Absent);
}

TEST_F(DispatcherFixture, SendFailureDropsConnection) {
    ASSERT_TRUE(dispatcher.send(samsung, {"home"}).delivered());
    connector.fail_writes(true);
    auto out = dispatcher.send(samsung, {"home"});
    EXPECT_EQ(out.status, CommandStatus::TransportError);
    EXPECT_EQ(out.code, errors::E3130_SEND_FAILED);
    EXPECT_EQ(connections.state("samsung"), ConnectionState::Absent);

    connector.fail_writes(false);
    EXPECT_TRUE(dispatcher.send(samsung, {"home"}).delivered());
    EXPECT_EQ(connector.connects(), 2);
}

TEST_F(DispatcherFixture, RokuUsesPathAndEmptyBody) {
    EXPECT_TRUE(dispatcher.send(roku, {"volume_down"}).delivered());
    EXPECT_TRUE(dispatcher.send(roku, {"launch_app", "837"}).delivered());
    auto posts = http.posts();
    ASSERT_EQ(posts.size(), 2u);
    EXPECT_EQ(posts[0].url, "http://192.168.1.22:8060/keypress/VolumeDown");
    EXPECT_TRUE(posts[0].body.empty());
    EXPECT_EQ(posts[1].url, "http://192.168.1.22:8060/launch/837");
}

TEST_F(DispatcherFixture, GenericFallbackReportsRealOutcome) {
    const Device mystery = make_tv("mystery", "192.168.1.99", 9000, Brand::Unknown, Protocol::Http);
    EXPECT_TRUE(dispatcher.send(mystery, {"power"}).delivered());
    ASSERT_EQ(http.posts().size(), 1u);
    EXPECT_EQ(http.posts()[0].url, "http://192.168.1.99:9000/api/command");
    EXPECT_EQ(json::parse(http.posts()[0].body), (json{{"command", "power"}}));

    http.set_post_default({404, "", ""});
    EXPECT_EQ(dispatcher.send(mystery, {"power"}).status, CommandStatus::TransportError);
}

TEST_F(DispatcherFixture, LgFramesGetDistinctIds) {
    ASSERT_TRUE(dispatcher.send(lg, {"channel_up"}).delivered());
    ASSERT_TRUE(dispatcher.send(lg, {"channel_up"}).delivered());
    auto frames = connector.frames();
    ASSERT_EQ(frames.size(), 2u);
    auto a = json::parse(frames[0]);
    auto b = json::parse(frames[1]);
    EXPECT_EQ(a["uri"], "ssap://tv/channelUp");
    EXPECT_NE(a["id"], b["id"]);
}

TEST_F(DispatcherFixture, SequenceStopsAtFirstRejection) {
    std::vector<CommandRequest> cmds = {{"volume_up"}, {"warp_speed"}, {"volume_up"}, {"mute"}, {"home"}};
    auto out = dispatcher.send_sequence(philips, cmds, std::chrono::milliseconds(0));
    EXPECT_EQ(out.attempted, 2u);
    EXPECT_EQ(out.outcome.status, CommandStatus::Rejected);
    EXPECT_EQ(out.outcome.reason, errors::MSG_UNSUPPORTED_COMMAND);
    EXPECT_EQ(http.posts().size(), 1u);
}

TEST_F(DispatcherFixture, SequenceStopsAtFirstTransportError) {
    http.respond_post("http://192.168.1.22:8060/keypress/VolumeUp", {503, "", ""});
    std::vector<CommandRequest> cmds = {{"home"}, {"volume_up"}, {"up"}, {"down"}, {"enter"}};
    auto out = dispatcher.send_sequence(roku, cmds, std::chrono::milliseconds(0));
    EXPECT_EQ(out.attempted, 2u);
    EXPECT_EQ(out.outcome.status, CommandStatus::TransportError);
    EXPECT_EQ(http.posts().size(), 2u);
}

TEST_F(DispatcherFixture, SequenceWaitsOnlyBetweenCommands) {
    std::vector<CommandRequest> cmds = {{"up"}, {"down"}, {"left"}};
    auto start = std::chrono::steady_clock::now();
    auto out = dispatcher.send_sequence(roku, cmds, std::chrono::milliseconds(40));
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_TRUE(out.outcome.delivered());
    EXPECT_EQ(out.attempted, 3u);
    EXPECT_GE(elapsed, std::chrono::milliseconds(80));

    auto posts = http.posts();
    ASSERT_EQ(posts.size(), 3u);
    EXPECT_EQ(posts[0].url, "http://192.168.1.22:8060/keypress/Up");
    EXPECT_EQ(posts[2].url, "http://192.168.1.22:8060/keypress/Left");
}

TEST_F(DispatcherFixture, SameDeviceCommandsDoNotOverlap) {
    http.set_post_delay(std::chrono::milliseconds(30));
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([this]() { dispatcher.send(philips, {"volume_up"}); });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(http.posts().size(), 4u);
    EXPECT_EQ(http.max_concurrent_posts(), 1);
}

TEST_F(DispatcherFixture, DifferentDevicesRunConcurrently) {
    http.set_post_delay(std::chrono::milliseconds(150));
    const Device other = make_tv("philips2", "192.168.1.12", 1925, Brand::Philips, Protocol::Http);
    std::thread t1([this]() { dispatcher.send(philips, {"volume_up"}); });
    std::thread t2([this, &other]() { dispatcher.send(other, {"volume_up"}); });
    t1.join();
    t2.join();
    EXPECT_EQ(http.posts().size(), 2u);
    EXPECT_EQ(http.max_concurrent_posts(), 2);
}

TEST_F(DispatcherFixture, DeviceLocksAreReleasedAfterSend) {
    EXPECT_TRUE(dispatcher.send(philips, {"mute"}).delivered());
    EXPECT_TRUE(dispatcher.send(samsung, {"mute"}).delivered());
    EXPECT_FALSE(dispatcher.send(roku, {"self_destruct"}).delivered());
    EXPECT_EQ(dispatcher.busy_devices(), 0u);
}

TEST_F(DispatcherFixture, QueryStatus) {
    http.respond_get("http://192.168.1.11:1925/6/system", 200, R"({"name":"55PUS","country":"ES"})");
    auto status = dispatcher.query_status(philips);
    ASSERT_TRUE(status);
    EXPECT_EQ((*status)["name"], "55PUS");

    http.respond_get("http://192.168.1.22:8060/query/device-info", 200, "<device-info/>");
    auto raw = dispatcher.query_status(roku);
    ASSERT_TRUE(raw);
    EXPECT_EQ((*raw)["raw"], "<device-info/>");

    EXPECT_FALSE(dispatcher.query_status(samsung));

    const std::size_t before = http.calls();
    EXPECT_FALSE(dispatcher.query_status(make_tv("x", "192.168.1.99", 80, Brand::Unknown, Protocol::Http)));
    EXPECT_EQ(http.calls(), before);
}
