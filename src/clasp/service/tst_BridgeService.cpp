// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/osc/OscCodec.hpp>
#include <clasp/platforms/asio/Context.hpp>
#include <clasp/service/BridgeService.hpp>
#include <clasp/test/CatchWrapper.hpp>
#include <clasp/transport/UdpTransport.hpp>
#include <future>

namespace clasp
{
namespace service
{
namespace
{

using Io = platforms::asio::Context<util::NullLog>;
using Transport = transport::UdpTransport<Io::Socket<v2::kMaxMessageSize>>;
using TestRouter = router::Router<Transport, Io&>;
using Service = BridgeService<TestRouter&>;

const auto kLoopback = transport::UdpEndpoint{transport::IpAddressV4::loopback(), 0};
const auto kTimeout = std::chrono::seconds{2};

std::unique_ptr<TestRouter> makeRouter(Io& io)
{
  return util::synchronous(io,
                           [&io]
                           {
                             return std::unique_ptr<TestRouter>(new TestRouter(
                               util::injectRef(io),
                               transport::bindUdpTransport(util::injectRef(io), kLoopback)));
                           });
}

void destroy(Io& io, std::unique_ptr<TestRouter>& pRouter)
{
  util::synchronous(io, [&pRouter] { pRouter.reset(); });
}

osc::OscConfig loopbackOsc()
{
  osc::OscConfig config;
  config.listenEndpoint = kLoopback;
  return config;
}

transport::UdpEndpoint endpointOf(const BridgeInfo& info)
{
  const auto colon = info.listenAddress.rfind(':');
  REQUIRE(std::string::npos != colon);
  return transport::makeEndpoint(
    info.listenAddress.substr(0, colon),
    static_cast<unsigned short>(std::stoi(info.listenAddress.substr(colon + 1))));
}

// Stands in for an adapter whose foreign side is down
struct OfflineBridge
{
  void send(const Envelope&) {}

  bridge::BridgeMetrics metrics() const { return {}; }

  std::vector<v2::SessionId> sessions() const { return {}; }

  bool running() const { return false; }

  void onSession(AnyBridge::SessionHandler) {}

  void onError(bridge::ErrorHandler handler) { *pReport = std::move(handler); }

  std::shared_ptr<bridge::ErrorHandler> pReport;
};

struct FixedDiscovery
{
  discovery::DiscoveryHealth health() const { return {true, false}; }
};

} // namespace

TEST_CASE("BridgeService | UnknownProtocol", "[BridgeService]")
{
  Io io;
  auto pRouter = makeRouter(io);
  {
    Service service(util::injectRef(*pRouter));
    CHECK_THROWS_AS(service.createBridge(osc::kProtocol, loopbackOsc()), OtherError);
    service.registerDefaultProtocols();
    CHECK_THROWS_AS(service.createBridge("dmx", loopbackOsc()), OtherError);
    CHECK_THROWS_AS(service.createBridge(osc::kProtocol, midi::MidiConfig{}), OtherError);
    CHECK(service.listBridges().empty());
    CHECK("idle" == service.health().status);
    CHECK_THROWS_AS(service.deleteBridge("osc-1"), OtherError);
    CHECK_THROWS_AS(service.diagnostics("osc-1"), OtherError);
  }
  destroy(io, pRouter);
}

TEST_CASE("BridgeService | OscBridgeLifecycle", "[BridgeService]")
{
  Io io;
  auto pRouter = makeRouter(io);
  std::promise<Signal> signal;
  std::promise<std::vector<uint8_t>> reply;
  auto peer = util::synchronous(
    io, [&io] { return transport::bindUdpTransport(util::injectRef(io), kLoopback); });
  util::synchronous(io,
                    [&peer, &reply]
                    {
                      peer.receive([&reply](const transport::UdpEndpoint&,
                                            const uint8_t* const begin,
                                            const uint8_t* const end)
                                   { reply.set_value(std::vector<uint8_t>(begin, end)); });
                    });
  {
    Service service(util::injectRef(*pRouter));
    service.registerDefaultProtocols();
    service.onSignal([&signal](const Signal& s) { signal.set_value(s); });

    const auto id = service.createBridge(osc::kProtocol, loopbackOsc());
    CHECK("osc-1" == id);

    const auto bridges = service.listBridges();
    REQUIRE(1 == bridges.size());
    CHECK(id == bridges[0].id);
    CHECK(osc::kProtocol == bridges[0].protocol);
    CHECK(BridgeStatus::Running == bridges[0].status);
    CHECK(!bridges[0].lastError);
    CHECK("healthy" == service.health().status);

    // Inbound OSC shows up as a signal
    const auto packet = osc::encode(osc::Message{"/fader", {0.5f}});
    const auto bridgeEndpoint = endpointOf(bridges[0]);
    util::synchronous(io, [&] { peer.send(packet, bridgeEndpoint); });
    auto futureSignal = signal.get_future();
    REQUIRE(std::future_status::ready == futureSignal.wait_for(kTimeout));
    const auto received = futureSignal.get();
    CHECK(id == received.bridgeId);
    CHECK(osc::kProtocol == received.protocol);
    CHECK("/osc/fader" == received.message.address);

    const auto diagnostics = service.diagnostics(id);
    CHECK(1 == diagnostics.metrics.messagesIn);
    CHECK(1 == diagnostics.sessions.size());
    CHECK(1 == diagnostics.info.messagesReceived);

    const auto health = service.health();
    CHECK(1 == health.bridgesRunning);
    REQUIRE(1 == health.sessions.size());
    CHECK(osc::kProtocol == health.sessions[0].protocol);
    CHECK(health.sessions[0].live);
    CHECK(!health.discovery);

    // Outbound signals reach the peer
    service.sendSignal(id, message::Message{message::Kind::Set, "/osc/fader", 0.25});
    auto futureReply = reply.get_future();
    REQUIRE(std::future_status::ready == futureReply.wait_for(kTimeout));
    const auto bytes = futureReply.get();
    const auto answer = osc::decode(bytes.begin(), bytes.end());
    REQUIRE(std::holds_alternative<osc::Message>(answer));
    CHECK("/fader" == std::get<osc::Message>(answer).address);

    const auto map = message::Message{message::Kind::Set, "/osc/m", message::Map{{"a", 1}}};
    CHECK_THROWS_AS(service.sendSignal(id, map), TranslationError);

    service.deleteBridge(id);
    CHECK(service.listBridges().empty());
    CHECK("idle" == service.health().status);
    CHECK(util::synchronous(io, [&pRouter] { return pRouter->sessions().empty(); }));
    CHECK_THROWS_AS(service.deleteBridge(id), OtherError);
    CHECK_THROWS_AS(
      service.sendSignal(id, message::Message{message::Kind::Set, "/osc/fader", 1}),
      OtherError);

    CHECK("osc-2" == service.createBridge(osc::kProtocol, loopbackOsc()));
  }
  util::synchronous(io, [&peer] { peer.close(); });
  destroy(io, pRouter);
}

TEST_CASE("BridgeService | StartCreatesConfiguredBridges", "[BridgeService]")
{
  Io io;
  auto pRouter = makeRouter(io);
  {
    BridgeServiceConfig config;
    config.osc = loopbackOsc();
    Service service(util::injectRef(*pRouter), config);
    service.registerDefaultProtocols();

    const auto ids = service.start();
    REQUIRE(1 == ids.size());
    CHECK("osc-1" == ids[0]);
    CHECK(1 == service.listBridges().size());
  }
  destroy(io, pRouter);
}

TEST_CASE("BridgeService | Health", "[BridgeService]")
{
  Io io;
  auto pRouter = makeRouter(io);
  {
    Service service(util::injectRef(*pRouter));
    service.registerDefaultProtocols();

    auto pReport = std::make_shared<bridge::ErrorHandler>();
    service.registerProtocol(
      "lamp",
      [pReport](TestRouter&, const BridgeConfig&)
      {
        auto pBridge = std::make_unique<OfflineBridge>();
        pBridge->pReport = pReport;
        return std::make_unique<AnyBridge>(std::move(pBridge), "lamp", "lamp0");
      });

    const auto lamp = service.createBridge("lamp", BridgeConfig{});
    CHECK("lamp-1" == lamp);
    CHECK("idle" == service.health().status);
    CHECK(BridgeStatus::Stopped == service.listBridges().at(0).status);

    service.createBridge(osc::kProtocol, loopbackOsc());
    auto health = service.health();
    CHECK("degraded" == health.status);
    CHECK(2 == health.bridgesTotal);
    CHECK(1 == health.bridgesRunning);

    util::synchronous(io, [&pReport] { (*pReport)("lamp offline"); });
    const auto diagnostics = service.diagnostics(lamp);
    CHECK(BridgeStatus::Error == diagnostics.info.status);
    CHECK(std::string{"lamp offline"} == diagnostics.info.lastError);
    CHECK((std::vector<std::string>{"lamp offline"}) == diagnostics.recentErrors);
    CHECK("lamp0" == diagnostics.info.listenAddress);

    FixedDiscovery discovery;
    service.watch(discovery);
    health = service.health();
    REQUIRE(health.discovery);
    CHECK(health.discovery->mdns);
    CHECK(!health.discovery->broadcast);
  }
  destroy(io, pRouter);
}

} // namespace service
} // namespace clasp
