// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/artnet/ArtNetBridge.hpp>
#include <clasp/test/CatchWrapper.hpp>
#include <clasp/test/Socket.hpp>
#include <clasp/transport/UdpTransport.hpp>
#include <clasp/util/test/IoContext.hpp>

namespace clasp
{
namespace artnet
{
namespace
{

using Transport = transport::UdpTransport<test::Socket>;
using TestRouter = router::Router<Transport, util::test::IoContext&>;
using Bridge = ArtNetBridge<TestRouter&, Transport>;

const auto kRouterEndpoint = transport::UdpEndpoint{transport::makeAddress("10.0.0.1"), 7330};
const auto kBridgeEndpoint = transport::UdpEndpoint{transport::makeAddress("10.0.0.1"), kPort};
const auto kNode = transport::UdpEndpoint{transport::makeAddress("10.0.0.20"), kPort};
const auto kOtherNode = transport::UdpEndpoint{transport::makeAddress("10.0.0.21"), kPort};
const auto kRemote = transport::UdpEndpoint{transport::makeAddress("10.0.0.30"), kPort};

struct Fixture
{
  explicit Fixture(ArtNetConfig config = {})
    : router(util::injectRef(io), Transport{test::Socket{kRouterEndpoint}, {}})
    , socket(kBridgeEndpoint)
    , bridge(util::injectRef(router), Transport{socket, {}}, std::move(config))
  {
    bridge.onSession([this](std::shared_ptr<router::Session> pSession)
                     { sessions.push_back(std::move(pSession)); });
    bridge.onError([this](const std::string& what) { errors.push_back(what); });
  }

  void incoming(const transport::UdpEndpoint& from, const Packet& packet)
  {
    socket.incomingMessage(from, encode(packet));
  }

  // Odd lengths are padded on the wire, so the fixtures use even ones
  void frame(const uint16_t universe,
             std::vector<uint8_t> data,
             const transport::UdpEndpoint& from = kNode)
  {
    Dmx dmx;
    dmx.universe = universe;
    dmx.data = std::move(data);
    incoming(from, dmx);
  }

  Dmx sentFrame(const std::size_t i)
  {
    const auto& bytes = socket.sentMessages().at(i).first;
    const auto packet = decode(bytes.begin(), bytes.end());
    REQUIRE(std::holds_alternative<Dmx>(packet));
    return std::get<Dmx>(packet);
  }

  util::test::IoContext io;
  TestRouter router;
  test::Socket socket;
  std::vector<std::shared_ptr<router::Session>> sessions;
  std::vector<std::string> errors;
  Bridge bridge;
};

std::vector<message::Message> received(router::Session& session)
{
  const auto envelope = session.tryReceive();
  if (!envelope)
  {
    return {};
  }
  return message::messagesOf(message::fromEnvelope(*envelope));
}

Envelope level(const std::string& address, const int value)
{
  return message::toEnvelope(message::Message{message::Kind::Set, address, value});
}

} // namespace

TEST_CASE("ArtNetBridge | InboundFramesAreReducedToChanges", "[ArtNetBridge]")
{
  Fixture f;
  f.frame(0, {1, 2, 3, 4});

  REQUIRE(1 == f.sessions.size());
  auto& session = *f.sessions[0];
  CHECK(router::SessionState::Active == session.state());
  CHECK(kProtocol == session.protocol());
  CHECK(kNode == session.peer());

  const auto first = received(session);
  REQUIRE(4 == first.size());
  CHECK("/artnet/0/1" == first[0].address);
  CHECK(message::Value{3} == first[2].value);

  SECTION("UnchangedFrameIsSilent")
  {
    f.frame(0, {1, 2, 3, 4});
    CHECK(received(session).empty());
  }

  SECTION("ChangedChannel")
  {
    f.frame(0, {1, 9, 3, 4});
    const auto delta = received(session);
    REQUIRE(1 == delta.size());
    CHECK("/artnet/0/2" == delta[0].address);
    CHECK(message::Value{9} == delta[0].value);
  }

  SECTION("UniversesAreTrackedSeparately")
  {
    f.frame(1, {1, 2, 3, 4});
    CHECK(4 == received(session).size());
    CHECK(1 == f.sessions.size());
  }

  SECTION("NodesAreTrackedSeparately")
  {
    f.frame(0, {1, 2, 3, 4}, kOtherNode);
    REQUIRE(2 == f.sessions.size());
    CHECK(kOtherNode == f.sessions[1]->peer());
    CHECK(4 == received(*f.sessions[1]).size());
    CHECK(received(session).empty());
  }

  SECTION("ReplacementSessionStartsFromFullFrame")
  {
    f.router.disconnect(session.id(), router::CloseReason::IdleTimeout);
    f.frame(0, {1, 2, 3, 4});
    REQUIRE(2 == f.sessions.size());
    CHECK(f.sessions[1]->live());
    CHECK(4 == received(*f.sessions[1]).size());
  }
}

TEST_CASE("ArtNetBridge | UniverseFilter", "[ArtNetBridge]")
{
  ArtNetConfig config;
  config.universes = {1};
  Fixture f(config);
  f.frame(0, {1});
  CHECK(f.sessions.empty());
  f.frame(1, {1});
  CHECK(1 == f.sessions.size());
}

TEST_CASE("ArtNetBridge | UnsolicitedFramesCanBeRefused", "[ArtNetBridge]")
{
  ArtNetConfig config;
  config.acceptUnsolicited = false;
  Fixture f(config);
  f.frame(0, {1});
  CHECK(f.router.sessions().empty());

  // The first frame of a session carries every channel
  const auto pSession = f.bridge.accept(kNode);
  f.frame(0, {2, 0});
  CHECK(2 == received(*pSession).size());
  f.frame(0, {2, 7});
  CHECK(1 == received(*pSession).size());
}

TEST_CASE("ArtNetBridge | MalformedPacketsAreReported", "[ArtNetBridge]")
{
  Fixture f;
  f.socket.incomingMessage(kNode, std::vector<uint8_t>{'A', 'r', 't'});
  CHECK(f.sessions.empty());
  CHECK(1 == f.errors.size());
  CHECK(1 == f.bridge.metrics().errors);
  f.frame(0, {1});
  CHECK(1 == f.sessions.size());
}

TEST_CASE("ArtNetBridge | OutboundFrameRate", "[ArtNetBridge]")
{
  Fixture f;
  f.frame(0, {0});
  auto& session = *f.sessions[0];

  // A quiet universe goes out at once
  session.send(level("/artnet/0/1", 255), f.io.now());
  REQUIRE(1 == f.socket.sentMessages().size());
  CHECK(kNode == f.socket.sentMessages()[0].second);
  auto dmx = f.sentFrame(0);
  CHECK(1 == dmx.sequence);
  CHECK((std::vector<uint8_t>{255, 0}) == dmx.data);

  // Further writes within the frame period are collected
  session.send(level("/artnet/0/1", 10), f.io.now());
  session.send(level("/artnet/0/3", 20), f.io.now());
  CHECK(1 == f.socket.sentMessages().size());

  f.io.advance(std::chrono::milliseconds{25});
  REQUIRE(2 == f.socket.sentMessages().size());
  dmx = f.sentFrame(1);
  CHECK(2 == dmx.sequence);
  CHECK((std::vector<uint8_t>{10, 0, 20, 0}) == dmx.data);

  f.io.advance(std::chrono::milliseconds{100});
  CHECK(2 == f.socket.sentMessages().size());
  CHECK(2 == f.bridge.metrics().messagesOut);
}

TEST_CASE("ArtNetBridge | RefreshEveryFrame", "[ArtNetBridge]")
{
  ArtNetConfig config;
  config.sendDeltasOnly = false;
  Fixture f(config);
  const auto pSession = f.bridge.accept(kNode);

  pSession->send(level("/artnet/2/1", 1), f.io.now());
  CHECK(1 == f.socket.sentMessages().size());
  f.io.advance(std::chrono::milliseconds{50});
  REQUIRE(3 == f.socket.sentMessages().size());
  CHECK(f.sentFrame(0).data == f.sentFrame(2).data);
  CHECK(2 == f.sentFrame(2).universe);
}

TEST_CASE("ArtNetBridge | SendToRemoteEndpoint", "[ArtNetBridge]")
{
  ArtNetConfig config;
  config.remoteEndpoint = kRemote;
  Fixture f(config);

  f.bridge.send(level("/artnet/0/1", 1));
  REQUIRE(1 == f.sessions.size());
  CHECK(kRemote == f.sessions[0]->peer());
  REQUIRE(1 == f.socket.sentMessages().size());
  CHECK(kRemote == f.socket.sentMessages()[0].second);

  // Frames of every node go to the remote endpoint
  f.frame(0, {1});
  f.sessions.at(1)->send(level("/artnet/4/1", 1), f.io.now());
  REQUIRE(2 == f.socket.sentMessages().size());
  CHECK(kRemote == f.socket.sentMessages()[1].second);
}

TEST_CASE("ArtNetBridge | SendSkipsClosingSessions", "[ArtNetBridge]")
{
  Fixture f;
  f.frame(0, {1, 2});
  f.frame(0, {1, 2}, kOtherNode);
  REQUIRE(2 == f.sessions.size());
  f.router.disconnect(f.sessions[0]->id(), router::CloseReason::IdleTimeout);

  f.bridge.send(level("/artnet/0/1", 5));
  REQUIRE(1 == f.socket.sentMessages().size());
  CHECK(kOtherNode == f.socket.sentMessages()[0].second);
  CHECK(f.errors.empty());
}

TEST_CASE("ArtNetBridge | SendFailureOfOneNodeIsReported", "[ArtNetBridge]")
{
  Fixture f;
  f.frame(0, {1, 2});
  f.frame(0, {1, 2}, kOtherNode);
  f.socket.failSends(true);

  CHECK_NOTHROW(f.bridge.send(level("/artnet/0/1", 5)));
  CHECK(2 == f.errors.size());
  CHECK(2 == f.bridge.metrics().errors);
}

TEST_CASE("ArtNetBridge | UntranslatableOutboundIsCounted", "[ArtNetBridge]")
{
  Fixture f;
  const auto pSession = f.bridge.accept(kNode);
  CHECK_THROWS_AS(pSession->send(level("/artnet/0/600", 1), f.io.now()), TranslationError);
  CHECK(f.socket.sentMessages().empty());
  CHECK(1 == f.bridge.metrics().errors);
}

TEST_CASE("ArtNetBridge | Poll", "[ArtNetBridge]")
{
  Fixture f;
  f.bridge.poll();
  REQUIRE(1 == f.socket.sentMessages().size());
  const auto& sent = f.socket.sentMessages()[0];
  CHECK((transport::UdpEndpoint{transport::IpAddressV4::broadcast(), kPort}) == sent.second);
  CHECK(std::holds_alternative<Poll>(decode(sent.first.begin(), sent.first.end())));

  PollReply reply;
  reply.address = kNode.address().to_v4();
  reply.shortName = "dimmer";
  reply.longName = "Dimmer rack";
  reply.subSwitch = 2;
  f.incoming(kNode, reply);
  f.incoming(kNode, reply);

  const auto nodes = f.bridge.nodes();
  REQUIRE(1 == nodes.size());
  CHECK(kNode == nodes[0].endpoint);
  CHECK("dimmer" == nodes[0].shortName);
  CHECK(2 == nodes[0].subSwitch);

  // Polls from others get no session
  f.incoming(kRemote, Poll{});
  CHECK(f.sessions.empty());
}

TEST_CASE("ArtNetBridge | SocketFailureClosesSessions", "[ArtNetBridge]")
{
  Fixture f;
  f.frame(0, {1});
  REQUIRE(1 == f.sessions.size());

  f.socket.receiveError(std::make_error_code(std::errc::network_down));
  CHECK(!f.bridge.running());
  CHECK(router::CloseReason::TransportError == f.sessions[0]->reason());
  CHECK(f.bridge.sessions().empty());
  CHECK(1 == f.errors.size());
}

TEST_CASE("ArtNetBridge | DestructionClosesSessions", "[ArtNetBridge]")
{
  util::test::IoContext io;
  TestRouter router(util::injectRef(io), Transport{test::Socket{kRouterEndpoint}, {}});
  test::Socket socket(kBridgeEndpoint);
  std::shared_ptr<router::Session> pSession;
  {
    Bridge bridge(util::injectRef(router), Transport{socket, {}}, {});
    pSession = bridge.accept(kNode);
  }
  CHECK(router::CloseReason::Local == pSession->reason());
  CHECK(router.sessions().empty());
  CHECK(socket.closed());
  // The frame timer is gone with the bridge
  io.advance(std::chrono::milliseconds{100});
}

TEST_CASE("ArtNetBridge | ClosingSessionsEndWithTheBridge", "[ArtNetBridge]")
{
  util::test::IoContext io;
  TestRouter router(util::injectRef(io), Transport{test::Socket{kRouterEndpoint}, {}});
  std::shared_ptr<router::Session> pOld;
  std::shared_ptr<router::Session> pNew;
  {
    Bridge bridge(util::injectRef(router), Transport{test::Socket{kBridgeEndpoint}, {}}, {});
    pOld = bridge.accept(kNode);
    router.disconnect(pOld->id());
    pNew = bridge.accept(kNode);
    REQUIRE(pOld->id() != pNew->id());
  }
  CHECK(router::SessionState::Closed == pOld->state());
  CHECK(router::SessionState::Closed == pNew->state());
  CHECK(router.sessions().empty());
  io.advance(std::chrono::seconds{2});
  CHECK_THROWS_AS(pNew->send(level("/artnet/0/1", 1), io.now()), SessionNotFound);
}

} // namespace artnet
} // namespace clasp
