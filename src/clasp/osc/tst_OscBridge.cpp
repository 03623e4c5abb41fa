// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/osc/OscBridge.hpp>
#include <clasp/test/CatchWrapper.hpp>
#include <clasp/test/Socket.hpp>
#include <clasp/transport/UdpTransport.hpp>
#include <clasp/util/test/IoContext.hpp>

namespace clasp
{
namespace osc
{
namespace
{

using Transport = transport::UdpTransport<test::Socket>;
using TestRouter = router::Router<Transport, util::test::IoContext&>;
using Bridge = OscBridge<TestRouter&, Transport>;

const auto kRouterEndpoint = transport::UdpEndpoint{transport::makeAddress("10.0.0.1"), 7330};
const auto kBridgeEndpoint = transport::UdpEndpoint{transport::makeAddress("10.0.0.1"), 9000};
const auto kPeer = transport::UdpEndpoint{transport::makeAddress("10.0.0.5"), 8000};
const auto kOtherPeer = transport::UdpEndpoint{transport::makeAddress("10.0.0.6"), 8000};

struct Fixture
{
  explicit Fixture(OscConfig config = {})
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

  Packet sentPacket(const std::size_t i)
  {
    const auto& bytes = socket.sentMessages().at(i).first;
    return decode(bytes.begin(), bytes.end());
  }

  util::test::IoContext io;
  TestRouter router;
  test::Socket socket;
  std::vector<std::shared_ptr<router::Session>> sessions;
  std::vector<std::string> errors;
  Bridge bridge;
};

message::Message claspMessage(const Envelope& envelope)
{
  const auto content = message::fromEnvelope(envelope);
  REQUIRE(std::holds_alternative<message::Message>(content));
  return std::get<message::Message>(content);
}

} // namespace

TEST_CASE("OscBridge | InboundCreatesSession", "[OscBridge]")
{
  Fixture f;
  f.incoming(kPeer, Message{"/fader/1", {0.5f}});

  REQUIRE(1 == f.sessions.size());
  const auto pSession = f.sessions[0];
  CHECK(router::SessionState::Active == pSession->state());
  CHECK(kProtocol == pSession->protocol());
  CHECK(kPeer == pSession->peer());

  const auto envelope = pSession->tryReceive();
  REQUIRE(envelope);
  const auto msg = claspMessage(*envelope);
  CHECK("/osc/fader/1" == msg.address);
  CHECK(message::Value{0.5} == msg.value);

  SECTION("SamePeerSameSession")
  {
    f.incoming(kPeer, Message{"/fader/2", {0.25f}});
    CHECK(1 == f.sessions.size());
    CHECK(pSession->tryReceive());
  }

  SECTION("OtherPeerOtherSession")
  {
    f.incoming(kOtherPeer, Message{"/fader/2", {0.25f}});
    REQUIRE(2 == f.sessions.size());
    CHECK(pSession->id() != f.sessions[1]->id());
    CHECK(2 == f.bridge.sessions().size());
  }

  SECTION("SendingOverTheSessionReachesThePeer")
  {
    const auto reply = message::Message{message::Kind::Set, "/osc/fader/1", 0.75};
    pSession->send(message::toEnvelope(reply), f.io.now());
    REQUIRE(1 == f.socket.sentMessages().size());
    CHECK(kPeer == f.socket.sentMessages()[0].second);
    const auto packet = f.sentPacket(0);
    REQUIRE(std::holds_alternative<Message>(packet));
    CHECK("/fader/1" == std::get<Message>(packet).address);
    CHECK(0.75f == std::get<float>(std::get<Message>(packet).arguments.at(0)));

    const auto metrics = f.bridge.metrics();
    CHECK(1 == metrics.messagesIn);
    CHECK(1 == metrics.messagesOut);
  }

  SECTION("UntranslatableOutboundIsCounted")
  {
    const auto map = message::Message{message::Kind::Set, "/osc/m", message::Map{{"a", 1}}};
    CHECK_THROWS_AS(pSession->send(message::toEnvelope(map), f.io.now()), TranslationError);
    CHECK(f.socket.sentMessages().empty());
    CHECK(1 == f.bridge.metrics().errors);
  }

  SECTION("ClosedSessionIsReplaced")
  {
    f.router.closeSession(pSession->id());
    CHECK(f.bridge.sessions().empty());
    f.incoming(kPeer, Message{"/fader/1", {0.5f}});
    REQUIRE(2 == f.sessions.size());
    CHECK(f.sessions[1]->live());
  }
}

TEST_CASE("OscBridge | InboundBundle", "[OscBridge]")
{
  Fixture f;
  Bundle bundle;
  bundle.messages = {Message{"/a", {int32_t{1}}}, Message{"/b", {int32_t{2}}}};
  f.incoming(kPeer, bundle);

  REQUIRE(1 == f.sessions.size());
  const auto envelope = f.sessions[0]->tryReceive();
  REQUIRE(envelope);
  const auto messages = message::messagesOf(message::fromEnvelope(*envelope));
  REQUIRE(2 == messages.size());
  CHECK("/osc/b" == messages[1].address);
}

TEST_CASE("OscBridge | MalformedPacketsAreReported", "[OscBridge]")
{
  Fixture f;
  f.socket.incomingMessage(kPeer, std::vector<uint8_t>{'/', 'x'});
  f.incoming(kPeer, Message{"/fader/*", {}});

  CHECK(f.sessions.empty());
  CHECK(2 == f.errors.size());
  CHECK(2 == f.bridge.metrics().errors);
  // Still listening
  f.incoming(kPeer, Message{"/fader", {}});
  CHECK(1 == f.sessions.size());
}

TEST_CASE("OscBridge | UnsolicitedPacketsCanBeRefused", "[OscBridge]")
{
  OscConfig config;
  config.acceptUnsolicited = false;
  Fixture f(config);
  f.incoming(kPeer, Message{"/fader", {}});
  CHECK(f.sessions.empty());
  CHECK(f.router.sessions().empty());

  // An explicitly accepted peer is served
  const auto pSession = f.bridge.accept(kPeer);
  f.incoming(kPeer, Message{"/fader", {}});
  CHECK(pSession->tryReceive());
}

TEST_CASE("OscBridge | SendUsesReplyEndpoint", "[OscBridge]")
{
  OscConfig config;
  config.replyEndpoint = kOtherPeer;
  Fixture f(config);

  f.bridge.send(message::toEnvelope(message::Message{message::Kind::Publish, "/osc/go", true}));
  REQUIRE(1 == f.sessions.size());
  REQUIRE(1 == f.socket.sentMessages().size());
  CHECK(kOtherPeer == f.socket.sentMessages()[0].second);

  // Replies go to the configured endpoint even for other peers
  f.incoming(kPeer, Message{"/fader", {}});
  f.sessions[1]->send(
    message::toEnvelope(message::Message{message::Kind::Set, "/osc/fader", 1}), f.io.now());
  REQUIRE(2 == f.socket.sentMessages().size());
  CHECK(kOtherPeer == f.socket.sentMessages()[1].second);
}

TEST_CASE("OscBridge | SendSkipsClosingSessions", "[OscBridge]")
{
  Fixture f;
  f.incoming(kPeer, Message{"/fader", {}});
  f.incoming(kOtherPeer, Message{"/fader", {}});
  REQUIRE(2 == f.sessions.size());
  f.router.disconnect(f.sessions[0]->id(), router::CloseReason::IdleTimeout);

  const auto set = message::Message{message::Kind::Set, "/osc/x", 1};
  f.bridge.send(message::toEnvelope(set));
  REQUIRE(1 == f.socket.sentMessages().size());
  CHECK(kOtherPeer == f.socket.sentMessages()[0].second);
  CHECK(f.errors.empty());

  SECTION("FailingPeerDoesNotStopOthers")
  {
    f.incoming(kPeer, Message{"/fader", {}});
    REQUIRE(3 == f.sessions.size());
    f.socket.failSends(true);
    CHECK_NOTHROW(f.bridge.send(message::toEnvelope(set)));
    CHECK(2 == f.errors.size());
  }

  SECTION("UntranslatableIsRejectedOnce")
  {
    const auto map = message::Message{message::Kind::Set, "/osc/m", message::Map{{"a", 1}}};
    CHECK_THROWS_AS(f.bridge.send(message::toEnvelope(map)), TranslationError);
    CHECK(1 == f.bridge.metrics().errors);
  }
}

TEST_CASE("OscBridge | TranslationHelpers", "[OscBridge]")
{
  Fixture f;
  const auto envelope = f.bridge.toClasp(Message{"/x", {int32_t{4}}});
  CHECK("/osc/x" == claspMessage(envelope).address);
  const auto packet = f.bridge.fromClasp(envelope);
  REQUIRE(std::holds_alternative<Message>(packet));
  CHECK("/x" == std::get<Message>(packet).address);
}

TEST_CASE("OscBridge | SocketFailureClosesSessions", "[OscBridge]")
{
  Fixture f;
  f.incoming(kPeer, Message{"/fader", {}});
  REQUIRE(1 == f.sessions.size());

  f.socket.receiveError(std::make_error_code(std::errc::network_down));
  CHECK(!f.bridge.running());
  CHECK(router::SessionState::Closed == f.sessions[0]->state());
  CHECK(router::CloseReason::TransportError == f.sessions[0]->reason());
  CHECK(1 == f.errors.size());
}

TEST_CASE("OscBridge | DestructionClosesSessions", "[OscBridge]")
{
  util::test::IoContext io;
  TestRouter router(util::injectRef(io), Transport{test::Socket{kRouterEndpoint}, {}});
  std::shared_ptr<router::Session> pSession;
  {
    Bridge bridge(util::injectRef(router), Transport{test::Socket{kBridgeEndpoint}, {}}, {});
    pSession = bridge.accept(kPeer);
  }
  CHECK(router::SessionState::Closed == pSession->state());
  CHECK(router::CloseReason::Local == pSession->reason());
  CHECK(router.sessions().empty());
}

TEST_CASE("OscBridge | ClosingSessionsEndWithTheBridge", "[OscBridge]")
{
  util::test::IoContext io;
  TestRouter router(util::injectRef(io), Transport{test::Socket{kRouterEndpoint}, {}});
  test::Socket socket(kBridgeEndpoint);
  std::vector<std::shared_ptr<router::Session>> sessions;
  {
    Bridge bridge(util::injectRef(router), Transport{socket, {}}, {});
    bridge.onSession([&sessions](std::shared_ptr<router::Session> pSession)
                     { sessions.push_back(std::move(pSession)); });
    socket.incomingMessage(kPeer, encode(Message{"/fader", {}}));
    REQUIRE(1 == sessions.size());
    router.disconnect(sessions[0]->id());
    socket.incomingMessage(kPeer, encode(Message{"/fader", {}}));
    REQUIRE(2 == sessions.size());
  }
  CHECK(router::SessionState::Closed == sessions[0]->state());
  CHECK(router::SessionState::Closed == sessions[1]->state());
  CHECK(router.sessions().empty());
  io.advance(std::chrono::seconds{2});
}

} // namespace osc
} // namespace clasp
