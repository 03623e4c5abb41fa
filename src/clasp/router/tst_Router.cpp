// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/router/Router.hpp>
#include <clasp/test/CatchWrapper.hpp>
#include <clasp/test/Socket.hpp>
#include <clasp/transport/UdpTransport.hpp>
#include <clasp/util/test/IoContext.hpp>

namespace clasp
{
namespace router
{
namespace
{

using Transport = transport::UdpTransport<test::Socket>;
using TestRouter = Router<Transport, util::test::IoContext&>;

const auto kEndpointA = transport::UdpEndpoint{transport::makeAddress("10.0.0.1"), 7330};
const auto kEndpointB = transport::UdpEndpoint{transport::makeAddress("10.0.0.2"), 7330};
const auto kStranger = transport::UdpEndpoint{transport::makeAddress("10.0.0.9"), 7330};

// Moves datagrams between sockets by destination endpoint
struct Network
{
  void pump()
  {
    auto delivered = true;
    while (delivered)
    {
      delivered = false;
      for (auto& sender : sockets)
      {
        auto sent = std::move(sender.sentMessages());
        sender.sentMessages().clear();
        for (const auto& datagram : sent)
        {
          delivered = true;
          for (auto& receiver : sockets)
          {
            if (receiver.endpoint() == datagram.second && !receiver.closed())
            {
              receiver.incomingMessage(sender.endpoint(), datagram.first);
            }
          }
        }
      }
    }
  }

  std::vector<test::Socket> sockets;
};

struct Node
{
  Node(util::test::IoContext& io,
       Network& net,
       const transport::UdpEndpoint& endpoint,
       RouterConfig config = {})
    : socket(endpoint)
    , router(util::injectRef(io), Transport{socket, transport::UdpConfig{}}, std::move(config))
  {
    net.sockets.push_back(socket);
    router.onAccept([this](std::shared_ptr<Session> pSession)
                    { accepted.push_back(std::move(pSession)); });
  }

  test::Socket socket;
  TestRouter router;
  std::vector<std::shared_ptr<Session>> accepted;
};

Envelope makeEnvelope(std::vector<uint8_t> payload)
{
  Envelope envelope;
  envelope.payloadType = 1;
  envelope.payload = std::move(payload);
  return envelope;
}

template <typename Payload>
std::vector<uint8_t> control(const v2::MessageType type,
                             const v2::SessionId to,
                             const Payload& payload)
{
  v2::MessageBuffer buffer;
  v2::encodeMessage(type, to, payload, std::back_inserter(buffer));
  return buffer;
}

std::vector<uint8_t> dataMessage(const v2::SessionId to, const std::vector<uint8_t>& payload)
{
  v2::MessageBuffer buffer;
  v2::encodeData(
    to, v2::DataHeader{0, 1}, payload.begin(), payload.end(), std::back_inserter(buffer));
  return buffer;
}

std::size_t countSent(test::Socket& socket, const v2::MessageType type)
{
  std::size_t count = 0;
  for (const auto& sent : socket.sentMessages())
  {
    const auto header = v2::parseMessageHeader(sent.first.begin(), sent.first.end()).first;
    count += header.messageType == type ? 1 : 0;
  }
  return count;
}

void advanceAndPump(util::test::IoContext& io,
                    Network& net,
                    const std::chrono::milliseconds duration)
{
  const auto step = std::chrono::milliseconds{250};
  for (auto elapsed = std::chrono::milliseconds{0}; elapsed < duration; elapsed += step)
  {
    io.advance(step);
    net.pump();
  }
}

} // namespace

TEST_CASE("Router | Handshake", "[Router]")
{
  util::test::IoContext io;
  Network net;
  std::vector<SessionInfo> transitions;
  Node a(io, net, kEndpointA);
  Node b(io, net, kEndpointB);

  a.router.onSessionState([&transitions](const SessionInfo& info)
                          { transitions.push_back(info); });

  const auto pSession = a.router.createSession(kEndpointB);
  CHECK(SessionState::Connecting == pSession->state());
  CHECK(1 == countSent(a.socket, v2::kHello));

  net.pump();

  REQUIRE(1 == b.accepted.size());
  const auto pPeer = b.accepted[0];
  CHECK(SessionState::Active == pSession->state());
  CHECK(SessionState::Active == pPeer->state());
  CHECK(pPeer->id() == pSession->remoteId());
  CHECK(pSession->id() == pPeer->remoteId());
  CHECK(kEndpointA == pPeer->peer());

  REQUIRE(2 == transitions.size());
  CHECK(SessionState::Connecting == transitions[0].state);
  CHECK(SessionState::Active == transitions[1].state);

  SECTION("DataFlowsBothWays")
  {
    a.router.send(pSession->id(), makeEnvelope({1, 2, 3}));
    pPeer->send(makeEnvelope({4}), io.now());
    net.pump();

    const auto atB = pPeer->tryReceive();
    REQUIRE(atB);
    CHECK(pPeer->id() == atB->sessionId);
    CHECK(0 == atB->sequence);
    CHECK((std::vector<uint8_t>{1, 2, 3}) == atB->payload);

    const auto atA = pSession->tryReceive();
    REQUIRE(atA);
    CHECK((std::vector<uint8_t>{4}) == atA->payload);
  }

  SECTION("HeartbeatsKeepSessionsAlive")
  {
    advanceAndPump(io, net, std::chrono::seconds{40});
    CHECK(SessionState::Active == pSession->state());
    CHECK(SessionState::Active == pPeer->state());
  }

  SECTION("IdleSessionsClose")
  {
    io.advance(std::chrono::milliseconds{29900});
    CHECK(SessionState::Active == pSession->state());
    io.advance(std::chrono::milliseconds{200});
    CHECK(SessionState::Closing == pSession->state());
    CHECK(1 == countSent(a.socket, v2::kGoodbye));
    io.advance(std::chrono::seconds{1});
    CHECK(SessionState::Closed == pSession->state());
    CHECK(CloseReason::IdleTimeout == pSession->reason());
    CHECK(a.router.sessions().empty());
  }

  SECTION("GoodbyeClosesPeer")
  {
    a.router.disconnect(pSession->id());
    CHECK(SessionState::Closing == pSession->state());
    CHECK(!a.router.findByPeer(kEndpointB));
    net.pump();
    CHECK(SessionState::Closed == pPeer->state());
    CHECK(CloseReason::Remote == pPeer->reason());
    CHECK(b.router.sessions().empty());

    io.advance(std::chrono::milliseconds{1250});
    CHECK(SessionState::Closed == pSession->state());
    CHECK(CloseReason::Local == pSession->reason());
  }
}

TEST_CASE("Router | ShutdownClosesSessions", "[Router]")
{
  std::vector<CloseReason> reasons;
  {
    util::test::IoContext io;
    Network net;
    Node a(io, net, kEndpointA);
    const auto pBridged = a.router.createSession(
      kStranger,
      "osc",
      {[](const Envelope&) {},
       [&reasons](const CloseReason reason) { reasons.push_back(reason); }});
    CHECK(a.socket.sentMessages().empty());
  }
  REQUIRE(1 == reasons.size());
  CHECK(CloseReason::Shutdown == reasons[0]);
}

TEST_CASE("Router | ConnectTimeout", "[Router]")
{
  util::test::IoContext io;
  Network net;
  Node a(io, net, kEndpointA);

  const auto pSession = a.router.createSession(kStranger);
  io.advance(std::chrono::milliseconds{4900});
  CHECK(SessionState::Connecting == pSession->state());
  CHECK(1 < countSent(a.socket, v2::kHello));

  io.advance(std::chrono::milliseconds{200});
  CHECK(SessionState::Closed == pSession->state());
  CHECK(CloseReason::ConnectTimeout == pSession->reason());
  CHECK(!a.router.find(pSession->id()));
  CHECK(1 == a.router.stats().sessionsClosed);
}

TEST_CASE("Router | OneLiveSessionPerPeerAndProtocol", "[Router]")
{
  util::test::IoContext io;
  Network net;
  Node a(io, net, kEndpointA);

  const auto pFirst = a.router.createSession(kStranger);
  const auto pBridged = a.router.createSession(kStranger, "osc", {[](const Envelope&) {}, {}});
  const auto pSecond = a.router.createSession(kStranger);

  CHECK(SessionState::Closed == pFirst->state());
  CHECK(CloseReason::Superseded == pFirst->reason());
  CHECK(pSecond->live());
  CHECK(pBridged->live());
  CHECK(pSecond == a.router.findByPeer(kStranger));
  CHECK(pBridged == a.router.findByPeer(kStranger, "osc"));
  CHECK(2 == a.router.sessions().size());
}

TEST_CASE("Router | SessionsAreIsolated", "[Router]")
{
  util::test::IoContext io;
  Network net;
  Node a(io, net, kEndpointA);

  std::vector<std::shared_ptr<Session>> sessions;
  for (auto i = 0; i < 50; ++i)
  {
    const auto peer = transport::UdpEndpoint{
      transport::IpAddressV4{static_cast<uint32_t>(0x0A000100 + i)}, 7330};
    sessions.push_back(a.router.createSession(peer));
  }
  CHECK(50 == a.router.sessions().size());

  a.router.closeSession(sessions[10]->id());
  a.router.send(sessions[20]->id(), makeEnvelope({1}));
  a.router.send(sessions[20]->id(), makeEnvelope({2}));

  for (auto i = 0u; i < sessions.size(); ++i)
  {
    if (i == 10)
    {
      CHECK(SessionState::Closed == sessions[i]->state());
      continue;
    }
    CHECK(SessionState::Connecting == sessions[i]->state());
    CHECK((i == 20 ? 2u : 0u) == sessions[i]->info().envelopesSent);
  }
  CHECK(49 == a.router.sessions().size());
  CHECK_THROWS_AS(a.router.send(sessions[10]->id(), makeEnvelope({3})), SessionNotFound);

  // Inbound traffic of all peers interleaved, round by round
  for (uint8_t round = 0; round < 3; ++round)
  {
    for (auto i = 0u; i < sessions.size(); ++i)
    {
      a.socket.incomingMessage(
        sessions[i]->peer(),
        dataMessage(sessions[i]->id(), {static_cast<uint8_t>(i), round}));
    }
  }
  CHECK(3 == a.router.stats().sessionNotFound);

  for (auto i = 0u; i < sessions.size(); ++i)
  {
    if (i == 10)
    {
      CHECK(!sessions[i]->tryReceive());
      continue;
    }
    CHECK(SessionState::Active == sessions[i]->state());
    for (uint8_t round = 0; round < 3; ++round)
    {
      const auto envelope = sessions[i]->tryReceive();
      REQUIRE(envelope);
      CHECK(sessions[i]->id() == envelope->sessionId);
      CHECK((std::vector<uint8_t>{static_cast<uint8_t>(i), round}) == envelope->payload);
    }
    CHECK(!sessions[i]->tryReceive());
  }
}

TEST_CASE("Router | SessionLimit", "[Router]")
{
  util::test::IoContext io;
  Network net;
  RouterConfig config;
  config.maxSessions = 2;
  Node a(io, net, kEndpointA, config);

  a.router.createSession(kEndpointB);
  a.router.createSession(kStranger);
  CHECK_THROWS_AS(a.router.createSession(kEndpointB, "osc", {[](const Envelope&) {}, {}}),
                  OtherError);
  CHECK(2 == a.router.sessions().size());
}

TEST_CASE("Router | UnsolicitedTraffic", "[Router]")
{
  util::test::IoContext io;
  Network net;
  const auto hello = control(
    v2::kHello, v2::kNoSession, wire::makePayload(SessionIdEntry{7}, PeerNameEntry{"peer"}));

  SECTION("HelloIsAccepted")
  {
    Node a(io, net, kEndpointA);
    a.socket.incomingMessage(kStranger, hello);
    REQUIRE(1 == a.accepted.size());
    CHECK(SessionState::Active == a.accepted[0]->state());
    CHECK(7 == a.accepted[0]->remoteId());
    REQUIRE(1 == a.socket.sentMessages().size());
    const auto& welcome = a.socket.sentMessages()[0];
    const auto header = v2::parseMessageHeader(welcome.first.begin(), welcome.first.end()).first;
    CHECK(v2::kWelcome == header.messageType);
    CHECK(7 == header.sessionId);
    CHECK(kStranger == welcome.second);

    // A repeated Hello is answered again without a new session
    a.socket.incomingMessage(kStranger, hello);
    CHECK(1 == a.accepted.size());
    CHECK(2 == countSent(a.socket, v2::kWelcome));
  }

  SECTION("DataOpensSession")
  {
    Node a(io, net, kEndpointA);
    a.socket.incomingMessage(kStranger, dataMessage(v2::kNoSession, {9}));
    REQUIRE(1 == a.accepted.size());
    const auto envelope = a.accepted[0]->tryReceive();
    REQUIRE(envelope);
    CHECK((std::vector<uint8_t>{9}) == envelope->payload);
  }

  SECTION("DroppedWhenNotAccepting")
  {
    RouterConfig config;
    config.acceptUnsolicited = false;
    Node a(io, net, kEndpointA, config);
    a.socket.incomingMessage(kStranger, hello);
    a.socket.incomingMessage(kStranger, dataMessage(v2::kNoSession, {9}));
    CHECK(a.accepted.empty());
    CHECK(a.router.sessions().empty());
    CHECK(a.socket.sentMessages().empty());
  }

  SECTION("UnknownSessionAndGarbage")
  {
    Node a(io, net, kEndpointA);
    a.socket.incomingMessage(kStranger, dataMessage(42, {9}));
    a.socket.incomingMessage(kStranger, std::vector<uint8_t>{1, 2, 3});
    CHECK(a.accepted.empty());
    CHECK(1 == a.router.stats().sessionNotFound);
    CHECK(1 == a.router.stats().datagramsDropped);
    CHECK(2 == a.router.stats().datagramsReceived);
  }
}

TEST_CASE("Router | BridgedSessions", "[Router]")
{
  util::test::IoContext io;
  Network net;
  std::vector<Envelope> sent;
  std::vector<CloseReason> closed;
  Node a(io, net, kEndpointA);

  const auto pSession = a.router.createSession(
    kStranger,
    "midi",
    {[&sent](const Envelope& e) { sent.push_back(e); },
     [&closed](const CloseReason reason) { closed.push_back(reason); }});

  CHECK(a.socket.sentMessages().empty());
  a.router.confirmSession(pSession->id());
  CHECK(SessionState::Active == pSession->state());

  a.router.send(pSession->id(), makeEnvelope({1}));
  REQUIRE(1 == sent.size());
  CHECK(pSession->id() == sent[0].sessionId);

  a.router.deliver(pSession->id(), makeEnvelope({2}));
  CHECK(pSession->tryReceive());

  a.router.closeSession(pSession->id());
  REQUIRE(1 == closed.size());
  CHECK(CloseReason::Local == closed[0]);
  CHECK(a.socket.sentMessages().empty());
  CHECK_THROWS_AS(a.router.confirmSession(pSession->id()), SessionNotFound);
  CHECK_THROWS_AS(a.router.deliver(pSession->id(), makeEnvelope({3})), SessionNotFound);
}

TEST_CASE("Router | TransportFailureClosesSessions", "[Router]")
{
  util::test::IoContext io;
  Network net;
  Node a(io, net, kEndpointA);
  const auto pSession = a.router.createSession(kStranger);

  a.socket.receiveError(std::make_error_code(std::errc::network_down));
  CHECK(SessionState::Closing == pSession->state());
  CHECK(CloseReason::TransportError == pSession->reason());
  io.advance(std::chrono::milliseconds{1250});
  CHECK(SessionState::Closed == pSession->state());
}

} // namespace router
} // namespace clasp
