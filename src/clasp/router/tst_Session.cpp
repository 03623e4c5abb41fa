// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/router/Session.hpp>
#include <clasp/test/CatchWrapper.hpp>
#include <thread>

namespace clasp
{
namespace router
{
namespace
{

const auto kPeer = transport::UdpEndpoint{transport::makeAddress("10.0.0.2"), 7330};
const auto kT0 = Clock::time_point{std::chrono::seconds{1000}};

struct Outbox
{
  std::vector<std::pair<v2::SessionId, Envelope>> sent;
};

Envelope makeEnvelope(std::vector<uint8_t> payload)
{
  Envelope envelope;
  envelope.payloadType = 1;
  envelope.payload = std::move(payload);
  return envelope;
}

std::shared_ptr<Session> makeSession(Outbox& outbox, Session::CloseHandler closed = {})
{
  return std::make_shared<Session>(
    7,
    kPeer,
    "clasp",
    kT0,
    [&outbox](const v2::SessionId remoteId, const Envelope& envelope)
    { outbox.sent.emplace_back(remoteId, envelope); },
    std::move(closed));
}

} // namespace

TEST_CASE("Session | SendStampsIdAndSequence", "[Session]")
{
  Outbox outbox;
  auto pSession = makeSession(outbox);
  pSession->setRemoteId(42);

  pSession->send(makeEnvelope({1}), kT0);
  pSession->send(makeEnvelope({2}), kT0 + std::chrono::seconds{1});

  REQUIRE(2 == outbox.sent.size());
  CHECK(42 == outbox.sent[0].first);
  CHECK(7 == outbox.sent[0].second.sessionId);
  CHECK(0 == outbox.sent[0].second.sequence);
  CHECK(1 == outbox.sent[1].second.sequence);

  const auto info = pSession->info();
  CHECK(2 == info.envelopesSent);
  CHECK(kT0 + std::chrono::seconds{1} == info.lastActivity);
  CHECK(kT0 == info.createdAt);
}

TEST_CASE("Session | DeliverActivatesAndQueues", "[Session]")
{
  Outbox outbox;
  auto pSession = makeSession(outbox);
  CHECK(SessionState::Connecting == pSession->state());
  CHECK(!pSession->tryReceive());

  auto envelope = makeEnvelope({1, 2, 3});
  envelope.sessionId = 99;
  CHECK(pSession->deliver(envelope, kT0));
  CHECK(SessionState::Active == pSession->state());

  const auto received = pSession->tryReceive();
  REQUIRE(received);
  CHECK(7 == received->sessionId);
  CHECK((std::vector<uint8_t>{1, 2, 3}) == received->payload);
  CHECK(1 == pSession->info().envelopesReceived);
}

TEST_CASE("Session | ReceiveHandlerBypassesInbox", "[Session]")
{
  Outbox outbox;
  auto pSession = makeSession(outbox);
  std::vector<Envelope> handled;
  pSession->setReceiveHandler([&handled](const Envelope& e) { handled.push_back(e); });

  pSession->deliver(makeEnvelope({1}), kT0);
  CHECK(1 == handled.size());
  CHECK(!pSession->tryReceive());
}

TEST_CASE("Session | Closing", "[Session]")
{
  Outbox outbox;
  std::vector<CloseReason> closed;
  auto pSession =
    makeSession(outbox, [&closed](const CloseReason reason) { closed.push_back(reason); });
  pSession->confirm(kT0);
  pSession->deliver(makeEnvelope({1}), kT0);

  pSession->beginClosing(CloseReason::IdleTimeout, kT0 + std::chrono::seconds{30});
  CHECK(SessionState::Closing == pSession->state());
  CHECK(!pSession->live());
  CHECK(kT0 + std::chrono::seconds{30} == pSession->closingSince());

  CHECK_THROWS_AS(pSession->send(makeEnvelope({2}), kT0), SessionNotFound);
  CHECK(!pSession->deliver(makeEnvelope({3}), kT0));

  // What arrived before closing can still be consumed
  CHECK(pSession->receive());
  CHECK(!pSession->receive());

  pSession->close(CloseReason::Local);
  pSession->close(CloseReason::Local);
  CHECK(SessionState::Closed == pSession->state());
  REQUIRE(1 == closed.size());
  CHECK(CloseReason::IdleTimeout == closed[0]);
  CHECK(CloseReason::IdleTimeout == pSession->reason());
  CHECK(outbox.sent.empty());
}

TEST_CASE("Session | ConfirmAfterCloseFails", "[Session]")
{
  Outbox outbox;
  auto pSession = makeSession(outbox);
  pSession->close(CloseReason::ConnectTimeout);
  CHECK(!pSession->confirm(kT0));
  CHECK(CloseReason::ConnectTimeout == pSession->reason());
}

TEST_CASE("Session | AwaitConnected", "[Session]")
{
  Outbox outbox;
  auto pSession = makeSession(outbox);

  SECTION("TimesOut")
  {
    CHECK(SessionState::Connecting
          == pSession->awaitConnected(std::chrono::milliseconds{10}));
  }

  SECTION("WakesOnConfirm")
  {
    std::thread confirmer([pSession] { pSession->confirm(kT0); });
    CHECK(SessionState::Active == pSession->awaitConnected(std::chrono::seconds{5}));
    confirmer.join();
  }

  SECTION("WakesOnClose")
  {
    std::thread closer([pSession] { pSession->close(CloseReason::Shutdown); });
    CHECK(SessionState::Closed == pSession->awaitConnected(std::chrono::seconds{5}));
    closer.join();
  }

  SECTION("BlockedReceiveEndsOnClose")
  {
    std::thread closer([pSession] { pSession->close(CloseReason::Remote); });
    CHECK(!pSession->receive());
    closer.join();
  }
}

} // namespace router
} // namespace clasp
