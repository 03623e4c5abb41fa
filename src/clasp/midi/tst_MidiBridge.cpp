// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/midi/MidiBridge.hpp>
#include <clasp/test/CatchWrapper.hpp>
#include <clasp/test/MidiPort.hpp>
#include <clasp/test/Socket.hpp>
#include <clasp/transport/UdpTransport.hpp>
#include <clasp/util/test/IoContext.hpp>

namespace clasp
{
namespace midi
{
namespace
{

using Transport = transport::UdpTransport<test::Socket>;
using TestRouter = router::Router<Transport, util::test::IoContext&>;
using Bridge = MidiBridge<TestRouter&, test::MidiPort>;

const auto kRouterEndpoint = transport::UdpEndpoint{transport::makeAddress("10.0.0.1"), 7330};

MidiConfig keysConfig()
{
  MidiConfig config;
  config.inputPort = "/dev/snd/midiC1D0";
  config.outputPort = "/dev/snd/midiC1D0";
  config.deviceName = "keys";
  return config;
}

struct Fixture
{
  explicit Fixture(const bool withOutput = true)
    : router(util::injectRef(io), Transport{test::Socket{kRouterEndpoint}, {}})
    , input("in")
    , output("out")
    , bridge(util::injectRef(router),
             input,
             withOutput ? std::optional<test::MidiPort>{output} : std::nullopt,
             keysConfig())
  {
    bridge.onError([this](const std::string& what) { errors.push_back(what); });
  }

  std::shared_ptr<router::Session> session()
  {
    const auto ids = bridge.sessions();
    REQUIRE(1 == ids.size());
    const auto pSession = router.find(ids[0]);
    REQUIRE(pSession);
    return pSession;
  }

  util::test::IoContext io;
  TestRouter router;
  test::MidiPort input;
  test::MidiPort output;
  std::vector<std::string> errors;
  Bridge bridge;
};

message::Message claspMessage(const Envelope& envelope)
{
  const auto content = message::fromEnvelope(envelope);
  REQUIRE(std::holds_alternative<message::Message>(content));
  return std::get<message::Message>(content);
}

Envelope controlChange(const int value)
{
  return message::toEnvelope(
    message::Message{message::Kind::Set, "/midi/keys/ch/0/cc/7", value});
}

} // namespace

TEST_CASE("MidiBridge | OpensSessionOnStart", "[MidiBridge]")
{
  Fixture f;
  const auto pSession = f.session();
  CHECK(router::SessionState::Active == pSession->state());
  CHECK("midi/keys" == pSession->protocol());
  CHECK("midi/keys" == f.bridge.protocol());
  CHECK(f.input.reading());
  CHECK(f.bridge.running());
  CHECK(0 == f.bridge.metrics().reconnects);
}

TEST_CASE("MidiBridge | InputReachesSession", "[MidiBridge]")
{
  Fixture f;
  const auto pSession = f.session();

  f.input.incoming({0x90, 60});
  CHECK(!pSession->tryReceive());
  CHECK(f.input.reading());

  f.input.incoming({100, 0xFE, 0xB0, 7, 64});
  const auto note = pSession->tryReceive();
  REQUIRE(note);
  CHECK("/midi/keys/ch/0/note" == claspMessage(*note).address);
  const auto cc = pSession->tryReceive();
  REQUIRE(cc);
  CHECK("/midi/keys/ch/0/cc/7" == claspMessage(*cc).address);
  CHECK(message::Value{64} == claspMessage(*cc).value);
  CHECK(!pSession->tryReceive());

  const auto metrics = f.bridge.metrics();
  CHECK(3 == metrics.messagesIn);
  CHECK(7 == metrics.bytesIn);
  CHECK(f.errors.empty());
}

TEST_CASE("MidiBridge | SessionSendWritesOutput", "[MidiBridge]")
{
  Fixture f;
  const auto pSession = f.session();

  SECTION("Message")
  {
    pSession->send(controlChange(100), f.io.now());
    CHECK((std::vector<uint8_t>{0xB0, 7, 100}) == f.output.written());
    CHECK(1 == f.bridge.metrics().messagesOut);
  }

  SECTION("Bundle")
  {
    const auto bundle = message::Bundle{
      std::nullopt,
      {message::Message{message::Kind::Publish, "/midi/keys/clock", {}},
       message::Message{message::Kind::Publish, "/midi/keys/transport", "stop"}}};
    pSession->send(message::toEnvelope(bundle), f.io.now());
    CHECK((std::vector<uint8_t>{0xF8, 0xFC}) == f.output.written());
  }

  SECTION("ThroughTheBridge")
  {
    f.bridge.send(controlChange(1));
    CHECK((std::vector<uint8_t>{0xB0, 7, 1}) == f.output.written());
  }

  SECTION("UntranslatableIsRejected")
  {
    const auto foreign =
      message::toEnvelope(message::Message{message::Kind::Set, "/osc/fader", 1});
    CHECK_THROWS_AS(pSession->send(foreign, f.io.now()), TranslationError);
    CHECK(f.output.written().empty());
    CHECK(1 == f.bridge.metrics().errors);
  }
}

TEST_CASE("MidiBridge | WithoutOutputSendingFails", "[MidiBridge]")
{
  Fixture f(false);
  CHECK_THROWS_AS(f.session()->send(controlChange(1), f.io.now()), IoError);
}

TEST_CASE("MidiBridge | ToAndFromClasp", "[MidiBridge]")
{
  Fixture f;
  CHECK(!f.bridge.toClasp({0xFE}));
  const auto envelope = f.bridge.toClasp({0xC2, 5});
  REQUIRE(envelope);
  CHECK("/midi/keys/ch/2/program" == claspMessage(*envelope).address);
  CHECK((std::vector<MidiMessage>{MidiMessage{0xC2, 5}}) == f.bridge.fromClasp(*envelope));
}

TEST_CASE("MidiBridge | PortFailureClosesSession", "[MidiBridge]")
{
  Fixture f;
  const auto pSession = f.session();

  f.input.fail(std::make_error_code(std::errc::io_error));
  CHECK(!f.bridge.running());
  CHECK(router::SessionState::Closed == pSession->state());
  CHECK(router::CloseReason::TransportError == pSession->reason());
  CHECK(f.bridge.sessions().empty());
  CHECK(1 == f.errors.size());
  CHECK(!f.input.reading());
}

TEST_CASE("MidiBridge | ClosedSessionIsReopened", "[MidiBridge]")
{
  Fixture f;
  const auto first = f.session();
  f.router.closeSession(first->id());
  CHECK(f.bridge.sessions().empty());

  f.input.incoming({0xB0, 7, 1});
  const auto second = f.session();
  CHECK(first->id() != second->id());
  CHECK(second->tryReceive());
  CHECK(1 == f.bridge.metrics().reconnects);
}

TEST_CASE("MidiBridge | DestructionClosesSessionAndPorts", "[MidiBridge]")
{
  util::test::IoContext io;
  TestRouter testRouter(util::injectRef(io), Transport{test::Socket{kRouterEndpoint}, {}});
  test::MidiPort input;
  test::MidiPort output;
  std::shared_ptr<router::Session> pSession;
  {
    Bridge bridge(util::injectRef(testRouter), input, output, keysConfig());
    pSession = testRouter.find(bridge.sessions().at(0));
  }
  REQUIRE(pSession);
  CHECK(router::CloseReason::Local == pSession->reason());
  CHECK(testRouter.sessions().empty());
  CHECK(input.closed());
  CHECK(output.closed());
}

TEST_CASE("MidiBridge | ClosingSessionsEndWithTheBridge", "[MidiBridge]")
{
  util::test::IoContext io;
  TestRouter testRouter(util::injectRef(io), Transport{test::Socket{kRouterEndpoint}, {}});
  test::MidiPort input;
  std::shared_ptr<router::Session> pOld;
  std::shared_ptr<router::Session> pNew;
  {
    Bridge bridge(util::injectRef(testRouter), input, std::nullopt, keysConfig());
    pOld = testRouter.find(bridge.sessions().at(0));
    REQUIRE(pOld);
    testRouter.disconnect(pOld->id());
    input.incoming({0xB0, 7, 1});
    pNew = testRouter.find(bridge.sessions().at(0));
    REQUIRE(pNew);
    REQUIRE(pOld->id() != pNew->id());
  }
  CHECK(router::SessionState::Closed == pOld->state());
  CHECK(router::SessionState::Closed == pNew->state());
  CHECK(testRouter.sessions().empty());
  io.advance(std::chrono::seconds{2});
}

} // namespace midi
} // namespace clasp
