// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/Client.hpp>
#include <clasp/platforms/asio/Context.hpp>
#include <clasp/test/CatchWrapper.hpp>
#include <clasp/transport/UdpTransport.hpp>
#include <future>

namespace clasp
{
namespace
{

using Io = platforms::asio::Context<util::NullLog>;
using Transport = transport::UdpTransport<Io::Socket<v2::kMaxMessageSize>>;
using TestRouter = router::Router<Transport, Io&>;

const auto kLoopback = transport::UdpEndpoint{transport::IpAddressV4::loopback(), 0};

// Routers live on the io thread
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

struct NoDevices
{
  std::optional<discovery::Device> find(const discovery::DeviceId&) const
  {
    return std::nullopt;
  }
};

} // namespace

TEST_CASE("Client | ConnectTimeout", "[Client]")
{
  Io io;
  auto pRouter = makeRouter(io);
  const auto nobody = transport::UdpEndpoint{transport::IpAddressV4::loopback(), 9};

  ClientConfig config;
  config.connectTimeout = std::chrono::milliseconds{200};
  CHECK_THROWS_AS(Client<TestRouter>::connect(*pRouter, nobody, config), ConnectTimeout);

  const auto sessions = util::synchronous(io, [&pRouter] { return pRouter->sessions(); });
  CHECK(sessions.empty());
  destroy(io, pRouter);
}

TEST_CASE("Client | UnknownDevice", "[Client]")
{
  Io io;
  auto pRouter = makeRouter(io);
  CHECK_THROWS_AS(Client<TestRouter>::connect(*pRouter, NoDevices{}, "missing"), OtherError);
  destroy(io, pRouter);
}

TEST_CASE("Client | ConnectSendDisconnect", "[Client]")
{
  Io io;
  auto pServer = makeRouter(io);
  auto pRouter = makeRouter(io);

  std::promise<std::shared_ptr<router::Session>> accepted;
  auto futureSession = accepted.get_future();
  util::synchronous(io,
                    [&pServer, &accepted]
                    {
                      pServer->onAccept([&accepted](std::shared_ptr<router::Session> pSession)
                                        { accepted.set_value(std::move(pSession)); });
                    });

  {
    auto client = Client<TestRouter>::connect(*pRouter, pServer->endpoint());
    CHECK(router::SessionState::Active == client.state());

    REQUIRE(std::future_status::ready == futureSession.wait_for(std::chrono::seconds{2}));
    const auto pPeer = futureSession.get();

    client.send(message::Message{message::Kind::Set, "/mixer/fader/1", 0.75});
    const auto envelope = pPeer->receive(std::chrono::seconds{2});
    REQUIRE(envelope);
    const auto content = message::fromEnvelope(*envelope);
    REQUIRE(std::holds_alternative<message::Message>(content));
    CHECK("/mixer/fader/1" == std::get<message::Message>(content).address);

    pPeer->send(message::toEnvelope(message::Message{message::Kind::Publish, "/ack", true}),
                router::Clock::now());
    const auto reply = client.receive(std::chrono::seconds{2});
    REQUIRE(reply);
    CHECK(message::kMessagePayload == reply->payloadType);

    client.disconnect();
    CHECK(router::SessionState::Closing == client.state());
    CHECK_THROWS_AS(client.send(Envelope{}), SessionNotFound);

    // The peer hears the goodbye and its pending receive comes back empty
    CHECK(!pPeer->receive(std::chrono::seconds{2}));
    CHECK(router::CloseReason::Remote == pPeer->reason());
  }

  destroy(io, pRouter);
  destroy(io, pServer);
}

} // namespace clasp
