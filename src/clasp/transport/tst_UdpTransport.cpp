// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/platforms/asio/Context.hpp>
#include <clasp/test/CatchWrapper.hpp>
#include <clasp/test/Socket.hpp>
#include <clasp/transport/UdpTransport.hpp>
#include <clasp/util/Synchronous.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <thread>

namespace clasp
{
namespace transport
{
namespace
{

using Transport = UdpTransport<test::Socket>;

const auto kPeer = UdpEndpoint{IpAddressV4::loopback(), 9000};

struct Received
{
  std::vector<std::pair<UdpEndpoint, std::vector<uint8_t>>> datagrams;

  void operator()(const UdpEndpoint& from, const uint8_t* begin, const uint8_t* end)
  {
    datagrams.emplace_back(from, std::vector<uint8_t>{begin, end});
  }
};

} // namespace

TEST_CASE("UdpTransport | DeliversDatagrams", "[UdpTransport]")
{
  auto socket = test::Socket{};
  auto transport = Transport{socket, UdpConfig{}};
  auto pReceived = std::make_shared<Received>();
  transport.receive([pReceived](const UdpEndpoint& from, const uint8_t* b, const uint8_t* e)
                    { (*pReceived)(from, b, e); });

  CHECK(socket.receiving());
  socket.incomingMessage(kPeer, std::vector<uint8_t>{1, 2, 3});
  socket.incomingMessage(kPeer, std::vector<uint8_t>{4});

  REQUIRE(2 == pReceived->datagrams.size());
  CHECK(kPeer == pReceived->datagrams[0].first);
  CHECK((std::vector<uint8_t>{1, 2, 3}) == pReceived->datagrams[0].second);
  CHECK((std::vector<uint8_t>{4}) == pReceived->datagrams[1].second);
  CHECK(socket.receiving());
}

TEST_CASE("UdpTransport | DropsDatagramsAboveBufferSize", "[UdpTransport]")
{
  auto socket = test::Socket{};
  UdpConfig config;
  config.receiveBufferSize = 4;
  auto transport = Transport{socket, config};
  auto pReceived = std::make_shared<Received>();
  transport.receive([pReceived](const UdpEndpoint& from, const uint8_t* b, const uint8_t* e)
                    { (*pReceived)(from, b, e); });

  socket.incomingMessage(kPeer, std::vector<uint8_t>(5, 0));
  socket.incomingMessage(kPeer, std::vector<uint8_t>(4, 0));
  REQUIRE(1 == pReceived->datagrams.size());
  CHECK(4 == pReceived->datagrams[0].second.size());
}

TEST_CASE("UdpTransport | Send", "[UdpTransport]")
{
  auto socket = test::Socket{};
  UdpConfig config;
  config.maxPacketSize = 8;
  auto transport = Transport{socket, config};

  SECTION("Unicast")
  {
    transport.send(std::vector<uint8_t>{1, 2, 3}, kPeer);
    REQUIRE(1 == socket.sentMessages().size());
    CHECK(kPeer == socket.sentMessages()[0].second);
  }

  SECTION("Broadcast")
  {
    transport.broadcast(std::vector<uint8_t>{1}, 7331);
    REQUIRE(1 == socket.sentMessages().size());
    CHECK(UdpEndpoint{IpAddressV4::broadcast(), 7331} == socket.sentMessages()[0].second);
  }

  SECTION("OversizedDatagramIsRejected")
  {
    CHECK_THROWS_AS(transport.send(std::vector<uint8_t>(9, 0), kPeer), NetworkError);
    CHECK(socket.sentMessages().empty());
  }

  SECTION("SocketFailureIsNetworkError")
  {
    socket.failSends(true);
    CHECK_THROWS_AS(transport.send(std::vector<uint8_t>{1}, kPeer), NetworkError);
  }

  SECTION("SendAfterClose")
  {
    transport.close();
    CHECK(transport.closed());
    CHECK(socket.closed());
    CHECK_THROWS_AS(transport.send(std::vector<uint8_t>{1}, kPeer), NetworkError);
  }
}

TEST_CASE("UdpTransport | ReceiveErrorClosesOnce", "[UdpTransport]")
{
  auto socket = test::Socket{};
  auto transport = Transport{socket, UdpConfig{}};
  auto pReceived = std::make_shared<Received>();
  transport.receive([pReceived](const UdpEndpoint& from, const uint8_t* b, const uint8_t* e)
                    { (*pReceived)(from, b, e); });
  auto errors = 0;
  transport.onError([&errors](const std::error_code&) { ++errors; });

  socket.receiveError(std::make_error_code(std::errc::connection_refused));
  socket.receiveError(std::make_error_code(std::errc::connection_refused));

  CHECK(1 == errors);
  CHECK(transport.closed());
  CHECK(socket.closed());
  CHECK(!socket.receiving());
}

TEST_CASE("UdpTransport | ClosedTransportDoesNotListen", "[UdpTransport]")
{
  auto socket = test::Socket{};
  auto transport = Transport{socket, UdpConfig{}};
  transport.close();
  transport.receive([](const UdpEndpoint&, const uint8_t*, const uint8_t*) {});
  CHECK(!socket.receiving());
}

TEST_CASE("UdpTransport | Loopback", "[UdpTransport]")
{
  using Io = platforms::asio::Context<util::NullLog>;
  Io io;
  const auto any = UdpEndpoint{IpAddressV4::loopback(), 0};
  auto a = bindUdpTransport(util::injectRef(io), any);
  auto b = bindUdpTransport(util::injectRef(io), any);

  using Datagram = std::pair<UdpEndpoint, std::vector<uint8_t>>;
  std::promise<Datagram> promise;
  auto future = promise.get_future();
  util::synchronous(io,
                    [&]
                    {
                      b.receive(
                        [&promise](
                          const UdpEndpoint& from, const uint8_t* begin, const uint8_t* end)
                        {
                          try
                          {
                            promise.set_value({from, {begin, end}});
                          }
                          catch (const std::future_error&)
                          {
                          }
                        });
                    });

  a.send(std::vector<uint8_t>{1, 2, 3}, b.endpoint());
  REQUIRE(std::future_status::ready == future.wait_for(std::chrono::seconds(2)));
  const auto datagram = future.get();
  CHECK(a.endpoint() == datagram.first);
  CHECK((std::vector<uint8_t>{1, 2, 3}) == datagram.second);

  util::synchronous(io,
                    [&]
                    {
                      a.close();
                      b.close();
                    });
}

TEST_CASE("UdpTransport | SendWhileReceiving", "[UdpTransport]")
{
  using Io = platforms::asio::Context<util::NullLog>;
  Io io;
  const auto any = UdpEndpoint{IpAddressV4::loopback(), 0};
  auto a = bindUdpTransport(util::injectRef(io), any);
  auto b = bindUdpTransport(util::injectRef(io), any);
  const auto aEndpoint = a.endpoint();
  const auto bEndpoint = b.endpoint();

  // b echoes on the io thread while another thread sends over a, whose
  // receive keeps being re-armed on the io thread
  std::atomic<int> echoes{0};
  util::synchronous(io,
                    [&]
                    {
                      a.receive([&echoes](const UdpEndpoint&, const uint8_t*, const uint8_t*)
                                { ++echoes; });
                      b.receive(
                        [&b, aEndpoint](
                          const UdpEndpoint&, const uint8_t* begin, const uint8_t* end)
                        { b.send(std::vector<uint8_t>{begin, end}, aEndpoint); });
                    });

  const auto kDatagrams = 50;
  auto sent = 0;
  std::thread sender(
    [&]
    {
      try
      {
        for (auto i = 0; i < kDatagrams; ++i)
        {
          a.send(std::vector<uint8_t>{static_cast<uint8_t>(i)}, bEndpoint);
          ++sent;
        }
      }
      catch (const NetworkError&)
      {
      }
    });
  sender.join();
  CHECK(kDatagrams == sent);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (echoes == 0 && std::chrono::steady_clock::now() < deadline)
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  CHECK(echoes > 0);

  util::synchronous(io,
                    [&]
                    {
                      a.close();
                      b.close();
                    });
}

} // namespace transport
} // namespace clasp
