// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/discovery/DiscoveryMessenger.hpp>
#include <clasp/test/CatchWrapper.hpp>
#include <clasp/test/Socket.hpp>
#include <clasp/util/test/IoContext.hpp>

namespace clasp
{
namespace discovery
{
namespace
{

const auto kTarget = transport::UdpEndpoint{transport::IpAddressV4::broadcast(), 7331};
const auto kService = std::string{"_clasp._udp.local."};

const auto kPeerEndpoint =
  transport::UdpEndpoint{transport::makeAddress("123.123.234.234"), 7331};

Device makeDevice(const std::string& id)
{
  Device device;
  device.id = id;
  device.address = {transport::makeAddress("10.0.0.1"), 7400};
  device.info.name = "Device " + id;
  return device;
}

struct StateQuery
{
  Device operator()() const { return device; }

  Device device;
};

struct TestHandler
{
  void operator()(DeviceAnnouncement announcement)
  {
    announcements.push_back(std::move(announcement));
  }

  void operator()(DeviceByeBye byeBye) { byeByes.push_back(std::move(byeBye)); }

  std::vector<DeviceAnnouncement> announcements;
  std::vector<DeviceByeBye> byeByes;
};

using Messenger = DiscoveryMessenger<test::Socket, StateQuery, util::test::IoContext&>;

Messenger makeMessenger(test::Socket socket,
                        util::test::IoContext& io,
                        const Device& local,
                        const std::string& serviceType = kService)
{
  return makeDiscoveryMessenger(std::move(socket),
                                kTarget,
                                StateQuery{local},
                                util::injectRef(io),
                                serviceType,
                                std::chrono::seconds{30},
                                10);
}

template <typename Payload>
std::vector<uint8_t> datagram(const v2::MessageType type, const Payload& payload)
{
  v2::MessageBuffer buffer;
  v2::encodeMessage(type, v2::kNoSession, payload, std::back_inserter(buffer));
  return buffer;
}

v2::MessageType typeOf(const test::Socket::SentMessage& sent)
{
  return v2::parseMessageHeader(sent.first.begin(), sent.first.end()).first.messageType;
}

} // namespace

TEST_CASE("DiscoveryMessenger | QueriesAndAnnouncesOnConstruction", "[DiscoveryMessenger]")
{
  util::test::IoContext io;
  auto socket = test::Socket{};
  const auto local = makeDevice("local");
  auto messenger = makeMessenger(socket, io, local);

  REQUIRE(2 == socket.sentMessages().size());
  CHECK(v2::kQuery == typeOf(socket.sentMessages()[0]));
  CHECK(v2::kAnnounce == typeOf(socket.sentMessages()[1]));
  CHECK(kTarget == socket.sentMessages()[1].second);
  CHECK(socket.receiving());
}

TEST_CASE("DiscoveryMessenger | Heartbeat", "[DiscoveryMessenger]")
{
  util::test::IoContext io;
  auto socket = test::Socket{};
  auto messenger = makeMessenger(socket, io, makeDevice("local"));

  REQUIRE(2 == socket.sentMessages().size());
  // Lease of 30s with an announce ratio of 10 means every 3s
  io.advance(std::chrono::milliseconds{3100});
  REQUIRE(3 == socket.sentMessages().size());
  CHECK(v2::kAnnounce == typeOf(socket.sentMessages()[2]));
}

TEST_CASE("DiscoveryMessenger | AnswersQueries", "[DiscoveryMessenger]")
{
  util::test::IoContext io;
  auto socket = test::Socket{};
  auto messenger = makeMessenger(socket, io, makeDevice("local"));

  socket.incomingMessage(
    kPeerEndpoint,
    datagram(v2::kQuery,
            wire::makePayload(DeviceIdEntry{"peer"}, ServiceTypeEntry{kService})));

  REQUIRE(3 == socket.sentMessages().size());
  CHECK(v2::kAnnounce == typeOf(socket.sentMessages()[2]));
  CHECK(kPeerEndpoint == socket.sentMessages()[2].second);
}

TEST_CASE("DiscoveryMessenger | Receive", "[DiscoveryMessenger]")
{
  util::test::IoContext io;
  auto socket = test::Socket{};
  auto tmpMessenger = makeMessenger(socket, io, makeDevice("local"));
  auto messenger = std::move(tmpMessenger);
  auto handler = TestHandler{};
  messenger.receive(std::ref(handler));

  auto peer = makeDevice("peer");

  SECTION("AnnouncementAndByeBye")
  {
    socket.incomingMessage(kPeerEndpoint, datagram(v2::kAnnounce, toPayload(peer, kService, 12)));
    socket.incomingMessage(
      kPeerEndpoint,
      datagram(v2::kByeBye, wire::makePayload(DeviceIdEntry{"peer"}, ServiceTypeEntry{kService})));

    REQUIRE(1 == handler.announcements.size());
    CHECK(peer == handler.announcements[0].device);
    CHECK(std::chrono::seconds{12} == handler.announcements[0].lease);
    REQUIRE(1 == handler.byeByes.size());
    CHECK("peer" == handler.byeByes[0].id);
  }

  SECTION("UnspecifiedAddressIsTakenFromSender")
  {
    peer.address = {transport::IpAddressV4::any(), 7400};
    socket.incomingMessage(kPeerEndpoint, datagram(v2::kAnnounce, toPayload(peer, kService, 12)));
    REQUIRE(1 == handler.announcements.size());
    CHECK(kPeerEndpoint.address() == handler.announcements[0].device.address.address());
    CHECK(7400 == handler.announcements[0].device.address.port());
  }

  SECTION("IgnoresOwnAndForeignServiceMessages")
  {
    socket.incomingMessage(
      kPeerEndpoint, datagram(v2::kAnnounce, toPayload(makeDevice("local"), kService, 12)));
    socket.incomingMessage(
      kPeerEndpoint, datagram(v2::kAnnounce, toPayload(peer, "_other._udp.local.", 12)));
    CHECK(handler.announcements.empty());
  }

  SECTION("IgnoresGarbage")
  {
    socket.incomingMessage(kPeerEndpoint, std::vector<uint8_t>{1, 2, 3});
    const auto truncated = [&] {
      auto bytes = datagram(v2::kAnnounce, toPayload(peer, kService, 12));
      bytes.resize(bytes.size() - 3);
      return bytes;
    }();
    socket.incomingMessage(kPeerEndpoint, truncated);
    CHECK(handler.announcements.empty());
    CHECK(socket.receiving());
  }
}

TEST_CASE("DiscoveryMessenger | SendsByeByeOnDestruction", "[DiscoveryMessenger]")
{
  util::test::IoContext io;
  auto socket = test::Socket{};
  {
    auto messenger = makeMessenger(socket, io, makeDevice("local"));
  }
  REQUIRE(3 == socket.sentMessages().size());
  CHECK(v2::kByeBye == typeOf(socket.sentMessages()[2]));
  CHECK(kTarget == socket.sentMessages()[2].second);
  CHECK(socket.closed());
}

TEST_CASE("DiscoveryMessenger | SocketFailureStopsLoop", "[DiscoveryMessenger]")
{
  util::test::IoContext io;
  auto socket = test::Socket{};
  auto messenger = makeMessenger(socket, io, makeDevice("local"));
  CHECK(messenger.running());
  socket.receiveError(std::make_error_code(std::errc::network_down));
  CHECK(!messenger.running());

  io.advance(std::chrono::seconds{10});
  CHECK(2 == socket.sentMessages().size());
}

} // namespace discovery
} // namespace clasp
