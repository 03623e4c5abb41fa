// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/discovery/Discovery.hpp>
#include <clasp/test/CatchWrapper.hpp>
#include <clasp/test/Socket.hpp>
#include <clasp/util/test/IoContext.hpp>

namespace clasp
{
namespace discovery
{
namespace
{

// Carries datagrams between the sockets opened through it. A datagram sent
// to a multicast or broadcast address reaches every other socket on the
// target port, a unicast datagram only the socket bound to the target.
struct Network
{
  test::Socket open(const transport::UdpEndpoint& local)
  {
    sockets.emplace_back(local);
    return sockets.back();
  }

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
          deliver(sender.endpoint(), datagram.first, datagram.second);
        }
      }
    }
  }

  void deliver(const transport::UdpEndpoint& from,
               const std::vector<uint8_t>& bytes,
               const transport::UdpEndpoint& to)
  {
    const auto toAll = to.address().is_multicast() || to.address().to_v4().to_uint() == 0xFFFFFFFF;
    for (auto& receiver : sockets)
    {
      const auto local = receiver.endpoint();
      if (receiver.closed() || local == from || local.port() != to.port())
      {
        continue;
      }
      if (toAll || local.address() == to.address())
      {
        receiver.incomingMessage(from, bytes);
      }
    }
  }

  std::vector<test::Socket> sockets;
};

// Deterministic io context whose sockets live on a Network. Posted
// handlers run right away.
class NetworkIo : public util::test::IoContext
{
public:
  template <std::size_t MaxPacketSize>
  using Socket = test::Socket;

  NetworkIo(Network& network, const std::string& address)
    : mNetwork(network)
    , mAddress(transport::makeAddress(address))
  {
  }

  template <std::size_t MaxPacketSize>
  test::Socket openMulticastSocket(const transport::UdpEndpoint& group)
  {
    if (failMulticast)
    {
      throw NetworkError("No multicast route");
    }
    return mNetwork.open({mAddress, group.port()});
  }

  template <std::size_t MaxPacketSize>
  test::Socket openBroadcastSocket(const unsigned short port)
  {
    return mNetwork.open({mAddress, port});
  }

  template <typename Handler>
  void async(Handler handler)
  {
    handler();
  }

  bool failMulticast = false;

private:
  Network& mNetwork;
  transport::IpAddress mAddress;
};

Device makeDevice(const std::string& id, const std::string& address)
{
  Device device;
  device.id = id;
  device.address = {transport::makeAddress(address), 7400};
  device.info.name = "Device " + id;
  return device;
}

const DeviceFound* asFound(const std::optional<DiscoveryEvent>& event)
{
  return event ? std::get_if<DeviceFound>(&*event) : nullptr;
}

const DeviceLost* asLost(const std::optional<DiscoveryEvent>& event)
{
  return event ? std::get_if<DeviceLost>(&*event) : nullptr;
}

} // namespace

TEST_CASE("Discovery | FindsPeersOnceAcrossLoops", "[Discovery]")
{
  Network network;
  NetworkIo ioA(network, "10.0.0.1");
  NetworkIo ioB(network, "10.0.0.2");

  Discovery<NetworkIo&> a(util::injectRef(ioA), makeDevice("a", "10.0.0.1"));
  Discovery<NetworkIo&> b(util::injectRef(ioB), makeDevice("b", "10.0.0.2"));

  a.start({});
  network.pump();
  b.start({});
  network.pump();

  const auto foundOnA = a.nextEvent();
  REQUIRE(asFound(foundOnA));
  CHECK(makeDevice("b", "10.0.0.2") == asFound(foundOnA)->device);
  CHECK(!a.nextEvent());

  REQUIRE(asFound(b.nextEvent()));
  CHECK(!b.nextEvent());

  REQUIRE(a.find("b"));
  CHECK(1 == a.devices().size());
  CHECK(!a.find("a"));

  const auto health = a.health();
  CHECK(health.mdns);
  CHECK(health.broadcast);

  SECTION("StopSendsByeBye")
  {
    b.stop();
    network.pump();
    const auto lost = a.nextEvent();
    REQUIRE(asLost(lost));
    CHECK("b" == asLost(lost)->id);
    CHECK(a.devices().empty());
    CHECK(!b.running());
    CHECK(!b.health().broadcast);
  }

  SECTION("SilentPeerExpires")
  {
    for (auto& socket : network.sockets)
    {
      if (socket.endpoint().address() == transport::makeAddress("10.0.0.2"))
      {
        socket.failSends(true);
      }
    }
    ioA.advance(std::chrono::seconds{30});
    CHECK(!a.nextEvent());
    ioA.advance(std::chrono::seconds{2});
    const auto lost = a.nextEvent();
    REQUIRE(asLost(lost));
    CHECK("b" == asLost(lost)->id);
  }
}

TEST_CASE("Discovery | BroadcastOnly", "[Discovery]")
{
  Network network;
  NetworkIo ioA(network, "10.0.0.1");
  NetworkIo ioB(network, "10.0.0.2");
  std::vector<DiscoveryEvent> events;
  Discovery<NetworkIo&> a(util::injectRef(ioA),
                          makeDevice("a", "10.0.0.1"),
                          [&events](const DiscoveryEvent& event) { events.push_back(event); });
  Discovery<NetworkIo&> b(util::injectRef(ioB), makeDevice("b", "10.0.0.2"));

  DiscoveryConfig config;
  config.mdns = false;
  a.start(config);
  b.start(config);
  network.pump();

  REQUIRE(1 == events.size());
  CHECK(std::holds_alternative<DeviceFound>(events[0]));
  CHECK(!a.health().mdns);
  CHECK(a.health().broadcast);

  SECTION("StopIsReported")
  {
    b.stop();
    network.pump();
    REQUIRE(2 == events.size());
    REQUIRE(std::holds_alternative<DeviceLost>(events[1]));
    CHECK("b" == std::get<DeviceLost>(events[1]).id);
    CHECK(a.devices().empty());
  }

  SECTION("SilentPeerExpiresWithinLease")
  {
    for (auto& socket : network.sockets)
    {
      if (socket.endpoint().address() == transport::makeAddress("10.0.0.2"))
      {
        socket.failSends(true);
      }
    }
    ioA.advance(config.leaseWindow);
    CHECK(1 == events.size());
    ioA.advance(std::chrono::seconds{2});
    REQUIRE(2 == events.size());
    REQUIRE(std::holds_alternative<DeviceLost>(events[1]));
    CHECK("b" == std::get<DeviceLost>(events[1]).id);
  }
}

TEST_CASE("Discovery | LocalDeviceWithoutIdGetsRandomId", "[Discovery]")
{
  Network network;
  NetworkIo io(network, "10.0.0.1");
  Discovery<NetworkIo&> a(util::injectRef(io), makeDevice("", "10.0.0.1"));
  Discovery<NetworkIo&> b(util::injectRef(io), makeDevice("", "10.0.0.1"));
  Discovery<NetworkIo&> named(util::injectRef(io), makeDevice("desk", "10.0.0.1"));

  const auto& id = a.localDevice().id;
  CHECK(16 == id.size());
  CHECK(std::string::npos == id.find_first_not_of("0123456789abcdef"));
  CHECK(id != b.localDevice().id);
  CHECK("desk" == named.localDevice().id);
}

TEST_CASE("Discovery | MulticastFailureIsMdnsError", "[Discovery]")
{
  Network network;
  NetworkIo io(network, "10.0.0.1");
  io.failMulticast = true;
  Discovery<NetworkIo&> discovery(util::injectRef(io), makeDevice("a", "10.0.0.1"));

  CHECK_THROWS_AS(discovery.start({}), MdnsError);
  CHECK(!discovery.running());

  DiscoveryConfig config;
  config.mdns = false;
  discovery.start(config);
  CHECK(discovery.running());
}

} // namespace discovery
} // namespace clasp
