// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/discovery/DeviceGateway.hpp>
#include <clasp/test/CatchWrapper.hpp>
#include <clasp/util/test/IoContext.hpp>

namespace clasp
{
namespace discovery
{
namespace
{

struct TestMessenger
{
  template <typename Handler>
  void receive(Handler handler)
  {
    receiveAnnouncement = [handler](const DeviceAnnouncement& msg) mutable { handler(msg); };
    receiveByeBye = [handler](const DeviceByeBye& msg) mutable { handler(msg); };
  }

  std::function<void(const DeviceAnnouncement&)> receiveAnnouncement;
  std::function<void(const DeviceByeBye&)> receiveByeBye;
};

struct TestObserver
{
  friend void deviceFound(TestObserver& observer, const Device& device)
  {
    observer.mFound.push_back(device);
  }

  friend void deviceLost(TestObserver& observer, const DeviceId& id)
  {
    observer.mLost.push_back(id);
  }

  std::vector<Device> mFound;
  std::vector<DeviceId> mLost;
};

Device makeDevice(const std::string& id, const unsigned short port = 7400)
{
  Device device;
  device.id = id;
  device.address = {transport::makeAddress("10.0.0.1"), port};
  return device;
}

DeviceAnnouncement announce(Device device, const int leaseSeconds = 5)
{
  return {std::move(device), std::chrono::seconds{leaseSeconds}};
}

} // namespace

TEST_CASE("DeviceGateway | NoActivity", "[DeviceGateway]")
{
  util::test::IoContext io;
  TestObserver observer;
  auto gateway = makeDeviceGateway(util::injectRef(observer), util::injectRef(io));
  io.advance(std::chrono::seconds{60});
  CHECK(observer.mFound.empty());
  CHECK(observer.mLost.empty());
}

TEST_CASE("DeviceGateway | FoundOnceForRepeatedAnnouncements", "[DeviceGateway]")
{
  util::test::IoContext io;
  TestObserver observer;
  auto gateway = makeDeviceGateway(util::injectRef(observer), util::injectRef(io));
  TestMessenger mdns;
  TestMessenger broadcast;
  gateway.listen(mdns);
  gateway.listen(broadcast);

  const auto device = makeDevice("a");
  mdns.receiveAnnouncement(announce(device));
  broadcast.receiveAnnouncement(announce(device));
  mdns.receiveAnnouncement(announce(device));

  REQUIRE(1 == observer.mFound.size());
  CHECK(device == observer.mFound[0]);
  CHECK(1 == gateway.devices().size());
}

TEST_CASE("DeviceGateway | AddressChangeIsReported", "[DeviceGateway]")
{
  util::test::IoContext io;
  TestObserver observer;
  auto gateway = makeDeviceGateway(util::injectRef(observer), util::injectRef(io));
  TestMessenger messenger;
  gateway.listen(messenger);

  messenger.receiveAnnouncement(announce(makeDevice("a", 7400)));
  io.advance(std::chrono::seconds{1});
  messenger.receiveAnnouncement(announce(makeDevice("a", 7401)));

  REQUIRE(2 == observer.mFound.size());
  CHECK(7401 == observer.mFound[1].address.port());
  REQUIRE(1 == gateway.devices().size());
  const auto tracked = gateway.devices()[0];
  CHECK(tracked.discoveredAt < tracked.lastSeen);
}

TEST_CASE("DeviceGateway | ByeBye", "[DeviceGateway]")
{
  util::test::IoContext io;
  TestObserver observer;
  auto gateway = makeDeviceGateway(util::injectRef(observer), util::injectRef(io));
  TestMessenger messenger;
  gateway.listen(messenger);

  messenger.receiveAnnouncement(announce(makeDevice("a")));
  messenger.receiveByeBye({"a"});
  // Unknown devices are not reported
  messenger.receiveByeBye({"b"});

  REQUIRE(1 == observer.mLost.size());
  CHECK("a" == observer.mLost[0]);
  CHECK(gateway.devices().empty());
}

TEST_CASE("DeviceGateway | LeaseExpiry", "[DeviceGateway]")
{
  util::test::IoContext io;
  TestObserver observer;
  auto gateway = makeDeviceGateway(util::injectRef(observer), util::injectRef(io));
  TestMessenger messenger;
  gateway.listen(messenger);

  messenger.receiveAnnouncement(announce(makeDevice("a"), 5));
  messenger.receiveAnnouncement(announce(makeDevice("b"), 10));

  SECTION("ExpiresAfterLeaseAndPadding")
  {
    io.advance(std::chrono::milliseconds{5500});
    CHECK(observer.mLost.empty());
    io.advance(std::chrono::milliseconds{600});
    REQUIRE(1 == observer.mLost.size());
    CHECK("a" == observer.mLost[0]);
    io.advance(std::chrono::seconds{5});
    REQUIRE(2 == observer.mLost.size());
    CHECK("b" == observer.mLost[1]);
  }

  SECTION("ReannouncementRenewsLease")
  {
    io.advance(std::chrono::seconds{4});
    messenger.receiveAnnouncement(announce(makeDevice("a"), 5));
    io.advance(std::chrono::seconds{4});
    CHECK(observer.mLost.empty());
    CHECK(2 == observer.mFound.size());
  }

  SECTION("WithdrawAll")
  {
    gateway.withdrawAll();
    CHECK(2 == observer.mLost.size());
    io.advance(std::chrono::seconds{60});
    CHECK(2 == observer.mLost.size());
  }
}

} // namespace discovery
} // namespace clasp
