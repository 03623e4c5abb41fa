// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Errors.hpp>
#include <clasp/discovery/DeviceGateway.hpp>
#include <clasp/discovery/DiscoveryMessenger.hpp>
#include <clasp/platforms/stl/Random.hpp>
#include <clasp/util/Channel.hpp>
#include <clasp/util/Injected.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <variant>
#include <vector>

namespace clasp
{
namespace discovery
{

// Discovery messages are small, there is no need for jumbo buffers
static constexpr std::size_t kMaxDiscoveryMessageSize = 1200;

struct DiscoveryConfig
{
  // The multicast DNS style loop: announcements to a multicast group
  bool mdns = true;
  transport::UdpEndpoint multicastEndpoint = {transport::makeAddress("239.255.76.83"), 7332};

  // The broadcast loop: announcements to the subnet broadcast address
  bool broadcast = true;
  transport::IpAddressV4 broadcastAddress = transport::IpAddressV4::broadcast();
  unsigned short broadcastPort = 7331;

  std::string serviceType = "_clasp._udp.local.";
  std::chrono::seconds leaseWindow{30};
  // Announce leaseWindow / announceRatio apart
  uint8_t announceRatio = 10;
  std::chrono::milliseconds pruningPadding{1000};
};

struct DeviceFound
{
  Device device;
};

struct DeviceLost
{
  DeviceId id;
};

using DiscoveryEvent = std::variant<DeviceFound, DeviceLost>;

// Liveness of the two discovery loops. A loop that is disabled or stopped
// reports false.
struct DiscoveryHealth
{
  bool mdns = false;
  bool broadcast = false;
};

// Announces the local device and reports the devices of the same service
// type seen on the network. All network activity happens on the io thread;
// the known-device table and the event stream may be read from any thread.
template <typename IoContext>
class Discovery
{
public:
  using IoType = typename util::Injected<IoContext>::type;
  using EventHandler = std::function<void(const DiscoveryEvent&)>;

  // Events go to the handler if one is given and to the event channel
  // read by nextEvent() otherwise. A local device without an id gets a
  // random one.
  Discovery(util::Injected<IoContext> io, Device localDevice, EventHandler handler = {})
    : mIo(std::move(io))
    , mLocalDevice(std::move(localDevice))
    , mpRegistry(std::make_shared<Registry>(std::move(handler)))
  {
    if (mLocalDevice.id.empty())
    {
      mLocalDevice.id = randomDeviceId<platforms::stl::Random>();
    }
  }

  Discovery(const Discovery&) = delete;
  Discovery& operator=(const Discovery&) = delete;

  ~Discovery() { stop(); }

  // Throws MdnsError if the multicast socket can't be opened and
  // BroadcastError if the broadcast socket can't be opened
  void start(DiscoveryConfig config)
  {
    if (mRunning)
    {
      return;
    }

    std::optional<Socket> multicastSocket;
    std::optional<Socket> broadcastSocket;
    if (config.mdns)
    {
      try
      {
        multicastSocket.emplace(
          mIo->template openMulticastSocket<kMaxDiscoveryMessageSize>(config.multicastEndpoint));
      }
      catch (const std::runtime_error& err)
      {
        throw MdnsError(std::string{"Failed to start multicast discovery: "} + err.what());
      }
    }
    if (config.broadcast)
    {
      try
      {
        broadcastSocket.emplace(
          mIo->template openBroadcastSocket<kMaxDiscoveryMessageSize>(config.broadcastPort));
      }
      catch (const std::runtime_error& err)
      {
        throw BroadcastError(std::string{"Failed to start broadcast discovery: "}
                             + err.what());
      }
    }

    mConfig = config;
    mRunning = true;
    auto pLoops = std::make_shared<Loops>(
      util::injectShared(mpRegistry), util::injectRef(*mIo), config.pruningPadding);
    mpLoops = pLoops;

    // The messengers start talking as soon as they exist, so they are
    // created on the io thread like everything else touching them
    auto pMulticast = std::make_shared<std::optional<Socket>>(std::move(multicastSocket));
    auto pBroadcast = std::make_shared<std::optional<Socket>>(std::move(broadcastSocket));
    mIo->async(
      [this, pLoops, pMulticast, pBroadcast, config]
      {
        const auto stateQuery = [this] { return mLocalDevice; };
        if (*pMulticast)
        {
          pLoops->mdns.emplace(std::move(**pMulticast),
                               config.multicastEndpoint,
                               stateQuery,
                               util::injectRef(*mIo),
                               config.serviceType,
                               config.leaseWindow,
                               config.announceRatio);
          pLoops->gateway.listen(*pLoops->mdns);
        }
        if (*pBroadcast)
        {
          pLoops->broadcast.emplace(
            std::move(**pBroadcast),
            transport::UdpEndpoint{config.broadcastAddress, config.broadcastPort},
            stateQuery,
            util::injectRef(*mIo),
            config.serviceType,
            config.leaseWindow,
            config.announceRatio);
          pLoops->gateway.listen(*pLoops->broadcast);
        }
      });
  }

  // Sends a bye bye on every loop and reports every device still known as
  // lost. Blocks until the loops are torn down.
  void stop()
  {
    if (!mRunning)
    {
      return;
    }
    mRunning = false;

    auto pLoops = std::move(mpLoops);
    std::promise<void> done;
    auto finished = done.get_future();
    mIo->async(
      [pLoops, &done]
      {
        pLoops->mdns.reset();
        pLoops->broadcast.reset();
        pLoops->gateway.withdrawAll();
        done.set_value();
      });
    finished.wait();
  }

  bool running() const { return mRunning; }

  // Blocks on the io thread
  DiscoveryHealth health()
  {
    DiscoveryHealth result;
    if (!mRunning)
    {
      return result;
    }
    auto pLoops = mpLoops;
    std::promise<DiscoveryHealth> promise;
    auto future = promise.get_future();
    mIo->async(
      [pLoops, &promise]
      {
        DiscoveryHealth h;
        h.mdns = pLoops->mdns && pLoops->mdns->running();
        h.broadcast = pLoops->broadcast && pLoops->broadcast->running();
        promise.set_value(h);
      });
    return future.get();
  }

  const Device& localDevice() const { return mLocalDevice; }

  const DiscoveryConfig& config() const { return mConfig; }

  std::vector<Device> devices() const
  {
    std::lock_guard<std::mutex> lock(mpRegistry->mMutex);
    std::vector<Device> result;
    for (const auto& entry : mpRegistry->mDevices)
    {
      result.push_back(entry.second);
    }
    return result;
  }

  std::optional<Device> find(const DeviceId& id) const
  {
    std::lock_guard<std::mutex> lock(mpRegistry->mMutex);
    const auto it = mpRegistry->mDevices.find(id);
    if (it == mpRegistry->mDevices.end())
    {
      return std::nullopt;
    }
    return it->second;
  }

  std::optional<DiscoveryEvent> nextEvent() { return mpRegistry->mEvents.tryPop(); }

  template <typename Rep, typename Period>
  std::optional<DiscoveryEvent> nextEvent(const std::chrono::duration<Rep, Period> timeout)
  {
    return mpRegistry->mEvents.popFor(timeout);
  }

private:
  using Socket = typename IoType::template Socket<kMaxDiscoveryMessageSize>;
  using StateQuery = std::function<Device()>;
  using Messenger = DiscoveryMessenger<Socket, StateQuery, IoType&>;

  // Observer of the gateway. Mirrors the device table for readers on
  // other threads and forwards the events.
  struct Registry
  {
    explicit Registry(EventHandler handler)
      : mHandler(std::move(handler))
    {
    }

    friend void deviceFound(Registry& registry, const Device& device)
    {
      {
        std::lock_guard<std::mutex> lock(registry.mMutex);
        registry.mDevices[device.id] = device;
      }
      registry.emit(DeviceFound{device});
    }

    friend void deviceLost(Registry& registry, const DeviceId& id)
    {
      {
        std::lock_guard<std::mutex> lock(registry.mMutex);
        registry.mDevices.erase(id);
      }
      registry.emit(DeviceLost{id});
    }

    void emit(DiscoveryEvent event)
    {
      if (mHandler)
      {
        mHandler(event);
      }
      else
      {
        mEvents.push(std::move(event));
      }
    }

    EventHandler mHandler;
    mutable std::mutex mMutex;
    std::map<DeviceId, Device> mDevices;
    util::Channel<DiscoveryEvent> mEvents;
  };

  struct Loops
  {
    Loops(util::Injected<std::shared_ptr<Registry>> registry,
          util::Injected<IoType&> io,
          const std::chrono::milliseconds pruningPadding)
      : gateway(std::move(registry), std::move(io), pruningPadding)
    {
    }

    DeviceGateway<std::shared_ptr<Registry>, IoType&> gateway;
    std::optional<Messenger> mdns;
    std::optional<Messenger> broadcast;
  };

  util::Injected<IoContext> mIo;
  Device mLocalDevice;
  DiscoveryConfig mConfig;
  std::shared_ptr<Registry> mpRegistry;
  std::shared_ptr<Loops> mpLoops;
  bool mRunning = false;
};

} // namespace discovery
} // namespace clasp
