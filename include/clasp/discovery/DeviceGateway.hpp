// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/discovery/DiscoveryMessenger.hpp>
#include <clasp/util/Injected.hpp>
#include <clasp/util/SafeAsyncHandler.hpp>
#include <algorithm>
#include <chrono>
#include <memory>
#include <vector>

namespace clasp
{
namespace discovery
{

// Tracks the devices heard of through any number of messengers and turns
// their traffic into a deduplicated stream of observer calls:
//  - deviceFound(observer, device) for a new device or a changed address
//  - deviceLost(observer, id) on bye bye or when the lease runs out
template <typename Observer, typename IoContext>
class DeviceGateway
{
public:
  using Timer = typename util::Injected<IoContext>::type::Timer;
  using TimerError = typename Timer::ErrorCode;
  using TimePoint = typename Timer::TimePoint;

  DeviceGateway(util::Injected<Observer> observer,
                util::Injected<IoContext> io,
                const std::chrono::milliseconds pruningPadding = std::chrono::seconds{1})
    : mpImpl(std::make_shared<Impl>(std::move(observer), std::move(io), pruningPadding))
  {
  }

  DeviceGateway(const DeviceGateway&) = delete;
  DeviceGateway& operator=(const DeviceGateway&) = delete;

  DeviceGateway(DeviceGateway&& rhs)
    : mpImpl(std::move(rhs.mpImpl))
  {
  }

  template <typename Messenger>
  void listen(Messenger& messenger)
  {
    messenger.receive(util::makeAsyncSafe(mpImpl));
  }

  // Reports every tracked device as lost and forgets it
  void withdrawAll() { mpImpl->withdrawAll(); }

  std::vector<Device> devices() const
  {
    std::vector<Device> result;
    for (const auto& timeout : mpImpl->mDeviceTimeouts)
    {
      result.push_back(timeout.device);
    }
    return result;
  }

private:
  struct DeviceTimeout
  {
    TimePoint expiry;
    Device device;
  };
  using DeviceTimeouts = std::vector<DeviceTimeout>;

  struct Impl : std::enable_shared_from_this<Impl>
  {
    Impl(util::Injected<Observer> observer,
         util::Injected<IoContext> io,
         const std::chrono::milliseconds pruningPadding)
      : mIo(std::move(io))
      , mObserver(std::move(observer))
      , mPruneTimer(mIo->makeTimer())
      , mLog(channel(mIo->log(), "gateway"))
      , mPruningPadding(pruningPadding)
    {
    }

    void operator()(const DeviceAnnouncement& msg) { onAnnouncement(msg.device, msg.lease); }

    void operator()(const DeviceByeBye& msg) { onByeBye(msg.id); }

    void onAnnouncement(Device device, const std::chrono::seconds lease)
    {
      using namespace std;
      const auto now = mPruneTimer.now();
      auto isNew = true;
      auto addressChanged = false;

      const auto existing = findDevice(device.id);
      if (existing != end(mDeviceTimeouts))
      {
        // The device is re-inserted below with its new expiry
        isNew = false;
        addressChanged = existing->device.address != device.address;
        device.discoveredAt = existing->device.discoveredAt;
        mDeviceTimeouts.erase(existing);
      }
      else
      {
        device.discoveredAt = now;
      }
      device.lastSeen = now;

      auto newTo = DeviceTimeout{now + lease, device};
      mDeviceTimeouts.insert(
        upper_bound(begin(mDeviceTimeouts), end(mDeviceTimeouts), newTo, TimeoutCompare{}),
        std::move(newTo));

      if (isNew || addressChanged)
      {
        info(mLog) << (isNew ? "found device " : "device moved ") << device;
        deviceFound(*mObserver, device);
      }
      scheduleNextPruning();
    }

    void onByeBye(const DeviceId& deviceId)
    {
      const auto it = findDevice(deviceId);
      if (it != mDeviceTimeouts.end())
      {
        info(mLog) << "device left " << it->device;
        mDeviceTimeouts.erase(it);
        deviceLost(*mObserver, deviceId);
      }
    }

    void withdrawAll()
    {
      mPruneTimer.cancel();
      auto timeouts = std::move(mDeviceTimeouts);
      mDeviceTimeouts.clear();
      for (const auto& timeout : timeouts)
      {
        deviceLost(*mObserver, timeout.device.id);
      }
    }

    void pruneExpiredDevices()
    {
      using namespace std;

      const auto test = DeviceTimeout{mPruneTimer.now(), {}};
      debug(mLog) << "pruning devices @ " << test.expiry.time_since_epoch().count();

      const auto endExpired =
        lower_bound(begin(mDeviceTimeouts), end(mDeviceTimeouts), test, TimeoutCompare{});

      auto expired = DeviceTimeouts(make_move_iterator(begin(mDeviceTimeouts)),
                                    make_move_iterator(endExpired));
      mDeviceTimeouts.erase(begin(mDeviceTimeouts), endExpired);

      for (const auto& timeout : expired)
      {
        info(mLog) << "pruning device " << timeout.device;
        deviceLost(*mObserver, timeout.device.id);
      }
      scheduleNextPruning();
    }

    void scheduleNextPruning()
    {
      // Find the next device to expire and set the timer based on it
      if (!mDeviceTimeouts.empty())
      {
        // Add padding to the timer to avoid over-eager timeouts
        const auto t = mDeviceTimeouts.front().expiry + mPruningPadding;

        debug(mLog) << "scheduling next pruning for " << t.time_since_epoch().count()
                    << " because of device " << mDeviceTimeouts.front().device;

        mPruneTimer.expires_at(t);
        mPruneTimer.async_wait(
          [this](const TimerError e)
          {
            if (!e)
            {
              pruneExpiredDevices();
            }
          });
      }
    }

    struct TimeoutCompare
    {
      bool operator()(const DeviceTimeout& lhs, const DeviceTimeout& rhs) const
      {
        return lhs.expiry < rhs.expiry;
      }
    };

    typename DeviceTimeouts::iterator findDevice(const DeviceId& deviceId)
    {
      return std::find_if(mDeviceTimeouts.begin(),
                          mDeviceTimeouts.end(),
                          [&deviceId](const DeviceTimeout& dto)
                          { return dto.device.id == deviceId; });
    }

    using IoLog = typename util::Injected<IoContext>::type::Log;

    util::Injected<IoContext> mIo;
    util::Injected<Observer> mObserver;
    Timer mPruneTimer;
    IoLog mLog;
    std::chrono::milliseconds mPruningPadding;
    DeviceTimeouts mDeviceTimeouts; // Invariant: sorted by expiry
  };

  std::shared_ptr<Impl> mpImpl;
};

template <typename Observer, typename IoContext>
DeviceGateway<Observer, IoContext> makeDeviceGateway(
  util::Injected<Observer> observer,
  util::Injected<IoContext> io,
  const std::chrono::milliseconds pruningPadding = std::chrono::seconds{1})
{
  return {std::move(observer), std::move(io), pruningPadding};
}

} // namespace discovery
} // namespace clasp
