// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Errors.hpp>
#include <clasp/discovery/Device.hpp>
#include <clasp/util/Injected.hpp>
#include <clasp/util/SafeAsyncHandler.hpp>
#include <clasp/v2/Messages.hpp>
#include <chrono>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <system_error>

namespace clasp
{
namespace discovery
{

struct DeviceAnnouncement
{
  Device device;
  std::chrono::seconds lease;
};

struct DeviceByeBye
{
  DeviceId id;
};

// Throws UdpSendException
template <typename Interface, typename Payload>
void sendDiscoveryMessage(Interface& iface,
                          const v2::MessageType messageType,
                          const Payload& payload,
                          const transport::UdpEndpoint& to)
{
  v2::MessageBuffer buffer;
  v2::encodeMessage(messageType, v2::kNoSession, payload, std::back_inserter(buffer));
  try
  {
    iface.send(buffer.data(), buffer.size(), to);
  }
  catch (const std::runtime_error& err)
  {
    throw UdpSendException{err, iface.endpoint()};
  }
}

// One discovery loop over one socket: periodic announcements to a target
// endpoint (a multicast group or a broadcast address), a query on start,
// unicast answers to queries and a bye bye when it goes away.
//
// DiscoveryMessenger uses a "shared_ptr pImpl" pattern to make it movable
// and to support safe async handler callbacks when receiving messages on
// the given interface.
template <typename Interface, typename StateQuery, typename IoContext>
class DiscoveryMessenger
{
public:
  using Timer = typename util::Injected<IoContext>::type::Timer;
  using TimerError = typename Timer::ErrorCode;
  using TimePoint = typename Timer::TimePoint;

  DiscoveryMessenger(Interface iface,
                     transport::UdpEndpoint target,
                     StateQuery stateQuery,
                     util::Injected<IoContext> io,
                     std::string serviceType,
                     const std::chrono::seconds lease,
                     const uint8_t announceRatio)
    : mpImpl(std::make_shared<Impl>(std::move(iface),
                                    std::move(target),
                                    std::move(stateQuery),
                                    std::move(io),
                                    std::move(serviceType),
                                    lease,
                                    announceRatio))
  {
    // We need to always listen for incoming traffic in order to
    // answer queries
    mpImpl->listen();
    mpImpl->sendQuery();
    mpImpl->broadcastState();
  }

  DiscoveryMessenger(const DiscoveryMessenger&) = delete;
  DiscoveryMessenger& operator=(const DiscoveryMessenger&) = delete;

  DiscoveryMessenger(DiscoveryMessenger&& rhs)
    : mpImpl(std::move(rhs.mpImpl))
  {
  }

  ~DiscoveryMessenger()
  {
    if (mpImpl != nullptr)
    {
      mpImpl->mTimer.cancel();
      try
      {
        mpImpl->sendByeBye();
      }
      catch (const UdpSendException& err)
      {
        debug(mpImpl->mLog) << "Failed to send bye bye message: " << err.what();
      }
      mpImpl->mInterface.close();
    }
  }

  // The handler must be callable with DeviceAnnouncement and with
  // DeviceByeBye. It stays installed for the lifetime of the messenger.
  template <typename Handler>
  void receive(Handler handler)
  {
    mpImpl->setReceiveHandler(std::move(handler));
  }

  void broadcastState() { mpImpl->broadcastState(); }

  // False once the socket has failed
  bool running() const { return mpImpl->mRunning; }

  transport::UdpEndpoint endpoint() const { return mpImpl->mInterface.endpoint(); }

private:
  struct Impl : std::enable_shared_from_this<Impl>
  {
    Impl(Interface iface,
         transport::UdpEndpoint target,
         StateQuery stateQuery,
         util::Injected<IoContext> io,
         std::string serviceType,
         const std::chrono::seconds lease,
         const uint8_t announceRatio)
      : mIo(std::move(io))
      , mInterface(std::move(iface))
      , mTarget(std::move(target))
      , mStateQuery(std::move(stateQuery))
      , mTimer(mIo->makeTimer())
      , mLastBroadcastTime{}
      , mLog(channel(mIo->log(), "discovery@" + transport::toString(mTarget)))
      , mServiceType(std::move(serviceType))
      , mLease(lease)
      , mAnnounceRatio(announceRatio)
      , mAnnouncementHandler([](DeviceAnnouncement) {})
      , mByeByeHandler([](DeviceByeBye) {})
    {
    }

    template <typename Handler>
    void setReceiveHandler(Handler handler)
    {
      mAnnouncementHandler = [handler](DeviceAnnouncement announcement) mutable
      { handler(std::move(announcement)); };

      mByeByeHandler = [handler](DeviceByeBye byeBye) mutable
      { handler(std::move(byeBye)); };
    }

    void sendByeBye()
    {
      sendDiscoveryMessage(
        mInterface,
        v2::kByeBye,
        wire::makePayload(DeviceIdEntry{mStateQuery().id}, ServiceTypeEntry{mServiceType}),
        mTarget);
    }

    void sendQuery()
    {
      try
      {
        sendDiscoveryMessage(
          mInterface,
          v2::kQuery,
          wire::makePayload(DeviceIdEntry{mStateQuery().id}, ServiceTypeEntry{mServiceType}),
          mTarget);
      }
      catch (const UdpSendException& err)
      {
        info(mLog) << "Failed to send query: " << err.what();
      }
    }

    void broadcastState()
    {
      using namespace std::chrono;

      const auto minBroadcastPeriod = milliseconds{50};
      const auto nominalBroadcastPeriod =
        milliseconds(duration_cast<milliseconds>(mLease).count() / mAnnounceRatio);
      const auto timeSinceLastBroadcast =
        duration_cast<milliseconds>(mTimer.now() - mLastBroadcastTime);

      // The rate is limited to maxBroadcastRate to prevent flooding the network.
      const auto delay = minBroadcastPeriod - timeSinceLastBroadcast;

      // Schedule the next broadcast before we actually send the
      // message so that if sending throws an exception we are still
      // scheduled to try again. We want to keep trying at our
      // interval as long as this instance is alive.
      mTimer.expires_from_now(delay > milliseconds{0} ? delay : nominalBroadcastPeriod);
      mTimer.async_wait(
        [this](const TimerError e)
        {
          if (!e)
          {
            broadcastState();
          }
        });

      // If we're not delaying, broadcast now
      if (delay < milliseconds{1})
      {
        debug(mLog) << "Broadcasting announcement";
        try
        {
          sendAnnouncement(mTarget);
        }
        catch (const UdpSendException& err)
        {
          info(mLog) << "Failed to send announcement: " << err.what();
        }
      }
    }

    void sendAnnouncement(const transport::UdpEndpoint& to)
    {
      sendDiscoveryMessage(
        mInterface,
        v2::kAnnounce,
        toPayload(mStateQuery(), mServiceType, static_cast<uint16_t>(mLease.count())),
        to);
      mLastBroadcastTime = mTimer.now();
    }

    void listen()
    {
      const auto pSelf = this->shared_from_this();
      mInterface.receive(util::makeAsyncSafe(pSelf), util::makeAsyncSafe(pSelf));
    }

    template <typename It>
    void operator()(const transport::UdpEndpoint& from,
                    const It messageBegin,
                    const It messageEnd)
    {
      const auto result = v2::parseMessageHeader(messageBegin, messageEnd);
      const auto& header = result.first;

      if (header.kind == v2::kDiscoveryKind)
      {
        try
        {
          receiveMessage(header.messageType, from, result.second, messageEnd);
        }
        catch (const std::runtime_error& err)
        {
          info(mLog) << "Ignoring discovery message from " << transport::toString(from)
                     << ": " << err.what();
        }
      }
      listen();
    }

    void operator()(const std::error_code& ec)
    {
      mRunning = false;
      mTimer.cancel();
      error(mLog) << "Discovery socket failed: " << ec.message();
    }

    template <typename It>
    void receiveMessage(const v2::MessageType messageType,
                        const transport::UdpEndpoint& from,
                        const It payloadBegin,
                        const It payloadEnd)
    {
      Device device;
      std::optional<std::string> serviceType;
      std::optional<uint16_t> lease;
      wire::parsePayload<DeviceIdEntry,
                         DeviceAddressEntry,
                         DeviceInfoEntry,
                         ServiceTypeEntry,
                         LeaseEntry>(
        payloadBegin,
        payloadEnd,
        mLog,
        [&device](DeviceIdEntry entry) { device.id = std::move(entry.id); },
        [&device](const DeviceAddressEntry& entry) { device.address = entry.endpoint; },
        [&device](DeviceInfoEntry entry) { device.info = std::move(entry.info); },
        [&serviceType](ServiceTypeEntry entry)
        { serviceType = std::move(entry.serviceType); },
        [&lease](const LeaseEntry& entry) { lease = entry.seconds; });

      // Ignore our own messages and those of other services
      if (device.id.empty() || device.id == mStateQuery().id || serviceType != mServiceType)
      {
        return;
      }

      debug(mLog) << "Received message type " << static_cast<int>(messageType)
                  << " from device " << device.id;

      switch (messageType)
      {
      case v2::kAnnounce:
        if (device.address.address().is_unspecified())
        {
          device.address.address(from.address());
        }
        mAnnouncementHandler(
          DeviceAnnouncement{std::move(device), std::chrono::seconds{lease.value_or(0)}});
        break;
      case v2::kQuery:
        try
        {
          sendAnnouncement(from);
        }
        catch (const UdpSendException& err)
        {
          info(mLog) << "Failed to answer query: " << err.what();
        }
        break;
      case v2::kByeBye:
        mByeByeHandler(DeviceByeBye{std::move(device.id)});
        break;
      default:
        info(mLog) << "Unknown message received of type: " << static_cast<int>(messageType);
      }
    }

    using IoLog = typename util::Injected<IoContext>::type::Log;

    util::Injected<IoContext> mIo;
    Interface mInterface;
    transport::UdpEndpoint mTarget;
    StateQuery mStateQuery;
    Timer mTimer;
    TimePoint mLastBroadcastTime;
    IoLog mLog;
    std::string mServiceType;
    std::chrono::seconds mLease;
    uint8_t mAnnounceRatio;
    bool mRunning = true;
    std::function<void(DeviceAnnouncement)> mAnnouncementHandler;
    std::function<void(DeviceByeBye)> mByeByeHandler;
  };

  std::shared_ptr<Impl> mpImpl;
};

template <typename Interface, typename StateQuery, typename IoContext>
DiscoveryMessenger<Interface, StateQuery, IoContext> makeDiscoveryMessenger(
  Interface iface,
  transport::UdpEndpoint target,
  StateQuery query,
  util::Injected<IoContext> io,
  std::string serviceType,
  const std::chrono::seconds lease,
  const uint8_t announceRatio)
{
  return {std::move(iface),
          std::move(target),
          std::move(query),
          std::move(io),
          std::move(serviceType),
          lease,
          announceRatio};
}

} // namespace discovery
} // namespace clasp
