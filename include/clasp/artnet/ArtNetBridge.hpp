// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Errors.hpp>
#include <clasp/artnet/ArtNetCodec.hpp>
#include <clasp/bridge/Metrics.hpp>
#include <clasp/router/Router.hpp>
#include <clasp/transport/AsioTypes.hpp>
#include <clasp/util/Injected.hpp>
#include <clasp/util/SafeAsyncHandler.hpp>
#include <algorithm>
#include <chrono>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace clasp
{
namespace artnet
{

const std::string kProtocol = "artnet";

struct ArtNetConfig
{
  transport::UdpEndpoint listenEndpoint = {transport::IpAddressV4::any(), kPort};
  std::string namespacePrefix = "/artnet";
  // Where outbound frames go. The node of the session if not set.
  std::optional<transport::UdpEndpoint> remoteEndpoint;
  // Universes to bridge inbound, all if empty
  std::vector<uint16_t> universes;
  std::chrono::milliseconds framePeriod{25};
  // Only transmit universes that changed. Otherwise every known universe
  // is refreshed once per frame period.
  bool sendDeltasOnly = true;
  bool acceptUnsolicited = true;
};

// A node that answered a poll
struct Node
{
  transport::UdpEndpoint endpoint;
  std::string shortName;
  std::string longName;
  uint8_t netSwitch = 0;
  uint8_t subSwitch = 0;
};

// Maps each Art-Net node to one router session. Inbound frames are reduced
// to the channels that changed since the node's last frame of their universe
// and delivered as one bundle of Set messages. A new session starts from a
// full frame. Outbound channel writes are
// collected per universe and transmitted at most once per frame period; a
// write to a universe that has been quiet for a frame period goes out
// immediately.
//
// Must be used on the router's io thread, destroyed before the router.
template <typename RouterT, typename Transport>
class ArtNetBridge
{
public:
  using SessionHandler = std::function<void(std::shared_ptr<router::Session>)>;

  ArtNetBridge(util::Injected<RouterT> router, Transport transport, ArtNetConfig config)
    : mpImpl(std::make_shared<Impl>(std::move(router), std::move(transport), std::move(config)))
  {
    mpImpl->listen();
    mpImpl->scheduleFrame();
  }

  ArtNetBridge(const ArtNetBridge&) = delete;
  ArtNetBridge& operator=(const ArtNetBridge&) = delete;

  ~ArtNetBridge() { mpImpl->shutdown(); }

  // The session of the node, created and confirmed if there is none. Throws
  // what the router throws when creating a session.
  std::shared_ptr<router::Session> accept(const transport::UdpEndpoint& node)
  {
    return mpImpl->accept(node);
  }

  // Every channel of the frame. Throws TranslationError.
  Envelope toClasp(const Dmx& dmx) const
  {
    return toEnvelope(dmx, mpImpl->mConfig.namespacePrefix);
  }

  // One frame per universe written. Throws TranslationError.
  std::vector<Dmx> fromClasp(const Envelope& envelope) const
  {
    return fromEnvelope(envelope, mpImpl->mConfig.namespacePrefix);
  }

  // Sends the envelope over every mapped session, or to the remote endpoint
  // if no node is known yet
  void send(const Envelope& envelope) { mpImpl->send(envelope); }

  // Broadcasts an ArtPoll. Nodes that answer show up in nodes(). Throws
  // NetworkError.
  void poll() { mpImpl->poll(); }

  std::vector<Node> nodes() const
  {
    std::vector<Node> result;
    for (const auto& node : mpImpl->mNodes)
    {
      result.push_back(node.second);
    }
    return result;
  }

  void onSession(SessionHandler handler) { mpImpl->mSessionHandler = std::move(handler); }

  void onError(bridge::ErrorHandler handler) { mpImpl->mErrorHandler = std::move(handler); }

  bridge::BridgeMetrics metrics() const { return mpImpl->mCounters.snapshot(); }

  std::vector<v2::SessionId> sessions() const
  {
    std::vector<v2::SessionId> ids;
    for (const auto& mapping : mpImpl->mMappings)
    {
      ids.push_back(mapping.second);
    }
    return ids;
  }

  transport::UdpEndpoint endpoint() const { return mpImpl->mTransport.endpoint(); }

  bool running() const { return !mpImpl->mTransport.closed(); }

  const ArtNetConfig& config() const { return mpImpl->mConfig; }

private:
  using RouterType = typename util::Injected<RouterT>::type;
  using Timer = typename RouterType::IoType::Timer;
  using TimerError = typename Timer::ErrorCode;
  using TimePoint = typename Timer::TimePoint;

  struct Impl : std::enable_shared_from_this<Impl>
  {
    // The latest state of one universe towards one destination
    struct Output
    {
      Frame frame{};
      std::size_t length = 0;
      uint8_t sequence = 0;
      bool dirty = false;
      TimePoint lastSent{};
    };

    using OutputKey = std::pair<transport::UdpEndpoint, uint16_t>;
    using InboundKey = std::pair<transport::UdpEndpoint, uint16_t>;

    Impl(util::Injected<RouterT> router, Transport transport, ArtNetConfig config)
      : mRouter(std::move(router))
      , mTransport(std::move(transport))
      , mConfig(std::move(config))
      , mFrameTimer(mRouter->io().makeTimer())
      , mLog(channel(mRouter->io().log(), "artnet"))
    {
    }

    void listen()
    {
      const auto pSelf = this->shared_from_this();
      mTransport.onError(util::makeAsyncSafe(pSelf));
      mTransport.receive(util::makeAsyncSafe(pSelf));
    }

    template <typename It>
    void operator()(const transport::UdpEndpoint& from, const It begin, const It end)
    {
      mCounters.received(static_cast<std::size_t>(std::distance(begin, end)));

      Packet packet;
      try
      {
        packet = decode(begin, end);
      }
      catch (const std::runtime_error& err)
      {
        reportError("Dropping Art-Net packet from " + transport::toString(from) + ": "
                    + err.what());
        return;
      }

      if (const auto pDmx = std::get_if<Dmx>(&packet))
      {
        onDmx(from, *pDmx);
      }
      else if (const auto pReply = std::get_if<PollReply>(&packet))
      {
        onPollReply(from, *pReply);
      }
      else
      {
        debug(mLog) << "ignoring poll from " << transport::toString(from);
      }
    }

    void operator()(const std::error_code& ec)
    {
      reportError("Art-Net socket failed: " + ec.message());
      closeSessions(router::CloseReason::TransportError);
    }

    bool bridged(const uint16_t universe) const
    {
      return mConfig.universes.empty()
             || std::find(mConfig.universes.begin(), mConfig.universes.end(), universe)
                  != mConfig.universes.end();
    }

    void onDmx(const transport::UdpEndpoint& from, const Dmx& dmx)
    {
      if (!bridged(dmx.universe))
      {
        debug(mLog) << "ignoring universe " << dmx.universe << " from "
                    << transport::toString(from);
        return;
      }

      auto pSession = mapped(from);
      if (!pSession)
      {
        if (!mConfig.acceptUnsolicited)
        {
          debug(mLog) << "ignoring unsolicited frame from " << transport::toString(from);
          return;
        }
        try
        {
          pSession = accept(from);
        }
        catch (const Error& err)
        {
          reportError(err.what());
          return;
        }
      }

      const auto key = InboundKey{from, dmx.universe};
      const auto it = mInbound.find(key);
      message::Bundle bundle;
      try
      {
        bundle = artnet::toClasp(
          dmx, mConfig.namespacePrefix, it == mInbound.end() ? nullptr : &it->second);
      }
      catch (const TranslationError& err)
      {
        reportError(err.what());
        return;
      }

      auto& previous = mInbound[key];
      std::copy(dmx.data.begin(), dmx.data.end(), previous.begin());
      if (bundle.messages.empty())
      {
        return;
      }

      mRouter->deliver(pSession->id(), message::toEnvelope(bundle));
    }

    void onPollReply(const transport::UdpEndpoint& from, const PollReply& reply)
    {
      if (mNodes.count(from) == 0)
      {
        info(mLog) << "found node " << reply.shortName << " at " << transport::toString(from);
      }
      mNodes[from] = Node{from, reply.shortName, reply.longName, reply.netSwitch,
                          reply.subSwitch};
    }

    void poll()
    {
      const auto bytes = encode(Poll{});
      mTransport.broadcast(bytes, kPort);
      mCounters.sent(bytes.size());
      debug(mLog) << "sent poll";
    }

    std::shared_ptr<router::Session> mapped(const transport::UdpEndpoint& node)
    {
      const auto it = mMappings.find(node);
      if (it == mMappings.end())
      {
        return nullptr;
      }
      auto pSession = mRouter->find(it->second);
      return pSession && pSession->live() ? pSession : nullptr;
    }

    std::shared_ptr<router::Session> accept(const transport::UdpEndpoint& node)
    {
      if (auto pSession = mapped(node))
      {
        return pSession;
      }

      // A session may outlive the bridge while it is closing
      const auto pWeak = std::weak_ptr<Impl>(this->shared_from_this());
      router::SessionSink sink;
      sink.send = [pWeak, node](const Envelope& envelope)
      {
        const auto pImpl = pWeak.lock();
        if (!pImpl)
        {
          throw SessionNotFound("Art-Net bridge for " + transport::toString(node) + " is gone");
        }
        pImpl->sendTo(node, envelope);
      };
      sink.closed = [pWeak, node](router::CloseReason)
      {
        if (const auto pImpl = pWeak.lock())
        {
          pImpl->unmap(node);
        }
      };
      forgetClosed();
      auto pSession = mRouter->createSession(node, kProtocol, std::move(sink));
      mRouter->confirmSession(pSession->id());
      mOwned.insert(pSession->id());
      mMappings[node] = pSession->id();
      forgetInbound(node);
      info(mLog) << "mapped " << transport::toString(node) << " to session "
                 << pSession->id();

      if (mSessionHandler)
      {
        mSessionHandler(pSession);
      }
      return pSession;
    }

    // The node may already be mapped to a newer session
    void unmap(const transport::UdpEndpoint& node)
    {
      if (mMappings.count(node) > 0 && !mapped(node))
      {
        mMappings.erase(node);
        forgetInbound(node);
      }
    }

    void forgetInbound(const transport::UdpEndpoint& node)
    {
      for (auto it = mInbound.begin(); it != mInbound.end();)
      {
        it = it->first.first == node ? mInbound.erase(it) : std::next(it);
      }
    }

    // Drops sessions the router no longer knows
    void forgetClosed()
    {
      for (auto it = mOwned.begin(); it != mOwned.end();)
      {
        it = mRouter->find(*it) ? std::next(it) : mOwned.erase(it);
      }
    }

    // Runs on the sending thread
    void sendTo(const transport::UdpEndpoint& node, const Envelope& envelope)
    {
      std::vector<ChannelUpdate> updates;
      try
      {
        updates = updatesOf(envelope, mConfig.namespacePrefix);
      }
      catch (const TranslationError&)
      {
        mCounters.failed();
        throw;
      }

      const auto destination = mConfig.remoteEndpoint ? *mConfig.remoteEndpoint : node;
      const auto now = mFrameTimer.now();
      std::lock_guard<std::mutex> lock(mOutputMutex);
      std::vector<uint16_t> touched;
      for (const auto& update : updates)
      {
        auto& output = mOutputs[OutputKey{destination, update.universe}];
        output.frame[update.channel - 1u] = update.value;
        output.length = std::max<std::size_t>(output.length, update.channel);
        output.dirty = true;
        touched.push_back(update.universe);
      }

      for (const auto universe : touched)
      {
        auto& output = mOutputs[OutputKey{destination, universe}];
        if (output.dirty && now - output.lastSent >= mConfig.framePeriod)
        {
          transmit(destination, universe, output, now);
        }
      }
    }

    // Requires mOutputMutex. Throws NetworkError.
    void transmit(const transport::UdpEndpoint& destination,
                  const uint16_t universe,
                  Output& output,
                  const TimePoint now)
    {
      // Sequence 0 disables reordering on the receiver, so it is skipped
      output.sequence = static_cast<uint8_t>(output.sequence % 255 + 1);
      Dmx dmx;
      dmx.sequence = output.sequence;
      dmx.universe = universe;
      dmx.data.assign(
        output.frame.begin(), output.frame.begin() + static_cast<std::ptrdiff_t>(output.length));
      const auto bytes = encode(dmx);
      output.dirty = false;
      output.lastSent = now;
      mTransport.send(bytes, destination);
      mCounters.sent(bytes.size());
    }

    void scheduleFrame()
    {
      mFrameTimer.expires_from_now(mConfig.framePeriod);
      mFrameTimer.async_wait(
        [this](const TimerError e)
        {
          if (!e)
          {
            flush();
            scheduleFrame();
          }
        });
    }

    void flush()
    {
      const auto now = mFrameTimer.now();
      std::vector<std::string> failures;
      {
        std::lock_guard<std::mutex> lock(mOutputMutex);
        for (auto& output : mOutputs)
        {
          if (output.second.dirty || !mConfig.sendDeltasOnly)
          {
            try
            {
              transmit(output.first.first, output.first.second, output.second, now);
            }
            catch (const NetworkError& err)
            {
              failures.push_back(err.what());
            }
          }
        }
      }
      for (const auto& failure : failures)
      {
        reportError(failure);
      }
    }

    void send(const Envelope& envelope)
    {
      if (mMappings.empty() && mConfig.remoteEndpoint)
      {
        accept(*mConfig.remoteEndpoint);
      }

      try
      {
        updatesOf(envelope, mConfig.namespacePrefix);
      }
      catch (const TranslationError&)
      {
        mCounters.failed();
        throw;
      }

      // One failing node doesn't keep the others from being served
      std::vector<v2::SessionId> ids;
      for (const auto& mapping : mMappings)
      {
        ids.push_back(mapping.second);
      }
      for (const auto id : ids)
      {
        const auto pSession = mRouter->find(id);
        if (!pSession || !pSession->live())
        {
          continue;
        }
        try
        {
          mRouter->send(id, envelope);
        }
        catch (const Error& err)
        {
          reportError("Failed to send on session " + std::to_string(id) + ": " + err.what());
        }
      }
    }

    void reportError(const std::string& what)
    {
      mCounters.failed();
      info(mLog) << what;
      if (mErrorHandler)
      {
        mErrorHandler(what);
      }
    }

    void closeSessions(const router::CloseReason reason)
    {
      // Closing sessions no longer mapped to their node included
      const auto owned = mOwned;
      for (const auto id : owned)
      {
        if (mRouter->find(id))
        {
          mRouter->closeSession(id, reason);
        }
      }
      mOwned.clear();
      mMappings.clear();
      mInbound.clear();
    }

    void shutdown()
    {
      mFrameTimer.cancel();
      closeSessions(router::CloseReason::Local);
      mTransport.close();
    }

    using IoLog = typename RouterType::IoType::Log;

    util::Injected<RouterT> mRouter;
    Transport mTransport;
    ArtNetConfig mConfig;
    Timer mFrameTimer;
    IoLog mLog;
    bridge::Counters mCounters;
    std::map<transport::UdpEndpoint, v2::SessionId> mMappings;
    std::set<v2::SessionId> mOwned;
    std::map<InboundKey, Frame> mInbound;
    std::map<transport::UdpEndpoint, Node> mNodes;
    std::mutex mOutputMutex;
    std::map<OutputKey, Output> mOutputs;
    SessionHandler mSessionHandler;
    bridge::ErrorHandler mErrorHandler;
  };

  std::shared_ptr<Impl> mpImpl;
};

} // namespace artnet
} // namespace clasp
