// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Errors.hpp>
#include <clasp/bridge/Metrics.hpp>
#include <clasp/osc/OscCodec.hpp>
#include <clasp/router/Router.hpp>
#include <clasp/transport/AsioTypes.hpp>
#include <clasp/util/Injected.hpp>
#include <clasp/util/SafeAsyncHandler.hpp>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace clasp
{
namespace osc
{

const std::string kProtocol = "osc";

struct OscConfig
{
  transport::UdpEndpoint listenEndpoint = {transport::IpAddressV4::any(), 9000};
  std::string namespacePrefix = "/osc";
  // Map a datagram from an unknown peer to a new session
  bool acceptUnsolicited = true;
  // Where outbound packets go. The peer of the session if not set.
  std::optional<transport::UdpEndpoint> replyEndpoint;
};

// Maps each OSC peer to one router session. Inbound packets become
// envelopes delivered to the peer's session; envelopes sent over the
// session go back to the peer as OSC packets.
//
// Must be used on the router's io thread, destroyed before the router.
template <typename RouterT, typename Transport>
class OscBridge
{
public:
  using SessionHandler = std::function<void(std::shared_ptr<router::Session>)>;

  OscBridge(util::Injected<RouterT> router, Transport transport, OscConfig config)
    : mpImpl(std::make_shared<Impl>(std::move(router), std::move(transport), std::move(config)))
  {
    mpImpl->listen();
  }

  OscBridge(const OscBridge&) = delete;
  OscBridge& operator=(const OscBridge&) = delete;

  ~OscBridge() { mpImpl->shutdown(); }

  // The session of the peer, created and confirmed if there is none. Throws
  // what the router throws when creating a session.
  std::shared_ptr<router::Session> accept(const transport::UdpEndpoint& peer)
  {
    return mpImpl->accept(peer);
  }

  // Throws TranslationError
  Envelope toClasp(const Packet& packet) const
  {
    return toEnvelope(packet, mpImpl->mConfig.namespacePrefix);
  }

  // Throws TranslationError
  Packet fromClasp(const Envelope& envelope) const
  {
    return fromEnvelope(envelope, mpImpl->mConfig.namespacePrefix);
  }

  // Sends the envelope over every mapped session, or to the reply endpoint
  // if no peer is known yet
  void send(const Envelope& envelope) { mpImpl->send(envelope); }

  // Called with every session the bridge creates
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

  const OscConfig& config() const { return mpImpl->mConfig; }

private:
  struct Impl : std::enable_shared_from_this<Impl>
  {
    Impl(util::Injected<RouterT> router, Transport transport, OscConfig config)
      : mRouter(std::move(router))
      , mTransport(std::move(transport))
      , mConfig(std::move(config))
      , mLog(channel(mRouter->io().log(), "osc"))
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

      Envelope envelope;
      try
      {
        envelope = toEnvelope(decode(begin, end), mConfig.namespacePrefix);
      }
      catch (const std::runtime_error& err)
      {
        reportError("Dropping OSC packet from " + transport::toString(from) + ": " + err.what());
        return;
      }

      auto pSession = mapped(from);
      if (!pSession)
      {
        if (!mConfig.acceptUnsolicited)
        {
          debug(mLog) << "ignoring unsolicited packet from " << transport::toString(from);
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

      mRouter->deliver(pSession->id(), std::move(envelope));
    }

    void operator()(const std::error_code& ec)
    {
      reportError("OSC socket failed: " + ec.message());
      closeSessions(router::CloseReason::TransportError);
    }

    std::shared_ptr<router::Session> mapped(const transport::UdpEndpoint& peer)
    {
      const auto it = mMappings.find(peer);
      if (it == mMappings.end())
      {
        return nullptr;
      }
      auto pSession = mRouter->find(it->second);
      return pSession && pSession->live() ? pSession : nullptr;
    }

    std::shared_ptr<router::Session> accept(const transport::UdpEndpoint& peer)
    {
      if (auto pSession = mapped(peer))
      {
        return pSession;
      }

      // A session may outlive the bridge while it is closing
      const auto pWeak = std::weak_ptr<Impl>(this->shared_from_this());
      router::SessionSink sink;
      sink.send = [pWeak, peer](const Envelope& envelope)
      {
        const auto pImpl = pWeak.lock();
        if (!pImpl)
        {
          throw SessionNotFound("OSC bridge for " + transport::toString(peer) + " is gone");
        }
        pImpl->sendTo(peer, envelope);
      };
      sink.closed = [pWeak, peer](router::CloseReason)
      {
        if (const auto pImpl = pWeak.lock())
        {
          pImpl->unmap(peer);
        }
      };
      forgetClosed();
      auto pSession = mRouter->createSession(peer, kProtocol, std::move(sink));
      mRouter->confirmSession(pSession->id());
      mOwned.insert(pSession->id());
      mMappings[peer] = pSession->id();
      info(mLog) << "mapped " << transport::toString(peer) << " to session "
                 << pSession->id();

      if (mSessionHandler)
      {
        mSessionHandler(pSession);
      }
      return pSession;
    }

    // The peer may already be mapped to a newer session
    void unmap(const transport::UdpEndpoint& peer)
    {
      if (mMappings.count(peer) > 0 && !mapped(peer))
      {
        mMappings.erase(peer);
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
    void sendTo(const transport::UdpEndpoint& peer, const Envelope& envelope)
    {
      std::vector<uint8_t> bytes;
      try
      {
        bytes = encode(fromEnvelope(envelope, mConfig.namespacePrefix));
      }
      catch (const TranslationError&)
      {
        mCounters.failed();
        throw;
      }
      mTransport.send(bytes, mConfig.replyEndpoint ? *mConfig.replyEndpoint : peer);
      mCounters.sent(bytes.size());
    }

    void send(const Envelope& envelope)
    {
      if (mMappings.empty() && mConfig.replyEndpoint)
      {
        accept(*mConfig.replyEndpoint);
      }

      try
      {
        fromEnvelope(envelope, mConfig.namespacePrefix);
      }
      catch (const TranslationError&)
      {
        mCounters.failed();
        throw;
      }

      // One failing peer doesn't keep the others from being served
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
      // Closing sessions no longer mapped to their peer included
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
    }

    void shutdown()
    {
      closeSessions(router::CloseReason::Local);
      mTransport.close();
    }

    using IoLog = typename util::Injected<RouterT>::type::IoType::Log;

    util::Injected<RouterT> mRouter;
    Transport mTransport;
    OscConfig mConfig;
    IoLog mLog;
    bridge::Counters mCounters;
    std::map<transport::UdpEndpoint, v2::SessionId> mMappings;
    std::set<v2::SessionId> mOwned;
    SessionHandler mSessionHandler;
    bridge::ErrorHandler mErrorHandler;
  };

  std::shared_ptr<Impl> mpImpl;
};

} // namespace osc
} // namespace clasp
