// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Envelope.hpp>
#include <clasp/Errors.hpp>
#include <clasp/router/PayloadEntries.hpp>
#include <clasp/router/Session.hpp>
#include <clasp/transport/AsioTypes.hpp>
#include <clasp/util/Injected.hpp>
#include <clasp/util/SafeAsyncHandler.hpp>
#include <clasp/v2/Messages.hpp>
#include <chrono>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace clasp
{
namespace router
{

// Protocol key of sessions carried natively over the router's transport
const std::string kNativeProtocol = "clasp";

struct RouterConfig
{
  std::string name = "clasp";
  std::size_t maxSessions = 100;
  std::chrono::milliseconds connectTimeout{5000};
  std::chrono::milliseconds idleTimeout{30000};
  std::chrono::milliseconds heartbeatInterval{5000};
  std::chrono::milliseconds helloRetryInterval{500};
  std::chrono::milliseconds closingGrace{1000};
  std::chrono::milliseconds sweepInterval{250};
  // Open a session for a Hello or Data datagram from an unknown peer
  bool acceptUnsolicited = true;
};

struct RouterStats
{
  uint64_t datagramsReceived = 0;
  uint64_t datagramsDropped = 0;
  uint64_t sessionNotFound = 0;
  uint64_t sessionsCreated = 0;
  uint64_t sessionsClosed = 0;
};

// Where a bridged session's outbound envelopes go and who hears about its
// end. A session created without a send function is a native one: its
// envelopes travel over the router's own transport.
struct SessionSink
{
  std::function<void(const Envelope&)> send;
  std::function<void(CloseReason)> closed;
};

// Owns every session and multiplexes the native ones over one transport.
//
// All member functions must be called on the io thread; a Client or a
// bridge service on another thread posts its calls with io().async(...).
// Sessions handed out by the router may be used from any thread. The router
// must be destroyed on the io thread or after the io thread stopped.
template <typename Transport, typename IoContext>
class Router
{
public:
  using IoType = typename util::Injected<IoContext>::type;
  using Timer = typename IoType::Timer;
  using TimerError = typename Timer::ErrorCode;
  using TimePoint = typename Timer::TimePoint;
  using AcceptHandler = std::function<void(std::shared_ptr<Session>)>;
  using StateHandler = std::function<void(const SessionInfo&)>;

  Router(util::Injected<IoContext> io, Transport transport, RouterConfig config = {})
    : mpImpl(std::make_shared<Impl>(std::move(io), std::move(transport), std::move(config)))
  {
    mpImpl->listen();
    mpImpl->scheduleSweep();
  }

  Router(const Router&) = delete;
  Router& operator=(const Router&) = delete;

  ~Router() { mpImpl->shutdown(); }

  // Creates a session towards the peer, superseding a live session for the
  // same peer and protocol. Native sessions start the handshake right away.
  // Throws OtherError once maxSessions sessions exist.
  std::shared_ptr<Session> createSession(const transport::UdpEndpoint& peer,
                                         const std::string& protocol = kNativeProtocol,
                                         SessionSink sink = {})
  {
    return mpImpl->createSession(peer, protocol, std::move(sink), true);
  }

  // Connecting -> Active for sessions whose confirmation doesn't come over
  // the wire. Throws SessionNotFound.
  void confirmSession(const v2::SessionId id) { mpImpl->confirmSession(id); }

  // Hands an inbound envelope to the session. Throws SessionNotFound.
  void deliver(const v2::SessionId id, Envelope envelope)
  {
    mpImpl->deliver(id, std::move(envelope));
  }

  // Throws SessionNotFound, or NetworkError if the transport fails
  void send(const v2::SessionId id, Envelope envelope)
  {
    mpImpl->findOrThrow(id)->send(std::move(envelope), mpImpl->now());
  }

  // Active -> Closing. The session is closed for good once the closing
  // grace period is over. Throws SessionNotFound.
  void disconnect(const v2::SessionId id, const CloseReason reason = CloseReason::Local)
  {
    mpImpl->findOrThrow(id);
    mpImpl->disconnect(id, reason);
  }

  // Closes and forgets the session immediately. Throws SessionNotFound.
  void closeSession(const v2::SessionId id, const CloseReason reason = CloseReason::Local)
  {
    mpImpl->findOrThrow(id);
    mpImpl->closeSession(id, reason);
  }

  void closeAll(const CloseReason reason = CloseReason::Shutdown)
  {
    mpImpl->closeAll(reason);
  }

  std::shared_ptr<Session> find(const v2::SessionId id) const { return mpImpl->find(id); }

  std::shared_ptr<Session> findByPeer(const transport::UdpEndpoint& peer,
                                      const std::string& protocol = kNativeProtocol) const
  {
    const auto it = mpImpl->mByPeer.find(std::make_pair(peer, protocol));
    return it == mpImpl->mByPeer.end() ? nullptr : mpImpl->find(it->second);
  }

  std::vector<SessionInfo> sessions() const
  {
    std::vector<SessionInfo> result;
    for (const auto& entry : mpImpl->mSessions)
    {
      result.push_back(entry.second.pSession->info());
    }
    return result;
  }

  // Called with every session a peer opened towards us
  void onAccept(AcceptHandler handler) { mpImpl->mAcceptHandler = std::move(handler); }

  // Called after every state change the router makes to a session
  void onSessionState(StateHandler handler) { mpImpl->mStateHandler = std::move(handler); }

  const RouterStats& stats() const { return mpImpl->mStats; }

  const RouterConfig& config() const { return mpImpl->mConfig; }

  transport::UdpEndpoint endpoint() const { return mpImpl->mTransport.endpoint(); }

  IoType& io() { return *mpImpl->mIo; }

private:
  struct Entry
  {
    std::shared_ptr<Session> pSession;
    bool native;
    bool initiator;
    TimePoint lastHelloSent;
    TimePoint lastHeartbeatSent;
  };

  using PeerKey = std::pair<transport::UdpEndpoint, std::string>;

  struct Impl : std::enable_shared_from_this<Impl>
  {
    Impl(util::Injected<IoContext> io, Transport transport, RouterConfig config)
      : mIo(std::move(io))
      , mTransport(std::move(transport))
      , mConfig(std::move(config))
      , mSweepTimer(mIo->makeTimer())
      , mLog(channel(mIo->log(), "router"))
    {
    }

    void listen()
    {
      const auto pSelf = this->shared_from_this();
      mTransport.onError(util::makeAsyncSafe(pSelf));
      mTransport.receive(util::makeAsyncSafe(pSelf));
    }

    TimePoint now() const { return mSweepTimer.now(); }

    std::shared_ptr<Session> find(const v2::SessionId id) const
    {
      const auto it = mSessions.find(id);
      return it == mSessions.end() ? nullptr : it->second.pSession;
    }

    std::shared_ptr<Session> findOrThrow(const v2::SessionId id) const
    {
      auto pSession = find(id);
      if (!pSession)
      {
        throw SessionNotFound("No session with id " + std::to_string(id));
      }
      return pSession;
    }

    std::shared_ptr<Session> createSession(const transport::UdpEndpoint& peer,
                                           const std::string& protocol,
                                           SessionSink sink,
                                           const bool initiator)
    {
      const auto key = std::make_pair(peer, protocol);
      const auto existing = mByPeer.find(key);
      if (existing != mByPeer.end())
      {
        info(mLog) << "superseding session " << existing->second << " with "
                   << transport::toString(peer);
        closeSession(existing->second, CloseReason::Superseded);
      }

      if (mSessions.size() >= mConfig.maxSessions)
      {
        throw OtherError("Session limit of " + std::to_string(mConfig.maxSessions)
                         + " reached");
      }

      const auto id = mNextId++;
      const auto native = !sink.send;
      auto outlet = native ? nativeOutlet(peer) : bridgeOutlet(std::move(sink.send));
      auto pSession = std::make_shared<Session>(
        id, peer, protocol, now(), std::move(outlet), std::move(sink.closed));

      mSessions.emplace(id, Entry{pSession, native, initiator && native, {}, now()});
      mByPeer[key] = id;
      ++mStats.sessionsCreated;
      debug(mLog) << "created session " << id << " (" << protocol << ") with "
                  << transport::toString(peer);

      if (native && initiator)
      {
        sendHello(mSessions.at(id));
      }
      notify(*pSession);
      return pSession;
    }

    void confirmSession(const v2::SessionId id)
    {
      auto pSession = findOrThrow(id);
      if (pSession->confirm(now()))
      {
        notify(*pSession);
      }
    }

    void deliver(const v2::SessionId id, Envelope envelope)
    {
      auto pSession = findOrThrow(id);
      const auto wasConnecting = pSession->state() == SessionState::Connecting;
      if (!pSession->deliver(std::move(envelope), now()))
      {
        ++mStats.datagramsDropped;
      }
      else if (wasConnecting)
      {
        notify(*pSession);
      }
    }

    void disconnect(const v2::SessionId id, const CloseReason reason)
    {
      const auto it = mSessions.find(id);
      if (it == mSessions.end() || !it->second.pSession->live())
      {
        return;
      }

      auto& entry = it->second;
      if (entry.native)
      {
        sendGoodbye(*entry.pSession);
      }
      entry.pSession->beginClosing(reason, now());
      forgetPeer(*entry.pSession);
      debug(mLog) << "closing session " << id << ": " << toString(reason);
      notify(*entry.pSession);
    }

    void closeSession(const v2::SessionId id, const CloseReason reason)
    {
      const auto it = mSessions.find(id);
      if (it == mSessions.end())
      {
        return;
      }

      auto entry = std::move(it->second);
      mSessions.erase(it);
      forgetPeer(*entry.pSession);

      if (entry.native && entry.pSession->live() && reason != CloseReason::Remote
          && reason != CloseReason::TransportError)
      {
        sendGoodbye(*entry.pSession);
      }
      entry.pSession->close(reason);
      ++mStats.sessionsClosed;
      debug(mLog) << "closed session " << id << ": " << toString(entry.pSession->reason());
      notify(*entry.pSession);
    }

    void closeAll(const CloseReason reason)
    {
      std::vector<v2::SessionId> ids;
      for (const auto& entry : mSessions)
      {
        ids.push_back(entry.first);
      }
      for (const auto id : ids)
      {
        closeSession(id, reason);
      }
    }

    void shutdown()
    {
      closeAll(CloseReason::Shutdown);
      mSweepTimer.cancel();
      mTransport.close();
    }

    // Inbound datagram
    template <typename It>
    void operator()(const transport::UdpEndpoint& from, const It messageBegin, const It messageEnd)
    {
      ++mStats.datagramsReceived;
      const auto result = v2::parseMessageHeader(messageBegin, messageEnd);
      const auto& header = result.first;

      try
      {
        switch (header.messageType)
        {
        case v2::kHello:
          onHello(from, result.second, messageEnd);
          break;
        case v2::kWelcome:
          onWelcome(from, header.sessionId, result.second, messageEnd);
          break;
        case v2::kHeartbeat:
          onHeartbeat(from, header.sessionId, result.second, messageEnd);
          break;
        case v2::kGoodbye:
          onGoodbye(from, header.sessionId);
          break;
        case v2::kData:
          onData(from, header.sessionId, result.second, messageEnd);
          break;
        default:
          // Discovery traffic and garbage
          ++mStats.datagramsDropped;
          break;
        }
      }
      catch (const std::runtime_error& err)
      {
        ++mStats.datagramsDropped;
        info(mLog) << "dropping datagram from " << transport::toString(from) << ": "
                   << err.what();
      }
    }

    // Socket-fatal transport error
    void operator()(const std::error_code& ec)
    {
      error(mLog) << "transport failed: " << ec.message();
      for (auto& entry : mSessions)
      {
        if (entry.second.pSession->live())
        {
          entry.second.pSession->beginClosing(CloseReason::TransportError, now());
          forgetPeer(*entry.second.pSession);
          notify(*entry.second.pSession);
        }
      }
    }

    template <typename It>
    void onHello(const transport::UdpEndpoint& from, const It begin, const It end)
    {
      auto initiatorId = v2::kNoSession;
      std::string peerName;
      wire::parsePayload<SessionIdEntry, PeerNameEntry>(
        begin,
        end,
        mLog,
        [&initiatorId](const SessionIdEntry& entry) { initiatorId = entry.id; },
        [&peerName](PeerNameEntry entry) { peerName = std::move(entry.name); });

      if (initiatorId == v2::kNoSession)
      {
        ++mStats.datagramsDropped;
        return;
      }

      const auto existing = mByPeer.find(std::make_pair(from, kNativeProtocol));
      if (existing != mByPeer.end())
      {
        auto& entry = mSessions.at(existing->second);
        const auto remoteId = entry.pSession->remoteId();
        if (remoteId == initiatorId)
        {
          // Our Welcome got lost
          entry.pSession->touch(now());
          sendWelcome(*entry.pSession);
          return;
        }
        if (remoteId == v2::kNoSession)
        {
          // Both sides opened at the same time, or the peer's data arrived
          // before its Hello
          entry.pSession->setRemoteId(initiatorId);
          sendWelcome(*entry.pSession);
          if (entry.pSession->confirm(now()))
          {
            notify(*entry.pSession);
          }
          return;
        }
        // The peer started over
        closeSession(existing->second, CloseReason::Superseded);
      }

      if (auto pSession = accept(from))
      {
        info(mLog) << "accepted session " << pSession->id() << " from '" << peerName << "' at "
                   << transport::toString(from);
        pSession->setRemoteId(initiatorId);
        sendWelcome(*pSession);
        pSession->confirm(now());
        notify(*pSession);
        announce(pSession);
      }
    }

    template <typename It>
    void onWelcome(const transport::UdpEndpoint& from,
                   const v2::SessionId id,
                   const It begin,
                   const It end)
    {
      auto pSession = lookup(from, id);
      if (!pSession)
      {
        ++mStats.sessionNotFound;
        return;
      }

      auto responderId = v2::kNoSession;
      wire::parsePayload<SessionIdEntry>(
        begin, end, mLog, [&responderId](const SessionIdEntry& entry) { responderId = entry.id; });
      if (responderId == v2::kNoSession)
      {
        ++mStats.datagramsDropped;
        return;
      }

      pSession->setRemoteId(responderId);
      const auto wasConnecting = pSession->state() == SessionState::Connecting;
      if (pSession->confirm(now()) && wasConnecting)
      {
        debug(mLog) << "session " << pSession->id() << " active";
        notify(*pSession);
      }
    }

    template <typename It>
    void onHeartbeat(const transport::UdpEndpoint& from,
                     const v2::SessionId id,
                     const It begin,
                     const It end)
    {
      auto pSession = lookup(from, id);
      if (!pSession)
      {
        ++mStats.sessionNotFound;
        return;
      }

      auto senderId = v2::kNoSession;
      wire::parsePayload<SessionIdEntry>(
        begin, end, mLog, [&senderId](const SessionIdEntry& entry) { senderId = entry.id; });
      if (senderId != v2::kNoSession && pSession->remoteId() == v2::kNoSession)
      {
        pSession->setRemoteId(senderId);
      }
      pSession->touch(now());
    }

    void onGoodbye(const transport::UdpEndpoint& from, const v2::SessionId id)
    {
      auto pSession = lookup(from, id);
      if (!pSession)
      {
        ++mStats.sessionNotFound;
        return;
      }
      debug(mLog) << "peer closed session " << pSession->id();
      closeSession(pSession->id(), CloseReason::Remote);
    }

    template <typename It>
    void onData(const transport::UdpEndpoint& from,
                const v2::SessionId id,
                const It begin,
                const It end)
    {
      const auto result = v2::DataHeader::fromNetworkByteStream(begin, end);
      Envelope envelope;
      envelope.sequence = result.first.sequence;
      envelope.payloadType = result.first.payloadType;
      envelope.payload.assign(result.second, end);

      auto pSession = lookup(from, id);
      if (!pSession && id == v2::kNoSession)
      {
        pSession = accept(from);
        if (pSession)
        {
          info(mLog) << "accepted session " << pSession->id() << " from data of "
                     << transport::toString(from);
          announce(pSession);
        }
      }
      if (!pSession)
      {
        ++mStats.sessionNotFound;
        debug(mLog) << "no session " << id << " for data from " << transport::toString(from);
        return;
      }

      const auto wasConnecting = pSession->state() == SessionState::Connecting;
      if (!pSession->deliver(std::move(envelope), now()))
      {
        ++mStats.datagramsDropped;
      }
      else if (wasConnecting)
      {
        notify(*pSession);
      }
    }

    // A native session the datagram may touch: the one named by the id if
    // it belongs to the sender, or the sender's live session if no id is
    // given
    std::shared_ptr<Session> lookup(const transport::UdpEndpoint& from, const v2::SessionId id)
    {
      if (id == v2::kNoSession)
      {
        const auto it = mByPeer.find(std::make_pair(from, kNativeProtocol));
        return it == mByPeer.end() ? nullptr : find(it->second);
      }

      const auto it = mSessions.find(id);
      if (it == mSessions.end() || !it->second.native || it->second.pSession->peer() != from)
      {
        return nullptr;
      }
      return it->second.pSession;
    }

    std::shared_ptr<Session> accept(const transport::UdpEndpoint& from)
    {
      if (!mConfig.acceptUnsolicited)
      {
        return nullptr;
      }
      if (mSessions.size() >= mConfig.maxSessions)
      {
        warning(mLog) << "session limit reached, ignoring " << transport::toString(from);
        return nullptr;
      }
      return createSession(from, kNativeProtocol, {}, false);
    }

    void announce(const std::shared_ptr<Session>& pSession)
    {
      if (mAcceptHandler)
      {
        mAcceptHandler(pSession);
      }
    }

    void notify(const Session& session)
    {
      if (mStateHandler)
      {
        mStateHandler(session.info());
      }
    }

    void forgetPeer(const Session& session)
    {
      const auto it = mByPeer.find(std::make_pair(session.peer(), session.protocol()));
      if (it != mByPeer.end() && it->second == session.id())
      {
        mByPeer.erase(it);
      }
    }

    Session::Outlet nativeOutlet(const transport::UdpEndpoint& peer)
    {
      // Runs on the sending thread under the session's lock. The transport
      // serializes the socket access.
      return [this, peer](const v2::SessionId remoteId, const Envelope& envelope)
      {
        v2::MessageBuffer buffer;
        try
        {
          v2::encodeData(remoteId,
                         v2::DataHeader{envelope.sequence, envelope.payloadType},
                         envelope.payload.begin(),
                         envelope.payload.end(),
                         std::back_inserter(buffer));
        }
        catch (const std::range_error& err)
        {
          throw NetworkError(err.what());
        }
        mTransport.send(buffer, peer);
      };
    }

    static Session::Outlet bridgeOutlet(std::function<void(const Envelope&)> send)
    {
      return [send](v2::SessionId, const Envelope& envelope) { send(envelope); };
    }

    void sendHello(Entry& entry)
    {
      entry.lastHelloSent = now();
      sendControl(v2::kHello,
                  v2::kNoSession,
                  wire::makePayload(SessionIdEntry{entry.pSession->id()},
                                    PeerNameEntry{mConfig.name}),
                  entry.pSession->peer());
    }

    void sendWelcome(const Session& session)
    {
      sendControl(v2::kWelcome,
                  session.remoteId(),
                  wire::makePayload(SessionIdEntry{session.id()}),
                  session.peer());
    }

    void sendHeartbeat(Entry& entry)
    {
      entry.lastHeartbeatSent = now();
      sendControl(v2::kHeartbeat,
                  entry.pSession->remoteId(),
                  wire::makePayload(SessionIdEntry{entry.pSession->id()}),
                  entry.pSession->peer());
    }

    void sendGoodbye(const Session& session)
    {
      sendControl(v2::kGoodbye, session.remoteId(), wire::makePayload(), session.peer());
    }

    // Control traffic is best effort, a lost message is covered by the
    // timeouts
    template <typename Payload>
    void sendControl(const v2::MessageType messageType,
                     const v2::SessionId to,
                     const Payload& payload,
                     const transport::UdpEndpoint& peer)
    {
      v2::MessageBuffer buffer;
      v2::encodeMessage(messageType, to, payload, std::back_inserter(buffer));
      try
      {
        mTransport.send(buffer, peer);
      }
      catch (const std::runtime_error& err)
      {
        info(mLog) << "failed to send to " << transport::toString(peer) << ": " << err.what();
      }
    }

    void scheduleSweep()
    {
      mSweepTimer.expires_from_now(mConfig.sweepInterval);
      mSweepTimer.async_wait(
        [this](const TimerError e)
        {
          if (!e)
          {
            sweep();
            scheduleSweep();
          }
        });
    }

    void sweep()
    {
      const auto t = now();
      std::vector<v2::SessionId> ids;
      for (const auto& entry : mSessions)
      {
        ids.push_back(entry.first);
      }

      for (const auto id : ids)
      {
        const auto it = mSessions.find(id);
        if (it == mSessions.end())
        {
          continue;
        }
        auto& entry = it->second;
        const auto sessionInfo = entry.pSession->info();

        switch (sessionInfo.state)
        {
        case SessionState::Connecting:
          if (t - sessionInfo.createdAt >= mConfig.connectTimeout)
          {
            info(mLog) << "session " << id << " timed out connecting";
            closeSession(id, CloseReason::ConnectTimeout);
          }
          else if (entry.initiator && t - entry.lastHelloSent >= mConfig.helloRetryInterval)
          {
            sendHello(entry);
          }
          break;
        case SessionState::Active:
          if (t - sessionInfo.lastActivity >= mConfig.idleTimeout)
          {
            info(mLog) << "session " << id << " idle";
            disconnect(id, CloseReason::IdleTimeout);
          }
          else if (entry.native && t - entry.lastHeartbeatSent >= mConfig.heartbeatInterval)
          {
            sendHeartbeat(entry);
          }
          break;
        case SessionState::Closing:
          if (t - entry.pSession->closingSince() >= mConfig.closingGrace)
          {
            closeSession(id, sessionInfo.reason);
          }
          break;
        case SessionState::Closed:
          mSessions.erase(it);
          break;
        }
      }
    }

    using IoLog = typename IoType::Log;

    util::Injected<IoContext> mIo;
    Transport mTransport;
    RouterConfig mConfig;
    Timer mSweepTimer;
    IoLog mLog;
    std::map<v2::SessionId, Entry> mSessions;
    std::map<PeerKey, v2::SessionId> mByPeer; // Invariant: live sessions only
    v2::SessionId mNextId = 1;
    RouterStats mStats;
    AcceptHandler mAcceptHandler;
    StateHandler mStateHandler;
  };

  std::shared_ptr<Impl> mpImpl;
};

} // namespace router
} // namespace clasp
