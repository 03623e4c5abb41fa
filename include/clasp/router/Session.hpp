// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Envelope.hpp>
#include <clasp/Errors.hpp>
#include <clasp/transport/AsioTypes.hpp>
#include <clasp/util/Channel.hpp>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace clasp
{
namespace router
{

enum class SessionState
{
  Connecting,
  Active,
  Closing,
  Closed
};

enum class CloseReason
{
  None,
  Local,
  Remote,
  ConnectTimeout,
  IdleTimeout,
  Superseded,
  TransportError,
  Shutdown
};

inline const char* toString(const SessionState state)
{
  switch (state)
  {
  case SessionState::Connecting:
    return "connecting";
  case SessionState::Active:
    return "active";
  case SessionState::Closing:
    return "closing";
  case SessionState::Closed:
    break;
  }
  return "closed";
}

inline const char* toString(const CloseReason reason)
{
  switch (reason)
  {
  case CloseReason::None:
    return "none";
  case CloseReason::Local:
    return "local";
  case CloseReason::Remote:
    return "remote";
  case CloseReason::ConnectTimeout:
    return "connect timeout";
  case CloseReason::IdleTimeout:
    return "idle timeout";
  case CloseReason::Superseded:
    return "superseded";
  case CloseReason::TransportError:
    return "transport error";
  case CloseReason::Shutdown:
    break;
  }
  return "shutdown";
}

using Clock = std::chrono::system_clock;

struct SessionInfo
{
  v2::SessionId id;
  v2::SessionId remoteId;
  transport::UdpEndpoint peer;
  std::string protocol;
  SessionState state;
  CloseReason reason;
  Clock::time_point createdAt;
  Clock::time_point lastActivity;
  uint64_t envelopesSent;
  uint64_t envelopesReceived;
};

// One routed conversation with one peer. The router owns the lifecycle and
// drives the state on its io thread; the owner of the session (a client or
// a bridge adapter) sends and receives through it from any thread. All
// mutable state is guarded by the session's own mutex, so sessions never
// contend with each other.
class Session
{
public:
  using TimePoint = Clock::time_point;
  // Puts an outbound envelope on its way, given the peer's id for this
  // session (0 while the peer's id is unknown)
  using Outlet = std::function<void(v2::SessionId, const Envelope&)>;
  using CloseHandler = std::function<void(CloseReason)>;
  using ReceiveHandler = std::function<void(const Envelope&)>;

  Session(const v2::SessionId id,
          transport::UdpEndpoint peer,
          std::string protocol,
          const TimePoint now,
          Outlet outlet,
          CloseHandler closeHandler = {})
    : mId(id)
    , mPeer(std::move(peer))
    , mProtocol(std::move(protocol))
    , mOutlet(std::move(outlet))
    , mCloseHandler(std::move(closeHandler))
    , mCreatedAt(now)
    , mLastActivity(now)
  {
  }

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  v2::SessionId id() const { return mId; }

  const transport::UdpEndpoint& peer() const { return mPeer; }

  const std::string& protocol() const { return mProtocol; }

  SessionState state() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mState;
  }

  CloseReason reason() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mReason;
  }

  v2::SessionId remoteId() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mRemoteId;
  }

  SessionInfo info() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return {mId,
            mRemoteId,
            mPeer,
            mProtocol,
            mState,
            mReason,
            mCreatedAt,
            mLastActivity,
            mEnvelopesSent,
            mEnvelopesReceived};
  }

  bool live() const
  {
    const auto s = state();
    return s == SessionState::Connecting || s == SessionState::Active;
  }

  // Stamps the envelope with this session's id and the next sequence number
  // and hands it to the outlet. Throws SessionNotFound once the session is
  // closing.
  void send(Envelope envelope, const TimePoint now)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    if (mState != SessionState::Connecting && mState != SessionState::Active)
    {
      throw SessionNotFound("Session " + std::to_string(mId) + " is " + toString(mState));
    }
    envelope.sessionId = mId;
    envelope.sequence = mNextSequence++;
    mLastActivity = now;
    ++mEnvelopesSent;
    mOutlet(mRemoteId, envelope);
  }

  // Blocks until an envelope arrives. Empty once the session is closing and
  // everything received before has been consumed.
  std::optional<Envelope> receive() { return mInbox.pop(); }

  template <typename Rep, typename Period>
  std::optional<Envelope> receive(const std::chrono::duration<Rep, Period> timeout)
  {
    return mInbox.popFor(timeout);
  }

  std::optional<Envelope> tryReceive() { return mInbox.tryPop(); }

  // Blocks while the session is connecting, at most for the timeout.
  // Returns the state it ended up in.
  template <typename Rep, typename Period>
  SessionState awaitConnected(const std::chrono::duration<Rep, Period> timeout)
  {
    std::unique_lock<std::mutex> lock(mMutex);
    mCondition.wait_for(
      lock, timeout, [this] { return mState != SessionState::Connecting; });
    return mState;
  }

  // Delivered envelopes go to the handler instead of the inbox. The handler
  // runs on the thread that delivers, which is the router's io thread.
  void setReceiveHandler(ReceiveHandler handler)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mReceiveHandler = std::move(handler);
  }

  // The operations below are the router's

  // Returns false if the session no longer accepts traffic
  bool deliver(Envelope envelope, const TimePoint now)
  {
    ReceiveHandler handler;
    {
      std::lock_guard<std::mutex> lock(mMutex);
      if (mState != SessionState::Connecting && mState != SessionState::Active)
      {
        return false;
      }
      envelope.sessionId = mId;
      mLastActivity = now;
      ++mEnvelopesReceived;
      if (mState == SessionState::Connecting)
      {
        mState = SessionState::Active;
        mCondition.notify_all();
      }
      handler = mReceiveHandler;
      if (!handler)
      {
        mInbox.push(std::move(envelope));
        return true;
      }
    }
    handler(envelope);
    return true;
  }

  void touch(const TimePoint now)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mLastActivity = now;
  }

  void setRemoteId(const v2::SessionId remoteId)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mRemoteId = remoteId;
  }

  // Connecting -> Active. Returns false if the session is past connecting.
  bool confirm(const TimePoint now)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    if (mState == SessionState::Active)
    {
      mLastActivity = now;
      return true;
    }
    if (mState != SessionState::Connecting)
    {
      return false;
    }
    mState = SessionState::Active;
    mLastActivity = now;
    mCondition.notify_all();
    return true;
  }

  // Stops accepting traffic. Pending receives drain what is left and
  // then come back empty.
  void beginClosing(const CloseReason reason, const TimePoint now)
  {
    {
      std::lock_guard<std::mutex> lock(mMutex);
      if (mState == SessionState::Closing || mState == SessionState::Closed)
      {
        return;
      }
      mState = SessionState::Closing;
      mReason = reason;
      mClosingSince = now;
      mCondition.notify_all();
    }
    mInbox.close();
  }

  // Terminal. Calls the close handler once.
  void close(const CloseReason reason)
  {
    CloseHandler handler;
    CloseReason finalReason;
    {
      std::lock_guard<std::mutex> lock(mMutex);
      if (mState == SessionState::Closed)
      {
        return;
      }
      if (mState != SessionState::Closing)
      {
        mReason = reason;
      }
      finalReason = mReason;
      mState = SessionState::Closed;
      mCondition.notify_all();
      handler = std::move(mCloseHandler);
      mCloseHandler = nullptr;
      mReceiveHandler = nullptr;
    }
    mInbox.close();
    if (handler)
    {
      handler(finalReason);
    }
  }

  TimePoint closingSince() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mClosingSince;
  }

private:
  const v2::SessionId mId;
  const transport::UdpEndpoint mPeer;
  const std::string mProtocol;
  Outlet mOutlet;
  CloseHandler mCloseHandler;
  ReceiveHandler mReceiveHandler;

  mutable std::mutex mMutex;
  std::condition_variable mCondition;
  SessionState mState = SessionState::Connecting;
  CloseReason mReason = CloseReason::None;
  v2::SessionId mRemoteId = v2::kNoSession;
  uint32_t mNextSequence = 0;
  TimePoint mCreatedAt;
  TimePoint mLastActivity;
  TimePoint mClosingSince;
  uint64_t mEnvelopesSent = 0;
  uint64_t mEnvelopesReceived = 0;
  util::Channel<Envelope> mInbox;
};

} // namespace router
} // namespace clasp
