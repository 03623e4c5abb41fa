// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Errors.hpp>
#include <clasp/bridge/Metrics.hpp>
#include <clasp/message/Codec.hpp>
#include <clasp/midi/MidiMapping.hpp>
#include <clasp/midi/MidiParser.hpp>
#include <clasp/router/Router.hpp>
#include <clasp/util/Injected.hpp>
#include <clasp/util/SafeAsyncHandler.hpp>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace clasp
{
namespace midi
{

const std::string kProtocol = "midi";

struct MidiConfig
{
  // Raw MIDI device paths, e.g. /dev/snd/midiC1D0. Empty for none.
  std::string inputPort;
  std::string outputPort;
  std::string namespacePrefix = "/midi";
  std::string deviceName = "default";
};

// Bridges one MIDI device to one router session. The device is the
// foreign connection, so the session is opened as soon as the bridge
// starts and closed with it.
//
// The Port concept:
//  - send(const uint8_t*, std::size_t), throws on failure
//  - receive(handler(begin, end), errorHandler(std::error_code)), one shot
//  - close()
//
// Must be used on the router's io thread, destroyed before the router.
template <typename RouterT, typename Port>
class MidiBridge
{
public:
  using SessionHandler = std::function<void(std::shared_ptr<router::Session>)>;

  MidiBridge(util::Injected<RouterT> router,
             std::optional<Port> input,
             std::optional<Port> output,
             MidiConfig config)
    : mpImpl(std::make_shared<Impl>(
      std::move(router), std::move(input), std::move(output), std::move(config)))
  {
    mpImpl->accept();
    mpImpl->listen();
  }

  MidiBridge(const MidiBridge&) = delete;
  MidiBridge& operator=(const MidiBridge&) = delete;

  ~MidiBridge() { mpImpl->shutdown(); }

  // The session of the device, reopened if the previous one was closed.
  // Throws what the router throws when creating a session.
  std::shared_ptr<router::Session> accept() { return mpImpl->accept(); }

  // Empty for MIDI messages without a CLASP address. Throws
  // TranslationError.
  std::optional<Envelope> toClasp(const MidiMessage& msg) const
  {
    const auto translated = midi::toClasp(msg, mpImpl->mBase);
    if (!translated)
    {
      return std::nullopt;
    }
    return message::toEnvelope(*translated);
  }

  // One MIDI message per CLASP message. Throws TranslationError.
  std::vector<MidiMessage> fromClasp(const Envelope& envelope) const
  {
    return mpImpl->fromClasp(envelope);
  }

  void send(const Envelope& envelope)
  {
    const auto pSession = mpImpl->accept();
    mpImpl->mRouter->send(pSession->id(), envelope);
  }

  void onSession(SessionHandler handler) { mpImpl->mSessionHandler = std::move(handler); }

  void onError(bridge::ErrorHandler handler) { mpImpl->mErrorHandler = std::move(handler); }

  bridge::BridgeMetrics metrics() const { return mpImpl->mCounters.snapshot(); }

  std::vector<v2::SessionId> sessions() const
  {
    std::vector<v2::SessionId> ids;
    if (mpImpl->mSessionId)
    {
      ids.push_back(*mpImpl->mSessionId);
    }
    return ids;
  }

  bool running() const { return !mpImpl->mFailed; }

  // The router protocol key of the device's session
  const std::string& protocol() const { return mpImpl->mProtocol; }

  const MidiConfig& config() const { return mpImpl->mConfig; }

private:
  struct Impl : std::enable_shared_from_this<Impl>
  {
    Impl(util::Injected<RouterT> router,
         std::optional<Port> input,
         std::optional<Port> output,
         MidiConfig config)
      : mRouter(std::move(router))
      , mInput(std::move(input))
      , mOutput(std::move(output))
      , mConfig(std::move(config))
      , mBase(baseAddress(mConfig.namespacePrefix, mConfig.deviceName))
      , mProtocol(kProtocol + "/" + mConfig.deviceName)
      , mLog(channel(mRouter->io().log(), "midi"))
    {
    }

    void listen()
    {
      if (mInput)
      {
        const auto pSelf = this->shared_from_this();
        mInput->receive(util::makeAsyncSafe(pSelf), util::makeAsyncSafe(pSelf));
      }
    }

    // Bytes read from the input port
    template <typename It>
    void operator()(const It begin, const It end)
    {
      mParser.feed(begin, end, [this](const MidiMessage& msg) { onMessage(msg); });
      listen();
    }

    void operator()(const std::error_code& ec)
    {
      mFailed = true;
      reportError("MIDI port " + mConfig.inputPort + " failed: " + ec.message());
      closeSession(router::CloseReason::TransportError);
    }

    void onMessage(const MidiMessage& msg)
    {
      mCounters.received(msg.size());
      std::optional<message::Message> translated;
      try
      {
        translated = midi::toClasp(msg, mBase);
      }
      catch (const TranslationError& err)
      {
        reportError(err.what());
        return;
      }
      if (!translated)
      {
        return;
      }

      try
      {
        const auto pSession = accept();
        mRouter->deliver(pSession->id(), message::toEnvelope(*translated));
      }
      catch (const Error& err)
      {
        reportError(err.what());
      }
    }

    std::shared_ptr<router::Session> accept()
    {
      if (mSessionId)
      {
        if (auto pSession = mRouter->find(*mSessionId))
        {
          if (pSession->live())
          {
            return pSession;
          }
        }
      }

      // A session may outlive the bridge while it is closing
      const auto pWeak = std::weak_ptr<Impl>(this->shared_from_this());
      router::SessionSink sink;
      sink.send = [pWeak](const Envelope& envelope)
      {
        const auto pImpl = pWeak.lock();
        if (!pImpl)
        {
          throw SessionNotFound("MIDI device is gone");
        }
        pImpl->write(envelope);
      };
      sink.closed = [pWeak](router::CloseReason)
      {
        const auto pImpl = pWeak.lock();
        // A newer session may already have taken over
        if (pImpl && pImpl->mSessionId && !pImpl->mRouter->find(*pImpl->mSessionId))
        {
          pImpl->mSessionId = std::nullopt;
        }
      };
      for (auto it = mOwned.begin(); it != mOwned.end();)
      {
        it = mRouter->find(*it) ? std::next(it) : mOwned.erase(it);
      }
      auto pSession = mRouter->createSession({}, mProtocol, std::move(sink));
      mRouter->confirmSession(pSession->id());
      mOwned.insert(pSession->id());
      if (mSessionsOpened++ > 0)
      {
        mCounters.reconnected();
      }
      mSessionId = pSession->id();
      info(mLog) << "device " << mConfig.deviceName << " on session " << pSession->id();

      if (mSessionHandler)
      {
        mSessionHandler(pSession);
      }
      return pSession;
    }

    std::vector<MidiMessage> fromClasp(const Envelope& envelope) const
    {
      std::vector<MidiMessage> result;
      for (const auto& msg : message::messagesOf(message::fromEnvelope(envelope)))
      {
        result.push_back(midi::fromClasp(msg, mBase));
      }
      return result;
    }

    // Runs on the sending thread. MIDI carries no timestamps, so messages
    // are written as soon as they are translated.
    void write(const Envelope& envelope)
    {
      std::vector<MidiMessage> messages;
      try
      {
        messages = fromClasp(envelope);
      }
      catch (const TranslationError&)
      {
        mCounters.failed();
        throw;
      }

      std::lock_guard<std::mutex> lock(mOutputMutex);
      if (!mOutput)
      {
        throw IoError("Device " + mConfig.deviceName + " has no output port");
      }
      for (const auto& msg : messages)
      {
        mOutput->send(msg.data(), msg.size());
        mCounters.sent(msg.size());
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

    // Closes closing sessions the device moved away from as well
    void closeSession(const router::CloseReason reason)
    {
      const auto owned = mOwned;
      for (const auto id : owned)
      {
        if (mRouter->find(id))
        {
          mRouter->closeSession(id, reason);
        }
      }
      mOwned.clear();
      mSessionId = std::nullopt;
    }

    void shutdown()
    {
      closeSession(router::CloseReason::Local);
      if (mInput)
      {
        mInput->close();
      }
      std::lock_guard<std::mutex> lock(mOutputMutex);
      if (mOutput)
      {
        mOutput->close();
      }
    }

    using IoLog = typename util::Injected<RouterT>::type::IoType::Log;

    util::Injected<RouterT> mRouter;
    std::optional<Port> mInput;
    std::optional<Port> mOutput;
    std::mutex mOutputMutex;
    MidiConfig mConfig;
    std::string mBase;
    std::string mProtocol;
    IoLog mLog;
    Parser mParser;
    bridge::Counters mCounters;
    std::optional<v2::SessionId> mSessionId;
    std::set<v2::SessionId> mOwned;
    std::size_t mSessionsOpened = 0;
    bool mFailed = false;
    SessionHandler mSessionHandler;
    bridge::ErrorHandler mErrorHandler;
  };

  std::shared_ptr<Impl> mpImpl;
};

} // namespace midi
} // namespace clasp
