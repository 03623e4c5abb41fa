// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Errors.hpp>
#include <clasp/artnet/ArtNetBridge.hpp>
#include <clasp/discovery/Discovery.hpp>
#include <clasp/message/Codec.hpp>
#include <clasp/midi/MidiBridge.hpp>
#include <clasp/osc/OscBridge.hpp>
#include <clasp/router/Router.hpp>
#include <clasp/service/AnyBridge.hpp>
#include <clasp/transport/UdpTransport.hpp>
#include <clasp/util/Injected.hpp>
#include <clasp/util/Synchronous.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace clasp
{
namespace service
{

using BridgeId = std::string;

using BridgeConfig = std::variant<osc::OscConfig, midi::MidiConfig, artnet::ArtNetConfig>;

enum class BridgeStatus
{
  Starting,
  Running,
  Stopped,
  Error,
  Reconnecting
};

inline const char* toString(const BridgeStatus status)
{
  switch (status)
  {
  case BridgeStatus::Starting:
    return "starting";
  case BridgeStatus::Running:
    return "running";
  case BridgeStatus::Stopped:
    return "stopped";
  case BridgeStatus::Error:
    return "error";
  case BridgeStatus::Reconnecting:
    break;
  }
  return "reconnecting";
}

struct BridgeInfo
{
  BridgeId id;
  std::string protocol;
  std::string listenAddress;
  BridgeStatus status = BridgeStatus::Starting;
  uint64_t messagesSent = 0;
  uint64_t messagesReceived = 0;
  std::optional<std::string> lastError;
  std::chrono::system_clock::time_point startedAt;
};

struct BridgeDiagnostics
{
  BridgeInfo info;
  bridge::BridgeMetrics metrics;
  std::vector<v2::SessionId> sessions;
  std::vector<std::string> recentErrors;
};

struct SessionHealth
{
  v2::SessionId id = 0;
  transport::UdpEndpoint peer;
  std::string protocol;
  router::SessionState state = router::SessionState::Connecting;
  bool live = false;
};

struct Health
{
  // "healthy" if every bridge runs, "degraded" if some do, "idle" otherwise
  std::string status;
  std::size_t bridgesTotal = 0;
  std::size_t bridgesRunning = 0;
  uint64_t totalErrors = 0;
  std::vector<SessionHealth> sessions;
  // Empty unless a discovery instance is watched
  std::optional<discovery::DiscoveryHealth> discovery;
};

// A message that arrived over a bridge
struct Signal
{
  BridgeId bridgeId;
  std::string protocol;
  message::Message message;
};

struct BridgeServiceConfig
{
  // A bridge is created by start() for every protocol configured here
  std::optional<osc::OscConfig> osc;
  std::optional<midi::MidiConfig> midi;
  std::optional<artnet::ArtNetConfig> artnet;
  std::size_t maxRecentErrors = 10;
};

// Creates, lists and removes bridge adapters on one router and reports
// their health. Public member functions are called from any thread but the
// router's io thread; the adapters themselves only ever run there. The
// service must be destroyed while the io thread is still running.
template <typename RouterT>
class BridgeService
{
public:
  using RouterType = typename util::Injected<RouterT>::type;
  using Factory = std::function<std::unique_ptr<AnyBridge>(RouterType&, const BridgeConfig&)>;
  using SignalHandler = std::function<void(const Signal&)>;

  explicit BridgeService(util::Injected<RouterT> router, BridgeServiceConfig config = {})
    : mRouter(std::move(router))
    , mConfig(std::move(config))
    , mLog(channel(mRouter->io().log(), "service"))
  {
  }

  BridgeService(const BridgeService&) = delete;
  BridgeService& operator=(const BridgeService&) = delete;

  ~BridgeService()
  {
    std::map<BridgeId, std::shared_ptr<Record>> records;
    {
      std::lock_guard<std::mutex> lock(mMutex);
      records.swap(mRecords);
    }
    util::synchronous(mRouter->io(),
                      [&records]
                      {
                        for (auto& record : records)
                        {
                          record.second->pBridge.reset();
                        }
                      });
  }

  void registerProtocol(std::string protocol, Factory factory)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mFactories[std::move(protocol)] = std::move(factory);
  }

  // OSC, MIDI and Art-Net over the sockets and MIDI devices of the router's
  // io context
  void registerDefaultProtocols()
  {
    registerProtocol(osc::kProtocol, &BridgeService::makeOscBridge);
    registerProtocol(midi::kProtocol, &BridgeService::makeMidiBridge);
    registerProtocol(artnet::kProtocol, &BridgeService::makeArtNetBridge);
  }

  // Creates the bridges of the configuration. Throws what createBridge
  // throws; bridges created before the failure are kept.
  std::vector<BridgeId> start()
  {
    std::vector<BridgeId> ids;
    if (mConfig.osc)
    {
      ids.push_back(createBridge(osc::kProtocol, *mConfig.osc));
    }
    if (mConfig.midi)
    {
      ids.push_back(createBridge(midi::kProtocol, *mConfig.midi));
    }
    if (mConfig.artnet)
    {
      ids.push_back(createBridge(artnet::kProtocol, *mConfig.artnet));
    }
    return ids;
  }

  // Throws OtherError for an unknown protocol or a configuration of another
  // protocol, or what the adapter throws when binding its connection
  BridgeId createBridge(const std::string& protocol, const BridgeConfig& config)
  {
    Factory factory;
    std::shared_ptr<Record> pRecord;
    {
      std::lock_guard<std::mutex> lock(mMutex);
      const auto it = mFactories.find(protocol);
      if (it == mFactories.end())
      {
        throw OtherError("Unknown bridge protocol " + protocol);
      }
      factory = it->second;
      pRecord = std::make_shared<Record>();
      pRecord->id = protocol + "-" + std::to_string(++mNextId);
      pRecord->protocol = protocol;
      pRecord->startedAt = std::chrono::system_clock::now();
      mRecords[pRecord->id] = pRecord;
    }

    try
    {
      util::synchronous(mRouter->io(),
                        [this, &factory, &config, pRecord]
                        {
                          auto pBridge = factory(*mRouter, config);
                          observe(*pRecord, *pBridge);
                          pRecord->listenAddress = pBridge->listenAddress();
                          pRecord->pBridge = std::move(pBridge);
                        });
    }
    catch (const std::runtime_error& err)
    {
      {
        std::lock_guard<std::mutex> lock(mMutex);
        mRecords.erase(pRecord->id);
      }
      warning(mLog) << "failed to create " << protocol << " bridge: " << err.what();
      throw;
    }

    info(mLog) << "created bridge " << pRecord->id << " on " << pRecord->listenAddress;
    return pRecord->id;
  }

  std::vector<BridgeInfo> listBridges()
  {
    const auto records = snapshot();
    return util::synchronous(mRouter->io(),
                             [this, &records]
                             {
                               std::vector<BridgeInfo> result;
                               for (const auto& pRecord : records)
                               {
                                 result.push_back(infoOf(*pRecord));
                               }
                               return result;
                             });
  }

  // Stops the bridge and closes its sessions. Throws OtherError if there is
  // no such bridge.
  void deleteBridge(const BridgeId& id)
  {
    std::shared_ptr<Record> pRecord;
    {
      std::lock_guard<std::mutex> lock(mMutex);
      const auto it = mRecords.find(id);
      if (it == mRecords.end())
      {
        throw OtherError("Bridge not found: " + id);
      }
      pRecord = it->second;
      mRecords.erase(it);
    }
    util::synchronous(mRouter->io(), [pRecord] { pRecord->pBridge.reset(); });
    info(mLog) << "deleted bridge " << id;
  }

  // Throws OtherError if there is no such bridge
  BridgeDiagnostics diagnostics(const BridgeId& id)
  {
    const auto pRecord = find(id);
    return util::synchronous(mRouter->io(),
                             [this, pRecord]
                             {
                               BridgeDiagnostics result;
                               result.info = infoOf(*pRecord);
                               if (pRecord->pBridge)
                               {
                                 result.metrics = pRecord->pBridge->metrics();
                                 result.sessions = pRecord->pBridge->sessions();
                               }
                               std::lock_guard<std::mutex> lock(pRecord->mutex);
                               result.recentErrors.assign(
                                 pRecord->recentErrors.begin(), pRecord->recentErrors.end());
                               return result;
                             });
  }

  Health health()
  {
    const auto records = snapshot();
    auto result = util::synchronous(
      mRouter->io(),
      [this, &records]
      {
        Health h;
        h.bridgesTotal = records.size();
        for (const auto& pRecord : records)
        {
          if (pRecord->pBridge)
          {
            if (pRecord->pBridge->running())
            {
              ++h.bridgesRunning;
            }
            h.totalErrors += pRecord->pBridge->metrics().errors;
          }
        }
        for (const auto& session : mRouter->sessions())
        {
          const auto live = session.state == router::SessionState::Connecting
                            || session.state == router::SessionState::Active;
          h.sessions.push_back(
            SessionHealth{session.id, session.peer, session.protocol, session.state, live});
        }
        return h;
      });

    if (result.bridgesTotal > 0 && result.bridgesRunning == result.bridgesTotal)
    {
      result.status = "healthy";
    }
    else if (result.bridgesRunning > 0)
    {
      result.status = "degraded";
    }
    else
    {
      result.status = "idle";
    }

    std::function<discovery::DiscoveryHealth()> discoveryHealth;
    {
      std::lock_guard<std::mutex> lock(mMutex);
      discoveryHealth = mDiscoveryHealth;
    }
    if (discoveryHealth)
    {
      result.discovery = discoveryHealth();
    }
    return result;
  }

  // Sends the message through the bridge to its foreign side. Throws
  // OtherError if there is no such bridge, TranslationError if the
  // message has no counterpart in the bridge's protocol.
  void sendSignal(const BridgeId& id, const message::Message& msg)
  {
    const auto pRecord = find(id);
    util::synchronous(mRouter->io(),
                      [pRecord, &msg]
                      {
                        if (!pRecord->pBridge)
                        {
                          throw OtherError("Bridge " + pRecord->id + " is stopped");
                        }
                        pRecord->pBridge->send(message::toEnvelope(msg));
                      });
  }

  // Called on the io thread with every message arriving over any bridge
  void onSignal(SignalHandler handler)
  {
    util::synchronous(mRouter->io(), [this, &handler] { mSignalHandler = std::move(handler); });
  }

  // Reports the discovery loops in health(). The discovery must outlive the
  // service.
  template <typename DiscoveryT>
  void watch(DiscoveryT& discovery)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mDiscoveryHealth = [&discovery] { return discovery.health(); };
  }

  const BridgeServiceConfig& config() const { return mConfig; }

private:
  struct Record
  {
    BridgeId id;
    std::string protocol;
    std::string listenAddress;
    std::chrono::system_clock::time_point startedAt;
    // Only touched on the io thread
    std::unique_ptr<AnyBridge> pBridge;
    std::mutex mutex;
    std::deque<std::string> recentErrors;
  };

  template <typename Config>
  static const Config& configOf(const BridgeConfig& config, const std::string& protocol)
  {
    if (const auto pConfig = std::get_if<Config>(&config))
    {
      return *pConfig;
    }
    throw OtherError("Expected a " + protocol + " bridge configuration");
  }

  static std::unique_ptr<AnyBridge> makeOscBridge(RouterType& router, const BridgeConfig& config)
  {
    const auto& oscConfig = configOf<osc::OscConfig>(config, osc::kProtocol);
    auto transport =
      transport::bindUdpTransport(util::injectRef(router.io()), oscConfig.listenEndpoint);
    const auto address = transport::toString(transport.endpoint());
    using Bridge = osc::OscBridge<RouterType&, decltype(transport)>;
    return std::make_unique<AnyBridge>(
      std::make_unique<Bridge>(util::injectRef(router), std::move(transport), oscConfig),
      osc::kProtocol,
      address);
  }

  static std::unique_ptr<AnyBridge> makeMidiBridge(RouterType& router,
                                                   const BridgeConfig& config)
  {
    using Port = typename RouterType::IoType::MidiPort;
    const auto& midiConfig = configOf<midi::MidiConfig>(config, midi::kProtocol);
    std::optional<Port> input;
    std::optional<Port> output;
    if (!midiConfig.inputPort.empty())
    {
      input.emplace(router.io().openMidiPort(midiConfig.inputPort, Port::Direction::Input));
    }
    if (!midiConfig.outputPort.empty())
    {
      output.emplace(router.io().openMidiPort(midiConfig.outputPort, Port::Direction::Output));
    }
    using Bridge = midi::MidiBridge<RouterType&, Port>;
    return std::make_unique<AnyBridge>(
      std::make_unique<Bridge>(
        util::injectRef(router), std::move(input), std::move(output), midiConfig),
      midi::kProtocol,
      midiConfig.inputPort.empty() ? midiConfig.outputPort : midiConfig.inputPort);
  }

  static std::unique_ptr<AnyBridge> makeArtNetBridge(RouterType& router,
                                                     const BridgeConfig& config)
  {
    const auto& artnetConfig = configOf<artnet::ArtNetConfig>(config, artnet::kProtocol);
    auto transport =
      transport::bindUdpTransport(util::injectRef(router.io()), artnetConfig.listenEndpoint);
    const auto address = transport::toString(transport.endpoint());
    using Bridge = artnet::ArtNetBridge<RouterType&, decltype(transport)>;
    return std::make_unique<AnyBridge>(
      std::make_unique<Bridge>(util::injectRef(router), std::move(transport), artnetConfig),
      artnet::kProtocol,
      address);
  }

  // Runs on the io thread. The record outlives the bridge, so the handlers
  // may refer to it.
  void observe(Record& record, AnyBridge& bridge)
  {
    Record* const pRecord = &record;
    const auto maxErrors = mConfig.maxRecentErrors;
    bridge.onError(
      [pRecord, maxErrors](const std::string& what)
      {
        std::lock_guard<std::mutex> lock(pRecord->mutex);
        pRecord->recentErrors.push_back(what);
        while (pRecord->recentErrors.size() > maxErrors)
        {
          pRecord->recentErrors.pop_front();
        }
      });
    bridge.onSession(
      [this, pRecord](const std::shared_ptr<router::Session>& pSession)
      {
        pSession->setReceiveHandler([this, pRecord](const Envelope& envelope)
                                    { forward(*pRecord, envelope); });
      });
  }

  // Runs on the io thread
  void forward(Record& record, const Envelope& envelope)
  {
    if (!mSignalHandler)
    {
      return;
    }

    std::vector<message::Message> messages;
    try
    {
      messages = message::messagesOf(message::fromEnvelope(envelope, mLog));
    }
    catch (const std::runtime_error& err)
    {
      info(mLog) << "dropping envelope from bridge " << record.id << ": " << err.what();
      return;
    }
    for (auto& msg : messages)
    {
      mSignalHandler(Signal{record.id, record.protocol, std::move(msg)});
    }
  }

  // Runs on the io thread
  BridgeInfo infoOf(Record& record) const
  {
    BridgeInfo result;
    result.id = record.id;
    result.protocol = record.protocol;
    result.listenAddress = record.listenAddress;
    result.startedAt = record.startedAt;

    bool hasErrors = false;
    {
      std::lock_guard<std::mutex> lock(record.mutex);
      hasErrors = !record.recentErrors.empty();
      if (hasErrors)
      {
        result.lastError = record.recentErrors.back();
      }
    }

    if (!record.pBridge)
    {
      result.status = BridgeStatus::Starting;
      return result;
    }

    const auto metrics = record.pBridge->metrics();
    result.messagesSent = metrics.messagesOut;
    result.messagesReceived = metrics.messagesIn;
    if (record.pBridge->running())
    {
      result.status = record.pBridge->sessions().empty() && metrics.reconnects > 0
                        ? BridgeStatus::Reconnecting
                        : BridgeStatus::Running;
    }
    else
    {
      result.status = hasErrors ? BridgeStatus::Error : BridgeStatus::Stopped;
    }
    return result;
  }

  std::vector<std::shared_ptr<Record>> snapshot() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    std::vector<std::shared_ptr<Record>> records;
    for (const auto& record : mRecords)
    {
      records.push_back(record.second);
    }
    return records;
  }

  std::shared_ptr<Record> find(const BridgeId& id) const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    const auto it = mRecords.find(id);
    if (it == mRecords.end())
    {
      throw OtherError("Bridge not found: " + id);
    }
    return it->second;
  }

  using IoLog = typename RouterType::IoType::Log;

  util::Injected<RouterT> mRouter;
  BridgeServiceConfig mConfig;
  IoLog mLog;
  mutable std::mutex mMutex;
  std::map<std::string, Factory> mFactories;
  std::map<BridgeId, std::shared_ptr<Record>> mRecords;
  std::size_t mNextId = 0;
  std::function<discovery::DiscoveryHealth()> mDiscoveryHealth;
  // Only touched on the io thread
  SignalHandler mSignalHandler;
};

} // namespace service
} // namespace clasp
