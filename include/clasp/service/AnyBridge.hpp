// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Envelope.hpp>
#include <clasp/bridge/Metrics.hpp>
#include <clasp/router/Session.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace clasp
{
namespace service
{

// Any bridge adapter behind one interface. The adapter keeps its own
// threading rules: everything but metrics() belongs on the router's io
// thread.
class AnyBridge
{
public:
  using SessionHandler = std::function<void(std::shared_ptr<router::Session>)>;

  template <typename Bridge>
  AnyBridge(std::unique_ptr<Bridge> pBridge, std::string protocol, std::string listenAddress)
    : mpBridge(new Model<Bridge>(std::move(pBridge)))
    , mProtocol(std::move(protocol))
    , mListenAddress(std::move(listenAddress))
  {
  }

  const std::string& protocol() const { return mProtocol; }

  const std::string& listenAddress() const { return mListenAddress; }

  void send(const Envelope& envelope) { mpBridge->send(envelope); }

  bridge::BridgeMetrics metrics() const { return mpBridge->metrics(); }

  std::vector<v2::SessionId> sessions() const { return mpBridge->sessions(); }

  bool running() const { return mpBridge->running(); }

  void onSession(SessionHandler handler) { mpBridge->onSession(std::move(handler)); }

  void onError(bridge::ErrorHandler handler) { mpBridge->onError(std::move(handler)); }

private:
  struct Concept
  {
    virtual ~Concept() = default;
    virtual void send(const Envelope&) = 0;
    virtual bridge::BridgeMetrics metrics() const = 0;
    virtual std::vector<v2::SessionId> sessions() const = 0;
    virtual bool running() const = 0;
    virtual void onSession(SessionHandler) = 0;
    virtual void onError(bridge::ErrorHandler) = 0;
  };

  template <typename Bridge>
  struct Model : Concept
  {
    explicit Model(std::unique_ptr<Bridge> pBridge)
      : mpBridge(std::move(pBridge))
    {
    }

    void send(const Envelope& envelope) override { mpBridge->send(envelope); }

    bridge::BridgeMetrics metrics() const override { return mpBridge->metrics(); }

    std::vector<v2::SessionId> sessions() const override { return mpBridge->sessions(); }

    bool running() const override { return mpBridge->running(); }

    void onSession(SessionHandler handler) override
    {
      mpBridge->onSession(std::move(handler));
    }

    void onError(bridge::ErrorHandler handler) override
    {
      mpBridge->onError(std::move(handler));
    }

    std::unique_ptr<Bridge> mpBridge;
  };

  std::unique_ptr<Concept> mpBridge;
  std::string mProtocol;
  std::string mListenAddress;
};

} // namespace service
} // namespace clasp
