// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Envelope.hpp>
#include <clasp/Errors.hpp>
#include <clasp/discovery/Device.hpp>
#include <clasp/message/Codec.hpp>
#include <clasp/router/Router.hpp>
#include <clasp/router/Session.hpp>
#include <clasp/util/Synchronous.hpp>
#include <chrono>
#include <memory>
#include <optional>

namespace clasp
{

struct ClientConfig
{
  std::chrono::milliseconds connectTimeout{5000};
};

// A native session seen from the application. Connecting and disconnecting
// go through the router's io thread and block the caller until done;
// sending and receiving use the session directly.
//
// A Client must not be used on the router's io thread and must not outlive
// its router.
template <typename RouterT>
class Client
{
public:
  // Blocks until the session is active. Throws ConnectTimeout if the peer
  // doesn't answer in time, or what the router throws when creating the
  // session.
  static Client connect(RouterT& router,
                        const transport::UdpEndpoint& peer,
                        const ClientConfig config = {})
  {
    auto pSession = util::synchronous(
      router.io(), [&router, &peer] { return router.createSession(peer); });

    const auto state = pSession->awaitConnected(config.connectTimeout);
    if (state != router::SessionState::Active)
    {
      const auto id = pSession->id();
      util::synchronous(router.io(),
                        [&router, id]
                        {
                          if (router.find(id))
                          {
                            router.closeSession(id, router::CloseReason::ConnectTimeout);
                          }
                        });
      throw ConnectTimeout("Timed out connecting to " + transport::toString(peer) + " ("
                           + router::toString(state) + ")");
    }
    return Client{router, std::move(pSession)};
  }

  // Resolves the device through discovery first. Throws OtherError if the
  // device is not known.
  template <typename DiscoveryT>
  static Client connect(RouterT& router,
                        const DiscoveryT& discovery,
                        const discovery::DeviceId& deviceId,
                        const ClientConfig config = {})
  {
    const auto device = discovery.find(deviceId);
    if (!device)
    {
      throw OtherError("Unknown device " + deviceId);
    }
    return connect(router, device->address, config);
  }

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  Client(Client&& rhs)
    : mpRouter(rhs.mpRouter)
    , mpSession(std::move(rhs.mpSession))
  {
  }

  ~Client()
  {
    if (mpSession && mpSession->live())
    {
      disconnect();
    }
  }

  // Throws SessionNotFound once the session is closing and NetworkError if
  // the transport fails
  void send(Envelope envelope) { mpSession->send(std::move(envelope), router::Clock::now()); }

  void send(const message::Message& msg) { send(message::toEnvelope(msg)); }

  void send(const message::Bundle& bundle) { send(message::toEnvelope(bundle)); }

  // Empty once the session is closed and drained
  std::optional<Envelope> receive() { return mpSession->receive(); }

  template <typename Rep, typename Period>
  std::optional<Envelope> receive(const std::chrono::duration<Rep, Period> timeout)
  {
    return mpSession->receive(timeout);
  }

  // Requests a graceful close
  void disconnect()
  {
    auto& router = *mpRouter;
    const auto id = mpSession->id();
    util::synchronous(router.io(),
                      [&router, id]
                      {
                        if (router.find(id))
                        {
                          router.disconnect(id);
                        }
                      });
  }

  v2::SessionId id() const { return mpSession->id(); }

  router::SessionState state() const { return mpSession->state(); }

  const std::shared_ptr<router::Session>& session() const { return mpSession; }

private:
  Client(RouterT& router, std::shared_ptr<router::Session> pSession)
    : mpRouter(&router)
    , mpSession(std::move(pSession))
  {
  }

  RouterT* mpRouter;
  std::shared_ptr<router::Session> mpSession;
};

} // namespace clasp
