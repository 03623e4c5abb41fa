// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Errors.hpp>
#include <clasp/transport/AsioTypes.hpp>
#include <functional>
#include <memory>
#include <system_error>
#include <utility>
#include <vector>

namespace clasp
{
namespace test
{

// Socket double. Copies share one state, so a test can keep a copy after
// moving the socket into the component under test.
class Socket
{
public:
  using SentMessage = std::pair<std::vector<uint8_t>, transport::UdpEndpoint>;

  explicit Socket(transport::UdpEndpoint local = {transport::IpAddressV4::loopback(), 7330})
    : mpState(std::make_shared<State>())
  {
    mpState->local = std::move(local);
  }

  std::size_t send(const uint8_t* const pData,
                   const std::size_t numBytes,
                   const transport::UdpEndpoint& to)
  {
    if (mpState->failSends || mpState->closed)
    {
      throw NetworkError("Failed to send to " + transport::toString(to));
    }
    mpState->sentMessages.push_back(
      std::make_pair(std::vector<uint8_t>{pData, pData + numBytes}, to));
    return numBytes;
  }

  template <typename Handler, typename ErrorHandler>
  void receive(Handler handler, ErrorHandler errorHandler)
  {
    mpState->callback = [handler](const transport::UdpEndpoint& from,
                                  const std::vector<uint8_t>& buffer) mutable
    { handler(from, buffer.cbegin(), buffer.cend()); };
    mpState->errorCallback = [errorHandler](const std::error_code& ec) mutable
    { errorHandler(ec); };
  }

  // Delivers a datagram to the pending receive, if there is one
  template <typename It>
  void incomingMessage(const transport::UdpEndpoint& from, It messageBegin, It messageEnd)
  {
    auto callback = std::move(mpState->callback);
    mpState->callback = nullptr;
    if (callback)
    {
      const std::vector<uint8_t> buffer{messageBegin, messageEnd};
      callback(from, buffer);
    }
  }

  void incomingMessage(const transport::UdpEndpoint& from, const std::vector<uint8_t>& bytes)
  {
    incomingMessage(from, bytes.begin(), bytes.end());
  }

  // Fails the pending receive
  void receiveError(const std::error_code& ec)
  {
    auto errorCallback = std::move(mpState->errorCallback);
    mpState->errorCallback = nullptr;
    mpState->callback = nullptr;
    if (errorCallback)
    {
      errorCallback(ec);
    }
  }

  bool receiving() const { return static_cast<bool>(mpState->callback); }

  transport::UdpEndpoint endpoint() const { return mpState->local; }

  void close() { mpState->closed = true; }

  bool closed() const { return mpState->closed; }

  void failSends(const bool fail) { mpState->failSends = fail; }

  std::vector<SentMessage>& sentMessages() { return mpState->sentMessages; }

private:
  struct State
  {
    transport::UdpEndpoint local;
    std::vector<SentMessage> sentMessages;
    std::function<void(const transport::UdpEndpoint&, const std::vector<uint8_t>&)> callback;
    std::function<void(const std::error_code&)> errorCallback;
    bool closed = false;
    bool failSends = false;
  };

  std::shared_ptr<State> mpState;
};

} // namespace test
} // namespace clasp
