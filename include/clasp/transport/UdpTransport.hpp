// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Errors.hpp>
#include <clasp/transport/AsioTypes.hpp>
#include <clasp/util/Injected.hpp>
#include <clasp/util/SafeAsyncHandler.hpp>
#include <clasp/v2/Messages.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <system_error>
#include <vector>

namespace clasp
{
namespace transport
{

struct UdpConfig
{
  std::size_t maxPacketSize = v2::kMaxMessageSize;
  std::size_t receiveBufferSize = 65536;
  IpAddressV4 broadcastAddress = IpAddressV4::broadcast();
  bool reuseAddress = false;
};

// One bound UDP socket. Datagrams are delivered to a single persistent
// handler on the io thread; sends may come from any thread. Sends and the
// arming of receives are serialized here. A receive error other than
// cancellation is fatal: the socket is closed and the error handler is
// called once.
//
// The Socket concept:
//  - send(const uint8_t*, std::size_t, const UdpEndpoint&), throws on failure
//  - receive(handler(from, begin, end), errorHandler(std::error_code)), one shot
//  - endpoint(), close()
template <typename Socket>
class UdpTransport
{
public:
  using Datagram = std::pair<UdpEndpoint, std::vector<uint8_t>>;

  UdpTransport(Socket socket, UdpConfig config)
    : mpImpl(std::make_shared<Impl>(std::move(socket), std::move(config)))
  {
  }

  UdpTransport(const UdpTransport&) = delete;
  UdpTransport& operator=(const UdpTransport&) = delete;

  UdpTransport(UdpTransport&&) = default;
  UdpTransport& operator=(UdpTransport&&) = default;

  ~UdpTransport()
  {
    if (mpImpl)
    {
      mpImpl->close();
    }
  }

  // Throws NetworkError if the socket fails or the datagram is larger than
  // the configured maximum
  void send(const uint8_t* const pData, const std::size_t numBytes, const UdpEndpoint& to)
  {
    mpImpl->send(pData, numBytes, to);
  }

  void send(const std::vector<uint8_t>& bytes, const UdpEndpoint& to)
  {
    mpImpl->send(bytes.data(), bytes.size(), to);
  }

  // Sends to the subnet broadcast address on the given port
  void broadcast(const std::vector<uint8_t>& bytes, const unsigned short port)
  {
    mpImpl->send(bytes.data(), bytes.size(), {mpImpl->mConfig.broadcastAddress, port});
  }

  // Starts delivering datagrams. The handler gets (from, begin, end) and
  // stays installed until the transport closes.
  template <typename Handler>
  void receive(Handler handler)
  {
    mpImpl->setReceiveHandler(std::move(handler));
    mpImpl->listen();
  }

  template <typename Handler>
  void onError(Handler handler)
  {
    std::lock_guard<std::mutex> lock(mpImpl->mMutex);
    mpImpl->mErrorHandler = std::move(handler);
  }

  void close() { mpImpl->close(); }

  bool closed() const
  {
    std::lock_guard<std::mutex> lock(mpImpl->mMutex);
    return mpImpl->mClosed;
  }

  UdpEndpoint endpoint() const
  {
    std::lock_guard<std::mutex> lock(mpImpl->mMutex);
    return mpImpl->mSocket.endpoint();
  }

  const UdpConfig& config() const { return mpImpl->mConfig; }

private:
  struct Impl : std::enable_shared_from_this<Impl>
  {
    Impl(Socket socket, UdpConfig config)
      : mSocket(std::move(socket))
      , mConfig(std::move(config))
    {
    }

    void send(const uint8_t* const pData, const std::size_t numBytes, const UdpEndpoint& to)
    {
      if (numBytes > mConfig.maxPacketSize)
      {
        throw NetworkError("Datagram of " + std::to_string(numBytes)
                           + " bytes exceeds maximum packet size of "
                           + std::to_string(mConfig.maxPacketSize));
      }

      std::lock_guard<std::mutex> lock(mMutex);
      if (mClosed)
      {
        throw NetworkError("Transport on " + toString(mSocket.endpoint()) + " is closed");
      }
      mSocket.send(pData, numBytes, to);
    }

    template <typename Handler>
    void setReceiveHandler(Handler handler)
    {
      std::lock_guard<std::mutex> lock(mMutex);
      mReceiveHandler = [handler](const UdpEndpoint& from,
                                  const uint8_t* const begin,
                                  const uint8_t* const end) mutable
      { handler(from, begin, end); };
    }

    void listen()
    {
      const auto pSelf = this->shared_from_this();
      std::lock_guard<std::mutex> lock(mMutex);
      if (!mClosed)
      {
        mSocket.receive(util::makeAsyncSafe(pSelf), util::makeAsyncSafe(pSelf));
      }
    }

    template <typename It>
    void operator()(const UdpEndpoint& from, const It begin, const It end)
    {
      ReceiveHandler handler;
      {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mClosed)
        {
          return;
        }
        handler = mReceiveHandler;
      }

      const auto numBytes = static_cast<std::size_t>(std::distance(begin, end));
      if (handler && numBytes <= mConfig.receiveBufferSize)
      {
        const uint8_t* const pBegin = numBytes > 0 ? &*begin : nullptr;
        handler(from, pBegin, pBegin + numBytes);
      }
      listen();
    }

    void operator()(const std::error_code& error)
    {
      std::function<void(const std::error_code&)> errorHandler;
      {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mClosed)
        {
          return;
        }
        errorHandler = std::move(mErrorHandler);
        mErrorHandler = nullptr;
      }
      close();
      if (errorHandler)
      {
        errorHandler(error);
      }
    }

    void close()
    {
      std::lock_guard<std::mutex> lock(mMutex);
      if (!mClosed)
      {
        mClosed = true;
        mSocket.close();
      }
    }

    using ReceiveHandler =
      std::function<void(const UdpEndpoint&, const uint8_t*, const uint8_t*)>;

    Socket mSocket;
    UdpConfig mConfig;
    mutable std::mutex mMutex;
    bool mClosed = false;
    ReceiveHandler mReceiveHandler;
    std::function<void(const std::error_code&)> mErrorHandler;
  };

  std::shared_ptr<Impl> mpImpl;
};

// Throws NetworkError if the address can't be bound
template <typename IoContext>
auto bindUdpTransport(util::Injected<IoContext> io, const UdpEndpoint& local, UdpConfig config = {})
  -> UdpTransport<
    typename util::Injected<IoContext>::type::template Socket<v2::kMaxMessageSize>>
{
  auto socket =
    io->template openUnicastSocket<v2::kMaxMessageSize>(local, config.reuseAddress);
  return {std::move(socket), std::move(config)};
}

} // namespace transport
} // namespace clasp
