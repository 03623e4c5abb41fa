// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Errors.hpp>
#include <clasp/platforms/asio/AsioWrapper.hpp>
#include <clasp/transport/AsioTypes.hpp>
#include <clasp/util/SafeAsyncHandler.hpp>
#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace clasp
{
namespace platforms
{
namespace asio
{

// A UDP socket that delivers datagrams of up to MaxPacketSize bytes to a
// handler. Uses a "shared_ptr pImpl" so that a pending receive never
// outlives the buffer it writes into.
template <std::size_t MaxPacketSize>
class Socket
{
public:
  using Buffer = std::array<uint8_t, MaxPacketSize>;
  using ByteIt = typename Buffer::const_iterator;

  explicit Socket(::asio::io_context& io)
    : mpImpl(std::make_shared<Impl>(io))
  {
  }

  Socket(const Socket&) = delete;
  Socket& operator=(const Socket&) = delete;

  Socket(Socket&&) = default;
  Socket& operator=(Socket&&) = default;

  // Throws NetworkError
  std::size_t send(const uint8_t* const pData,
                   const std::size_t numBytes,
                   const transport::UdpEndpoint& to)
  {
    if (numBytes > MaxPacketSize)
    {
      throw NetworkError("Datagram of " + std::to_string(numBytes)
                         + " bytes exceeds maximum packet size");
    }
    try
    {
      return mpImpl->mSocket.send_to(::asio::buffer(pData, numBytes), to);
    }
    catch (const std::system_error& err)
    {
      throw NetworkError(std::string{"Failed to send to "} + transport::toString(to)
                         + ": " + err.what());
    }
  }

  // Arms one receive. The handler is called with (sender, begin, end) for
  // a datagram, the error handler for anything but cancellation.
  template <typename Handler, typename ErrorHandler>
  void receive(Handler handler, ErrorHandler errorHandler)
  {
    mpImpl->mHandler = std::move(handler);
    mpImpl->mErrorHandler = std::move(errorHandler);
    mpImpl->mSocket.async_receive_from(::asio::buffer(mpImpl->mReceiveBuffer),
                                       mpImpl->mSenderEndpoint,
                                       util::makeAsyncSafe(mpImpl));
  }

  transport::UdpEndpoint endpoint() const
  {
    ::asio::error_code ec;
    return mpImpl->mSocket.local_endpoint(ec);
  }

  void close() { mpImpl->close(); }

  transport::UdpSocket& native() { return mpImpl->mSocket; }

private:
  struct Impl
  {
    explicit Impl(::asio::io_context& io)
      : mSocket(io, ::asio::ip::udp::v4())
    {
    }

    ~Impl() { close(); }

    void close()
    {
      // Ignore error codes in shutdown and close as the socket may
      // have already been forcibly closed
      ::asio::error_code ec;
      mSocket.shutdown(::asio::ip::udp::socket::shutdown_both, ec);
      mSocket.close(ec);
    }

    void operator()(const ::asio::error_code& error, const std::size_t numBytes)
    {
      if (error)
      {
        if (error != ::asio::error::operation_aborted && mErrorHandler)
        {
          mErrorHandler(error);
        }
      }
      else if (numBytes <= MaxPacketSize)
      {
        const auto bufBegin = mReceiveBuffer.cbegin();
        mHandler(mSenderEndpoint, bufBegin, bufBegin + static_cast<ptrdiff_t>(numBytes));
      }
    }

    transport::UdpSocket mSocket;
    transport::UdpEndpoint mSenderEndpoint;
    Buffer mReceiveBuffer;
    std::function<void(const transport::UdpEndpoint&, ByteIt, ByteIt)> mHandler;
    std::function<void(const ::asio::error_code&)> mErrorHandler;
  };

  std::shared_ptr<Impl> mpImpl;
};

} // namespace asio
} // namespace platforms
} // namespace clasp
