// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Errors.hpp>
#include <clasp/platforms/asio/AsioTimer.hpp>
#include <clasp/platforms/asio/AsioWrapper.hpp>
#include <clasp/platforms/asio/MidiPort.hpp>
#include <clasp/platforms/asio/Socket.hpp>
#include <clasp/platforms/linux/ThreadFactory.hpp>
#include <clasp/util/Log.hpp>
#include <memory>
#include <string>
#include <thread>

namespace clasp
{
namespace platforms
{
namespace asio
{

// Model of the IoContext concept: an asio io_context run by one service
// thread. Every handler of the components built on a Context runs on that
// thread, which is what allows them to keep their state unsynchronized.
template <typename LogT = util::StdLog,
          typename ThreadFactory = linux_::ThreadFactory>
class Context
{
public:
  using Timer = AsioTimer;
  using Log = LogT;

  template <std::size_t MaxPacketSize>
  using Socket = asio::Socket<MaxPacketSize>;

  using MidiPort = asio::MidiPort;

  Context()
    : Context(DefaultHandler{})
  {
  }

  template <typename ExceptionHandler>
  explicit Context(ExceptionHandler exceptHandler, Log log = Log{})
    : mpService(new ::asio::io_context())
    , mpWork(new WorkGuard(mpService->get_executor()))
    , mLog(std::move(log))
  {
    mThread = ThreadFactory::makeThread(
      "CLASP Main",
      [](::asio::io_context& service, ExceptionHandler handler)
      {
        for (;;)
        {
          try
          {
            service.run();
            break;
          }
          catch (const typename ExceptionHandler::Exception& exception)
          {
            handler(exception);
          }
        }
      },
      std::ref(*mpService),
      std::move(exceptHandler));
  }

  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  Context(Context&& rhs)
    : mpService(std::move(rhs.mpService))
    , mpWork(std::move(rhs.mpWork))
    , mThread(std::move(rhs.mThread))
    , mLog(std::move(rhs.mLog))
  {
  }

  ~Context()
  {
    if (mpService && mpWork)
    {
      mpWork.reset();
      mpService->stop();
      mThread.join();
    }
  }

  // Throws NetworkError
  template <std::size_t MaxPacketSize>
  Socket<MaxPacketSize> openUnicastSocket(const transport::UdpEndpoint& local,
                                          const bool reuseAddress)
  {
    auto socket = Socket<MaxPacketSize>{*mpService};
    configure(
      [&](transport::UdpSocket& native)
      {
        native.set_option(::asio::ip::udp::socket::reuse_address(reuseAddress));
        native.set_option(::asio::socket_base::broadcast(true));
        native.bind(local);
      },
      socket,
      local);
    return socket;
  }

  // Socket bound to the wildcard address so that it sees datagrams sent to
  // the subnet broadcast address. Several processes may share the port.
  // Throws NetworkError
  template <std::size_t MaxPacketSize>
  Socket<MaxPacketSize> openBroadcastSocket(const unsigned short port)
  {
    auto socket = Socket<MaxPacketSize>{*mpService};
    const auto local = transport::UdpEndpoint{::asio::ip::address_v4::any(), port};
    configure(
      [&](transport::UdpSocket& native)
      {
        native.set_option(::asio::ip::udp::socket::reuse_address(true));
        native.set_option(::asio::socket_base::broadcast(true));
        native.bind(local);
      },
      socket,
      local);
    return socket;
  }

  // Throws NetworkError
  template <std::size_t MaxPacketSize>
  Socket<MaxPacketSize> openMulticastSocket(const transport::UdpEndpoint& group)
  {
    auto socket = Socket<MaxPacketSize>{*mpService};
    configure(
      [&](transport::UdpSocket& native)
      {
        native.set_option(::asio::ip::udp::socket::reuse_address(true));
        native.set_option(::asio::ip::multicast::enable_loopback(true));
        native.bind({::asio::ip::address_v4::any(), group.port()});
        native.set_option(::asio::ip::multicast::join_group(group.address().to_v4()));
      },
      socket,
      group);
    return socket;
  }

  // Throws IoError
  MidiPort openMidiPort(std::string path, const MidiPort::Direction direction)
  {
    return MidiPort{*mpService, std::move(path), direction};
  }

  Timer makeTimer() const { return Timer{*mpService}; }

  Log& log() { return mLog; }

  template <typename Handler>
  void async(Handler handler)
  {
    ::asio::post(*mpService, std::move(handler));
  }

private:
  using WorkGuard = ::asio::executor_work_guard<::asio::io_context::executor_type>;

  // Logs any CLASP error that escapes a handler and keeps the thread alive
  struct DefaultHandler
  {
    using Exception = Error;

    void operator()(const Exception& exception)
    {
      error(util::StdLog{"clasp"}) << "Unhandled " << toString(exception.kind)
                                   << " error: " << exception.what();
    }
  };

  template <typename Configure, typename SocketT>
  static void configure(Configure configureNative,
                        SocketT& socket,
                        const transport::UdpEndpoint& endpoint)
  {
    try
    {
      configureNative(socket.native());
    }
    catch (const std::system_error& err)
    {
      throw NetworkError("Failed to open socket on " + transport::toString(endpoint)
                         + ": " + err.what());
    }
  }

  std::unique_ptr<::asio::io_context> mpService;
  std::unique_ptr<WorkGuard> mpWork;
  std::thread mThread;
  Log mLog;
};

} // namespace asio
} // namespace platforms
} // namespace clasp
