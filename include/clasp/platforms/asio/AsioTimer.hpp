// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/platforms/asio/AsioWrapper.hpp>
#include <clasp/util/SafeAsyncHandler.hpp>
#include <chrono>
#include <functional>
#include <memory>

namespace clasp
{
namespace platforms
{
namespace asio
{

// Model of the Timer concept on top of asio::system_timer.
//
// The handler given to async_wait is stored in a shared holder that the
// pending asio operation only references weakly, so destroying the timer
// while a wait is outstanding never calls into a dead object.
class AsioTimer
{
public:
  using ErrorCode = ::asio::error_code;
  using TimePoint = std::chrono::system_clock::time_point;

  explicit AsioTimer(::asio::io_context& io)
    : mpTimer(new ::asio::system_timer(io))
    , mpAsyncHandler(std::make_shared<AsyncHandler>())
  {
  }

  AsioTimer(const AsioTimer&) = delete;
  AsioTimer& operator=(const AsioTimer&) = delete;

  AsioTimer(AsioTimer&&) = default;
  AsioTimer& operator=(AsioTimer&&) = default;

  void expires_at(const TimePoint tp) { mpTimer->expires_at(tp); }

  template <typename Rep, typename Period>
  void expires_from_now(const std::chrono::duration<Rep, Period> duration)
  {
    mpTimer->expires_after(duration);
  }

  void cancel()
  {
    mpTimer->cancel();
  }

  template <typename Handler>
  void async_wait(Handler handler)
  {
    mpAsyncHandler->mHandler = [handler](const ErrorCode ec) mutable { handler(ec); };
    mpTimer->async_wait(util::makeAsyncSafe(mpAsyncHandler));
  }

  TimePoint now() const { return std::chrono::system_clock::now(); }

private:
  struct AsyncHandler
  {
    void operator()(const ErrorCode& ec)
    {
      if (mHandler)
      {
        mHandler(ec);
      }
    }

    std::function<void(const ErrorCode&)> mHandler;
  };

  std::unique_ptr<::asio::system_timer> mpTimer;
  std::shared_ptr<AsyncHandler> mpAsyncHandler;
};

} // namespace asio
} // namespace platforms
} // namespace clasp
