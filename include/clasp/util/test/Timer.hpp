// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace clasp
{
namespace util
{
namespace test
{

// Timer whose notion of "now" is owned by the test IoContext that made it.
// Cancelling calls a pending handler with a truthy error code.
class Timer
{
public:
  using ErrorCode = int;
  using TimePoint = std::chrono::system_clock::time_point;

  struct State
  {
    TimePoint fireAt;
    std::function<void(ErrorCode)> handler;
  };

  Timer(std::shared_ptr<State> pState, std::shared_ptr<const TimePoint> pNow)
    : mpState(std::move(pState))
    , mpNow(std::move(pNow))
  {
  }

  void expires_at(const TimePoint t)
  {
    cancel();
    mpState->fireAt = t;
  }

  template <typename Rep, typename Period>
  void expires_from_now(const std::chrono::duration<Rep, Period> duration)
  {
    cancel();
    mpState->fireAt =
      now() + std::chrono::duration_cast<TimePoint::duration>(duration);
  }

  void cancel()
  {
    if (mpState->handler)
    {
      auto handler = std::move(mpState->handler);
      mpState->handler = nullptr;
      handler(1);
    }
  }

  template <typename Handler>
  void async_wait(Handler handler)
  {
    mpState->handler = [handler](const ErrorCode ec) mutable { handler(ec); };
  }

  TimePoint now() const { return *mpNow; }

private:
  std::shared_ptr<State> mpState;
  std::shared_ptr<const TimePoint> mpNow;
};

} // namespace test
} // namespace util
} // namespace clasp
