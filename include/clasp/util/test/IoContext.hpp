// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/util/Log.hpp>
#include <clasp/util/test/Timer.hpp>
#include <algorithm>
#include <functional>
#include <memory>
#include <vector>

namespace clasp
{
namespace util
{
namespace test
{

// Deterministic IoContext for tests. Handlers posted with async() only run
// from advance() or runHandlers(), and time only moves when advance() is
// called. Timers that fall due during an advance fire in deadline order, so
// a timer that re-arms itself from its handler can fire several times
// within one advance.
class IoContext
{
public:
  using Timer = test::Timer;
  using Log = NullLog;

  IoContext()
    // Initialize with an arbitrary large value to simulate the
    // time_since_epoch of a real clock.
    : mpNow(std::make_shared<Timer::TimePoint>(std::chrono::milliseconds{123456789}))
  {
  }

  IoContext(const IoContext&) = delete;
  IoContext& operator=(const IoContext&) = delete;

  Timer makeTimer()
  {
    auto pState = std::make_shared<Timer::State>();
    mTimers.push_back(pState);
    return Timer{std::move(pState), mpNow};
  }

  template <typename Handler>
  void async(Handler handler)
  {
    mHandlers.emplace_back(std::move(handler));
  }

  Log& log() { return mLog; }

  Timer::TimePoint now() const { return *mpNow; }

  template <typename Rep, typename Period>
  void advance(const std::chrono::duration<Rep, Period> duration)
  {
    const auto end = *mpNow + std::chrono::duration_cast<Timer::TimePoint::duration>(duration);
    runHandlers();

    while (auto pDue = nextDueTimer(end))
    {
      *mpNow = std::max(*mpNow, pDue->fireAt);
      auto handler = std::move(pDue->handler);
      pDue->handler = nullptr;
      handler(0);
      runHandlers();
    }

    *mpNow = end;
  }

  void runHandlers()
  {
    while (!mHandlers.empty())
    {
      auto handlers = std::move(mHandlers);
      mHandlers.clear();
      for (auto& handler : handlers)
      {
        handler();
      }
    }
  }

private:
  std::shared_ptr<Timer::State> nextDueTimer(const Timer::TimePoint end)
  {
    mTimers.erase(std::remove_if(mTimers.begin(),
                                 mTimers.end(),
                                 [](const std::weak_ptr<Timer::State>& pTimer)
                                 { return pTimer.expired(); }),
                  mTimers.end());

    std::shared_ptr<Timer::State> pDue;
    for (const auto& pWeak : mTimers)
    {
      const auto pTimer = pWeak.lock();
      if (pTimer->handler && pTimer->fireAt <= end
          && (!pDue || pTimer->fireAt < pDue->fireAt))
      {
        pDue = pTimer;
      }
    }
    return pDue;
  }

  std::shared_ptr<Timer::TimePoint> mpNow;
  std::vector<std::weak_ptr<Timer::State>> mTimers;
  std::vector<std::function<void()>> mHandlers;
  Log mLog;
};

} // namespace test
} // namespace util
} // namespace clasp
