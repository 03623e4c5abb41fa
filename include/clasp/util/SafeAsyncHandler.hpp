// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <memory>
#include <utility>

namespace clasp
{
namespace util
{

// Handler for async operations that may complete after the object that
// started them is gone. asio timers and sockets may invoke a handler with
// a success code even after cancellation, so the delegate is only held
// weakly and the call is skipped once it has expired.
template <typename Delegate>
struct SafeAsyncHandler
{
  explicit SafeAsyncHandler(const std::shared_ptr<Delegate>& pDelegate)
    : mpDelegate(pDelegate)
  {
  }

  template <typename... Args>
  void operator()(Args&&... args) const
  {
    if (const auto pDelegate = mpDelegate.lock())
    {
      (*pDelegate)(std::forward<Args>(args)...);
    }
  }

  std::weak_ptr<Delegate> mpDelegate;
};

template <typename Delegate>
SafeAsyncHandler<Delegate> makeAsyncSafe(const std::shared_ptr<Delegate>& pDelegate)
{
  return SafeAsyncHandler<Delegate>{pDelegate};
}

} // namespace util
} // namespace clasp
