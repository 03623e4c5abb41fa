// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <exception>
#include <future>
#include <type_traits>

namespace clasp
{
namespace util
{

namespace detail
{

template <typename Result>
struct Fulfill
{
  template <typename Function>
  static void run(std::promise<Result>& promise, Function& function)
  {
    promise.set_value(function());
  }
};

template <>
struct Fulfill<void>
{
  template <typename Function>
  static void run(std::promise<void>& promise, Function& function)
  {
    function();
    promise.set_value();
  }
};

} // namespace detail

// Runs the function on the io thread and blocks until it returned. An
// exception thrown by the function is rethrown on the calling thread.
// Must not be called from the io thread itself.
template <typename IoContext, typename Function>
auto synchronous(IoContext& io, Function function) -> decltype(function())
{
  using Result = decltype(function());
  std::promise<Result> promise;
  auto future = promise.get_future();
  io.async(
    [&promise, &function]
    {
      try
      {
        detail::Fulfill<Result>::run(promise, function);
      }
      catch (...)
      {
        promise.set_exception(std::current_exception());
      }
    });
  return future.get();
}

} // namespace util
} // namespace clasp
