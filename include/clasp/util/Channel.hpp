// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace clasp
{
namespace util
{

// Unbounded multi-producer, multi-consumer mailbox. Values come out in the
// order they were pushed. Closing wakes every blocked consumer; values that
// were pushed before the close can still be drained.
template <typename T>
class Channel
{
public:
  // Returns false if the channel is already closed and the value was dropped
  bool push(T value)
  {
    {
      std::lock_guard<std::mutex> lock(mMutex);
      if (mClosed)
      {
        return false;
      }
      mValues.push_back(std::move(value));
    }
    mCondition.notify_one();
    return true;
  }

  void close()
  {
    {
      std::lock_guard<std::mutex> lock(mMutex);
      mClosed = true;
    }
    mCondition.notify_all();
  }

  bool closed() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mClosed;
  }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mValues.size();
  }

  std::optional<T> tryPop()
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return popLocked();
  }

  // Blocks until a value is available. Empty result means the channel was
  // closed and drained.
  std::optional<T> pop()
  {
    std::unique_lock<std::mutex> lock(mMutex);
    mCondition.wait(lock, [this] { return !mValues.empty() || mClosed; });
    return popLocked();
  }

  // Like pop() but gives up after the timeout
  template <typename Rep, typename Period>
  std::optional<T> popFor(const std::chrono::duration<Rep, Period> timeout)
  {
    std::unique_lock<std::mutex> lock(mMutex);
    mCondition.wait_for(lock, timeout, [this] { return !mValues.empty() || mClosed; });
    return popLocked();
  }

private:
  std::optional<T> popLocked()
  {
    if (mValues.empty())
    {
      return std::nullopt;
    }
    auto value = std::move(mValues.front());
    mValues.pop_front();
    return value;
  }

  mutable std::mutex mMutex;
  std::condition_variable mCondition;
  std::deque<T> mValues;
  bool mClosed = false;
};

} // namespace util
} // namespace clasp
