// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <pthread.h>
#include <string>
#include <thread>
#include <utility>

namespace clasp
{
namespace platforms
{
namespace linux_
{

struct ThreadFactory
{
  template <typename Callable, typename... Args>
  static std::thread makeThread(std::string name, Callable&& f, Args&&... args)
  {
    auto thread = std::thread(std::forward<Callable>(f), std::forward<Args>(args)...);
    // Linux limits thread names to 15 characters
    pthread_setname_np(thread.native_handle(), name.substr(0, 15).c_str());
    return thread;
  }
};

} // namespace linux_
} // namespace platforms
} // namespace clasp
