// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>

namespace clasp
{
namespace util
{

// Concept: Log
// Requirements:
//  - copyable
//  - selectors for debug, info, warning, and error streams
//  - channel function that provides new log object tagged with the
//    given channel name

enum class LogLevel
{
  Debug,
  Info,
  Warning,
  Error,
  Off
};

// Null object for the Log concept
struct NullLog
{
  template <typename T>
  friend NullLog& operator<<(NullLog& log, const T&)
  {
    return log;
  }

  friend NullLog& debug(NullLog& log) { return log; }

  friend NullLog& info(NullLog& log) { return log; }

  friend NullLog& warning(NullLog& log) { return log; }

  friend NullLog& error(NullLog& log) { return log; }

  friend NullLog channel(const NullLog&, std::string) { return {}; }
};

// std streams-based log with a minimum level. Lines below the level are
// formatted into nothing.
struct StdLog
{
  StdLog(std::string channelName = {}, LogLevel level = LogLevel::Info)
    : mChannelName(std::move(channelName))
    , mLevel(level)
  {
  }

  // Prepends the channel name and terminates the line on destruction
  struct StdLogStream
  {
    StdLogStream(std::ostream* pIoStream, const std::string& channelName)
      : mpIoStream(pIoStream)
    {
      if (mpIoStream)
      {
        (*mpIoStream) << "[" << channelName << "] ";
      }
    }

    StdLogStream(StdLogStream&& rhs)
      : mpIoStream(rhs.mpIoStream)
    {
      rhs.mpIoStream = nullptr;
    }

    StdLogStream(const StdLogStream&) = delete;
    StdLogStream& operator=(const StdLogStream&) = delete;

    ~StdLogStream()
    {
      if (mpIoStream)
      {
        (*mpIoStream) << "\n";
      }
    }

    template <typename T>
    StdLogStream& operator<<(const T& rhs)
    {
      if (mpIoStream)
      {
        (*mpIoStream) << rhs;
      }
      return *this;
    }

    std::ostream* mpIoStream;
  };

  friend StdLogStream debug(const StdLog& log)
  {
    return log.stream(LogLevel::Debug, std::clog);
  }

  friend StdLogStream info(const StdLog& log)
  {
    return log.stream(LogLevel::Info, std::clog);
  }

  friend StdLogStream warning(const StdLog& log)
  {
    return log.stream(LogLevel::Warning, std::clog);
  }

  friend StdLogStream error(const StdLog& log)
  {
    return log.stream(LogLevel::Error, std::cerr);
  }

  friend StdLog channel(const StdLog& log, const std::string& channelName)
  {
    auto compositeName =
      log.mChannelName.empty() ? channelName : log.mChannelName + "::" + channelName;
    return {std::move(compositeName), log.mLevel};
  }

  StdLogStream stream(const LogLevel level, std::ostream& ioStream) const
  {
    return {level >= mLevel ? &ioStream : nullptr, mChannelName};
  }

  std::string mChannelName;
  LogLevel mLevel;
};

// Log adapter that adds timestamps
template <typename Log>
struct Timestamped
{
  Timestamped() = default;

  Timestamped(Log log)
    : mLog(std::move(log))
  {
  }

  friend decltype(debug(std::declval<const Log&>())) debug(const Timestamped& log)
  {
    auto stream = debug(log.mLog);
    stream << "|" << now() << "ms| ";
    return stream;
  }

  friend decltype(info(std::declval<const Log&>())) info(const Timestamped& log)
  {
    auto stream = info(log.mLog);
    stream << "|" << now() << "ms| ";
    return stream;
  }

  friend decltype(warning(std::declval<const Log&>())) warning(const Timestamped& log)
  {
    auto stream = warning(log.mLog);
    stream << "|" << now() << "ms| ";
    return stream;
  }

  friend decltype(error(std::declval<const Log&>())) error(const Timestamped& log)
  {
    auto stream = error(log.mLog);
    stream << "|" << now() << "ms| ";
    return stream;
  }

  friend Timestamped channel(const Timestamped& log, const std::string& channelName)
  {
    return {channel(log.mLog, channelName)};
  }

  static std::int64_t now()
  {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
  }

  Log mLog;
};

} // namespace util
} // namespace clasp
