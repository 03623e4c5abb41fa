// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace clasp
{
namespace bridge
{

struct BridgeMetrics
{
  uint64_t messagesIn = 0;
  uint64_t messagesOut = 0;
  uint64_t bytesIn = 0;
  uint64_t bytesOut = 0;
  uint64_t errors = 0;
  uint64_t reconnects = 0;
};

// Counters shared by the io thread and the threads sending over a bridge
class Counters
{
public:
  void received(const std::size_t numBytes)
  {
    ++mMessagesIn;
    mBytesIn += numBytes;
  }

  void sent(const std::size_t numBytes)
  {
    ++mMessagesOut;
    mBytesOut += numBytes;
  }

  void failed() { ++mErrors; }

  void reconnected() { ++mReconnects; }

  BridgeMetrics snapshot() const
  {
    BridgeMetrics metrics;
    metrics.messagesIn = mMessagesIn;
    metrics.messagesOut = mMessagesOut;
    metrics.bytesIn = mBytesIn;
    metrics.bytesOut = mBytesOut;
    metrics.errors = mErrors;
    metrics.reconnects = mReconnects;
    return metrics;
  }

private:
  std::atomic<uint64_t> mMessagesIn{0};
  std::atomic<uint64_t> mMessagesOut{0};
  std::atomic<uint64_t> mBytesIn{0};
  std::atomic<uint64_t> mBytesOut{0};
  std::atomic<uint64_t> mErrors{0};
  std::atomic<uint64_t> mReconnects{0};
};

using ErrorHandler = std::function<void(const std::string&)>;

} // namespace bridge
} // namespace clasp
