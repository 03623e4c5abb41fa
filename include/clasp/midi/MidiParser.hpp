// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <cstdint>
#include <vector>

namespace clasp
{
namespace midi
{

using MidiMessage = std::vector<uint8_t>;

// Number of data bytes following a status byte, -1 for a SysEx that runs
// until its end byte
inline int dataLength(const uint8_t status)
{
  if (status < 0xF0)
  {
    const auto type = status & 0xF0;
    return type == 0xC0 || type == 0xD0 ? 1 : 2;
  }
  switch (status)
  {
  case 0xF0:
    return -1;
  case 0xF1:
  case 0xF3:
    return 1;
  case 0xF2:
    return 2;
  default:
    return 0;
  }
}

// Frames a raw MIDI byte stream into complete messages. Handles running
// status, real-time bytes interleaved with other messages and SysEx. Stray
// data bytes are dropped.
class Parser
{
public:
  static constexpr std::size_t kMaxSysExSize = 1024;

  template <typename It, typename Handler>
  void feed(It begin, const It end, Handler handler)
  {
    for (; begin != end; ++begin)
    {
      const uint8_t byte = *begin;
      if (byte >= 0xF8)
      {
        // Real-time messages may appear anywhere and leave the running
        // status alone
        handler(MidiMessage{byte});
      }
      else if (byte == 0xF7)
      {
        if (mInSysEx)
        {
          mMessage.push_back(byte);
          handler(mMessage);
        }
        reset();
      }
      else if (byte >= 0x80)
      {
        startMessage(byte, handler);
      }
      else if (mInSysEx)
      {
        if (mMessage.size() < kMaxSysExSize)
        {
          mMessage.push_back(byte);
        }
        else
        {
          reset();
        }
      }
      else if (!mMessage.empty() || mRunningStatus != 0)
      {
        if (mMessage.empty())
        {
          mMessage.push_back(mRunningStatus);
        }
        mMessage.push_back(byte);
        completeIfDone(handler);
      }
    }
  }

  void reset()
  {
    mMessage.clear();
    mInSysEx = false;
  }

private:
  template <typename Handler>
  void startMessage(const uint8_t status, Handler& handler)
  {
    mMessage.clear();
    mInSysEx = false;
    const auto length = dataLength(status);
    if (length < 0)
    {
      mInSysEx = true;
      mRunningStatus = 0;
      mMessage.push_back(status);
      return;
    }

    // System common messages cancel the running status
    mRunningStatus = status < 0xF0 ? status : 0;
    mMessage.push_back(status);
    if (length == 0)
    {
      handler(mMessage);
      mMessage.clear();
    }
  }

  template <typename Handler>
  void completeIfDone(Handler& handler)
  {
    const auto status = mMessage.front();
    if (static_cast<int>(mMessage.size()) - 1 == dataLength(status))
    {
      handler(mMessage);
      mMessage.clear();
    }
  }

  MidiMessage mMessage;
  uint8_t mRunningStatus = 0;
  bool mInSysEx = false;
};

} // namespace midi
} // namespace clasp
