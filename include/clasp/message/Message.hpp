// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/message/Value.hpp>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace clasp
{
namespace message
{

enum class Kind : uint8_t
{
  // Parameter state: the latest value wins
  Set = 1,
  // Event: every occurrence counts
  Publish = 2
};

inline std::ostream& operator<<(std::ostream& os, const Kind kind)
{
  return os << (kind == Kind::Set ? "set" : "publish");
}

struct Message
{
  Kind kind = Kind::Set;
  std::string address;
  Value value;

  friend bool operator==(const Message& lhs, const Message& rhs)
  {
    return lhs.kind == rhs.kind && lhs.address == rhs.address && lhs.value == rhs.value;
  }

  friend bool operator!=(const Message& lhs, const Message& rhs) { return !(lhs == rhs); }

  friend std::ostream& operator<<(std::ostream& os, const Message& msg)
  {
    return os << msg.kind << " " << msg.address << " " << msg.value;
  }

  // Compact form used for the messages inside a bundle
  friend std::uint32_t sizeInByteStream(const Message& msg)
  {
    using wire::sizeInByteStream;
    return sizeInByteStream(static_cast<uint8_t>(msg.kind)) + sizeInByteStream(msg.address)
           + sizeInByteStream(msg.value);
  }

  template <typename It>
  friend It toNetworkByteStream(const Message& msg, It out)
  {
    using wire::toNetworkByteStream;
    return toNetworkByteStream(
      msg.value,
      toNetworkByteStream(msg.address,
                          toNetworkByteStream(static_cast<uint8_t>(msg.kind), std::move(out))));
  }

  template <typename It>
  static std::pair<Message, It> fromNetworkByteStream(It begin, It end)
  {
    using namespace std;
    Message msg;
    uint8_t kind;
    tie(kind, begin) = wire::Deserialize<uint8_t>::fromNetworkByteStream(begin, end);
    tie(msg.address, begin) = wire::Deserialize<string>::fromNetworkByteStream(begin, end);
    tie(msg.value, begin) = wire::Deserialize<Value>::fromNetworkByteStream(begin, end);
    msg.kind = toKind(kind);
    return make_pair(std::move(msg), std::move(begin));
  }

  static Kind toKind(const uint8_t kind)
  {
    if (kind != static_cast<uint8_t>(Kind::Set) && kind != static_cast<uint8_t>(Kind::Publish))
    {
      throw std::range_error("Unknown message kind: " + std::to_string(kind));
    }
    return static_cast<Kind>(kind);
  }
};

// NTP timetag value meaning "immediately"
const uint64_t kImmediately = 1;

// Messages that belong together, optionally scheduled at an absolute time
// given as a 64-bit NTP timetag (32.32 fixed point seconds since 1900).
struct Bundle
{
  std::optional<uint64_t> timetag;
  std::vector<Message> messages;

  friend bool operator==(const Bundle& lhs, const Bundle& rhs)
  {
    return lhs.timetag == rhs.timetag && lhs.messages == rhs.messages;
  }

  friend bool operator!=(const Bundle& lhs, const Bundle& rhs) { return !(lhs == rhs); }
};

} // namespace message
} // namespace clasp
