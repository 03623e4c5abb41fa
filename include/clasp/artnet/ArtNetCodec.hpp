// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Envelope.hpp>
#include <clasp/Errors.hpp>
#include <clasp/message/Codec.hpp>
#include <clasp/message/Message.hpp>
#include <clasp/transport/AsioTypes.hpp>
#include <clasp/wire/NetworkByteStreamSerializable.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace clasp
{
namespace artnet
{

const unsigned short kPort = 6454;
const uint16_t kProtocolVersion = 14;
const uint16_t kMaxUniverse = 32767;
const std::size_t kChannels = 512;

const uint16_t kOpPoll = 0x2000;
const uint16_t kOpPollReply = 0x2100;
const uint16_t kOpDmx = 0x5000;

const std::array<uint8_t, 8> kId = {{'A', 'r', 't', '-', 'N', 'e', 't', 0}};

using Frame = std::array<uint8_t, kChannels>;

// ArtDmx. The universe is the 15 bit port address: net in the high byte,
// sub-net and universe in the low byte.
struct Dmx
{
  uint8_t sequence = 0;
  uint8_t physical = 0;
  uint16_t universe = 0;
  std::vector<uint8_t> data;

  friend bool operator==(const Dmx& lhs, const Dmx& rhs)
  {
    return lhs.sequence == rhs.sequence && lhs.physical == rhs.physical
           && lhs.universe == rhs.universe && lhs.data == rhs.data;
  }
};

struct Poll
{
  uint8_t flags = 0;
  uint8_t priority = 0;
};

struct PollReply
{
  transport::IpAddressV4 address;
  uint16_t port = kPort;
  uint16_t versionInfo = 0;
  uint8_t netSwitch = 0;
  uint8_t subSwitch = 0;
  std::string shortName;
  std::string longName;
};

using Packet = std::variant<Dmx, Poll, PollReply>;

// A channel write decoded from a CLASP message. Channels count from 1.
struct ChannelUpdate
{
  uint16_t universe = 0;
  uint16_t channel = 0;
  uint8_t value = 0;
};

namespace detail
{

const std::size_t kHeaderSize = 10;
const std::size_t kDmxHeaderSize = 18;
const std::size_t kPollSize = 14;
const std::size_t kPollReplySize = 239;
const std::size_t kShortNameOffset = 26;
const std::size_t kShortNameSize = 18;
const std::size_t kLongNameOffset = 44;
const std::size_t kLongNameSize = 64;

// The op code is the one little endian field of the protocol
inline void writeHeader(std::vector<uint8_t>& out, const uint16_t opCode)
{
  out.insert(out.end(), kId.begin(), kId.end());
  out.push_back(static_cast<uint8_t>(opCode & 0xFF));
  out.push_back(static_cast<uint8_t>(opCode >> 8));
}

inline void writeVersion(std::vector<uint8_t>& out)
{
  out.push_back(static_cast<uint8_t>(kProtocolVersion >> 8));
  out.push_back(static_cast<uint8_t>(kProtocolVersion & 0xFF));
}

inline void writeName(std::vector<uint8_t>& out,
                      const std::size_t offset,
                      const std::size_t size,
                      const std::string& name)
{
  // Null terminated within the field
  const auto length = std::min(name.size(), size - 1);
  std::copy(name.begin(), name.begin() + static_cast<std::ptrdiff_t>(length),
            out.begin() + static_cast<std::ptrdiff_t>(offset));
}

template <typename It>
std::string readName(const It begin, const std::size_t offset, const std::size_t size)
{
  const auto first = begin + static_cast<std::ptrdiff_t>(offset);
  const auto last = first + static_cast<std::ptrdiff_t>(size);
  return std::string(first, std::find(first, last, 0));
}

inline std::vector<uint8_t> encodePacket(const Dmx& dmx)
{
  if (dmx.universe > kMaxUniverse)
  {
    throw TranslationError("Art-Net universe " + std::to_string(dmx.universe)
                           + " is out of range");
  }
  if (dmx.data.size() > kChannels)
  {
    throw TranslationError("DMX frame of " + std::to_string(dmx.data.size())
                           + " channels is too long");
  }

  // The length must be even and at least 2
  const auto length = std::max<std::size_t>(2, dmx.data.size() + dmx.data.size() % 2);
  std::vector<uint8_t> out;
  out.reserve(kDmxHeaderSize + length);
  writeHeader(out, kOpDmx);
  writeVersion(out);
  out.push_back(dmx.sequence);
  out.push_back(dmx.physical);
  out.push_back(static_cast<uint8_t>(dmx.universe & 0xFF));
  out.push_back(static_cast<uint8_t>(dmx.universe >> 8));
  wire::toNetworkByteStream(static_cast<uint16_t>(length), std::back_inserter(out));
  out.insert(out.end(), dmx.data.begin(), dmx.data.end());
  out.resize(kDmxHeaderSize + length, 0);
  return out;
}

inline std::vector<uint8_t> encodePacket(const Poll& poll)
{
  std::vector<uint8_t> out;
  out.reserve(kPollSize);
  writeHeader(out, kOpPoll);
  writeVersion(out);
  out.push_back(poll.flags);
  out.push_back(poll.priority);
  return out;
}

inline std::vector<uint8_t> encodePacket(const PollReply& reply)
{
  std::vector<uint8_t> out;
  out.reserve(kPollReplySize);
  writeHeader(out, kOpPollReply);
  const auto address = reply.address.to_bytes();
  out.insert(out.end(), address.begin(), address.end());
  out.push_back(static_cast<uint8_t>(reply.port & 0xFF));
  out.push_back(static_cast<uint8_t>(reply.port >> 8));
  wire::toNetworkByteStream(reply.versionInfo, std::back_inserter(out));
  out.push_back(reply.netSwitch);
  out.push_back(reply.subSwitch);
  out.resize(kPollReplySize, 0);
  writeName(out, kShortNameOffset, kShortNameSize, reply.shortName);
  writeName(out, kLongNameOffset, kLongNameSize, reply.longName);
  return out;
}

template <typename It>
Dmx decodeDmx(It begin, const It end)
{
  wire::detail::requireBytes(begin, end, kDmxHeaderSize);
  Dmx dmx;
  dmx.sequence = begin[12];
  dmx.physical = begin[13];
  dmx.universe = static_cast<uint16_t>(begin[14] | (begin[15] << 8));
  uint16_t length = 0;
  std::tie(length, std::ignore) =
    wire::Deserialize<uint16_t>::fromNetworkByteStream(begin + 16, end);
  if (length > kChannels)
  {
    throw std::runtime_error("DMX length " + std::to_string(length) + " exceeds 512");
  }
  const auto data = begin + static_cast<std::ptrdiff_t>(kDmxHeaderSize);
  wire::detail::requireBytes(data, end, length);
  dmx.data.assign(data, data + length);
  return dmx;
}

template <typename It>
PollReply decodePollReply(It begin, const It end)
{
  wire::detail::requireBytes(begin, end, kLongNameOffset + kLongNameSize);
  PollReply reply;
  transport::IpAddressV4::bytes_type address;
  std::copy(begin + 10, begin + 14, address.begin());
  reply.address = transport::IpAddressV4{address};
  reply.port = static_cast<uint16_t>(begin[14] | (begin[15] << 8));
  std::tie(reply.versionInfo, std::ignore) =
    wire::Deserialize<uint16_t>::fromNetworkByteStream(begin + 16, end);
  reply.netSwitch = begin[18];
  reply.subSwitch = begin[19];
  reply.shortName = readName(begin, kShortNameOffset, kShortNameSize);
  reply.longName = readName(begin, kLongNameOffset, kLongNameSize);
  return reply;
}

inline uint16_t parseNumber(const std::string& text,
                            const uint16_t min,
                            const uint16_t max,
                            const std::string& address)
{
  if (text.empty() || text.size() > 5
      || !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; }))
  {
    throw TranslationError("Malformed Art-Net address " + address);
  }
  const auto number = std::stoi(text);
  if (number < min || number > max)
  {
    throw TranslationError("Out of range Art-Net address " + address);
  }
  return static_cast<uint16_t>(number);
}

inline uint8_t channelValue(const message::Value& value, const std::string& address)
{
  int64_t level = 0;
  if (const auto pInt = value.get<int64_t>())
  {
    level = *pInt;
  }
  else if (const auto pFloat = value.get<double>())
  {
    if (std::isnan(*pFloat))
    {
      throw TranslationError("Expected a channel level for " + address);
    }
    level = static_cast<int64_t>(std::min(std::max(*pFloat, 0.0), 255.0));
  }
  else if (const auto pBool = value.get<bool>())
  {
    level = *pBool ? 255 : 0;
  }
  else
  {
    throw TranslationError("Expected a channel level for " + address);
  }
  return static_cast<uint8_t>(std::min<int64_t>(std::max<int64_t>(level, 0), 255));
}

} // namespace detail

// Throws TranslationError for a universe or frame length the protocol
// cannot carry
inline std::vector<uint8_t> encode(const Packet& packet)
{
  return std::visit([](const auto& p) { return detail::encodePacket(p); }, packet);
}

// Throws std::range_error for truncated packets and std::runtime_error for
// anything that is not a supported Art-Net packet
template <typename It>
Packet decode(const It begin, const It end)
{
  wire::detail::requireBytes(begin, end, detail::kHeaderSize);
  if (!std::equal(kId.begin(), kId.end(), begin))
  {
    throw std::runtime_error("Not an Art-Net packet");
  }
  const auto opCode = static_cast<uint16_t>(begin[8] | (begin[9] << 8));
  switch (opCode)
  {
  case kOpDmx:
    return detail::decodeDmx(begin, end);
  case kOpPoll:
  {
    wire::detail::requireBytes(begin, end, detail::kPollSize);
    Poll poll;
    poll.flags = begin[12];
    poll.priority = begin[13];
    return poll;
  }
  case kOpPollReply:
    return detail::decodePollReply(begin, end);
  default:
    throw std::runtime_error("Unsupported Art-Net op code " + std::to_string(opCode));
  }
}

// /<prefix>/<universe>/<channel>
inline std::string channelAddress(const std::string& prefix,
                                  const uint16_t universe,
                                  const std::size_t channel)
{
  return prefix + "/" + std::to_string(universe) + "/" + std::to_string(channel);
}

// One Set message per channel of the frame, or per channel that differs from
// the previous frame of the universe if one is given. Throws
// TranslationError for an out of range universe or an oversized frame.
inline message::Bundle toClasp(const Dmx& dmx,
                               const std::string& prefix,
                               const Frame* const pPrevious = nullptr)
{
  if (dmx.universe > kMaxUniverse)
  {
    throw TranslationError("Art-Net universe " + std::to_string(dmx.universe)
                           + " is out of range");
  }
  if (dmx.data.size() > kChannels)
  {
    throw TranslationError("DMX frame of " + std::to_string(dmx.data.size())
                           + " channels is too long");
  }

  message::Bundle bundle;
  for (std::size_t i = 0; i < dmx.data.size(); ++i)
  {
    if (!pPrevious || (*pPrevious)[i] != dmx.data[i])
    {
      bundle.messages.push_back(
        message::Message{message::Kind::Set, channelAddress(prefix, dmx.universe, i + 1),
                         message::Value{dmx.data[i]}});
    }
  }
  return bundle;
}

// Throws TranslationError for an address outside the prefix, a universe
// above 32767, a channel outside 1 to 512 or a value that isn't a level.
// Levels are clamped to 0 to 255.
inline ChannelUpdate fromClasp(const message::Message& msg, const std::string& prefix)
{
  const auto& address = msg.address;
  if (address.compare(0, prefix.size(), prefix) != 0 || address.size() <= prefix.size()
      || address[prefix.size()] != '/')
  {
    throw TranslationError("Address " + address + " is not below " + prefix);
  }

  const auto rest = address.substr(prefix.size() + 1);
  const auto slash = rest.find('/');
  if (slash == std::string::npos)
  {
    throw TranslationError("No DMX channel in " + address);
  }

  ChannelUpdate update;
  update.universe = detail::parseNumber(rest.substr(0, slash), 0, kMaxUniverse, address);
  update.channel = detail::parseNumber(
    rest.substr(slash + 1), 1, static_cast<uint16_t>(kChannels), address);
  update.value = detail::channelValue(msg.value, address);
  return update;
}

inline std::vector<ChannelUpdate> updatesOf(const Envelope& envelope, const std::string& prefix)
{
  std::vector<ChannelUpdate> updates;
  for (const auto& msg : message::messagesOf(message::fromEnvelope(envelope)))
  {
    updates.push_back(fromClasp(msg, prefix));
  }
  return updates;
}

// Collects channel updates into one frame per universe, in universe order.
// Channels without an update are 0; each frame ends at its highest updated
// channel.
inline std::vector<Dmx> framesOf(const std::vector<ChannelUpdate>& updates)
{
  std::map<uint16_t, Dmx> frames;
  for (const auto& update : updates)
  {
    auto& dmx = frames[update.universe];
    dmx.universe = update.universe;
    if (dmx.data.size() < update.channel)
    {
      dmx.data.resize(update.channel, 0);
    }
    dmx.data[update.channel - 1u] = update.value;
  }

  std::vector<Dmx> result;
  for (auto& frame : frames)
  {
    result.push_back(std::move(frame.second));
  }
  return result;
}

inline Envelope toEnvelope(const Dmx& dmx, const std::string& prefix)
{
  return message::toEnvelope(toClasp(dmx, prefix));
}

// Throws TranslationError
inline std::vector<Dmx> fromEnvelope(const Envelope& envelope, const std::string& prefix)
{
  return framesOf(updatesOf(envelope, prefix));
}

} // namespace artnet
} // namespace clasp
