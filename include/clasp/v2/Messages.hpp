// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/wire/Payload.hpp>
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace clasp
{
namespace v2
{

// The largest datagram a UDP socket over IPv4 can carry: 65535 bytes minus
// the 20 byte IP header and the 8 byte UDP header.
static constexpr std::size_t kMaxMessageSize = 65507;
static constexpr std::size_t kHeaderSize = 8;
static constexpr std::size_t kMaxPayloadSize = kMaxMessageSize - kHeaderSize;

using MessageBuffer = std::vector<uint8_t>;

using MessageKind = uint8_t;
using MessageType = uint8_t;
using SessionId = uint32_t;
using PayloadType = uint8_t;

const uint8_t kMagic = 0x53;
const uint8_t kVersion = 2;

const MessageKind kDiscoveryKind = 1;
const MessageKind kSessionKind = 2;
const MessageKind kDataKind = 3;

const MessageType kInvalid = 0;
// Discovery
const MessageType kAnnounce = 1;
const MessageType kQuery = 2;
const MessageType kByeBye = 3;
// Session control
const MessageType kHello = 4;
const MessageType kWelcome = 5;
const MessageType kHeartbeat = 6;
const MessageType kGoodbye = 7;
// Envelopes
const MessageType kData = 8;

// Session id 0 never names a session. It marks discovery traffic and the
// first Hello of a handshake.
const SessionId kNoSession = 0;

inline MessageKind kindOf(const MessageType type)
{
  switch (type)
  {
  case kAnnounce:
  case kQuery:
  case kByeBye:
    return kDiscoveryKind;
  case kHello:
  case kWelcome:
  case kHeartbeat:
  case kGoodbye:
    return kSessionKind;
  case kData:
    return kDataKind;
  default:
    return 0;
  }
}

struct MessageHeader
{
  MessageKind kind;
  MessageType messageType;
  SessionId sessionId;

  friend std::uint32_t sizeInByteStream(const MessageHeader&)
  {
    return static_cast<std::uint32_t>(kHeaderSize);
  }

  template <typename It>
  friend It toNetworkByteStream(const MessageHeader& header, It out)
  {
    using wire::toNetworkByteStream;
    out = toNetworkByteStream(kMagic, std::move(out));
    out = toNetworkByteStream(kVersion, std::move(out));
    out = toNetworkByteStream(header.kind, std::move(out));
    out = toNetworkByteStream(header.messageType, std::move(out));
    return toNetworkByteStream(header.sessionId, std::move(out));
  }
};

// The fixed head of every Data message body. The envelope payload bytes
// follow it up to the end of the datagram.
struct DataHeader
{
  uint32_t sequence;
  PayloadType payloadType;

  friend std::uint32_t sizeInByteStream(const DataHeader&) { return 5; }

  template <typename It>
  friend It toNetworkByteStream(const DataHeader& header, It out)
  {
    using wire::toNetworkByteStream;
    return toNetworkByteStream(header.payloadType,
                               toNetworkByteStream(header.sequence, std::move(out)));
  }

  template <typename It>
  static std::pair<DataHeader, It> fromNetworkByteStream(It begin, const It end)
  {
    using namespace std;
    DataHeader header;
    tie(header.sequence, begin) =
      wire::Deserialize<uint32_t>::fromNetworkByteStream(begin, end);
    tie(header.payloadType, begin) =
      wire::Deserialize<PayloadType>::fromNetworkByteStream(begin, end);
    return make_pair(header, std::move(begin));
  }
};

namespace detail
{

template <typename It>
It checkedEnd(const std::size_t messageSize, It out)
{
  if (messageSize > kMaxMessageSize)
  {
    throw std::range_error("Exceeded maximum message size");
  }
  return out;
}

} // namespace detail

// Writes a header followed by the payload. Throws std::range_error if the
// message would not fit in one datagram.
template <typename Payload, typename It>
It encodeMessage(const MessageType messageType,
                 const SessionId sessionId,
                 const Payload& payload,
                 It out)
{
  const MessageHeader header = {kindOf(messageType), messageType, sessionId};
  const auto messageSize = sizeInByteStream(header) + sizeInByteStream(payload);
  out = detail::checkedEnd(messageSize, std::move(out));
  return toNetworkByteStream(payload, toNetworkByteStream(header, std::move(out)));
}

template <typename ByteIt, typename It>
It encodeData(const SessionId sessionId,
              const DataHeader& dataHeader,
              ByteIt payloadBegin,
              ByteIt payloadEnd,
              It out)
{
  const MessageHeader header = {kDataKind, kData, sessionId};
  const auto payloadSize = static_cast<std::size_t>(std::distance(payloadBegin, payloadEnd));
  const auto messageSize =
    sizeInByteStream(header) + sizeInByteStream(dataHeader) + payloadSize;
  out = detail::checkedEnd(messageSize, std::move(out));
  out = toNetworkByteStream(dataHeader, toNetworkByteStream(header, std::move(out)));
  return std::copy(payloadBegin, payloadEnd, std::move(out));
}

// Returns a header with messageType kInvalid if the bytes don't start with
// a valid header of this protocol version.
template <typename It>
std::pair<MessageHeader, It> parseMessageHeader(It bytesBegin, const It bytesEnd)
{
  using namespace std;
  using ItDiff = typename iterator_traits<It>::difference_type;

  MessageHeader header = {0, kInvalid, kNoSession};
  if (distance(bytesBegin, bytesEnd) < static_cast<ItDiff>(kHeaderSize))
  {
    return make_pair(header, bytesBegin);
  }

  uint8_t magic;
  uint8_t version;
  auto it = bytesBegin;
  tie(magic, it) = wire::Deserialize<uint8_t>::fromNetworkByteStream(it, bytesEnd);
  tie(version, it) = wire::Deserialize<uint8_t>::fromNetworkByteStream(it, bytesEnd);
  if (magic != kMagic || version != kVersion)
  {
    return make_pair(header, bytesBegin);
  }

  MessageKind kind;
  MessageType type;
  tie(kind, it) = wire::Deserialize<MessageKind>::fromNetworkByteStream(it, bytesEnd);
  tie(type, it) = wire::Deserialize<MessageType>::fromNetworkByteStream(it, bytesEnd);
  tie(header.sessionId, it) = wire::Deserialize<SessionId>::fromNetworkByteStream(it, bytesEnd);

  // A kind that disagrees with the type is as good as garbage
  if (kindOf(type) != kind)
  {
    return make_pair(MessageHeader{0, kInvalid, kNoSession}, bytesBegin);
  }
  header.kind = kind;
  header.messageType = type;
  return make_pair(header, it);
}

} // namespace v2
} // namespace clasp
