// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Envelope.hpp>
#include <clasp/Errors.hpp>
#include <clasp/message/Message.hpp>
#include <clasp/util/Log.hpp>
#include <clasp/wire/Payload.hpp>
#include <iterator>
#include <optional>
#include <variant>

namespace clasp
{
namespace message
{

const v2::PayloadType kMessagePayload = 1;
const v2::PayloadType kBundlePayload = 2;

struct AddressEntry
{
  static inline const std::int32_t key = 'addr';
  static_assert(key == 0x61646472, "Unexpected byte order");

  std::string address;

  friend std::uint32_t sizeInByteStream(const AddressEntry& entry)
  {
    return wire::sizeInByteStream(entry.address);
  }

  template <typename It>
  friend It toNetworkByteStream(const AddressEntry& entry, It out)
  {
    return wire::toNetworkByteStream(entry.address, std::move(out));
  }

  template <typename It>
  static std::pair<AddressEntry, It> fromNetworkByteStream(It begin, It end)
  {
    auto result =
      wire::Deserialize<std::string>::fromNetworkByteStream(std::move(begin), std::move(end));
    return std::make_pair(AddressEntry{std::move(result.first)}, std::move(result.second));
  }
};

struct KindEntry
{
  static inline const std::int32_t key = 'kind';
  static_assert(key == 0x6b696e64, "Unexpected byte order");

  Kind kind;

  friend std::uint32_t sizeInByteStream(const KindEntry&) { return 1; }

  template <typename It>
  friend It toNetworkByteStream(const KindEntry& entry, It out)
  {
    return wire::toNetworkByteStream(static_cast<uint8_t>(entry.kind), std::move(out));
  }

  template <typename It>
  static std::pair<KindEntry, It> fromNetworkByteStream(It begin, It end)
  {
    auto result =
      wire::Deserialize<uint8_t>::fromNetworkByteStream(std::move(begin), std::move(end));
    return std::make_pair(KindEntry{Message::toKind(result.first)}, std::move(result.second));
  }
};

struct ValueEntry
{
  static inline const std::int32_t key = 'valu';
  static_assert(key == 0x76616c75, "Unexpected byte order");

  Value value;

  friend std::uint32_t sizeInByteStream(const ValueEntry& entry)
  {
    return sizeInByteStream(entry.value);
  }

  template <typename It>
  friend It toNetworkByteStream(const ValueEntry& entry, It out)
  {
    return toNetworkByteStream(entry.value, std::move(out));
  }

  template <typename It>
  static std::pair<ValueEntry, It> fromNetworkByteStream(It begin, It end)
  {
    auto result =
      wire::Deserialize<Value>::fromNetworkByteStream(std::move(begin), std::move(end));
    return std::make_pair(ValueEntry{std::move(result.first)}, std::move(result.second));
  }
};

struct TimetagEntry
{
  static inline const std::int32_t key = 'ttag';
  static_assert(key == 0x74746167, "Unexpected byte order");

  uint64_t timetag;

  friend std::uint32_t sizeInByteStream(const TimetagEntry&) { return 8; }

  template <typename It>
  friend It toNetworkByteStream(const TimetagEntry& entry, It out)
  {
    return wire::toNetworkByteStream(entry.timetag, std::move(out));
  }

  template <typename It>
  static std::pair<TimetagEntry, It> fromNetworkByteStream(It begin, It end)
  {
    auto result =
      wire::Deserialize<uint64_t>::fromNetworkByteStream(std::move(begin), std::move(end));
    return std::make_pair(TimetagEntry{result.first}, std::move(result.second));
  }
};

struct BundleMessagesEntry
{
  static inline const std::int32_t key = 'bmsg';
  static_assert(key == 0x626d7367, "Unexpected byte order");

  std::vector<Message> messages;

  friend std::uint32_t sizeInByteStream(const BundleMessagesEntry& entry)
  {
    return wire::sizeInByteStream(entry.messages);
  }

  template <typename It>
  friend It toNetworkByteStream(const BundleMessagesEntry& entry, It out)
  {
    return wire::toNetworkByteStream(entry.messages, std::move(out));
  }

  template <typename It>
  static std::pair<BundleMessagesEntry, It> fromNetworkByteStream(It begin, It end)
  {
    auto result = wire::Deserialize<std::vector<Message>>::fromNetworkByteStream(
      std::move(begin), std::move(end));
    return std::make_pair(BundleMessagesEntry{std::move(result.first)},
                          std::move(result.second));
  }
};

using Content = std::variant<Message, Bundle>;

namespace detail
{

template <typename Payload>
std::vector<uint8_t> toBytes(const Payload& payload)
{
  std::vector<uint8_t> bytes;
  bytes.reserve(sizeInByteStream(payload));
  toNetworkByteStream(payload, std::back_inserter(bytes));
  return bytes;
}

} // namespace detail

inline Envelope toEnvelope(const Message& msg)
{
  Envelope envelope;
  envelope.payloadType = kMessagePayload;
  envelope.payload = detail::toBytes(wire::makePayload(
    AddressEntry{msg.address}, KindEntry{msg.kind}, ValueEntry{msg.value}));
  return envelope;
}

inline Envelope toEnvelope(const Bundle& bundle)
{
  Envelope envelope;
  envelope.payloadType = kBundlePayload;
  if (bundle.timetag)
  {
    envelope.payload = detail::toBytes(wire::makePayload(
      TimetagEntry{*bundle.timetag}, BundleMessagesEntry{bundle.messages}));
  }
  else
  {
    envelope.payload = detail::toBytes(wire::makePayload(BundleMessagesEntry{bundle.messages}));
  }
  return envelope;
}

inline Envelope toEnvelope(const Content& content)
{
  return std::visit([](const auto& c) { return toEnvelope(c); }, content);
}

// Throws TranslationError if the payload is not a well formed message or
// bundle
template <typename Log>
Content fromEnvelope(const Envelope& envelope, Log log)
{
  const auto begin = envelope.payload.cbegin();
  const auto end = envelope.payload.cend();
  try
  {
    switch (envelope.payloadType)
    {
    case kMessagePayload:
    {
      std::optional<std::string> address;
      Message msg;
      wire::parsePayload<AddressEntry, KindEntry, ValueEntry>(
        begin,
        end,
        log,
        [&address](AddressEntry entry) { address = std::move(entry.address); },
        [&msg](const KindEntry& entry) { msg.kind = entry.kind; },
        [&msg](ValueEntry entry) { msg.value = std::move(entry.value); });
      if (!address)
      {
        throw TranslationError("Message payload without address");
      }
      msg.address = std::move(*address);
      return msg;
    }
    case kBundlePayload:
    {
      Bundle bundle;
      wire::parsePayload<TimetagEntry, BundleMessagesEntry>(
        begin,
        end,
        log,
        [&bundle](const TimetagEntry& entry) { bundle.timetag = entry.timetag; },
        [&bundle](BundleMessagesEntry entry) { bundle.messages = std::move(entry.messages); });
      return bundle;
    }
    default:
      throw TranslationError("Unknown payload type: "
                             + std::to_string(static_cast<int>(envelope.payloadType)));
    }
  }
  catch (const std::range_error& err)
  {
    throw TranslationError(std::string{"Malformed envelope payload: "} + err.what());
  }
}

inline Content fromEnvelope(const Envelope& envelope)
{
  return fromEnvelope(envelope, util::NullLog{});
}

// All messages of the content in order
inline std::vector<Message> messagesOf(Content content)
{
  if (auto pMsg = std::get_if<Message>(&content))
  {
    return {std::move(*pMsg)};
  }
  return std::move(std::get<Bundle>(content).messages);
}

} // namespace message
} // namespace clasp
