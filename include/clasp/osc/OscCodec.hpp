// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Errors.hpp>
#include <clasp/message/Codec.hpp>
#include <clasp/message/Message.hpp>
#include <clasp/wire/NetworkByteStreamSerializable.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstring>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace clasp
{
namespace osc
{

// OSC 1.0 packets and their translation to and from CLASP messages

using Blob = std::vector<uint8_t>;

// 'S', a string the receiver should treat as a symbol
struct Symbol
{
  std::string name;
};

// 't', 64 bit NTP time
struct TimeTag
{
  uint64_t value;
};

// 'm', port id, status byte, data1, data2
using MidiBytes = std::array<uint8_t, 4>;

// 'N'
struct Nil
{
};

// 'I'
struct Impulse
{
};

using Argument = std::variant<int32_t,
                              float,
                              std::string,
                              Symbol,
                              Blob,
                              int64_t,
                              TimeTag,
                              double,
                              char,
                              MidiBytes,
                              bool,
                              Nil,
                              Impulse>;

struct Message
{
  std::string address;
  std::vector<Argument> arguments;
};

struct Bundle
{
  uint64_t timetag = message::kImmediately;
  std::vector<Message> messages;
  std::vector<Bundle> bundles;
};

using Packet = std::variant<Message, Bundle>;

const std::array<char, 8> kBundleTag = {{'#', 'b', 'u', 'n', 'd', 'l', 'e', '\0'}};

inline char typeTag(const Argument& argument)
{
  static const char tags[] = {'i', 'f', 's', 'S', 'b', 'h', 't', 'd', 'c', 'm', 'T', 'N', 'I'};
  if (const auto pBool = std::get_if<bool>(&argument))
  {
    return *pBool ? 'T' : 'F';
  }
  return tags[argument.index()];
}

// Characters of an address pattern that CLASP addresses can't carry
inline bool isRepresentable(const std::string& address)
{
  static const std::string reserved = " #*,?[]{}";
  return !address.empty() && address.front() == '/'
         && address.find_first_of(reserved) == std::string::npos;
}

namespace detail
{

inline std::size_t padding(const std::size_t size)
{
  return (4 - (size & 3)) & 3;
}

template <typename It>
It writeString(const std::string& str, It out)
{
  out = std::copy(str.begin(), str.end(), std::move(out));
  // At least one terminating zero
  return std::fill_n(std::move(out), 1 + padding(str.size() + 1), uint8_t{0});
}

template <typename It>
It writeFloat(const float f, It out)
{
  uint32_t bits;
  std::memcpy(&bits, &f, sizeof(bits));
  return wire::toNetworkByteStream(bits, std::move(out));
}

template <typename It>
It writeBlob(const Blob& blob, It out)
{
  out = wire::toNetworkByteStream(static_cast<int32_t>(blob.size()), std::move(out));
  out = std::copy(blob.begin(), blob.end(), std::move(out));
  return std::fill_n(std::move(out), padding(blob.size()), uint8_t{0});
}

template <typename It>
struct ArgumentWriter
{
  It operator()(const int32_t i) { return wire::toNetworkByteStream(i, std::move(out)); }
  It operator()(const float f) { return writeFloat(f, std::move(out)); }
  It operator()(const std::string& s) { return writeString(s, std::move(out)); }
  It operator()(const Symbol& s) { return writeString(s.name, std::move(out)); }
  It operator()(const Blob& b) { return writeBlob(b, std::move(out)); }
  It operator()(const int64_t h) { return wire::toNetworkByteStream(h, std::move(out)); }
  It operator()(const TimeTag t) { return wire::toNetworkByteStream(t.value, std::move(out)); }
  It operator()(const double d) { return wire::toNetworkByteStream(d, std::move(out)); }
  It operator()(const char c)
  {
    return wire::toNetworkByteStream(static_cast<int32_t>(c), std::move(out));
  }
  It operator()(const MidiBytes& m) { return std::copy(m.begin(), m.end(), std::move(out)); }
  It operator()(bool) { return std::move(out); }
  It operator()(Nil) { return std::move(out); }
  It operator()(Impulse) { return std::move(out); }

  It out;
};

template <typename It>
std::pair<std::string, It> readString(It begin, const It end)
{
  const auto terminator = std::find(begin, end, uint8_t{0});
  if (terminator == end)
  {
    throw std::range_error("Unterminated OSC string");
  }
  std::string str(begin, terminator);
  auto next = std::next(terminator);
  const auto pad = padding(str.size() + 1);
  wire::detail::requireBytes(next, end, pad);
  std::advance(next, pad);
  return std::make_pair(std::move(str), std::move(next));
}

template <typename It>
std::pair<Blob, It> readBlob(It begin, const It end)
{
  int32_t size;
  std::tie(size, begin) = wire::Deserialize<int32_t>::fromNetworkByteStream(begin, end);
  if (size < 0)
  {
    throw std::range_error("Negative OSC blob size");
  }
  const auto numBytes = static_cast<std::size_t>(size);
  wire::detail::requireBytes(begin, end, numBytes + padding(numBytes));
  auto blobEnd = std::next(begin, static_cast<std::ptrdiff_t>(numBytes));
  Blob blob(begin, blobEnd);
  std::advance(blobEnd, static_cast<std::ptrdiff_t>(padding(numBytes)));
  return std::make_pair(std::move(blob), std::move(blobEnd));
}

template <typename It>
std::pair<Argument, It> readArgument(const char tag, It begin, const It end)
{
  using namespace std;
  switch (tag)
  {
  case 'i':
  {
    auto result = wire::Deserialize<int32_t>::fromNetworkByteStream(begin, end);
    return make_pair(Argument{result.first}, result.second);
  }
  case 'f':
  {
    auto result = wire::Deserialize<uint32_t>::fromNetworkByteStream(begin, end);
    float f;
    memcpy(&f, &result.first, sizeof(f));
    return make_pair(Argument{f}, result.second);
  }
  case 's':
  {
    auto result = readString(begin, end);
    return make_pair(Argument{std::move(result.first)}, result.second);
  }
  case 'S':
  {
    auto result = readString(begin, end);
    return make_pair(Argument{Symbol{std::move(result.first)}}, result.second);
  }
  case 'b':
  {
    auto result = readBlob(begin, end);
    return make_pair(Argument{std::move(result.first)}, result.second);
  }
  case 'h':
  {
    auto result = wire::Deserialize<int64_t>::fromNetworkByteStream(begin, end);
    return make_pair(Argument{result.first}, result.second);
  }
  case 't':
  {
    auto result = wire::Deserialize<uint64_t>::fromNetworkByteStream(begin, end);
    return make_pair(Argument{TimeTag{result.first}}, result.second);
  }
  case 'd':
  {
    auto result = wire::Deserialize<double>::fromNetworkByteStream(begin, end);
    return make_pair(Argument{result.first}, result.second);
  }
  case 'c':
  {
    auto result = wire::Deserialize<int32_t>::fromNetworkByteStream(begin, end);
    return make_pair(Argument{static_cast<char>(result.first)}, result.second);
  }
  case 'm':
  {
    auto result = wire::Deserialize<MidiBytes>::fromNetworkByteStream(begin, end);
    return make_pair(Argument{result.first}, result.second);
  }
  case 'T':
    return make_pair(Argument{true}, begin);
  case 'F':
    return make_pair(Argument{false}, begin);
  case 'N':
    return make_pair(Argument{Nil{}}, begin);
  case 'I':
    return make_pair(Argument{Impulse{}}, begin);
  default:
    throw std::range_error(std::string{"Unknown OSC type tag '"} + tag + "'");
  }
}

template <typename It>
Message decodeMessage(It begin, const It end)
{
  Message msg;
  std::tie(msg.address, begin) = readString(begin, end);

  // Packets without a type tag string predate OSC 1.0 and carry no
  // arguments we could read
  if (begin == end)
  {
    return msg;
  }

  std::string tags;
  std::tie(tags, begin) = readString(begin, end);
  if (tags.empty() || tags.front() != ',')
  {
    throw std::range_error("Malformed OSC type tag string");
  }

  for (auto tag = std::next(tags.begin()); tag != tags.end(); ++tag)
  {
    Argument argument;
    std::tie(argument, begin) = readArgument(*tag, begin, end);
    msg.arguments.push_back(std::move(argument));
  }
  return msg;
}

template <typename It>
bool isBundle(const It begin, const It end)
{
  return std::distance(begin, end) >= static_cast<std::ptrdiff_t>(kBundleTag.size())
         && std::equal(kBundleTag.begin(), kBundleTag.end(), begin);
}

template <typename It>
Bundle decodeBundle(It begin, const It end, const int depth)
{
  if (depth > 8)
  {
    throw std::range_error("OSC bundles nested too deeply");
  }

  std::advance(begin, static_cast<std::ptrdiff_t>(kBundleTag.size()));
  Bundle bundle;
  std::tie(bundle.timetag, begin) = wire::Deserialize<uint64_t>::fromNetworkByteStream(begin, end);

  while (begin != end)
  {
    int32_t size;
    std::tie(size, begin) = wire::Deserialize<int32_t>::fromNetworkByteStream(begin, end);
    if (size < 0 || (size & 3) != 0)
    {
      throw std::range_error("Malformed OSC bundle element size");
    }
    wire::detail::requireBytes(begin, end, static_cast<std::size_t>(size));
    const auto elementEnd = std::next(begin, size);
    if (isBundle(begin, elementEnd))
    {
      bundle.bundles.push_back(decodeBundle(begin, elementEnd, depth + 1));
    }
    else
    {
      bundle.messages.push_back(decodeMessage(begin, elementEnd));
    }
    begin = elementEnd;
  }
  return bundle;
}

} // namespace detail

template <typename It>
It encode(const Message& msg, It out)
{
  std::string tags = ",";
  for (const auto& argument : msg.arguments)
  {
    tags.push_back(typeTag(argument));
  }
  out = detail::writeString(msg.address, std::move(out));
  out = detail::writeString(tags, std::move(out));
  for (const auto& argument : msg.arguments)
  {
    out = std::visit(detail::ArgumentWriter<It>{std::move(out)}, argument);
  }
  return out;
}

template <typename It>
It encode(const Bundle& bundle, It out);

namespace detail
{

template <typename Element, typename It>
It writeElement(const Element& element, It out)
{
  std::vector<uint8_t> bytes;
  encode(element, std::back_inserter(bytes));
  out = wire::toNetworkByteStream(static_cast<int32_t>(bytes.size()), std::move(out));
  return std::copy(bytes.begin(), bytes.end(), std::move(out));
}

} // namespace detail

template <typename It>
It encode(const Bundle& bundle, It out)
{
  out = std::copy(kBundleTag.begin(), kBundleTag.end(), std::move(out));
  out = wire::toNetworkByteStream(bundle.timetag, std::move(out));
  for (const auto& msg : bundle.messages)
  {
    out = detail::writeElement(msg, std::move(out));
  }
  for (const auto& nested : bundle.bundles)
  {
    out = detail::writeElement(nested, std::move(out));
  }
  return out;
}

inline std::vector<uint8_t> encode(const Packet& packet)
{
  std::vector<uint8_t> bytes;
  std::visit([&bytes](const auto& p) { encode(p, std::back_inserter(bytes)); }, packet);
  return bytes;
}

// Throws std::range_error on malformed packets
template <typename It>
Packet decode(const It begin, const It end)
{
  if (detail::isBundle(begin, end))
  {
    return detail::decodeBundle(begin, end, 0);
  }
  return detail::decodeMessage(begin, end);
}

inline message::Value toValue(const Argument& argument)
{
  struct Visitor
  {
    message::Value operator()(const int32_t i) const { return i; }
    message::Value operator()(const float f) const { return static_cast<double>(f); }
    message::Value operator()(const std::string& s) const { return s; }
    message::Value operator()(const Symbol& s) const { return s.name; }
    message::Value operator()(const Blob& b) const { return message::Value{b}; }
    message::Value operator()(const int64_t h) const { return h; }
    message::Value operator()(const TimeTag t) const { return static_cast<int64_t>(t.value); }
    message::Value operator()(const double d) const { return d; }
    message::Value operator()(const char c) const { return std::string(1, c); }
    message::Value operator()(const MidiBytes& m) const
    {
      return message::Value{message::Bytes(m.begin(), m.end())};
    }
    message::Value operator()(const bool b) const { return b; }
    message::Value operator()(Nil) const { return {}; }
    message::Value operator()(Impulse) const
    {
      return std::numeric_limits<double>::infinity();
    }
  };
  return std::visit(Visitor{}, argument);
}

// Throws TranslationError for values OSC has no argument for
inline void appendArguments(const message::Value& value,
                            std::vector<Argument>& arguments,
                            const bool nested)
{
  using message::Value;
  switch (value.type())
  {
  case Value::Type::Null:
    if (nested)
    {
      arguments.emplace_back(Nil{});
    }
    break;
  case Value::Type::Bool:
    arguments.emplace_back(*value.get<bool>());
    break;
  case Value::Type::Int:
  {
    const auto i = *value.get<int64_t>();
    if (i >= std::numeric_limits<int32_t>::min() && i <= std::numeric_limits<int32_t>::max())
    {
      arguments.emplace_back(static_cast<int32_t>(i));
    }
    else
    {
      arguments.emplace_back(i);
    }
    break;
  }
  case Value::Type::Float:
  {
    const auto d = *value.get<double>();
    const auto f = static_cast<float>(d);
    if (static_cast<double>(f) == d || std::isnan(d))
    {
      arguments.emplace_back(f);
    }
    else
    {
      arguments.emplace_back(d);
    }
    break;
  }
  case Value::Type::String:
    arguments.emplace_back(*value.get<std::string>());
    break;
  case Value::Type::Bytes:
    arguments.emplace_back(*value.get<message::Bytes>());
    break;
  case Value::Type::Array:
    if (nested)
    {
      throw TranslationError("OSC arguments can't nest arrays");
    }
    for (const auto& element : *value.get<message::Array>())
    {
      appendArguments(element, arguments, true);
    }
    break;
  case Value::Type::Map:
    throw TranslationError("OSC has no argument type for maps");
  }
}

// The OSC address appended to the namespace prefix becomes the CLASP
// address. Throws TranslationError for address patterns.
inline message::Message toClasp(const Message& msg, const std::string& prefix)
{
  if (!isRepresentable(msg.address))
  {
    throw TranslationError("OSC address pattern '" + msg.address + "' can't be translated");
  }

  message::Message result;
  result.kind = message::Kind::Set;
  result.address = prefix + msg.address;
  if (msg.arguments.size() == 1)
  {
    result.value = toValue(msg.arguments.front());
  }
  else if (!msg.arguments.empty())
  {
    message::Array values;
    for (const auto& argument : msg.arguments)
    {
      values.push_back(toValue(argument));
    }
    result.value = std::move(values);
  }
  return result;
}

namespace detail
{

inline void flatten(const Bundle& bundle,
                    const std::string& prefix,
                    std::vector<message::Message>& out)
{
  for (const auto& msg : bundle.messages)
  {
    out.push_back(toClasp(msg, prefix));
  }
  for (const auto& nested : bundle.bundles)
  {
    if (nested.timetag != bundle.timetag)
    {
      throw TranslationError("Nested OSC bundle with timetag " + std::to_string(nested.timetag)
                             + " inside bundle with timetag "
                             + std::to_string(bundle.timetag));
    }
    flatten(nested, prefix, out);
  }
}

} // namespace detail

// Nested bundles sharing the timetag of their parent are flattened into
// one. The timetag is carried unchanged. Throws TranslationError for a
// nested bundle with a timetag of its own.
inline message::Bundle toClasp(const Bundle& bundle, const std::string& prefix)
{
  message::Bundle result;
  result.timetag = bundle.timetag;
  detail::flatten(bundle, prefix, result.messages);
  return result;
}

inline Envelope toEnvelope(const Packet& packet, const std::string& prefix)
{
  return std::visit(
    [&prefix](const auto& p) { return message::toEnvelope(toClasp(p, prefix)); }, packet);
}

// Strips the namespace prefix if the address carries it
inline Message fromClasp(const message::Message& msg, const std::string& prefix)
{
  auto address = msg.address;
  if (!prefix.empty() && address.compare(0, prefix.size(), prefix) == 0
      && address.size() > prefix.size() && address[prefix.size()] == '/')
  {
    address.erase(0, prefix.size());
  }
  if (!isRepresentable(address))
  {
    throw TranslationError("Address '" + msg.address + "' is not a valid OSC address");
  }

  Message result;
  result.address = std::move(address);
  appendArguments(msg.value, result.arguments, false);
  return result;
}

inline Bundle fromClasp(const message::Bundle& bundle, const std::string& prefix)
{
  Bundle result;
  result.timetag = bundle.timetag ? *bundle.timetag : message::kImmediately;
  for (const auto& msg : bundle.messages)
  {
    result.messages.push_back(fromClasp(msg, prefix));
  }
  return result;
}

// Throws TranslationError
inline Packet fromEnvelope(const Envelope& envelope, const std::string& prefix)
{
  const auto content = message::fromEnvelope(envelope);
  if (const auto pMessage = std::get_if<message::Message>(&content))
  {
    return fromClasp(*pMessage, prefix);
  }
  return fromClasp(std::get<message::Bundle>(content), prefix);
}

} // namespace osc
} // namespace clasp
