// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/Errors.hpp>
#include <clasp/message/Message.hpp>
#include <clasp/midi/MidiParser.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace clasp
{
namespace midi
{

// Addresses below the base /<namespace>/<device>:
//   /ch/{n}/note              Publish {note, velocity, on}
//   /ch/{n}/cc/{cc}           Set Int 0..127
//   /ch/{n}/program           Publish Int 0..127
//   /ch/{n}/bend              Set Int -8192..8191
//   /ch/{n}/pressure          Set Int 0..127 (channel aftertouch)
//   /ch/{n}/aftertouch/{note} Set Int 0..127 (polyphonic aftertouch)
//   /clock                    Publish Null
//   /transport                Publish "start" | "continue" | "stop"
// Channels are numbered 0 to 15 like on the wire.

inline std::string baseAddress(const std::string& prefix, const std::string& deviceName)
{
  return prefix + "/" + deviceName;
}

namespace detail
{

inline uint8_t clamp7(const int64_t value)
{
  return static_cast<uint8_t>(std::min<int64_t>(std::max<int64_t>(value, 0), 127));
}

inline void requireLength(const MidiMessage& msg, const std::size_t length)
{
  if (msg.size() < length)
  {
    throw TranslationError("Truncated MIDI message");
  }
}

// Saturates at the int32 range, which covers every MIDI value. Empty for
// NaN.
inline std::optional<int64_t> truncated(const double value)
{
  if (std::isnan(value))
  {
    return std::nullopt;
  }
  const auto lo = static_cast<double>(std::numeric_limits<int32_t>::min());
  const auto hi = static_cast<double>(std::numeric_limits<int32_t>::max());
  return static_cast<int64_t>(std::min(std::max(value, lo), hi));
}

inline int64_t intValue(const message::Value& value, const std::string& address)
{
  if (const auto pInt = value.get<int64_t>())
  {
    return *pInt;
  }
  if (const auto pFloat = value.get<double>())
  {
    if (const auto number = truncated(*pFloat))
    {
      return *number;
    }
  }
  throw TranslationError("Expected a number for " + address);
}

inline std::optional<int64_t> mapInt(const message::Map& map, const std::string& key)
{
  for (const auto& entry : map)
  {
    if (entry.first == key)
    {
      if (const auto pInt = entry.second.get<int64_t>())
      {
        return *pInt;
      }
      if (const auto pFloat = entry.second.get<double>())
      {
        return truncated(*pFloat);
      }
    }
  }
  return std::nullopt;
}

inline std::optional<bool> mapBool(const message::Map& map, const std::string& key)
{
  for (const auto& entry : map)
  {
    if (entry.first == key)
    {
      if (const auto pBool = entry.second.get<bool>())
      {
        return *pBool;
      }
    }
  }
  return std::nullopt;
}

inline std::vector<std::string> split(const std::string& path)
{
  std::vector<std::string> parts;
  std::istringstream stream(path);
  std::string part;
  while (std::getline(stream, part, '/'))
  {
    if (!part.empty())
    {
      parts.push_back(part);
    }
  }
  return parts;
}

// Throws TranslationError if the text isn't a number in range
inline uint8_t parseNumber(const std::string& text, const int max, const std::string& address)
{
  if (text.empty() || text.size() > 3
      || !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; }))
  {
    throw TranslationError("Malformed MIDI address " + address);
  }
  const auto number = std::stoi(text);
  if (number > max)
  {
    throw TranslationError("Out of range MIDI address " + address);
  }
  return static_cast<uint8_t>(number);
}

} // namespace detail

// Empty for well formed messages CLASP has no address for (SysEx, active
// sensing and the like). Throws TranslationError for a message without a
// status byte or with missing data bytes.
inline std::optional<message::Message> toClasp(const MidiMessage& msg, const std::string& base)
{
  using message::Kind;
  using message::Value;

  if (msg.empty() || msg.front() < 0x80)
  {
    throw TranslationError("MIDI message without status byte");
  }

  const auto status = msg.front();
  const auto type = status & 0xF0;
  const auto channelAddress = base + "/ch/" + std::to_string(status & 0x0F);

  switch (type)
  {
  case 0x80:
  case 0x90:
  {
    detail::requireLength(msg, 3);
    const auto on = type == 0x90 && msg[2] > 0;
    return message::Message{Kind::Publish,
                            channelAddress + "/note",
                            message::Map{{"note", Value{msg[1]}},
                                         {"velocity", Value{msg[2]}},
                                         {"on", Value{on}}}};
  }
  case 0xA0:
    detail::requireLength(msg, 3);
    return message::Message{
      Kind::Set, channelAddress + "/aftertouch/" + std::to_string(msg[1]), Value{msg[2]}};
  case 0xB0:
    detail::requireLength(msg, 3);
    return message::Message{
      Kind::Set, channelAddress + "/cc/" + std::to_string(msg[1]), Value{msg[2]}};
  case 0xC0:
    detail::requireLength(msg, 2);
    return message::Message{Kind::Publish, channelAddress + "/program", Value{msg[1]}};
  case 0xD0:
    detail::requireLength(msg, 2);
    return message::Message{Kind::Set, channelAddress + "/pressure", Value{msg[1]}};
  case 0xE0:
  {
    detail::requireLength(msg, 3);
    const auto bend = ((static_cast<int64_t>(msg[2]) << 7) | msg[1]) - 8192;
    return message::Message{Kind::Set, channelAddress + "/bend", Value{bend}};
  }
  default:
    break;
  }

  switch (status)
  {
  case 0xF8:
    return message::Message{Kind::Publish, base + "/clock", Value{}};
  case 0xFA:
    return message::Message{Kind::Publish, base + "/transport", Value{"start"}};
  case 0xFB:
    return message::Message{Kind::Publish, base + "/transport", Value{"continue"}};
  case 0xFC:
    return message::Message{Kind::Publish, base + "/transport", Value{"stop"}};
  default:
    return std::nullopt;
  }
}

// Values are clamped to the MIDI range. Throws TranslationError for
// addresses outside the base or without a MIDI counterpart.
inline MidiMessage fromClasp(const message::Message& msg, const std::string& base)
{
  const auto& address = msg.address;
  if (address.compare(0, base.size(), base) != 0 || address.size() <= base.size()
      || address[base.size()] != '/')
  {
    throw TranslationError("Address " + address + " is not below " + base);
  }

  const auto parts = detail::split(address.substr(base.size()));
  if (parts.size() == 1 && parts[0] == "clock")
  {
    return {0xF8};
  }
  if (parts.size() == 1 && parts[0] == "transport")
  {
    const auto pCommand = msg.value.get<std::string>();
    if (pCommand && *pCommand == "start")
    {
      return {0xFA};
    }
    if (pCommand && *pCommand == "continue")
    {
      return {0xFB};
    }
    if (pCommand && *pCommand == "stop")
    {
      return {0xFC};
    }
    throw TranslationError("Unknown transport command for " + address);
  }

  if (parts.size() < 3 || parts[0] != "ch")
  {
    throw TranslationError("No MIDI message for " + address);
  }
  const auto channel = detail::parseNumber(parts[1], 15, address);
  const auto& command = parts[2];

  if (command == "note" && parts.size() == 3)
  {
    const auto pMap = msg.value.get<message::Map>();
    if (!pMap)
    {
      throw TranslationError("Expected a note map for " + address);
    }
    const auto note = detail::mapInt(*pMap, "note");
    if (!note)
    {
      throw TranslationError("Missing note number for " + address);
    }
    const auto velocity = detail::clamp7(detail::mapInt(*pMap, "velocity").value_or(0));
    const auto on = detail::mapBool(*pMap, "on").value_or(velocity > 0);
    const uint8_t type = on ? 0x90 : 0x80;
    return {static_cast<uint8_t>(type | channel), detail::clamp7(*note), velocity};
  }
  if (command == "cc" && parts.size() == 4)
  {
    const auto cc = detail::parseNumber(parts[3], 127, address);
    return {static_cast<uint8_t>(0xB0 | channel),
            cc,
            detail::clamp7(detail::intValue(msg.value, address))};
  }
  if (command == "aftertouch" && parts.size() == 4)
  {
    const auto note = detail::parseNumber(parts[3], 127, address);
    return {static_cast<uint8_t>(0xA0 | channel),
            note,
            detail::clamp7(detail::intValue(msg.value, address))};
  }
  if (command == "program" && parts.size() == 3)
  {
    return {static_cast<uint8_t>(0xC0 | channel),
            detail::clamp7(detail::intValue(msg.value, address))};
  }
  if (command == "pressure" && parts.size() == 3)
  {
    return {static_cast<uint8_t>(0xD0 | channel),
            detail::clamp7(detail::intValue(msg.value, address))};
  }
  if (command == "bend" && parts.size() == 3)
  {
    const auto bend =
      std::min<int64_t>(std::max<int64_t>(detail::intValue(msg.value, address), -8192), 8191)
      + 8192;
    return {static_cast<uint8_t>(0xE0 | channel),
            static_cast<uint8_t>(bend & 0x7F),
            static_cast<uint8_t>((bend >> 7) & 0x7F)};
  }
  throw TranslationError("No MIDI message for " + address);
}

} // namespace midi
} // namespace clasp
