// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/transport/AsioTypes.hpp>
#include <clasp/v2/Messages.hpp>
#include <clasp/wire/Payload.hpp>
#include <chrono>
#include <ostream>
#include <string>

namespace clasp
{
namespace discovery
{

using DeviceId = std::string;
using Clock = std::chrono::system_clock;

// 8 random bytes as 16 lowercase hex digits
template <typename Random>
DeviceId randomDeviceId()
{
  static const char kHexDigits[] = "0123456789abcdef";
  Random random;
  DeviceId id;
  for (int i = 0; i < 8; ++i)
  {
    const auto byte = random();
    id += kHexDigits[byte >> 4];
    id += kHexDigits[byte & 0x0F];
  }
  return id;
}

// Capabilities a device advertises. On the wire a feature set is the string
// of the letters of the enabled features, in the order param, stream,
// event, timeline, gesture.
struct Features
{
  bool param = true;
  bool stream = true;
  bool event = true;
  bool timeline = false;
  bool gesture = false;

  std::string toLetters() const
  {
    std::string letters;
    if (param)
    {
      letters += 'p';
    }
    if (stream)
    {
      letters += 's';
    }
    if (event)
    {
      letters += 'e';
    }
    if (timeline)
    {
      letters += 't';
    }
    if (gesture)
    {
      letters += 'g';
    }
    return letters;
  }

  // Unknown letters are ignored
  static Features fromLetters(const std::string& letters)
  {
    const auto has = [&letters](const char c)
    { return letters.find(c) != std::string::npos; };
    Features features;
    features.param = has('p');
    features.stream = has('s');
    features.event = has('e');
    features.timeline = has('t');
    features.gesture = has('g');
    return features;
  }

  friend bool operator==(const Features& lhs, const Features& rhs)
  {
    return lhs.toLetters() == rhs.toLetters();
  }

  friend bool operator!=(const Features& lhs, const Features& rhs) { return !(lhs == rhs); }
};

struct DeviceInfo
{
  std::string name;
  uint8_t version = v2::kVersion;
  Features features;
  bool bridge = false;
  // Empty unless bridge is set
  std::string bridgeProtocol;

  friend bool operator==(const DeviceInfo& lhs, const DeviceInfo& rhs)
  {
    return lhs.name == rhs.name && lhs.version == rhs.version
           && lhs.features == rhs.features && lhs.bridge == rhs.bridge
           && lhs.bridgeProtocol == rhs.bridgeProtocol;
  }

  friend bool operator!=(const DeviceInfo& lhs, const DeviceInfo& rhs) { return !(lhs == rhs); }
};

// A discovered or local endpoint. The id never changes; the address may
// move between announcements.
struct Device
{
  DeviceId id;
  transport::UdpEndpoint address;
  DeviceInfo info;
  Clock::time_point discoveredAt;
  Clock::time_point lastSeen;

  // Timestamps are bookkeeping and don't take part in comparison
  friend bool operator==(const Device& lhs, const Device& rhs)
  {
    return lhs.id == rhs.id && lhs.address == rhs.address && lhs.info == rhs.info;
  }

  friend bool operator!=(const Device& lhs, const Device& rhs) { return !(lhs == rhs); }

  friend std::ostream& operator<<(std::ostream& os, const Device& device)
  {
    return os << device.id << "@" << transport::toString(device.address);
  }
};

// Payload entries of discovery messages

struct DeviceIdEntry
{
  static inline const std::int32_t key = 'didt';
  static_assert(key == 0x64696474, "Unexpected byte order");

  DeviceId id;

  friend std::uint32_t sizeInByteStream(const DeviceIdEntry& entry)
  {
    return wire::sizeInByteStream(entry.id);
  }

  template <typename It>
  friend It toNetworkByteStream(const DeviceIdEntry& entry, It out)
  {
    return wire::toNetworkByteStream(entry.id, std::move(out));
  }

  template <typename It>
  static std::pair<DeviceIdEntry, It> fromNetworkByteStream(It begin, It end)
  {
    auto result =
      wire::Deserialize<std::string>::fromNetworkByteStream(std::move(begin), std::move(end));
    return std::make_pair(DeviceIdEntry{std::move(result.first)}, std::move(result.second));
  }
};

struct DeviceInfoEntry
{
  static inline const std::int32_t key = 'dinf';
  static_assert(key == 0x64696e66, "Unexpected byte order");

  DeviceInfo info;

  friend std::uint32_t sizeInByteStream(const DeviceInfoEntry& entry)
  {
    using wire::sizeInByteStream;
    return sizeInByteStream(entry.info.name) + sizeInByteStream(entry.info.version)
           + sizeInByteStream(entry.info.features.toLetters())
           + sizeInByteStream(entry.info.bridge)
           + sizeInByteStream(entry.info.bridgeProtocol);
  }

  template <typename It>
  friend It toNetworkByteStream(const DeviceInfoEntry& entry, It out)
  {
    using wire::toNetworkByteStream;
    out = toNetworkByteStream(entry.info.name, std::move(out));
    out = toNetworkByteStream(entry.info.version, std::move(out));
    out = toNetworkByteStream(entry.info.features.toLetters(), std::move(out));
    out = toNetworkByteStream(entry.info.bridge, std::move(out));
    return toNetworkByteStream(entry.info.bridgeProtocol, std::move(out));
  }

  template <typename It>
  static std::pair<DeviceInfoEntry, It> fromNetworkByteStream(It begin, It end)
  {
    using namespace std;
    using wire::Deserialize;
    DeviceInfo info;
    string letters;
    tie(info.name, begin) = Deserialize<string>::fromNetworkByteStream(begin, end);
    tie(info.version, begin) = Deserialize<uint8_t>::fromNetworkByteStream(begin, end);
    tie(letters, begin) = Deserialize<string>::fromNetworkByteStream(begin, end);
    tie(info.bridge, begin) = Deserialize<bool>::fromNetworkByteStream(begin, end);
    tie(info.bridgeProtocol, begin) = Deserialize<string>::fromNetworkByteStream(begin, end);
    info.features = Features::fromLetters(letters);
    return make_pair(DeviceInfoEntry{std::move(info)}, std::move(begin));
  }
};

// The address the device accepts CLASP sessions on. An unspecified address
// means "the address this announcement came from".
struct DeviceAddressEntry
{
  static inline const std::int32_t key = 'dadr';
  static_assert(key == 0x64616472, "Unexpected byte order");

  transport::UdpEndpoint endpoint;

  friend std::uint32_t sizeInByteStream(const DeviceAddressEntry&) { return 6; }

  template <typename It>
  friend It toNetworkByteStream(const DeviceAddressEntry& entry, It out)
  {
    using wire::toNetworkByteStream;
    const auto addr = entry.endpoint.address().is_v4()
                        ? entry.endpoint.address().to_v4().to_uint()
                        : uint32_t{0};
    return toNetworkByteStream(
      entry.endpoint.port(), toNetworkByteStream(static_cast<uint32_t>(addr), std::move(out)));
  }

  template <typename It>
  static std::pair<DeviceAddressEntry, It> fromNetworkByteStream(It begin, It end)
  {
    using namespace std;
    using wire::Deserialize;
    uint32_t addr;
    uint16_t port;
    tie(addr, begin) = Deserialize<uint32_t>::fromNetworkByteStream(begin, end);
    tie(port, begin) = Deserialize<uint16_t>::fromNetworkByteStream(begin, end);
    return make_pair(
      DeviceAddressEntry{transport::UdpEndpoint{transport::IpAddressV4{addr}, port}},
      std::move(begin));
  }
};

struct ServiceTypeEntry
{
  static inline const std::int32_t key = 'styp';
  static_assert(key == 0x73747970, "Unexpected byte order");

  std::string serviceType;

  friend std::uint32_t sizeInByteStream(const ServiceTypeEntry& entry)
  {
    return wire::sizeInByteStream(entry.serviceType);
  }

  template <typename It>
  friend It toNetworkByteStream(const ServiceTypeEntry& entry, It out)
  {
    return wire::toNetworkByteStream(entry.serviceType, std::move(out));
  }

  template <typename It>
  static std::pair<ServiceTypeEntry, It> fromNetworkByteStream(It begin, It end)
  {
    auto result =
      wire::Deserialize<std::string>::fromNetworkByteStream(std::move(begin), std::move(end));
    return std::make_pair(ServiceTypeEntry{std::move(result.first)}, std::move(result.second));
  }
};

// The lease in seconds the announcing device asks for
struct LeaseEntry
{
  static inline const std::int32_t key = 'leas';
  static_assert(key == 0x6c656173, "Unexpected byte order");

  uint16_t seconds;

  friend std::uint32_t sizeInByteStream(const LeaseEntry&) { return 2; }

  template <typename It>
  friend It toNetworkByteStream(const LeaseEntry& entry, It out)
  {
    return wire::toNetworkByteStream(entry.seconds, std::move(out));
  }

  template <typename It>
  static std::pair<LeaseEntry, It> fromNetworkByteStream(It begin, It end)
  {
    auto result =
      wire::Deserialize<uint16_t>::fromNetworkByteStream(std::move(begin), std::move(end));
    return std::make_pair(LeaseEntry{result.first}, std::move(result.second));
  }
};

inline auto toPayload(const Device& device, const std::string& serviceType, uint16_t lease)
  -> decltype(wire::makePayload(DeviceIdEntry{},
                                DeviceAddressEntry{},
                                DeviceInfoEntry{},
                                ServiceTypeEntry{},
                                LeaseEntry{}))
{
  return wire::makePayload(DeviceIdEntry{device.id},
                           DeviceAddressEntry{device.address},
                           DeviceInfoEntry{device.info},
                           ServiceTypeEntry{serviceType},
                           LeaseEntry{lease});
}

} // namespace discovery
} // namespace clasp
