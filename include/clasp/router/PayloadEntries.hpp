// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/v2/Messages.hpp>
#include <clasp/wire/Payload.hpp>
#include <string>

namespace clasp
{
namespace router
{

// The sender's own id for the session a Hello or Welcome is about
struct SessionIdEntry
{
  static inline const std::int32_t key = 'sess';
  static_assert(key == 0x73657373, "Unexpected byte order");

  v2::SessionId id;

  friend std::uint32_t sizeInByteStream(const SessionIdEntry&) { return 4; }

  template <typename It>
  friend It toNetworkByteStream(const SessionIdEntry& entry, It out)
  {
    return wire::toNetworkByteStream(entry.id, std::move(out));
  }

  template <typename It>
  static std::pair<SessionIdEntry, It> fromNetworkByteStream(It begin, It end)
  {
    auto result = wire::Deserialize<v2::SessionId>::fromNetworkByteStream(
      std::move(begin), std::move(end));
    return std::make_pair(SessionIdEntry{result.first}, std::move(result.second));
  }
};

// Name the peer gives itself in a Hello
struct PeerNameEntry
{
  static inline const std::int32_t key = 'name';
  static_assert(key == 0x6e616d65, "Unexpected byte order");

  std::string name;

  friend std::uint32_t sizeInByteStream(const PeerNameEntry& entry)
  {
    return wire::sizeInByteStream(entry.name);
  }

  template <typename It>
  friend It toNetworkByteStream(const PeerNameEntry& entry, It out)
  {
    return wire::toNetworkByteStream(entry.name, std::move(out));
  }

  template <typename It>
  static std::pair<PeerNameEntry, It> fromNetworkByteStream(It begin, It end)
  {
    auto result =
      wire::Deserialize<std::string>::fromNetworkByteStream(std::move(begin), std::move(end));
    return std::make_pair(PeerNameEntry{std::move(result.first)}, std::move(result.second));
  }
};

} // namespace router
} // namespace clasp
