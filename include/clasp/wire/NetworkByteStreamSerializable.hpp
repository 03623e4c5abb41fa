// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <algorithm>
#include <arpa/inet.h>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace clasp
{
namespace wire
{

// Concept: NetworkByteStreamSerializable
//
// A type that can be encoded to a stream of bytes and decoded from a
// stream of bytes in network byte order. The following type is for
// documentation purposes only.

struct NetworkByteStreamSerializable
{
  friend std::uint32_t sizeInByteStream(const NetworkByteStreamSerializable&);

  // The byte stream pointed to by 'out' must have sufficient space to
  // hold this object, as defined by sizeInByteStream.
  template <typename It>
  friend It toNetworkByteStream(const NetworkByteStreamSerializable&, It out);
};

// Deserialization aspect of the concept. Clients must name the type
// explicitly. The default defers to a static member of T; types that
// cannot provide one specialize this template.
template <typename T>
struct Deserialize
{
  // Throws std::range_error if the byte range is too short. Returns the
  // parsed value and an iterator to the next byte to parse.
  template <typename It>
  static std::pair<T, It> fromNetworkByteStream(It begin, It end)
  {
    return T::fromNetworkByteStream(std::move(begin), std::move(end));
  }
};

// Default size implementation. Works for primitive types.
template <typename T>
std::uint32_t sizeInByteStream(T)
{
  return sizeof(T);
}

namespace detail
{

template <typename It>
void requireBytes(const It begin, const It end, const std::size_t numBytes)
{
  using ItDiff = typename std::iterator_traits<It>::difference_type;
  if (std::distance(begin, end) < static_cast<ItDiff>(numBytes))
  {
    throw std::range_error("Parsing type from byte stream failed");
  }
}

template <typename T, typename It>
It copyToByteStream(const T t, It out)
{
  const auto pBytes = reinterpret_cast<const uint8_t*>(&t);
  return std::copy(pBytes, pBytes + sizeof(t), std::move(out));
}

template <typename T, typename It>
std::pair<T, It> copyFromByteStream(It begin, const It end)
{
  requireBytes(begin, end, sizeof(T));
  T t;
  std::copy_n(begin, sizeof(t), reinterpret_cast<uint8_t*>(&t));
  std::advance(begin, sizeof(t));
  return std::make_pair(t, std::move(begin));
}

inline uint64_t hostToNetwork64(const uint64_t ll)
{
  const uint32_t high = htonl(static_cast<uint32_t>(ll >> 32));
  const uint32_t low = htonl(static_cast<uint32_t>(ll & 0xFFFFFFFF));
  uint64_t result;
  std::memcpy(&result, &high, sizeof(high));
  std::memcpy(reinterpret_cast<uint8_t*>(&result) + sizeof(high), &low, sizeof(low));
  return result;
}

inline uint64_t networkToHost64(const uint64_t ll)
{
  uint32_t high;
  uint32_t low;
  std::memcpy(&high, &ll, sizeof(high));
  std::memcpy(&low, reinterpret_cast<const uint8_t*>(&ll) + sizeof(high), sizeof(low));
  return (static_cast<uint64_t>(ntohl(high)) << 32) | ntohl(low);
}

} // namespace detail

// uint8_t
template <typename It>
It toNetworkByteStream(const uint8_t byte, It out)
{
  return detail::copyToByteStream(byte, std::move(out));
}

template <>
struct Deserialize<uint8_t>
{
  template <typename It>
  static std::pair<uint8_t, It> fromNetworkByteStream(It begin, It end)
  {
    return detail::copyFromByteStream<uint8_t>(std::move(begin), std::move(end));
  }
};

// bool as a single byte
inline std::uint32_t sizeInByteStream(bool)
{
  return 1;
}

template <typename It>
It toNetworkByteStream(const bool b, It out)
{
  return toNetworkByteStream(static_cast<uint8_t>(b ? 1 : 0), std::move(out));
}

template <>
struct Deserialize<bool>
{
  template <typename It>
  static std::pair<bool, It> fromNetworkByteStream(It begin, It end)
  {
    auto result = Deserialize<uint8_t>::fromNetworkByteStream(std::move(begin), std::move(end));
    return std::make_pair(result.first != 0, std::move(result.second));
  }
};

// uint16_t
template <typename It>
It toNetworkByteStream(const uint16_t s, It out)
{
  return detail::copyToByteStream(htons(s), std::move(out));
}

template <>
struct Deserialize<uint16_t>
{
  template <typename It>
  static std::pair<uint16_t, It> fromNetworkByteStream(It begin, It end)
  {
    auto result = detail::copyFromByteStream<uint16_t>(std::move(begin), std::move(end));
    result.first = ntohs(result.first);
    return result;
  }
};

// uint32_t
template <typename It>
It toNetworkByteStream(const uint32_t l, It out)
{
  return detail::copyToByteStream(htonl(l), std::move(out));
}

template <>
struct Deserialize<uint32_t>
{
  template <typename It>
  static std::pair<uint32_t, It> fromNetworkByteStream(It begin, It end)
  {
    auto result = detail::copyFromByteStream<uint32_t>(std::move(begin), std::move(end));
    result.first = ntohl(result.first);
    return result;
  }
};

// int32_t in terms of uint32_t
template <typename It>
It toNetworkByteStream(const int32_t l, It out)
{
  return toNetworkByteStream(static_cast<uint32_t>(l), std::move(out));
}

template <>
struct Deserialize<int32_t>
{
  template <typename It>
  static std::pair<int32_t, It> fromNetworkByteStream(It begin, It end)
  {
    auto result =
      Deserialize<uint32_t>::fromNetworkByteStream(std::move(begin), std::move(end));
    return std::make_pair(static_cast<int32_t>(result.first), std::move(result.second));
  }
};

// uint64_t
template <typename It>
It toNetworkByteStream(const uint64_t ll, It out)
{
  return detail::copyToByteStream(detail::hostToNetwork64(ll), std::move(out));
}

template <>
struct Deserialize<uint64_t>
{
  template <typename It>
  static std::pair<uint64_t, It> fromNetworkByteStream(It begin, It end)
  {
    auto result = detail::copyFromByteStream<uint64_t>(std::move(begin), std::move(end));
    result.first = detail::networkToHost64(result.first);
    return result;
  }
};

// int64_t in terms of uint64_t
template <typename It>
It toNetworkByteStream(const int64_t ll, It out)
{
  return toNetworkByteStream(static_cast<uint64_t>(ll), std::move(out));
}

template <>
struct Deserialize<int64_t>
{
  template <typename It>
  static std::pair<int64_t, It> fromNetworkByteStream(It begin, It end)
  {
    auto result =
      Deserialize<uint64_t>::fromNetworkByteStream(std::move(begin), std::move(end));
    return std::make_pair(static_cast<int64_t>(result.first), std::move(result.second));
  }
};

// double as its IEEE 754 bit pattern
template <typename It>
It toNetworkByteStream(const double d, It out)
{
  uint64_t bits;
  std::memcpy(&bits, &d, sizeof(bits));
  return toNetworkByteStream(bits, std::move(out));
}

template <>
struct Deserialize<double>
{
  template <typename It>
  static std::pair<double, It> fromNetworkByteStream(It begin, It end)
  {
    auto result =
      Deserialize<uint64_t>::fromNetworkByteStream(std::move(begin), std::move(end));
    double d;
    std::memcpy(&d, &result.first, sizeof(d));
    return std::make_pair(d, std::move(result.second));
  }
};

// overloads for std::chrono durations
template <typename Rep, typename Ratio>
std::uint32_t sizeInByteStream(const std::chrono::duration<Rep, Ratio> dur)
{
  return sizeInByteStream(dur.count());
}

template <typename Rep, typename Ratio, typename It>
It toNetworkByteStream(const std::chrono::duration<Rep, Ratio> dur, It out)
{
  return toNetworkByteStream(dur.count(), std::move(out));
}

template <typename Rep, typename Ratio>
struct Deserialize<std::chrono::duration<Rep, Ratio>>
{
  template <typename It>
  static std::pair<std::chrono::duration<Rep, Ratio>, It> fromNetworkByteStream(It begin,
                                                                                It end)
  {
    auto result = Deserialize<Rep>::fromNetworkByteStream(std::move(begin), std::move(end));
    return std::make_pair(std::chrono::duration<Rep, Ratio>{result.first},
                          std::move(result.second));
  }
};

// string, prefixed with its byte count
inline std::uint32_t sizeInByteStream(const std::string& str)
{
  return static_cast<std::uint32_t>(sizeof(std::uint32_t) + str.size());
}

template <typename It>
It toNetworkByteStream(const std::string& str, It out)
{
  out = toNetworkByteStream(static_cast<std::uint32_t>(str.size()), std::move(out));
  return std::copy(str.begin(), str.end(), std::move(out));
}

template <>
struct Deserialize<std::string>
{
  template <typename It>
  static std::pair<std::string, It> fromNetworkByteStream(It begin, It end)
  {
    auto size = Deserialize<std::uint32_t>::fromNetworkByteStream(begin, end);
    detail::requireBytes(size.second, end, size.first);
    auto strEnd = size.second;
    std::advance(strEnd, size.first);
    return std::make_pair(std::string{size.second, strEnd}, std::move(strEnd));
  }
};

namespace detail
{

// Generic serialize/deserialize utilities for containers

template <typename Container>
std::uint32_t containerSizeInByteStream(const Container& container)
{
  std::uint32_t totalSize = 0;
  for (const auto& val : container)
  {
    totalSize += sizeInByteStream(val);
  }
  return totalSize;
}

template <typename Container, typename It>
It containerToNetworkByteStream(const Container& container, It out)
{
  for (const auto& val : container)
  {
    out = toNetworkByteStream(val, std::move(out));
  }
  return out;
}

template <typename T, typename BytesIt, typename InsertIt>
BytesIt deserializeContainer(BytesIt bytesBegin,
                             const BytesIt bytesEnd,
                             InsertIt contBegin,
                             const std::uint32_t numElements)
{
  for (std::uint32_t i = 0; i < numElements; ++i)
  {
    auto result = Deserialize<T>::fromNetworkByteStream(bytesBegin, bytesEnd);
    *contBegin++ = std::move(result.first);
    bytesBegin = std::move(result.second);
  }
  return bytesBegin;
}

} // namespace detail

// array, fixed number of elements without a size prefix
template <typename T, std::size_t Size>
std::uint32_t sizeInByteStream(const std::array<T, Size>& arr)
{
  return detail::containerSizeInByteStream(arr);
}

template <typename T, std::size_t Size, typename It>
It toNetworkByteStream(const std::array<T, Size>& arr, It out)
{
  return detail::containerToNetworkByteStream(arr, std::move(out));
}

template <typename T, std::size_t Size>
struct Deserialize<std::array<T, Size>>
{
  template <typename It>
  static std::pair<std::array<T, Size>, It> fromNetworkByteStream(It begin, It end)
  {
    std::array<T, Size> result{};
    auto resultIt = detail::deserializeContainer<T>(
      std::move(begin), std::move(end), result.begin(), static_cast<std::uint32_t>(Size));
    return std::make_pair(std::move(result), std::move(resultIt));
  }
};

// vector, prefixed with its element count
template <typename T, typename Alloc>
std::uint32_t sizeInByteStream(const std::vector<T, Alloc>& vec)
{
  return sizeof(std::uint32_t) + detail::containerSizeInByteStream(vec);
}

template <typename T, typename Alloc, typename It>
It toNetworkByteStream(const std::vector<T, Alloc>& vec, It out)
{
  out = toNetworkByteStream(static_cast<std::uint32_t>(vec.size()), std::move(out));
  return detail::containerToNetworkByteStream(vec, std::move(out));
}

template <typename T, typename Alloc>
struct Deserialize<std::vector<T, Alloc>>
{
  template <typename It>
  static std::pair<std::vector<T, Alloc>, It> fromNetworkByteStream(It bytesBegin,
                                                                    It bytesEnd)
  {
    auto size = Deserialize<std::uint32_t>::fromNetworkByteStream(bytesBegin, bytesEnd);
    // Every element takes at least one byte, which bounds the reservation
    // for hostile size prefixes.
    const auto remaining = std::distance(size.second, bytesEnd);
    if (remaining < 0 || static_cast<std::size_t>(remaining) < size.first)
    {
      throw std::range_error("Vector size exceeds byte stream");
    }
    std::vector<T, Alloc> result;
    result.reserve(size.first);
    auto resultIt = detail::deserializeContainer<T>(
      std::move(size.second), std::move(bytesEnd), std::back_inserter(result), size.first);
    return std::make_pair(std::move(result), std::move(resultIt));
  }
};

} // namespace wire
} // namespace clasp
