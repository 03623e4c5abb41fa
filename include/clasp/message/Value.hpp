// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/wire/NetworkByteStreamSerializable.hpp>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace clasp
{
namespace message
{

class Value;

struct Null
{
  friend bool operator==(const Null&, const Null&) { return true; }
  friend bool operator!=(const Null&, const Null&) { return false; }
};

using Bytes = std::vector<uint8_t>;
using Array = std::vector<Value>;
// Ordered so that a value survives a round trip byte for byte
using Map = std::vector<std::pair<std::string, Value>>;

// The dynamically typed value carried by every CLASP message
class Value
{
public:
  // The order matches the variant alternatives and the wire tags
  enum class Type : uint8_t
  {
    Null,
    Bool,
    Int,
    Float,
    String,
    Bytes,
    Array,
    Map
  };

  using Variant = std::variant<Null, bool, int64_t, double, std::string, Bytes, Array, Map>;

  Value() = default;

  Value(Null) {}

  Value(const bool b)
    : mData(b)
  {
  }

  template <typename T,
            typename std::enable_if<std::is_integral<T>::value
                                      && !std::is_same<T, bool>::value,
                                    int>::type = 0>
  Value(const T i)
    : mData(static_cast<int64_t>(i))
  {
  }

  template <typename T,
            typename std::enable_if<std::is_floating_point<T>::value, int>::type = 0>
  Value(const T f)
    : mData(static_cast<double>(f))
  {
  }

  Value(const char* const str)
    : mData(std::string{str})
  {
  }

  Value(std::string str)
    : mData(std::move(str))
  {
  }

  Value(Bytes bytes)
    : mData(std::move(bytes))
  {
  }

  Value(Array array)
    : mData(std::move(array))
  {
  }

  Value(Map map)
    : mData(std::move(map))
  {
  }

  Type type() const { return static_cast<Type>(mData.index()); }

  bool isNull() const { return type() == Type::Null; }

  // nullptr if the value holds another type
  template <typename T>
  const T* get() const
  {
    return std::get_if<T>(&mData);
  }

  template <typename T>
  T* get()
  {
    return std::get_if<T>(&mData);
  }

  const Variant& data() const { return mData; }

  friend bool operator==(const Value& lhs, const Value& rhs) { return lhs.mData == rhs.mData; }

  friend bool operator!=(const Value& lhs, const Value& rhs) { return !(lhs == rhs); }

  friend std::ostream& operator<<(std::ostream& os, const Value& value)
  {
    switch (value.type())
    {
    case Type::Null:
      return os << "null";
    case Type::Bool:
      return os << (*value.get<bool>() ? "true" : "false");
    case Type::Int:
      return os << *value.get<int64_t>();
    case Type::Float:
      return os << *value.get<double>();
    case Type::String:
      return os << '"' << *value.get<std::string>() << '"';
    case Type::Bytes:
      return os << "<" << value.get<Bytes>()->size() << " bytes>";
    case Type::Array:
    {
      os << "[";
      const auto& array = *value.get<Array>();
      for (std::size_t i = 0; i < array.size(); ++i)
      {
        os << (i == 0 ? "" : ", ") << array[i];
      }
      return os << "]";
    }
    case Type::Map:
    {
      os << "{";
      const auto& map = *value.get<Map>();
      for (std::size_t i = 0; i < map.size(); ++i)
      {
        os << (i == 0 ? "" : ", ") << map[i].first << ": " << map[i].second;
      }
      return os << "}";
    }
    }
    return os;
  }

  // Model the NetworkByteStreamSerializable concept: a type tag followed by
  // the data of that type. Containers are prefixed with their element count.
  friend std::uint32_t sizeInByteStream(const Value& value)
  {
    using wire::sizeInByteStream;
    std::uint32_t size = 1;
    switch (value.type())
    {
    case Type::Null:
      break;
    case Type::Bool:
      size += sizeInByteStream(*value.get<bool>());
      break;
    case Type::Int:
      size += sizeInByteStream(*value.get<int64_t>());
      break;
    case Type::Float:
      size += sizeInByteStream(*value.get<double>());
      break;
    case Type::String:
      size += sizeInByteStream(*value.get<std::string>());
      break;
    case Type::Bytes:
      size += sizeInByteStream(*value.get<Bytes>());
      break;
    case Type::Array:
      size += sizeof(std::uint32_t);
      for (const auto& element : *value.get<Array>())
      {
        size += sizeInByteStream(element);
      }
      break;
    case Type::Map:
      size += sizeof(std::uint32_t);
      for (const auto& entry : *value.get<Map>())
      {
        size += sizeInByteStream(entry.first) + sizeInByteStream(entry.second);
      }
      break;
    }
    return size;
  }

  template <typename It>
  friend It toNetworkByteStream(const Value& value, It out)
  {
    using wire::toNetworkByteStream;
    out = toNetworkByteStream(static_cast<uint8_t>(value.type()), std::move(out));
    switch (value.type())
    {
    case Type::Null:
      return out;
    case Type::Bool:
      return toNetworkByteStream(*value.get<bool>(), std::move(out));
    case Type::Int:
      return toNetworkByteStream(*value.get<int64_t>(), std::move(out));
    case Type::Float:
      return toNetworkByteStream(*value.get<double>(), std::move(out));
    case Type::String:
      return toNetworkByteStream(*value.get<std::string>(), std::move(out));
    case Type::Bytes:
      return toNetworkByteStream(*value.get<Bytes>(), std::move(out));
    case Type::Array:
    {
      const auto& array = *value.get<Array>();
      out = toNetworkByteStream(static_cast<std::uint32_t>(array.size()), std::move(out));
      for (const auto& element : array)
      {
        out = toNetworkByteStream(element, std::move(out));
      }
      return out;
    }
    case Type::Map:
    {
      const auto& map = *value.get<Map>();
      out = toNetworkByteStream(static_cast<std::uint32_t>(map.size()), std::move(out));
      for (const auto& entry : map)
      {
        out = toNetworkByteStream(entry.second,
                                  toNetworkByteStream(entry.first, std::move(out)));
      }
      return out;
    }
    }
    return out;
  }

  template <typename It>
  static std::pair<Value, It> fromNetworkByteStream(It begin, It end)
  {
    return fromNetworkByteStream(std::move(begin), std::move(end), 0);
  }

private:
  // Nesting deeper than this is rejected rather than recursed into
  static constexpr int kMaxDepth = 32;

  template <typename It>
  static std::pair<Value, It> fromNetworkByteStream(It begin, It end, const int depth)
  {
    using namespace std;
    using wire::Deserialize;

    if (depth > kMaxDepth)
    {
      throw range_error("Value nesting too deep");
    }

    uint8_t tag;
    tie(tag, begin) = Deserialize<uint8_t>::fromNetworkByteStream(begin, end);
    switch (static_cast<Type>(tag))
    {
    case Type::Null:
      return make_pair(Value{}, std::move(begin));
    case Type::Bool:
      return wrap(Deserialize<bool>::fromNetworkByteStream(begin, end));
    case Type::Int:
      return wrap(Deserialize<int64_t>::fromNetworkByteStream(begin, end));
    case Type::Float:
      return wrap(Deserialize<double>::fromNetworkByteStream(begin, end));
    case Type::String:
      return wrap(Deserialize<std::string>::fromNetworkByteStream(begin, end));
    case Type::Bytes:
      return wrap(Deserialize<Bytes>::fromNetworkByteStream(begin, end));
    case Type::Array:
    {
      uint32_t count;
      tie(count, begin) = Deserialize<uint32_t>::fromNetworkByteStream(begin, end);
      Array array;
      for (uint32_t i = 0; i < count; ++i)
      {
        auto element = fromNetworkByteStream(begin, end, depth + 1);
        array.push_back(std::move(element.first));
        begin = std::move(element.second);
      }
      return make_pair(Value{std::move(array)}, std::move(begin));
    }
    case Type::Map:
    {
      uint32_t count;
      tie(count, begin) = Deserialize<uint32_t>::fromNetworkByteStream(begin, end);
      Map map;
      for (uint32_t i = 0; i < count; ++i)
      {
        auto key = Deserialize<std::string>::fromNetworkByteStream(begin, end);
        auto element = fromNetworkByteStream(key.second, end, depth + 1);
        map.emplace_back(std::move(key.first), std::move(element.first));
        begin = std::move(element.second);
      }
      return make_pair(Value{std::move(map)}, std::move(begin));
    }
    }
    throw range_error("Unknown value type tag: " + to_string(tag));
  }

  template <typename T, typename It>
  static std::pair<Value, It> wrap(std::pair<T, It> result)
  {
    return std::make_pair(Value{std::move(result.first)}, std::move(result.second));
  }

  Variant mData;
};

} // namespace message
} // namespace clasp
