// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/transport/AsioTypes.hpp>
#include <stdexcept>
#include <string>

namespace clasp
{

enum class ErrorKind
{
  Network,
  Io,
  Mdns,
  Broadcast,
  ConnectTimeout,
  SessionNotFound,
  TranslationError,
  Other
};

inline const char* toString(const ErrorKind kind)
{
  switch (kind)
  {
  case ErrorKind::Network:
    return "network";
  case ErrorKind::Io:
    return "io";
  case ErrorKind::Mdns:
    return "mdns";
  case ErrorKind::Broadcast:
    return "broadcast";
  case ErrorKind::ConnectTimeout:
    return "connect timeout";
  case ErrorKind::SessionNotFound:
    return "session not found";
  case ErrorKind::TranslationError:
    return "translation error";
  case ErrorKind::Other:
    break;
  }
  return "other";
}

// Base of every exception thrown by CLASP. The kind allows callers that
// only care about the error category to catch the base type.
struct Error : std::runtime_error
{
  Error(const ErrorKind errorKind, const std::string& what)
    : std::runtime_error(what)
    , kind(errorKind)
  {
  }

  ErrorKind kind;
};

// Socket-level failures: bind, send, fatal receive errors
struct NetworkError : Error
{
  explicit NetworkError(const std::string& what)
    : Error(ErrorKind::Network, what)
  {
  }
};

// Faults of the underlying device or file I/O (MIDI ports)
struct IoError : Error
{
  explicit IoError(const std::string& what)
    : Error(ErrorKind::Io, what)
  {
  }
};

struct MdnsError : Error
{
  explicit MdnsError(const std::string& what)
    : Error(ErrorKind::Mdns, what)
  {
  }
};

struct BroadcastError : Error
{
  explicit BroadcastError(const std::string& what)
    : Error(ErrorKind::Broadcast, what)
  {
  }
};

struct ConnectTimeout : Error
{
  explicit ConnectTimeout(const std::string& what)
    : Error(ErrorKind::ConnectTimeout, what)
  {
  }
};

struct SessionNotFound : Error
{
  explicit SessionNotFound(const std::string& what)
    : Error(ErrorKind::SessionNotFound, what)
  {
  }
};

// A foreign message or an envelope lies outside what the other side can
// represent
struct TranslationError : Error
{
  explicit TranslationError(const std::string& what)
    : Error(ErrorKind::TranslationError, what)
  {
  }
};

struct OtherError : Error
{
  explicit OtherError(const std::string& what)
    : Error(ErrorKind::Other, what)
  {
  }
};

// An exception thrown when sending a udp message fails. Stores the
// local endpoint through which the sending failed.
struct UdpSendException : NetworkError
{
  UdpSendException(const std::runtime_error& e, transport::UdpEndpoint local)
    : NetworkError(e.what())
    , localEndpoint(std::move(local))
  {
  }

  transport::UdpEndpoint localEndpoint;
};

} // namespace clasp
