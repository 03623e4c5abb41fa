// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/platforms/asio/AsioWrapper.hpp>
#include <string>

namespace clasp
{
namespace transport
{

using IpAddress = ::asio::ip::address;
using IpAddressV4 = ::asio::ip::address_v4;
using UdpSocket = ::asio::ip::udp::socket;
using UdpEndpoint = ::asio::ip::udp::endpoint;

inline IpAddress makeAddress(const std::string& address)
{
  return ::asio::ip::make_address(address);
}

inline UdpEndpoint makeEndpoint(const std::string& address, const unsigned short port)
{
  return {makeAddress(address), port};
}

inline std::string toString(const UdpEndpoint& endpoint)
{
  return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace transport
} // namespace clasp
