// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/router/PayloadEntries.hpp>
#include <clasp/test/CatchWrapper.hpp>
#include <clasp/v2/Messages.hpp>
#include <array>
#include <iterator>
#include <vector>

namespace clasp
{
namespace v2
{

TEST_CASE("Messages | HeaderLayoutIsPinned", "[Messages]")
{
  // A change here breaks every deployed peer
  std::vector<uint8_t> bytes;
  encodeMessage(kHello, 0x0A0B0C0D, wire::makePayload(), std::back_inserter(bytes));
  CHECK((std::vector<uint8_t>{0x53, 0x02, 0x02, 0x04, 0x0A, 0x0B, 0x0C, 0x0D}) == bytes);
}

TEST_CASE("Messages | MessageTypesArePinned", "[Messages]")
{
  CHECK(1 == kAnnounce);
  CHECK(2 == kQuery);
  CHECK(3 == kByeBye);
  CHECK(4 == kHello);
  CHECK(5 == kWelcome);
  CHECK(6 == kHeartbeat);
  CHECK(7 == kGoodbye);
  CHECK(8 == kData);
  CHECK(kDiscoveryKind == kindOf(kQuery));
  CHECK(kSessionKind == kindOf(kGoodbye));
  CHECK(kDataKind == kindOf(kData));
}

TEST_CASE("Messages | DataLayoutIsPinned", "[Messages]")
{
  const std::array<uint8_t, 3> payload{{0xAA, 0xBB, 0xCC}};
  std::vector<uint8_t> bytes;
  encodeData(7, DataHeader{0x01020304, 1}, payload.begin(), payload.end(),
             std::back_inserter(bytes));

  CHECK((std::vector<uint8_t>{0x53, 0x02, 0x03, 0x08, 0, 0, 0, 7, 1, 2, 3, 4, 1, 0xAA, 0xBB,
                              0xCC})
        == bytes);

  const auto result = parseMessageHeader(bytes.cbegin(), bytes.cend());
  CHECK(kData == result.first.messageType);
  CHECK(7 == result.first.sessionId);

  const auto data = DataHeader::fromNetworkByteStream(result.second, bytes.cend());
  CHECK(0x01020304 == data.first.sequence);
  CHECK(1 == data.first.payloadType);
  CHECK(3 == std::distance(data.second, bytes.cend()));
}

TEST_CASE("Messages | ParseHeaderWithPayload", "[Messages]")
{
  std::vector<uint8_t> bytes;
  encodeMessage(kWelcome, 9, wire::makePayload(router::SessionIdEntry{3}),
                std::back_inserter(bytes));

  const auto result = parseMessageHeader(bytes.cbegin(), bytes.cend());
  CHECK(kSessionKind == result.first.kind);
  CHECK(kWelcome == result.first.messageType);
  CHECK(9 == result.first.sessionId);
  CHECK(12 == std::distance(result.second, bytes.cend()));
}

TEST_CASE("Messages | RejectsForeignBytes", "[Messages]")
{
  SECTION("TooShort")
  {
    const std::vector<uint8_t> bytes{0x53, 0x02, 0x02, 0x04};
    CHECK(kInvalid == parseMessageHeader(bytes.cbegin(), bytes.cend()).first.messageType);
  }

  SECTION("WrongMagic")
  {
    const std::vector<uint8_t> bytes{'_', 'a', 's', 'd', 'p', '_', 'v', 1};
    CHECK(kInvalid == parseMessageHeader(bytes.cbegin(), bytes.cend()).first.messageType);
  }

  SECTION("WrongVersion")
  {
    const std::vector<uint8_t> bytes{0x53, 0x01, 0x02, 0x04, 0, 0, 0, 0};
    CHECK(kInvalid == parseMessageHeader(bytes.cbegin(), bytes.cend()).first.messageType);
  }

  SECTION("KindDisagreesWithType")
  {
    const std::vector<uint8_t> bytes{0x53, 0x02, 0x01, 0x08, 0, 0, 0, 1};
    CHECK(kInvalid == parseMessageHeader(bytes.cbegin(), bytes.cend()).first.messageType);
  }
}

TEST_CASE("Messages | OversizedMessageThrows", "[Messages]")
{
  const std::vector<uint8_t> payload(kMaxMessageSize, 0);
  std::vector<uint8_t> bytes;
  CHECK_THROWS_AS(encodeData(1, DataHeader{0, 1}, payload.begin(), payload.end(),
                             std::back_inserter(bytes)),
                  std::range_error);
}

} // namespace v2
} // namespace clasp
