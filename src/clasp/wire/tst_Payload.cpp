// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/router/PayloadEntries.hpp>
#include <clasp/test/CatchWrapper.hpp>
#include <clasp/util/Log.hpp>
#include <clasp/wire/Payload.hpp>
#include <vector>

namespace clasp
{
namespace wire
{

using router::PeerNameEntry;
using router::SessionIdEntry;

TEST_CASE("Payload | EmptyPayload", "[Payload]")
{
  CHECK(0 == sizeInByteStream(makePayload()));
  CHECK(nullptr == toNetworkByteStream(makePayload(), static_cast<uint8_t*>(nullptr)));
}

TEST_CASE("Payload | FixedSizeEntryPayloadSize", "[Payload]")
{
  CHECK(12 == sizeInByteStream(makePayload(SessionIdEntry{7})));
}

TEST_CASE("Payload | SingleEntryPayloadEncoding", "[Payload]")
{
  const auto payload = makePayload(SessionIdEntry{0x01020304});
  std::vector<uint8_t> bytes(sizeInByteStream(payload));
  const auto end = toNetworkByteStream(payload, begin(bytes));

  CHECK(bytes.size() == static_cast<size_t>(end - begin(bytes)));
  // Key, size, then the id, all in network byte order
  CHECK((std::vector<uint8_t>{'s', 'e', 's', 's', 0, 0, 0, 4, 1, 2, 3, 4}) == bytes);
}

TEST_CASE("Payload | RoundtripDoubleEntry", "[Payload]")
{
  const auto payload = makePayload(SessionIdEntry{42}, PeerNameEntry{"console"});
  std::vector<uint8_t> bytes(sizeInByteStream(payload));
  const auto end = toNetworkByteStream(payload, begin(bytes));

  v2::SessionId id = 0;
  std::string name;
  parsePayload<SessionIdEntry, PeerNameEntry>(
    begin(bytes),
    end,
    util::NullLog{},
    [&id](const SessionIdEntry& entry) { id = entry.id; },
    [&name](const PeerNameEntry& entry) { name = entry.name; });

  CHECK(42 == id);
  CHECK("console" == name);
}

TEST_CASE("Payload | ParseSubset", "[Payload]")
{
  const auto payload = makePayload(SessionIdEntry{42}, PeerNameEntry{"console"});
  std::vector<uint8_t> bytes(sizeInByteStream(payload));
  const auto end = toNetworkByteStream(payload, begin(bytes));

  // The unknown session id entry is skipped
  std::string name;
  parsePayload<PeerNameEntry>(begin(bytes),
                              end,
                              util::NullLog{},
                              [&name](const PeerNameEntry& entry) { name = entry.name; });

  CHECK("console" == name);
}

TEST_CASE("Payload | ParseTruncatedEntry", "[Payload]")
{
  const auto payload = makePayload(PeerNameEntry{"console"}, SessionIdEntry{42});
  std::vector<uint8_t> bytes(sizeInByteStream(payload));
  const auto end = toNetworkByteStream(payload, begin(bytes));

  v2::SessionId id = 0;
  std::string name;
  REQUIRE_THROWS_AS(
    (parsePayload<SessionIdEntry, PeerNameEntry>(
      begin(bytes),
      end - 1,
      util::NullLog{},
      [&id](const SessionIdEntry& entry) { id = entry.id; },
      [&name](const PeerNameEntry& entry) { name = entry.name; })),
    std::runtime_error);

  // The name came first and is complete, the id is not
  CHECK("console" == name);
  CHECK(0 == id);
}

TEST_CASE("Payload | AddPayloads", "[Payload]")
{
  const auto id = SessionIdEntry{1};
  const auto name = PeerNameEntry{"desk"};
  const auto combined = makePayload(id, name);
  const auto sum = makePayload(id) + makePayload(name);

  REQUIRE(sizeInByteStream(combined) == sizeInByteStream(sum));

  std::vector<uint8_t> combinedBytes(sizeInByteStream(combined));
  std::vector<uint8_t> sumBytes(sizeInByteStream(sum));
  toNetworkByteStream(combined, begin(combinedBytes));
  toNetworkByteStream(sum, begin(sumBytes));

  CHECK(combinedBytes == sumBytes);
}

} // namespace wire
} // namespace clasp
