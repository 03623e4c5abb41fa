// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/artnet/ArtNetCodec.hpp>
#include <clasp/test/CatchWrapper.hpp>
#include <limits>

namespace clasp
{
namespace artnet
{
namespace
{

const std::string kPrefix = "/artnet";

Packet roundtrip(const Packet& packet)
{
  const auto bytes = encode(packet);
  return decode(bytes.begin(), bytes.end());
}

message::Message setMessage(const std::string& address, message::Value value)
{
  return {message::Kind::Set, address, std::move(value)};
}

} // namespace

TEST_CASE("ArtNetCodec | DmxLayoutIsPinned", "[ArtNetCodec]")
{
  Dmx dmx;
  dmx.sequence = 1;
  dmx.universe = 0x0102;
  dmx.data = {10, 20, 30};

  const auto bytes = encode(dmx);
  const auto expected = std::vector<uint8_t>{'A', 'r', 't', '-', 'N', 'e', 't', 0,
                                             0x00, 0x50, 0, 14, 1, 0, 0x02, 0x01,
                                             0, 4, 10, 20, 30, 0};
  CHECK(expected == bytes);

  const auto decoded = roundtrip(dmx);
  REQUIRE(std::holds_alternative<Dmx>(decoded));
  const auto& back = std::get<Dmx>(decoded);
  CHECK(0x0102 == back.universe);
  CHECK(1 == back.sequence);
  // Odd lengths are padded
  CHECK((std::vector<uint8_t>{10, 20, 30, 0}) == back.data);
}

TEST_CASE("ArtNetCodec | PollAndReply", "[ArtNetCodec]")
{
  CHECK(14 == encode(Poll{}).size());
  CHECK(std::holds_alternative<Poll>(roundtrip(Poll{})));

  PollReply reply;
  reply.address = transport::makeAddress("10.0.0.7").to_v4();
  reply.versionInfo = 0x0102;
  reply.netSwitch = 3;
  reply.subSwitch = 4;
  reply.shortName = "dimmer";
  reply.longName = std::string(100, 'x');

  const auto bytes = encode(reply);
  CHECK(239 == bytes.size());
  const auto decoded = decode(bytes.begin(), bytes.end());
  REQUIRE(std::holds_alternative<PollReply>(decoded));
  const auto& back = std::get<PollReply>(decoded);
  CHECK(reply.address == back.address);
  CHECK(kPort == back.port);
  CHECK(0x0102 == back.versionInfo);
  CHECK(3 == back.netSwitch);
  CHECK(4 == back.subSwitch);
  CHECK("dimmer" == back.shortName);
  CHECK(std::string(63, 'x') == back.longName);
}

TEST_CASE("ArtNetCodec | Limits", "[ArtNetCodec]")
{
  SECTION("Universe")
  {
    Dmx dmx;
    dmx.universe = kMaxUniverse;
    CHECK_NOTHROW(encode(dmx));
    dmx.universe = kMaxUniverse + 1;
    CHECK_THROWS_AS(encode(dmx), TranslationError);
    CHECK_THROWS_AS(toClasp(dmx, kPrefix), TranslationError);
  }

  SECTION("FrameLength")
  {
    Dmx dmx;
    dmx.data.assign(kChannels, 1);
    CHECK(18 + kChannels == encode(dmx).size());
    dmx.data.push_back(1);
    CHECK_THROWS_AS(encode(dmx), TranslationError);
  }
}

TEST_CASE("ArtNetCodec | MalformedPackets", "[ArtNetCodec]")
{
  Dmx dmx;
  dmx.data = {1, 2};
  const auto valid = encode(dmx);

  SECTION("Truncated")
  {
    const auto bytes = std::vector<uint8_t>(valid.begin(), valid.end() - 1);
    CHECK_THROWS_AS(decode(bytes.begin(), bytes.end()), std::range_error);
  }

  SECTION("ForeignPacket")
  {
    auto bytes = valid;
    bytes[0] = 'B';
    CHECK_THROWS_AS(decode(bytes.begin(), bytes.end()), std::runtime_error);
  }

  SECTION("UnsupportedOpCode")
  {
    auto bytes = valid;
    bytes[9] = 0x99;
    CHECK_THROWS_AS(decode(bytes.begin(), bytes.end()), std::runtime_error);
  }

  SECTION("OversizedLength")
  {
    auto bytes = valid;
    bytes[16] = 0x02;
    bytes[17] = 0x02;
    CHECK_THROWS_AS(decode(bytes.begin(), bytes.end()), std::runtime_error);
  }
}

TEST_CASE("ArtNetCodec | ToClasp", "[ArtNetCodec]")
{
  Dmx dmx;
  dmx.universe = 3;
  dmx.data = {0, 128, 255};

  const auto all = toClasp(dmx, kPrefix);
  REQUIRE(3 == all.messages.size());
  CHECK(setMessage("/artnet/3/1", 0) == all.messages[0]);
  CHECK(setMessage("/artnet/3/3", 255) == all.messages[2]);
  CHECK(!all.timetag);

  SECTION("OnlyChangedChannels")
  {
    Frame previous{};
    previous[1] = 128;
    const auto delta = toClasp(dmx, kPrefix, &previous);
    REQUIRE(1 == delta.messages.size());
    CHECK("/artnet/3/3" == delta.messages[0].address);
  }

  SECTION("UnchangedFrameIsEmpty")
  {
    Frame previous{};
    std::copy(dmx.data.begin(), dmx.data.end(), previous.begin());
    CHECK(toClasp(dmx, kPrefix, &previous).messages.empty());
  }
}

TEST_CASE("ArtNetCodec | FromClasp", "[ArtNetCodec]")
{
  SECTION("Levels")
  {
    const auto update = fromClasp(setMessage("/artnet/32767/512", 17), kPrefix);
    CHECK(32767 == update.universe);
    CHECK(512 == update.channel);
    CHECK(17 == update.value);

    CHECK(255 == fromClasp(setMessage("/artnet/0/1", 300), kPrefix).value);
    CHECK(0 == fromClasp(setMessage("/artnet/0/1", -1), kPrefix).value);
    CHECK(12 == fromClasp(setMessage("/artnet/0/1", 12.7), kPrefix).value);
    CHECK(255 == fromClasp(setMessage("/artnet/0/1", true), kPrefix).value);
    CHECK(255 == fromClasp(setMessage("/artnet/0/1", 1e300), kPrefix).value);
    CHECK(0 == fromClasp(setMessage("/artnet/0/1", -1e300), kPrefix).value);
    CHECK(255
          == fromClasp(setMessage("/artnet/0/1", std::numeric_limits<int64_t>::max()), kPrefix)
               .value);
  }

  SECTION("Untranslatable")
  {
    CHECK_THROWS_AS(fromClasp(setMessage("/osc/0/1", 1), kPrefix), TranslationError);
    CHECK_THROWS_AS(fromClasp(setMessage("/artnet/0", 1), kPrefix), TranslationError);
    CHECK_THROWS_AS(fromClasp(setMessage("/artnet/0/0", 1), kPrefix), TranslationError);
    CHECK_THROWS_AS(fromClasp(setMessage("/artnet/0/513", 1), kPrefix), TranslationError);
    CHECK_THROWS_AS(fromClasp(setMessage("/artnet/32768/1", 1), kPrefix), TranslationError);
    CHECK_THROWS_AS(fromClasp(setMessage("/artnet/a/1", 1), kPrefix), TranslationError);
    CHECK_THROWS_AS(fromClasp(setMessage("/artnet/0/1", "full"), kPrefix), TranslationError);
    CHECK_THROWS_AS(
      fromClasp(setMessage("/artnet/0/1", std::numeric_limits<double>::quiet_NaN()), kPrefix),
      TranslationError);
  }
}

TEST_CASE("ArtNetCodec | FramesPerUniverse", "[ArtNetCodec]")
{
  const auto bundle = message::Bundle{std::nullopt,
                                      {setMessage("/artnet/1/3", 5),
                                       setMessage("/artnet/0/1", 9),
                                       setMessage("/artnet/1/1", 7)}};
  const auto frames = fromEnvelope(message::toEnvelope(bundle), kPrefix);
  REQUIRE(2 == frames.size());
  CHECK(0 == frames[0].universe);
  CHECK((std::vector<uint8_t>{9}) == frames[0].data);
  CHECK(1 == frames[1].universe);
  CHECK((std::vector<uint8_t>{7, 0, 5}) == frames[1].data);
}

} // namespace artnet
} // namespace clasp
