// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/midi/MidiParser.hpp>
#include <clasp/test/CatchWrapper.hpp>

namespace clasp
{
namespace midi
{
namespace
{

std::vector<MidiMessage> parse(Parser& parser, const std::vector<uint8_t>& bytes)
{
  std::vector<MidiMessage> messages;
  parser.feed(
    bytes.begin(), bytes.end(), [&messages](const MidiMessage& msg) { messages.push_back(msg); });
  return messages;
}

} // namespace

TEST_CASE("MidiParser | DataLength", "[MidiParser]")
{
  CHECK(2 == dataLength(0x90));
  CHECK(1 == dataLength(0xC3));
  CHECK(1 == dataLength(0xD0));
  CHECK(2 == dataLength(0xE7));
  CHECK(-1 == dataLength(0xF0));
  CHECK(1 == dataLength(0xF1));
  CHECK(2 == dataLength(0xF2));
  CHECK(0 == dataLength(0xF6));
}

TEST_CASE("MidiParser | CompleteMessages", "[MidiParser]")
{
  Parser parser;
  const auto messages = parse(parser, {0x90, 60, 100, 0xC1, 5, 0xB0, 7, 127});
  REQUIRE(3 == messages.size());
  CHECK((MidiMessage{0x90, 60, 100}) == messages[0]);
  CHECK((MidiMessage{0xC1, 5}) == messages[1]);
  CHECK((MidiMessage{0xB0, 7, 127}) == messages[2]);
}

TEST_CASE("MidiParser | SplitAcrossReads", "[MidiParser]")
{
  Parser parser;
  CHECK(parse(parser, {0x90, 60}).empty());
  const auto messages = parse(parser, {100});
  REQUIRE(1 == messages.size());
  CHECK((MidiMessage{0x90, 60, 100}) == messages[0]);
}

TEST_CASE("MidiParser | RunningStatus", "[MidiParser]")
{
  Parser parser;
  const auto messages = parse(parser, {0x90, 60, 100, 62, 100, 64, 0});
  REQUIRE(3 == messages.size());
  CHECK((MidiMessage{0x90, 62, 100}) == messages[1]);
  CHECK((MidiMessage{0x90, 64, 0}) == messages[2]);

  // Running status survives a read boundary
  const auto more = parse(parser, {65, 90});
  REQUIRE(1 == more.size());
  CHECK((MidiMessage{0x90, 65, 90}) == more[0]);
}

TEST_CASE("MidiParser | RealTimeInterleaved", "[MidiParser]")
{
  Parser parser;
  const auto messages = parse(parser, {0x90, 60, 0xF8, 100, 62, 0xFA, 101});
  REQUIRE(4 == messages.size());
  CHECK((MidiMessage{0xF8}) == messages[0]);
  CHECK((MidiMessage{0x90, 60, 100}) == messages[1]);
  CHECK((MidiMessage{0xFA}) == messages[2]);
  CHECK((MidiMessage{0x90, 62, 101}) == messages[3]);
}

TEST_CASE("MidiParser | SysEx", "[MidiParser]")
{
  Parser parser;

  SECTION("Complete")
  {
    const auto messages = parse(parser, {0xF0, 0x7E, 0x01, 0xF7, 0x80, 60, 0});
    REQUIRE(2 == messages.size());
    CHECK((MidiMessage{0xF0, 0x7E, 0x01, 0xF7}) == messages[0]);
    CHECK((MidiMessage{0x80, 60, 0}) == messages[1]);
  }

  SECTION("CancelsRunningStatus")
  {
    const auto messages = parse(parser, {0x90, 60, 100, 0xF0, 1, 0xF7, 62, 100});
    CHECK(2 == messages.size());
  }

  SECTION("OversizedIsDropped")
  {
    std::vector<uint8_t> bytes{0xF0};
    bytes.insert(bytes.end(), Parser::kMaxSysExSize + 10, 0x01);
    bytes.push_back(0xF7);
    CHECK(parse(parser, bytes).empty());
  }
}

TEST_CASE("MidiParser | StrayDataIsDropped", "[MidiParser]")
{
  Parser parser;
  const auto messages = parse(parser, {1, 2, 3, 0xC0, 9});
  REQUIRE(1 == messages.size());
  CHECK((MidiMessage{0xC0, 9}) == messages[0]);
}

} // namespace midi
} // namespace clasp
