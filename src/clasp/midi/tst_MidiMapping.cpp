// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/midi/MidiMapping.hpp>
#include <clasp/test/CatchWrapper.hpp>
#include <limits>

namespace clasp
{
namespace midi
{
namespace
{

const auto kBase = baseAddress("/midi", "keys");

message::Message translated(const MidiMessage& msg)
{
  const auto result = toClasp(msg, kBase);
  REQUIRE(result);
  return *result;
}

message::Message setMessage(const std::string& path, message::Value value)
{
  return {message::Kind::Set, kBase + path, std::move(value)};
}

} // namespace

TEST_CASE("MidiMapping | ToClasp", "[MidiMapping]")
{
  CHECK("/midi/keys" == kBase);

  SECTION("NoteOn")
  {
    const auto msg = translated({0x93, 60, 100});
    CHECK(message::Kind::Publish == msg.kind);
    CHECK("/midi/keys/ch/3/note" == msg.address);
    CHECK((message::Value{message::Map{{"note", 60}, {"velocity", 100}, {"on", true}}})
          == msg.value);
  }

  SECTION("NoteOnWithZeroVelocityIsOff")
  {
    const auto msg = translated({0x90, 60, 0});
    const auto& map = *msg.value.get<message::Map>();
    CHECK(message::Value{false} == map[2].second);
  }

  SECTION("ControlChange")
  {
    const auto msg = translated({0xB0, 7, 127});
    CHECK(message::Kind::Set == msg.kind);
    CHECK("/midi/keys/ch/0/cc/7" == msg.address);
    CHECK(message::Value{127} == msg.value);
  }

  SECTION("ProgramPressureAftertouch")
  {
    CHECK("/midi/keys/ch/15/program" == translated({0xCF, 5}).address);
    CHECK("/midi/keys/ch/1/pressure" == translated({0xD1, 40}).address);
    CHECK("/midi/keys/ch/2/aftertouch/64" == translated({0xA2, 64, 10}).address);
  }

  SECTION("PitchBend")
  {
    CHECK(message::Value{0} == translated({0xE0, 0x00, 0x40}).value);
    CHECK(message::Value{-8192} == translated({0xE0, 0x00, 0x00}).value);
    CHECK(message::Value{8191} == translated({0xE0, 0x7F, 0x7F}).value);
  }

  SECTION("Realtime")
  {
    CHECK("/midi/keys/clock" == translated({0xF8}).address);
    CHECK(message::Value{"start"} == translated({0xFA}).value);
    CHECK(message::Value{"stop"} == translated({0xFC}).value);
  }

  SECTION("Unmapped")
  {
    CHECK(!toClasp({0xFE}, kBase));
    CHECK(!toClasp({0xF0, 1, 2, 0xF7}, kBase));
  }

  SECTION("Malformed")
  {
    CHECK_THROWS_AS(toClasp({}, kBase), TranslationError);
    CHECK_THROWS_AS(toClasp({60, 100}, kBase), TranslationError);
    CHECK_THROWS_AS(toClasp({0x90, 60}, kBase), TranslationError);
  }
}

TEST_CASE("MidiMapping | FromClasp", "[MidiMapping]")
{
  SECTION("Note")
  {
    const auto on =
      setMessage("/ch/3/note", message::Map{{"note", 60}, {"velocity", 100}, {"on", true}});
    CHECK((MidiMessage{0x93, 60, 100}) == fromClasp(on, kBase));

    const auto off = setMessage("/ch/3/note", message::Map{{"note", 60}, {"velocity", 0}});
    CHECK((MidiMessage{0x83, 60, 0}) == fromClasp(off, kBase));
  }

  SECTION("ValuesAreClamped")
  {
    CHECK((MidiMessage{0xB1, 7, 127}) == fromClasp(setMessage("/ch/1/cc/7", 300), kBase));
    CHECK((MidiMessage{0xB1, 7, 0}) == fromClasp(setMessage("/ch/1/cc/7", -4), kBase));
    CHECK((MidiMessage{0xB1, 7, 64}) == fromClasp(setMessage("/ch/1/cc/7", 64.9), kBase));
    CHECK((MidiMessage{0xE0, 0x7F, 0x7F}) == fromClasp(setMessage("/ch/0/bend", 20000), kBase));
  }

  SECTION("ExtremeValuesSaturate")
  {
    const auto nan = std::numeric_limits<double>::quiet_NaN();
    const auto maxInt = std::numeric_limits<int64_t>::max();
    CHECK((MidiMessage{0xB1, 7, 127}) == fromClasp(setMessage("/ch/1/cc/7", 1e300), kBase));
    CHECK((MidiMessage{0xB1, 7, 0}) == fromClasp(setMessage("/ch/1/cc/7", -1e300), kBase));
    CHECK((MidiMessage{0xE0, 0x7F, 0x7F}) == fromClasp(setMessage("/ch/0/bend", maxInt), kBase));
    CHECK((MidiMessage{0xE0, 0x00, 0x00})
          == fromClasp(setMessage("/ch/0/bend", std::numeric_limits<int64_t>::min()), kBase));
    CHECK((MidiMessage{0xE0, 0x7F, 0x7F}) == fromClasp(setMessage("/ch/0/bend", 1e300), kBase));
    CHECK_THROWS_AS(fromClasp(setMessage("/ch/1/cc/7", nan), kBase), TranslationError);
    CHECK_THROWS_AS(fromClasp(setMessage("/ch/0/bend", nan), kBase), TranslationError);

    const auto note = setMessage("/ch/0/note", message::Map{{"note", 1e300}, {"velocity", nan}});
    CHECK((MidiMessage{0x80, 127, 0}) == fromClasp(note, kBase));
    CHECK_THROWS_AS(fromClasp(setMessage("/ch/0/note", message::Map{{"note", nan}}), kBase),
                    TranslationError);
  }

  SECTION("Bend")
  {
    CHECK((MidiMessage{0xE0, 0x00, 0x40}) == fromClasp(setMessage("/ch/0/bend", 0), kBase));
    CHECK((MidiMessage{0xE0, 0x00, 0x00}) == fromClasp(setMessage("/ch/0/bend", -8192), kBase));
  }

  SECTION("Transport")
  {
    CHECK((MidiMessage{0xFB}) == fromClasp(setMessage("/transport", "continue"), kBase));
    CHECK((MidiMessage{0xF8}) == fromClasp(setMessage("/clock", {}), kBase));
    CHECK_THROWS_AS(fromClasp(setMessage("/transport", "rewind"), kBase), TranslationError);
  }

  SECTION("Untranslatable")
  {
    CHECK_THROWS_AS(fromClasp(message::Message{message::Kind::Set, "/osc/a", 1}, kBase),
                    TranslationError);
    CHECK_THROWS_AS(fromClasp(setMessage("/ch/16/cc/1", 1), kBase), TranslationError);
    CHECK_THROWS_AS(fromClasp(setMessage("/ch/0/cc/128", 1), kBase), TranslationError);
    CHECK_THROWS_AS(fromClasp(setMessage("/ch/x/program", 1), kBase), TranslationError);
    CHECK_THROWS_AS(fromClasp(setMessage("/ch/0/cc/1", "loud"), kBase), TranslationError);
    CHECK_THROWS_AS(fromClasp(setMessage("/ch/0/note", 60), kBase), TranslationError);
    CHECK_THROWS_AS(fromClasp(setMessage("/ch/0/sustain", 1), kBase), TranslationError);
  }
}

} // namespace midi
} // namespace clasp
