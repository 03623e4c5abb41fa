// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/osc/OscCodec.hpp>
#include <clasp/test/CatchWrapper.hpp>

namespace clasp
{
namespace osc
{
namespace
{

template <typename T>
const T& argumentAt(const Message& msg, const std::size_t i)
{
  return std::get<T>(msg.arguments.at(i));
}

Message decodeSingle(const std::vector<uint8_t>& bytes)
{
  const auto packet = decode(bytes.begin(), bytes.end());
  REQUIRE(std::holds_alternative<Message>(packet));
  return std::get<Message>(packet);
}

} // namespace

TEST_CASE("OscCodec | MessageLayoutIsPinned", "[OscCodec]")
{
  const auto bytes = encode(Packet{Message{"/a", {int32_t{1}}}});
  const auto expected = std::vector<uint8_t>{'/', 'a', 0, 0, ',', 'i', 0, 0, 0, 0, 0, 1};
  CHECK(expected == bytes);
}

TEST_CASE("OscCodec | ArgumentTypes", "[OscCodec]")
{
  Message msg;
  msg.address = "/mixer/channel/3";
  msg.arguments = {int32_t{-5},
                   0.5f,
                   std::string{"kick"},
                   Symbol{"sym"},
                   Blob{1, 2, 3},
                   int64_t{1} << 40,
                   TimeTag{message::kImmediately},
                   0.25,
                   'x',
                   MidiBytes{{0, 0x90, 60, 100}},
                   true,
                   false,
                   Nil{},
                   Impulse{}};

  const auto bytes = encode(Packet{msg});
  CHECK(0 == bytes.size() % 4);

  const auto decoded = decodeSingle(bytes);
  CHECK(msg.address == decoded.address);
  REQUIRE(msg.arguments.size() == decoded.arguments.size());
  CHECK(-5 == argumentAt<int32_t>(decoded, 0));
  CHECK(0.5f == argumentAt<float>(decoded, 1));
  CHECK("kick" == argumentAt<std::string>(decoded, 2));
  CHECK("sym" == argumentAt<Symbol>(decoded, 3).name);
  CHECK((Blob{1, 2, 3}) == argumentAt<Blob>(decoded, 4));
  CHECK((int64_t{1} << 40) == argumentAt<int64_t>(decoded, 5));
  CHECK(message::kImmediately == argumentAt<TimeTag>(decoded, 6).value);
  CHECK(0.25 == argumentAt<double>(decoded, 7));
  CHECK('x' == argumentAt<char>(decoded, 8));
  CHECK(100 == argumentAt<MidiBytes>(decoded, 9)[3]);
  CHECK(argumentAt<bool>(decoded, 10));
  CHECK(!argumentAt<bool>(decoded, 11));
  CHECK(std::holds_alternative<Nil>(decoded.arguments[12]));
  CHECK(std::holds_alternative<Impulse>(decoded.arguments[13]));
}

TEST_CASE("OscCodec | NestedBundle", "[OscCodec]")
{
  Bundle inner;
  inner.timetag = 42;
  inner.messages = {Message{"/b", {int32_t{2}}}};
  Bundle outer;
  outer.messages = {Message{"/a", {int32_t{1}}}};
  outer.bundles = {inner};

  const auto bytes = encode(Packet{outer});
  const auto packet = decode(bytes.begin(), bytes.end());
  REQUIRE(std::holds_alternative<Bundle>(packet));
  const auto& decoded = std::get<Bundle>(packet);
  CHECK(message::kImmediately == decoded.timetag);
  REQUIRE(1 == decoded.messages.size());
  REQUIRE(1 == decoded.bundles.size());
  CHECK(42 == decoded.bundles[0].timetag);

  SECTION("OwnTimetagIsNotDropped")
  {
    CHECK_THROWS_AS(toClasp(decoded, "/osc"), TranslationError);
  }

  SECTION("SharedTimetagIsFlattened")
  {
    auto sameTime = decoded;
    sameTime.timetag = 42;
    const auto flat = toClasp(sameTime, "/osc");
    CHECK(42 == *flat.timetag);
    REQUIRE(2 == flat.messages.size());
    CHECK("/osc/a" == flat.messages[0].address);
    CHECK("/osc/b" == flat.messages[1].address);

    const auto back = fromClasp(flat, "/osc");
    CHECK(42 == back.timetag);
    CHECK(2 == back.messages.size());
  }
}

TEST_CASE("OscCodec | MalformedPackets", "[OscCodec]")
{
  const auto valid = encode(Packet{Message{"/a", {int32_t{1}}}});

  SECTION("Truncated")
  {
    const auto truncated = std::vector<uint8_t>(valid.begin(), valid.end() - 2);
    CHECK_THROWS_AS(decode(truncated.begin(), truncated.end()), std::range_error);
  }

  SECTION("UnknownTypeTag")
  {
    auto bytes = valid;
    bytes[5] = 'z';
    CHECK_THROWS_AS(decode(bytes.begin(), bytes.end()), std::range_error);
  }

  SECTION("UnterminatedAddress")
  {
    const auto bytes = std::vector<uint8_t>{'/', 'a', 'b', 'c'};
    CHECK_THROWS_AS(decode(bytes.begin(), bytes.end()), std::range_error);
  }
}

TEST_CASE("OscCodec | ToClasp", "[OscCodec]")
{
  SECTION("SingleArgument")
  {
    const auto msg = toClasp(Message{"/fader/1", {0.5f}}, "/osc");
    CHECK(message::Kind::Set == msg.kind);
    CHECK("/osc/fader/1" == msg.address);
    CHECK(message::Value{0.5} == msg.value);
  }

  SECTION("SeveralArgumentsBecomeArray")
  {
    const auto msg = toClasp(Message{"/xy", {int32_t{1}, std::string{"on"}}}, "/osc");
    CHECK((message::Value{message::Array{1, "on"}}) == msg.value);
  }

  SECTION("NoArgumentsIsNull")
  {
    CHECK(toClasp(Message{"/go", {}}, "/osc").value.isNull());
  }

  SECTION("AddressPatternsAreRejected")
  {
    CHECK_THROWS_AS(toClasp(Message{"/fader/*", {}}, "/osc"), TranslationError);
    CHECK_THROWS_AS(toClasp(Message{"/a/{b,c}", {}}, "/osc"), TranslationError);
  }
}

TEST_CASE("OscCodec | FromClasp", "[OscCodec]")
{
  SECTION("StripsPrefix")
  {
    const auto msg = fromClasp(message::Message{message::Kind::Set, "/osc/fader", 0.25}, "/osc");
    CHECK("/fader" == msg.address);
    REQUIRE(1 == msg.arguments.size());
    CHECK(0.25f == std::get<float>(msg.arguments[0]));
  }

  SECTION("KeepsForeignAddresses")
  {
    const auto msg =
      fromClasp(message::Message{message::Kind::Set, "/oscillator", 1}, "/osc");
    CHECK("/oscillator" == msg.address);
  }

  SECTION("WideValues")
  {
    const auto msg = fromClasp(
      message::Message{message::Kind::Set, "/osc/t", message::Array{int64_t{1} << 40, 0.1}},
      "/osc");
    REQUIRE(2 == msg.arguments.size());
    CHECK(std::holds_alternative<int64_t>(msg.arguments[0]));
    CHECK(std::holds_alternative<double>(msg.arguments[1]));
  }

  SECTION("Untranslatable")
  {
    CHECK_THROWS_AS(
      fromClasp(message::Message{message::Kind::Set, "/osc/m", message::Map{{"a", 1}}}, "/osc"),
      TranslationError);
    CHECK_THROWS_AS(
      fromClasp(message::Message{message::Kind::Set,
                                 "/osc/n",
                                 message::Array{message::Value{message::Array{1}}}},
                "/osc"),
      TranslationError);
    CHECK_THROWS_AS(
      fromClasp(message::Message{message::Kind::Set, "relative", 1}, "/osc"), TranslationError);
  }
}

TEST_CASE("OscCodec | EnvelopeRoundtrip", "[OscCodec]")
{
  const auto envelope = toEnvelope(Packet{Message{"/fader", {int32_t{3}}}}, "/osc");
  const auto packet = fromEnvelope(envelope, "/osc");
  REQUIRE(std::holds_alternative<Message>(packet));
  const auto& msg = std::get<Message>(packet);
  CHECK("/fader" == msg.address);
  REQUIRE(1 == msg.arguments.size());
  CHECK(3 == std::get<int32_t>(msg.arguments[0]));
}

} // namespace osc
} // namespace clasp
