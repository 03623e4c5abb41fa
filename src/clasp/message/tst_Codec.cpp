// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/message/Codec.hpp>
#include <clasp/test/CatchWrapper.hpp>

namespace clasp
{
namespace message
{

TEST_CASE("Value | Types", "[Codec]")
{
  CHECK(Value::Type::Null == Value{}.type());
  CHECK(Value::Type::Bool == Value{true}.type());
  CHECK(Value::Type::Int == Value{3}.type());
  CHECK(Value::Type::Int == Value{uint8_t{3}}.type());
  CHECK(Value::Type::Float == Value{0.5f}.type());
  CHECK(Value::Type::String == Value{"go"}.type());
  CHECK(Value::Type::Bytes == Value{Bytes{1, 2}}.type());
  CHECK(Value::Type::Array == Value{Array{1, "two"}}.type());
  CHECK(Value::Type::Map == Value{Map{{"on", true}}}.type());

  const auto value = Value{42};
  REQUIRE(value.get<int64_t>());
  CHECK(42 == *value.get<int64_t>());
  CHECK(nullptr == value.get<double>());
}

TEST_CASE("Codec | MessageRoundtrip", "[Codec]")
{
  const auto msg = Message{Kind::Publish,
                           "/stage/cue",
                           Map{{"number", 12},
                               {"label", "blackout"},
                               {"fade", 2.5},
                               {"tags", Array{"a", Null{}, Bytes{0xFF}}}}};
  const auto envelope = toEnvelope(msg);
  CHECK(kMessagePayload == envelope.payloadType);

  const auto content = fromEnvelope(envelope);
  REQUIRE(std::holds_alternative<Message>(content));
  CHECK(msg == std::get<Message>(content));
}

TEST_CASE("Codec | BundleKeepsTimetag", "[Codec]")
{
  Bundle bundle;
  bundle.timetag = 0xDEADBEEF00000001;
  bundle.messages = {Message{Kind::Set, "/a", 1}, Message{Kind::Set, "/b", 2}};

  const auto envelope = toEnvelope(bundle);
  CHECK(kBundlePayload == envelope.payloadType);

  const auto content = fromEnvelope(envelope);
  REQUIRE(std::holds_alternative<Bundle>(content));
  CHECK(bundle == std::get<Bundle>(content));
  CHECK(2 == messagesOf(content).size());
}

TEST_CASE("Codec | BundleWithoutTimetag", "[Codec]")
{
  Bundle bundle;
  bundle.messages = {Message{Kind::Set, "/a", 1}};
  const auto content = fromEnvelope(toEnvelope(bundle));
  REQUIRE(std::holds_alternative<Bundle>(content));
  CHECK(!std::get<Bundle>(content).timetag);
}

TEST_CASE("Codec | MalformedEnvelopes", "[Codec]")
{
  SECTION("UnknownPayloadType")
  {
    auto envelope = toEnvelope(Message{Kind::Set, "/a", 1});
    envelope.payloadType = 77;
    CHECK_THROWS_AS(fromEnvelope(envelope), TranslationError);
  }

  SECTION("Truncated")
  {
    auto envelope = toEnvelope(Message{Kind::Set, "/a", "some text"});
    envelope.payload.pop_back();
    CHECK_THROWS_AS(fromEnvelope(envelope), TranslationError);
  }

  SECTION("MissingAddress")
  {
    Envelope envelope;
    envelope.payloadType = kMessagePayload;
    CHECK_THROWS_AS(fromEnvelope(envelope), TranslationError);
  }
}

} // namespace message
} // namespace clasp
