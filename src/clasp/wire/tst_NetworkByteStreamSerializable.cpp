// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/test/CatchWrapper.hpp>
#include <clasp/wire/NetworkByteStreamSerializable.hpp>

namespace clasp
{
namespace wire
{

TEST_CASE("NetworkByteStreamSerializable")
{
  SECTION("DurationRoundtripByteStreamEncoding")
  {
    using namespace std;
    const auto expectedDuration = chrono::microseconds{42};
    const auto size = sizeInByteStream(expectedDuration);
    CHECK(8 == size);

    auto byteStream = vector<uint8_t>(size);
    const auto serializedEndIt = toNetworkByteStream(expectedDuration, begin(byteStream));
    CHECK(byteStream.size()
          == static_cast<size_t>(distance(begin(byteStream), serializedEndIt)));

    const auto deserialized = Deserialize<chrono::microseconds>::fromNetworkByteStream(
      begin(byteStream), end(byteStream));
    CHECK(expectedDuration == deserialized.first);
  }

  SECTION("StringRoundtripByteStreamEncoding")
  {
    using namespace std;
    const auto expectedString = string{"/lights/front/intensity"};
    const auto size = sizeInByteStream(expectedString);
    CHECK(4 + expectedString.size() == size);

    auto byteStream = vector<uint8_t>(size);
    const auto serializedEndIt = toNetworkByteStream(expectedString, begin(byteStream));
    CHECK(byteStream.size()
          == static_cast<size_t>(distance(begin(byteStream), serializedEndIt)));

    const auto deserialized =
      Deserialize<string>::fromNetworkByteStream(begin(byteStream), end(byteStream));
    CHECK(expectedString == deserialized.first);
  }

  SECTION("DoubleIsEncodedAsItsBitPattern")
  {
    using namespace std;
    auto byteStream = vector<uint8_t>(sizeInByteStream(0.5));
    toNetworkByteStream(0.5, begin(byteStream));
    CHECK((vector<uint8_t>{0x3F, 0xE0, 0, 0, 0, 0, 0, 0}) == byteStream);

    const auto deserialized =
      Deserialize<double>::fromNetworkByteStream(begin(byteStream), end(byteStream));
    CHECK(0.5 == deserialized.first);
  }

  SECTION("ArrayRoundtripByteStreamEncoding")
  {
    using namespace std;
    using Array = array<int64_t, 3>;
    const auto expectedArray = Array{{0, -1, 2}};
    const auto size = sizeInByteStream(expectedArray);
    CHECK(24 == size);

    auto byteStream = vector<uint8_t>(size);
    toNetworkByteStream(expectedArray, begin(byteStream));

    const auto deserialized =
      Deserialize<Array>::fromNetworkByteStream(begin(byteStream), end(byteStream));
    CHECK(expectedArray == deserialized.first);
  }

  SECTION("VectorRoundtripByteStreamEncoding")
  {
    using namespace std;
    using Vector = vector<uint16_t>;
    const auto expectedVector = Vector{0, 1, 2, 3};
    const auto size = sizeInByteStream(expectedVector);
    CHECK(12 == size);

    auto byteStream = vector<uint8_t>(size);
    toNetworkByteStream(expectedVector, begin(byteStream));

    const auto deserialized =
      Deserialize<Vector>::fromNetworkByteStream(begin(byteStream), end(byteStream));
    CHECK(expectedVector == deserialized.first);
  }

  SECTION("TruncatedStringThrows")
  {
    using namespace std;
    auto byteStream = vector<uint8_t>(sizeInByteStream(string{"abcdef"}));
    toNetworkByteStream(string{"abcdef"}, begin(byteStream));
    CHECK_THROWS_AS(
      Deserialize<string>::fromNetworkByteStream(begin(byteStream), end(byteStream) - 1),
      std::range_error);
  }

  SECTION("HostileVectorSizeThrows")
  {
    using namespace std;
    // Claims 2^32 - 1 elements but carries none
    const auto byteStream = vector<uint8_t>{0xFF, 0xFF, 0xFF, 0xFF};
    CHECK_THROWS_AS(Deserialize<vector<uint32_t>>::fromNetworkByteStream(
                      begin(byteStream), end(byteStream)),
                    std::range_error);
  }
}

} // namespace wire
} // namespace clasp
