// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/test/CatchWrapper.hpp>
#include <clasp/util/Channel.hpp>
#include <thread>

namespace clasp
{
namespace util
{

TEST_CASE("Channel | Order", "[Channel]")
{
  Channel<int> channel;
  CHECK(!channel.tryPop());
  channel.push(1);
  channel.push(2);
  CHECK(2 == channel.size());
  CHECK(1 == *channel.tryPop());
  CHECK(2 == *channel.pop());
}

TEST_CASE("Channel | CloseDrainsThenEnds", "[Channel]")
{
  Channel<int> channel;
  channel.push(1);
  channel.close();
  CHECK(channel.closed());
  CHECK(!channel.push(2));
  CHECK(1 == *channel.pop());
  CHECK(!channel.pop());
  CHECK(!channel.popFor(std::chrono::milliseconds{1}));
}

TEST_CASE("Channel | BlockingConsumers", "[Channel]")
{
  Channel<int> channel;

  SECTION("WakesOnPush")
  {
    std::thread producer([&channel] { channel.push(7); });
    const auto value = channel.popFor(std::chrono::seconds{5});
    producer.join();
    REQUIRE(value);
    CHECK(7 == *value);
  }

  SECTION("WakesOnClose")
  {
    std::thread closer([&channel] { channel.close(); });
    CHECK(!channel.pop());
    closer.join();
  }

  SECTION("TimesOut")
  {
    CHECK(!channel.popFor(std::chrono::milliseconds{10}));
  }
}

} // namespace util
} // namespace clasp
