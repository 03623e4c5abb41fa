// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/Errors.hpp>
#include <clasp/platforms/asio/Context.hpp>
#include <clasp/test/CatchWrapper.hpp>
#include <clasp/util/Synchronous.hpp>
#include <thread>

namespace clasp
{
namespace util
{

TEST_CASE("Synchronous | RunsOnIoThread", "[Synchronous]")
{
  platforms::asio::Context<NullLog> io;
  const auto caller = std::this_thread::get_id();
  const auto runner = synchronous(io, [] { return std::this_thread::get_id(); });
  CHECK(caller != runner);

  auto counter = 0;
  synchronous(io, [&counter] { ++counter; });
  CHECK(1 == counter);
}

TEST_CASE("Synchronous | RethrowsOnCaller", "[Synchronous]")
{
  platforms::asio::Context<NullLog> io;
  CHECK_THROWS_AS(
    synchronous(io, []() -> int { throw SessionNotFound("No session with id 3"); }),
    SessionNotFound);
  // The io thread survives
  CHECK(3 == synchronous(io, [] { return 3; }));
}

} // namespace util
} // namespace clasp
