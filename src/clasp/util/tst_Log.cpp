// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#include <clasp/test/CatchWrapper.hpp>
#include <clasp/util/Log.hpp>
#include <sstream>

namespace clasp
{
namespace util
{
namespace
{

// Captures what is written to std::clog while alive
struct ClogCapture
{
  ClogCapture()
    : mpPrevious(std::clog.rdbuf(stream.rdbuf()))
  {
  }

  ~ClogCapture() { std::clog.rdbuf(mpPrevious); }

  std::ostringstream stream;
  std::streambuf* mpPrevious;
};

} // namespace

TEST_CASE("StdLog | ChannelsAndLevels", "[Log]")
{
  ClogCapture capture;
  const auto log = channel(StdLog{"clasp", LogLevel::Info}, "router");

  debug(log) << "hidden";
  info(log) << "session " << 3;
  warning(channel(log, "sweep")) << "late";

  CHECK("[clasp::router] session 3\n[clasp::router::sweep] late\n" == capture.stream.str());
}

TEST_CASE("StdLog | Off", "[Log]")
{
  ClogCapture capture;
  const StdLog log{"quiet", LogLevel::Off};
  info(log) << "nothing";
  warning(log) << "nothing";
  CHECK(capture.stream.str().empty());
}

TEST_CASE("Timestamped | PrefixesLines", "[Log]")
{
  ClogCapture capture;
  const auto log = channel(Timestamped<StdLog>{StdLog{}}, "discovery");
  info(log) << "found";

  const auto line = capture.stream.str();
  CHECK(0 == line.find("[discovery] |"));
  CHECK(std::string::npos != line.find("ms| found\n"));
}

} // namespace util
} // namespace clasp
