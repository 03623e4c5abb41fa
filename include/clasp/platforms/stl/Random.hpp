// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <cstdint>
#include <random>

namespace clasp
{
namespace platforms
{
namespace stl
{

// Source of random bytes for identifiers. Each instance seeds its own
// engine from the system entropy source.
struct Random
{
  Random()
    : mGenerator(std::random_device{}())
    , mDistribution(0, 255)
  {
  }

  uint8_t operator()() { return static_cast<uint8_t>(mDistribution(mGenerator)); }

  std::mt19937_64 mGenerator;
  std::uniform_int_distribution<unsigned> mDistribution;
};

} // namespace stl
} // namespace platforms
} // namespace clasp
