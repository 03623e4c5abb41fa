// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <clasp/v2/Messages.hpp>
#include <cstdint>
#include <vector>

namespace clasp
{

// The unit exchanged over a session. The router only ever looks at the
// metadata; payloadType tells the bridge adapters how to read the bytes.
struct Envelope
{
  v2::SessionId sessionId = v2::kNoSession;
  uint32_t sequence = 0;
  v2::PayloadType payloadType = 0;
  std::vector<uint8_t> payload;

  friend bool operator==(const Envelope& lhs, const Envelope& rhs)
  {
    return lhs.sessionId == rhs.sessionId && lhs.sequence == rhs.sequence
           && lhs.payloadType == rhs.payloadType && lhs.payload == rhs.payload;
  }

  friend bool operator!=(const Envelope& lhs, const Envelope& rhs)
  {
    return !(lhs == rhs);
  }
};

} // namespace clasp
