#pragma once
#include <variant>

#include "byte_buffer.hpp"

namespace rechunk {

// Data events
struct InboundBytes {
  ByteBuf buf;
};

// Upstream lifecycle events
struct InboundEnd {};

struct InboundError {
  int err;
};

// Sent from the sink towards the source to abort the stream.
struct OutboundCancel {
  int reason = 0;
};

using Event = std::variant<InboundBytes, InboundEnd, InboundError, OutboundCancel>;

}  // namespace rechunk
