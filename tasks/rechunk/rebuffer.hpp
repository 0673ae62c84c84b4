#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "conveyor.hpp"
#include "event.hpp"

namespace rechunk {

struct RebufferOptions {
  // Drop a trailing block shorter than the chunk size instead of emitting it.
  bool discard_incomplete_chunks = false;
};

// ChunkRebuffer re-slices inbound blocks of arbitrary sizes into blocks of
// exactly size() bytes. Only the block emitted on InboundEnd may be shorter.
// Each emitted block is a copy; the carry-over buffer is never handed out.
class ChunkRebuffer {
public:
  // Throws std::invalid_argument when size is 0.
  explicit ChunkRebuffer(size_t size, RebufferOptions options = {});
  ~ChunkRebuffer() = default;

  void onInbound(StageContext& ctx, InboundBytes& evt);
  void onInbound(StageContext& ctx, InboundEnd& evt);
  void onInbound(StageContext& ctx, InboundError& evt);
  void onOutbound(StageContext& ctx, OutboundCancel& evt);

  [[nodiscard]] size_t size() const noexcept { return buffer_.size(); }

  // Bytes held in the carry-over buffer, always < size().
  [[nodiscard]] size_t buffered() const noexcept { return used_; }

  // kEnded after InboundEnd, kAborted after an upstream error, a downstream
  // cancel or a failed emission. Both are terminal.
  enum class State { kAccumulating, kEnded, kAborted };

  [[nodiscard]] State state() const noexcept { return state_; }

private:
  // Copies the first n carry-over bytes into a fresh block and fires it.
  // Returns false once the stage can no longer emit.
  bool emit(StageContext& ctx, size_t n);

  std::vector<uint8_t> buffer_;
  size_t used_ = 0;
  bool discard_incomplete_;
  State state_ = State::kAccumulating;
};

}  // namespace rechunk
