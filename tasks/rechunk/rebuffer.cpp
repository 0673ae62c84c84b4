#include "rebuffer.hpp"

#include <sys/uio.h>
#include <algorithm>
#include <bits/ttl/logger.hpp>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace rechunk {

namespace {

std::vector<uint8_t> allocateCarryOver(size_t size) {
  if (size == 0) {
    TTL_LOG(Error) << "Chunk size must be positive";
    throw std::invalid_argument("chunk size must be positive");
  }
  return std::vector<uint8_t>(size);
}

}  // namespace

ChunkRebuffer::ChunkRebuffer(size_t size, RebufferOptions options)
    : buffer_(allocateCarryOver(size)),
      discard_incomplete_(options.discard_incomplete_chunks) {}

void ChunkRebuffer::onInbound(StageContext& ctx, InboundBytes& evt) {
  if (state_ == State::kAborted) {
    TTL_LOG(Debug) << "Dropping " << evt.buf.readableBytes()
                   << " bytes of an aborted stream";
    return;
  }
  if (state_ == State::kEnded) {
    TTL_LOG(Error) << "Got " << evt.buf.readableBytes()
                   << " bytes after end of input";
    ctx.failure(-EPIPE);
    return;
  }

  const iovec in  = evt.buf.headroom();
  const auto* src = static_cast<const uint8_t*>(in.iov_base);
  size_t off      = 0;

  while (off < in.iov_len) {
    const size_t n = std::min(buffer_.size() - used_, in.iov_len - off);
    std::memcpy(buffer_.data() + used_, src + off, n);
    used_ += n;
    off += n;

    if (used_ == buffer_.size()) {
      if (!emit(ctx, used_)) {
        return;
      }
      used_ = 0;
    }
  }

  evt.buf.advance(off);
}

void ChunkRebuffer::onInbound(StageContext& ctx, InboundEnd& evt) {
  if (state_ == State::kAborted) {
    return;
  }
  if (state_ == State::kEnded) {
    TTL_LOG(Error) << "Duplicate end of input";
    ctx.failure(-EPIPE);
    return;
  }

  if (used_ > 0) {
    if (discard_incomplete_) {
      TTL_LOG(Debug) << "Discarding incomplete chunk of " << used_ << " bytes";
    } else if (!emit(ctx, used_)) {
      return;
    }
    used_ = 0;
  }

  state_ = State::kEnded;
  ctx.fireInbound(evt);
}

void ChunkRebuffer::onInbound(StageContext& ctx, InboundError& evt) {
  TTL_LOG(Debug) << "Upstream error " << evt.err << ", dropping " << used_
                 << " pending bytes";
  used_  = 0;
  state_ = State::kAborted;
  ctx.fireInbound(evt);
}

void ChunkRebuffer::onOutbound(StageContext& ctx, OutboundCancel& evt) {
  TTL_LOG(Debug) << "Cancelled with " << used_ << " bytes pending, reason="
                 << evt.reason;
  used_  = 0;
  state_ = State::kAborted;
  ctx.fireOutbound(evt);
}

bool ChunkRebuffer::emit(StageContext& ctx, size_t n) {
  ByteBuf out;
  if (!out.write(buffer_.data(), n)) {
    TTL_LOG(Error) << "Failed to allocate a " << n << " byte chunk";
    state_ = State::kAborted;
    ctx.failure(-ENOMEM);
    return false;
  }

  InboundBytes chunk{std::move(out)};
  ctx.fireInbound(chunk);

  // Downstream may have cancelled the stream while handling the chunk.
  return state_ == State::kAccumulating;
}

}  // namespace rechunk
