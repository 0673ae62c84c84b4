#include "fd_endpoint.hpp"

#include <sys/uio.h>
#include <unistd.h>
#include <algorithm>
#include <bits/ttl/logger.hpp>
#include <cerrno>
#include <utility>

namespace rechunk {

FdPump::FdPump(int fd, std::string name)
    : fd_(fd), name_(std::move(name)), pipeline_(this) {}

void FdPump::abort(int err) {
  TTL_LOG(Info) << "abort(" << err << ") : " << name_;
  if (aborted_ == 0) {
    aborted_ = err;
    on_aborted_(err);
  }
}

void FdPump::onAborted(F<void(int)> cb) {
  on_aborted_ = std::move(cb);
}

int FdPump::run(size_t max_read) {
  if (max_read == 0) {
    TTL_LOG(Error) << "run() : read size must be positive";
    return -EINVAL;
  }

  while (aborted_ == 0) {
    ByteBuf buf{};
    const int n = readSome(buf, max_read);

    if (n > 0) {
      TTL_LOG(Debug) << "fireInbound(InboundBytes) : " << n << " bytes";
      pipeline_.fireInbound(InboundBytes{std::move(buf)});
      continue;
    }

    if (n == 0) {
      TTL_LOG(Info) << "End of input on " << name_;
      pipeline_.fireInbound(InboundEnd{});
      return aborted_;
    }

    TTL_LOG(Error) << "readSome() : error=" << n;
    pipeline_.fireInbound(InboundError{n});
    return n;
  }

  return aborted_;
}

int FdPump::readSome(ByteBuf& dst, size_t max_bytes) {
  if (!dst.reserve(max_bytes)) {
    return -ENOMEM;
  }

  iovec iov   = dst.tailroom();
  iov.iov_len = std::min(iov.iov_len, max_bytes);

  ssize_t n;
  do {
    n = ::readv(fd_, &iov, 1);
  } while (n < 0 && errno == EINTR);

  if (n < 0) {
    return -errno;
  }

  dst.commit(static_cast<size_t>(n));
  return static_cast<int>(n);
}

void FdWriter::onInbound(StageContext& ctx, InboundBytes& evt) {
  const size_t len = evt.buf.readableBytes();

  while (evt.buf.readableBytes() > 0) {
    const int n = writeSome(evt.buf);
    if (n < 0) {
      TTL_LOG(Error) << "writeSome() : error=" << n;
      OutboundCancel cancel{n};
      ctx.fireOutbound(cancel);
      ctx.failure(n);
      return;
    }
  }

  ++blocks_;
  bytes_ += len;
}

void FdWriter::onInbound(StageContext& ctx, InboundEnd& evt) {
  TTL_LOG(Info) << "Wrote " << blocks_ << " blocks, " << bytes_ << " bytes";
  ctx.fireInbound(evt);
}

int FdWriter::writeSome(ByteBuf& src) {
  iovec iov = src.headroom();
  if (iov.iov_len == 0) {
    return 0;
  }

  ssize_t n;
  do {
    n = ::writev(fd_, &iov, 1);
  } while (n < 0 && errno == EINTR);

  if (n < 0) {
    return -errno;
  }

  if (n == 0) {
    return -EIO;
  }

  src.advance(static_cast<size_t>(n));
  return static_cast<int>(n);
}

}  // namespace rechunk
