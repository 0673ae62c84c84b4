#pragma once
#include <sys/uio.h>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <new>
#include <stdexcept>
#include <vector>

namespace rechunk {

// ByteBuf owns one contiguous block travelling through a conveyor.
// Readable bytes live in [r_, w_), tailroom in [w_, data_.size()).
// Blocks are moved between stages, never shared.
class ByteBuf {
public:
  ByteBuf() = default;

  // Returns total readable bytes.
  [[nodiscard]] size_t readableBytes() const noexcept;

  // Returns currently reserved writable bytes (no new allocation).
  [[nodiscard]] size_t writableBytes() const noexcept;

  // Best-effort peek:
  // Copies up to n bytes into dst, no state change.
  size_t peek(void* dst, size_t n) const noexcept;

  // Appends raw bytes to the tail; grows the buffer.
  // Returns false on allocation failure.
  bool write(const void* src, size_t n) noexcept;

  // Reserve n writable bytes.
  // Returns false on allocation failure.
  bool reserve(size_t n) noexcept;

  // Writable tailroom as one iovec for readv. Does not allocate; call
  // reserve() first. Valid until the buffer is mutated.
  [[nodiscard]] iovec tailroom() noexcept;

  // Readable bytes as one iovec for writev or scanning.
  // Valid until the buffer is mutated.
  [[nodiscard]] iovec headroom() noexcept;

  // Drop up to n readable bytes from the head.
  // Returns bytes dropped (<= n).
  size_t advance(size_t n);

  // Make up to n bytes from tailroom readable.
  // Returns bytes committed (<= n).
  size_t commit(size_t n);

private:
  size_t r_ = 0;
  size_t w_ = 0;
  std::vector<uint8_t> data_;
};

inline size_t ByteBuf::readableBytes() const noexcept {
  return w_ - r_;
}

inline size_t ByteBuf::writableBytes() const noexcept {
  return data_.size() - w_;
}

inline size_t ByteBuf::peek(void* dst, size_t n) const noexcept {
  const size_t m = std::min(n, readableBytes());
  if (m == 0) {
    return 0;
  }
  std::memcpy(dst, data_.data() + r_, m);
  return m;
}

inline bool ByteBuf::write(const void* src, size_t n) noexcept {
  if (n == 0) {
    return true;
  }
  if (!reserve(n)) {
    return false;
  }

  std::memcpy(data_.data() + w_, src, n);
  w_ += n;
  return true;
}

inline bool ByteBuf::reserve(size_t n) noexcept {
  if (writableBytes() >= n) {
    return true;
  }

  try {
    data_.resize(w_ + n);
    return true;
  } catch (const std::bad_alloc&) {
    return false;
  } catch (const std::length_error&) {
    return false;
  }
}

inline size_t ByteBuf::advance(size_t n) {
  const size_t m = std::min(n, readableBytes());
  r_ += m;
  if (r_ == w_) {
    r_ = w_ = 0;
  }
  return m;
}

inline size_t ByteBuf::commit(size_t n) {
  const size_t m = std::min(n, writableBytes());
  w_ += m;
  return m;
}

inline iovec ByteBuf::tailroom() noexcept {
  iovec v{};
  v.iov_base = static_cast<void*>(data_.data() + w_);
  v.iov_len  = writableBytes();
  return v;
}

inline iovec ByteBuf::headroom() noexcept {
  iovec v{};
  v.iov_base = static_cast<void*>(data_.data() + r_);
  v.iov_len  = readableBytes();
  return v;
}

}  // namespace rechunk
