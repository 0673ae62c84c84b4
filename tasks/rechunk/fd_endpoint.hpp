#pragma once
#include <cstddef>
#include <string>

#include "byte_buffer.hpp"
#include "conveyor.hpp"
#include "endpoint.hpp"
#include "event.hpp"

namespace rechunk {

// FdPump feeds its conveyor with whatever read(2) returns on a descriptor.
// The descriptor is borrowed, not closed.
class FdPump : public IEndpoint {
public:
  static constexpr size_t kDefaultReadSize = 4096;

  explicit FdPump(int fd, std::string name = "fd");
  ~FdPump() override = default;

  Conveyor& pipeline() noexcept override { return pipeline_; }

  void abort(int err) override;
  void onAborted(F<void(int)> cb) override;

  [[nodiscard]] const char* name() const override { return name_.c_str(); }

  // Reads until EOF, a read error or an abort by one of the stages.
  // Returns 0 after a clean end of input, a negative errno otherwise.
  int run(size_t max_read = kDefaultReadSize);

  [[nodiscard]] int aborted() const noexcept { return aborted_; }

private:
  int readSome(ByteBuf& dst, size_t max_bytes);

  int fd_;
  std::string name_;
  Conveyor pipeline_;
  int aborted_ = 0;

  F<void(int)> on_aborted_ = [](int) {
  };
};

// FdWriter is a terminal stage writing every inbound block to a descriptor.
class FdWriter {
public:
  explicit FdWriter(int fd) : fd_(fd) {}

  void onInbound(StageContext& ctx, InboundBytes& evt);
  void onInbound(StageContext& ctx, InboundEnd& evt);

private:
  int writeSome(ByteBuf& src);

  int fd_;
  size_t blocks_ = 0;
  size_t bytes_  = 0;
};

}  // namespace rechunk
