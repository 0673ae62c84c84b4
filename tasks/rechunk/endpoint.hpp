#pragma once

#include <functional>

namespace rechunk {

template <typename T>
using F = std::move_only_function<T>;

class Conveyor;

// IEndpoint owns a conveyor and is told when one of its stages fails.
class IEndpoint {
 public:
  virtual ~IEndpoint()                           = default;
  virtual Conveyor& pipeline() noexcept          = 0;
  virtual void abort(int err)                    = 0;
  virtual void onAborted(F<void(int)>)           = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

}  // namespace rechunk
