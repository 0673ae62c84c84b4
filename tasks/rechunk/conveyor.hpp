#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "endpoint.hpp"
#include "event.hpp"

namespace rechunk {

class Conveyor;
class StageContext;

enum class Direction { kInbound, kOutbound };

namespace traits {

template <class T, class E>
concept HandlesInbound =
    requires(T& t, StageContext& c, E& e) { t.onInbound(c, e); };

template <class T, class E>
concept HandlesOutbound =
    requires(T& t, StageContext& c, E& e) { t.onOutbound(c, e); };

}  // namespace traits

// Type-erased slot of a conveyor.
class Stage {
public:
  virtual ~Stage() = default;

  virtual void dispatch(StageContext& ctx, Direction dir, Event& evt) noexcept = 0;
};

// StageContext is the view a stage gets of its own position in the conveyor.
class StageContext {
public:
  StageContext(Conveyor& p, size_t i) noexcept : p_(p), i_(i) {}

  // Hands evt to the next stage towards the sink.
  template <typename E>
  void fireInbound(E& evt) noexcept;

  // Hands evt to the next stage towards the source.
  template <typename E>
  void fireOutbound(E& evt) noexcept;

  // Reports a negative errno to the owning endpoint.
  void failure(int err) noexcept;

private:
  void forward(Direction dir, Event& evt) noexcept;

  Conveyor& p_;
  size_t i_;
};

// Conveyor is an ordered chain of stages between a source (front) and a sink
// (back). Events that walk past either end are dropped.
class Conveyor {
public:
  explicit Conveyor(IEndpoint* e) noexcept : endpoint_(e) {}

  Conveyor(const Conveyor&)            = delete;
  Conveyor& operator=(const Conveyor&) = delete;

  [[nodiscard]] size_t size() const noexcept { return stages_.size(); }

  // Constructs T in place at the back. A throwing constructor leaves the
  // conveyor unchanged.
  template <class T, class... Args>
  Conveyor& addLast(Args&&... args);

  template <typename E>
    requires(!std::same_as<std::decay_t<E>, Event>)
  void fireInbound(E&& evt) {
    Event wrapped{std::forward<E>(evt)};
    deliver(0, Direction::kInbound, wrapped);
  }

  template <typename E>
    requires(!std::same_as<std::decay_t<E>, Event>)
  void fireOutbound(E&& evt) {
    if (stages_.empty()) {
      return;
    }
    Event wrapped{std::forward<E>(evt)};
    deliver(stages_.size() - 1, Direction::kOutbound, wrapped);
  }

private:
  friend class StageContext;

  void deliver(size_t idx, Direction dir, Event& evt) noexcept {
    if (idx < stages_.size()) {
      StageContext ctx(*this, idx);
      stages_[idx]->dispatch(ctx, dir, evt);
    }
  }

  IEndpoint* endpoint_;
  std::vector<std::unique_ptr<Stage>> stages_;
};

inline void StageContext::failure(int err) noexcept {
  p_.endpoint_->abort(err);
}

inline void StageContext::forward(Direction dir, Event& evt) noexcept {
  if (dir == Direction::kInbound) {
    p_.deliver(i_ + 1, dir, evt);
  } else if (i_ > 0) {
    p_.deliver(i_ - 1, dir, evt);
  }
}

template <typename E>
inline void StageContext::fireInbound(E& evt) noexcept {
  if constexpr (std::same_as<E, Event>) {
    forward(Direction::kInbound, evt);
  } else {
    Event wrapped{std::move(evt)};
    forward(Direction::kInbound, wrapped);
  }
}

template <typename E>
inline void StageContext::fireOutbound(E& evt) noexcept {
  if constexpr (std::same_as<E, Event>) {
    forward(Direction::kOutbound, evt);
  } else {
    Event wrapped{std::move(evt)};
    forward(Direction::kOutbound, wrapped);
  }
}

// Routes each event alternative to T's typed handler for that direction, or
// passes it on untouched when T has none.
template <class T>
class TypedStage final : public Stage {
public:
  template <class... Args>
  explicit TypedStage(Args&&... args) : impl_(std::forward<Args>(args)...) {}

  void dispatch(StageContext& ctx, Direction dir, Event& evt) noexcept override {
    std::visit(
        [&](auto& e) {
          using E = std::decay_t<decltype(e)>;
          if (dir == Direction::kInbound) {
            if constexpr (traits::HandlesInbound<T, E>) {
              impl_.onInbound(ctx, e);
            } else {
              ctx.fireInbound(evt);
            }
          } else {
            if constexpr (traits::HandlesOutbound<T, E>) {
              impl_.onOutbound(ctx, e);
            } else {
              ctx.fireOutbound(evt);
            }
          }
        },
        evt);
  }

private:
  T impl_;
};

template <class T, class... Args>
inline Conveyor& Conveyor::addLast(Args&&... args) {
  stages_.push_back(
      std::make_unique<TypedStage<T>>(std::forward<Args>(args)...));
  return *this;
}

}  // namespace rechunk
