#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "event.hpp"

class Conveyor;
class ITransport;
class StageContext;

// Inbound events travel from the socket towards the application (head to
// tail), outbound events the other way.
enum class Direction : uint8_t { kInbound, kOutbound };

namespace traits {

template <class T>
concept HasOnAdded = requires(T& t, StageContext& c) { t.onAdded(c); };

template <class T>
concept HasOnRemoved = requires(T& t, StageContext& c) { t.onRemoved(c); };

template <class T, class E>
concept HasOnInbound =
    requires(T& t, StageContext& c, E& e) { t.onInbound(c, e); };

template <class T, class E>
concept HasOnOutbound =
    requires(T& t, StageContext& c, E& e) { t.onOutbound(c, e); };

}  // namespace traits

struct Stage {
  virtual ~Stage() = default;

  virtual void onAdded(StageContext& /*unused*/) {}

  virtual void onRemoved(StageContext& /*unused*/) {}

  // Handles evt or passes it on in the same direction.
  virtual void onEvent(StageContext&, Direction, Event&) noexcept = 0;
};

// A stage's position in its conveyor.
class StageContext {
public:
  StageContext(Conveyor* conveyor, size_t index) noexcept
      : conveyor_(conveyor), index_(index) {}

  [[nodiscard]] size_t index() const noexcept { return index_; }

  [[nodiscard]] ITransport& transport() noexcept;

  template <typename E>
  void fireInbound(E& evt) noexcept {
    forward(Direction::kInbound, evt);
  }

  template <typename E>
  void fireOutbound(E& evt) noexcept {
    forward(Direction::kOutbound, evt);
  }

  // Reports an unrecoverable stage error to the stages after this one.
  void failure(int err) noexcept {
    InboundTransportError evt{err};
    fireInbound(evt);
  }

private:
  template <typename E>
  void forward(Direction dir, E& evt) noexcept;

  Conveyor* conveyor_;
  size_t index_;
};

// Ordered list of stages owned by one transport. Events are delivered
// synchronously; a stage that neither handles nor forwards an event ends
// its journey.
class Conveyor {
public:
  explicit Conveyor(ITransport* transport) noexcept : transport_(transport) {}

  Conveyor(const Conveyor&)            = delete;
  Conveyor& operator=(const Conveyor&) = delete;

  ~Conveyor() {
    for (size_t i = 0; i < stages_.size(); ++i) {
      StageContext ctx(this, i);
      stages_[i]->onRemoved(ctx);
    }
  }

  [[nodiscard]] ITransport* transport() const noexcept { return transport_; }

  [[nodiscard]] size_t size() const noexcept { return stages_.size(); }

  template <class T, class... Args>
  Conveyor& addLast(Args&&... args);

  // Enters at the head.
  template <typename E>
    requires(!std::same_as<std::decay_t<E>, Event>)
  void fireInbound(E&& evt) {
    Event wrapped{std::forward<E>(evt)};
    deliver(Direction::kInbound, 0, wrapped);
  }

  // Enters at the tail.
  template <typename E>
    requires(!std::same_as<std::decay_t<E>, Event>)
  void fireOutbound(E&& evt) {
    if (stages_.empty()) {
      return;
    }
    Event wrapped{std::forward<E>(evt)};
    deliver(Direction::kOutbound, stages_.size() - 1, wrapped);
  }

private:
  friend class StageContext;

  void deliver(Direction dir, size_t index, Event& evt) {
    if (index >= stages_.size()) {
      return;
    }
    StageContext ctx(this, index);
    stages_[index]->onEvent(ctx, dir, evt);
  }

  ITransport* transport_;
  std::vector<std::unique_ptr<Stage>> stages_;
};

inline ITransport& StageContext::transport() noexcept {
  return *conveyor_->transport();
}

template <typename E>
inline void StageContext::forward(Direction dir, E& evt) noexcept {
  if (dir == Direction::kOutbound && index_ == 0) {
    return;
  }
  const size_t next = dir == Direction::kInbound ? index_ + 1 : index_ - 1;
  if constexpr (std::same_as<E, Event>) {
    conveyor_->deliver(dir, next, evt);
  } else {
    Event wrapped{std::move(evt)};
    conveyor_->deliver(dir, next, wrapped);
  }
}

// Type-erases a stage struct. Events the struct has no handler for are
// forwarded untouched.
template <class T>
class StageAdapter final : public Stage {
public:
  template <class... Args>
  explicit StageAdapter(Args&&... args) : impl_(std::forward<Args>(args)...) {}

  void onAdded(StageContext& ctx) override {
    if constexpr (traits::HasOnAdded<T>) {
      impl_.onAdded(ctx);
    }
  }

  void onRemoved(StageContext& ctx) override {
    if constexpr (traits::HasOnRemoved<T>) {
      impl_.onRemoved(ctx);
    }
  }

  void onEvent(StageContext& ctx, Direction dir, Event& evt) noexcept override {
    std::visit(
        [&](auto& e) {
          using E = std::decay_t<decltype(e)>;
          if (dir == Direction::kInbound) {
            if constexpr (traits::HasOnInbound<T, E>) {
              impl_.onInbound(ctx, e);
              return;
            }
            ctx.fireInbound(evt);
          } else {
            if constexpr (traits::HasOnOutbound<T, E>) {
              impl_.onOutbound(ctx, e);
              return;
            }
            ctx.fireOutbound(evt);
          }
        },
        evt);
  }

private:
  T impl_;
};

template <class T, class... Args>
inline Conveyor& Conveyor::addLast(Args&&... args) {
  auto stage = std::make_unique<StageAdapter<T>>(std::forward<Args>(args)...);
  StageContext ctx(this, stages_.size());
  stage->onAdded(ctx);
  stages_.push_back(std::move(stage));
  return *this;
}
