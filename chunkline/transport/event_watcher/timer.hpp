#pragma once

#include <sys/timerfd.h>

#include <chrono>

#include "event_watcher.hpp"

namespace chunkline::io {

namespace detail {
// One-shot expiry after delay. An all-zero it_value disarms a timerfd, so
// delays round up to 1ms.
[[nodiscard]] itimerspec toTimerSpec(std::chrono::milliseconds delay) noexcept;
}  // namespace detail

// Re-armable one-shot timer backed by a timerfd registered with the
// event watcher. Destroying the timer disarms it.
class Timer {
public:
  explicit Timer(EventWatcher& ew) noexcept : ew_(ew) {}
  ~Timer();

  Timer(const Timer&)            = delete;
  Timer& operator=(const Timer&) = delete;

  // Replaces any pending expiry. Returns false if the timerfd could not
  // be created or set; errno is preserved.
  bool arm(std::chrono::milliseconds delay, WatchCallback on_expired);
  void disarm();

  [[nodiscard]] bool armed() const noexcept { return armed_; }

private:
  void onExpired();

  EventWatcher& ew_;
  int fd_     = -1;
  bool armed_ = false;
  WatchCallback on_expired_;
};

}  // namespace chunkline::io
