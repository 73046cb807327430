#include "timer.hpp"

#include <sys/timerfd.h>
#include <unistd.h>

#include <algorithm>
#include <bits/ttl/logger.hpp>
#include <cerrno>
#include <cstdint>
#include <utility>

namespace chunkline::io {

itimerspec detail::toTimerSpec(std::chrono::milliseconds delay) noexcept {
  const int64_t ms = std::max<int64_t>(delay.count(), 1);
  itimerspec spec{};
  spec.it_value.tv_sec  = static_cast<time_t>(ms / 1000);
  spec.it_value.tv_nsec = static_cast<long>((ms % 1000) * 1000000);
  return spec;
}

Timer::~Timer() {
  disarm();
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

bool Timer::arm(std::chrono::milliseconds delay, WatchCallback on_expired) {
  if (fd_ < 0) {
    fd_ = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd_ < 0) {
      TTL_LOG(Error) << "timerfd_create() : ERR = " << errno;
      return false;
    }
  }

  const itimerspec spec = detail::toTimerSpec(delay);
  if (::timerfd_settime(fd_, 0, &spec, nullptr) < 0) {
    TTL_LOG(Error) << "timerfd_settime(" << fd_ << ") : ERR = " << errno;
    return false;
  }

  on_expired_ = std::move(on_expired);
  if (!armed_) {
    ew_.watch(fd_, RDONLY, [this]() { onExpired(); });
    armed_ = true;
  }
  return true;
}

void Timer::disarm() {
  if (!armed_) {
    return;
  }
  armed_ = false;
  itimerspec off{};
  if (::timerfd_settime(fd_, 0, &off, nullptr) < 0) {
    TTL_LOG(Error) << "timerfd_settime(" << fd_ << ", 0) : ERR = " << errno;
  }
  ew_.unwatch(fd_, RDONLY);
  on_expired_ = nullptr;
}

void Timer::onExpired() {
  uint64_t expirations = 0;
  if (::read(fd_, &expirations, sizeof(expirations)) < 0) {
    // Disarmed between the wakeup and now.
    return;
  }
  WatchCallback cb = std::move(on_expired_);
  on_expired_      = nullptr;
  disarm();
  if (cb) {
    cb();
  }
}

}  // namespace chunkline::io
