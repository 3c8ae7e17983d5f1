#include "server/auth/rate_limiter.h"

#include <utility>

namespace vertexbridge {

RateLimiter::RateLimiter(int requests_per_minute, Clock clock)
    : limit_(requests_per_minute), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return std::chrono::steady_clock::now(); };
  }
}

bool RateLimiter::Admit() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (limit_ <= 0) {
    return true;
  }
  auto now = clock_();
  if (!window_open_ || now > window_start_ + kWindow) {
    window_start_ = now;
    count_ = 0;
    window_open_ = true;
  }
  if (count_ < limit_) {
    ++count_;
    return true;
  }
  return false;
}

bool RateLimiter::Enabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return limit_ > 0;
}

int RateLimiter::CurrentLimit() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return limit_;
}

int RateLimiter::SecondsUntilReset() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!window_open_) {
    return 0;
  }
  auto remaining = window_start_ + kWindow - clock_();
  auto secs = std::chrono::ceil<std::chrono::seconds>(remaining).count();
  return secs < 1 ? 1 : static_cast<int>(secs);
}

}  // namespace vertexbridge
