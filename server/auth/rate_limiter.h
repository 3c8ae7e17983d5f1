#pragma once

#include <chrono>
#include <functional>
#include <mutex>

namespace vertexbridge {

// Process-wide fixed-window admission gate. The counter resets once the
// current time has moved past window_start + window; bursts at a window
// boundary are admitted.
class RateLimiter {
 public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  static constexpr std::chrono::seconds kWindow{60};

  // requests_per_minute <= 0 disables the limiter (every call is admitted).
  explicit RateLimiter(int requests_per_minute, Clock clock = nullptr);

  bool Admit();
  bool Enabled() const;
  int CurrentLimit() const;

  // Whole seconds until the current window closes (at least 1 while a window
  // is open, 0 when no request has been admitted yet).
  int SecondsUntilReset() const;

 private:
  int limit_;
  Clock clock_;
  std::chrono::steady_clock::time_point window_start_{};
  int count_{0};
  bool window_open_{false};
  mutable std::mutex mutex_;
};

}  // namespace vertexbridge
