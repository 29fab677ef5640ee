#pragma once
/*
 * Debouncer
 *
 * Trailing-edge coalescing: any number of notify() calls closer together than
 * the window produce exactly one ready() == true, once the window has passed
 * since the last notification. Time is passed in so tests need no clock.
 */
#include <chrono>
#include <optional>

class Debouncer {
public:
  using Clock = std::chrono::steady_clock;

  explicit Debouncer(std::chrono::milliseconds window) : window_(window) {}

  void notify(Clock::time_point now) {
    pending_ = true;
    last_ = now;
  }

  bool ready(Clock::time_point now) {
    if (!pending_ || now - last_ < window_) return false;
    pending_ = false;
    return true;
  }

  bool pending() const { return pending_; }

  // How long a poll may sleep before ready() could flip; empty when idle.
  std::optional<std::chrono::milliseconds> time_until_ready(Clock::time_point now) const {
    if (!pending_) return std::nullopt;
    auto left = window_ - std::chrono::duration_cast<std::chrono::milliseconds>(now - last_);
    if (left < std::chrono::milliseconds(0)) left = std::chrono::milliseconds(0);
    return left;
  }

  void reset() { pending_ = false; }
  std::chrono::milliseconds window() const { return window_; }

private:
  std::chrono::milliseconds window_;
  bool pending_ = false;
  Clock::time_point last_{};
};
