#pragma once
/*
 * EventChannel
 *
 * Purpose: multi-producer queue from worker threads (watcher, runner) to the
 * main loop. Producers push by move; the main loop drains without blocking.
 */
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

template <typename T>
class EventChannel {
public:
  void push(T v) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push_back(std::move(v));
    }
    cv_.notify_one();
  }

  bool pop_for(T& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) return false;
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
  }

  std::vector<T> drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<T> out;
    out.reserve(queue_.size());
    while (!queue_.empty()) {
      out.push_back(std::move(queue_.front()));
      queue_.pop_front();
    }
    return out;
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> queue_;
};
