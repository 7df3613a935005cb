#include "scheduler/request_limiter.hpp"
#include <algorithm>

RequestLimiter::RequestLimiter(size_t max_in_flight, std::chrono::milliseconds min_interval)
  : max_in_flight_(std::max<size_t>(1, max_in_flight)), min_interval_(min_interval),
    next_start_(std::chrono::steady_clock::now()) {}

void RequestLimiter::Acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]{ return in_flight_ < max_in_flight_; });
  ++in_flight_;
  auto now = std::chrono::steady_clock::now();
  auto start = std::max(now, next_start_);
  next_start_ = start + min_interval_;
  if (start > now) {
    lock.unlock();
    std::this_thread::sleep_until(start);
  }
}

void RequestLimiter::Release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_ > 0) --in_flight_;
  }
  cv_.notify_one();
}

size_t RequestLimiter::InFlight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_flight_;
}
