#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

// Caps concurrent upstream requests and enforces a minimum spacing between request starts.
class RequestLimiter {
public:
  RequestLimiter(size_t max_in_flight, std::chrono::milliseconds min_interval);
  void Acquire();
  void Release();
  size_t InFlight() const;

  class Permit {
  public:
    explicit Permit(RequestLimiter* limiter) : limiter_(limiter) { if (limiter_) limiter_->Acquire(); }
    ~Permit() { if (limiter_) limiter_->Release(); }
    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;
  private:
    RequestLimiter* limiter_;
  };

private:
  size_t max_in_flight_;
  std::chrono::milliseconds min_interval_;
  size_t in_flight_ = 0;
  std::chrono::steady_clock::time_point next_start_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};
