#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

// Millisecond wall clock used for cache freshness, ramp interpolation and retry timing.
class Clock {
public:
  virtual ~Clock() = default;
  virtual int64_t NowMs() const = 0;
  virtual void SleepMs(int64_t ms) = 0;
};

class SystemClock : public Clock {
public:
  int64_t NowMs() const override {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  }
  void SleepMs(int64_t ms) override {
    if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  }
};

// Time only moves when told to; SleepMs advances it instantly and records the request.
class ManualClock : public Clock {
public:
  explicit ManualClock(int64_t start_ms = 0) : now_(start_ms) {}
  int64_t NowMs() const override { return now_.load(); }
  void SleepMs(int64_t ms) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      sleeps_.push_back(ms);
    }
    if (ms > 0) now_.fetch_add(ms);
  }
  void Set(int64_t ms) { now_.store(ms); }
  void Advance(int64_t ms) { now_.fetch_add(ms); }
  std::vector<int64_t> Sleeps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sleeps_;
  }
private:
  std::atomic<int64_t> now_;
  mutable std::mutex mutex_;
  std::vector<int64_t> sleeps_;
};
