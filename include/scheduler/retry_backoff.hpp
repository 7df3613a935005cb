#pragma once
#include <cstdint>

// Exponential backoff: base * 2^(attempt-1), capped at max_delay_ms.
class RetryBackoff {
public:
  RetryBackoff(int64_t base_delay_ms = 500, int64_t max_delay_ms = 8000, unsigned int max_attempts = 3)
    : base_delay_ms_(base_delay_ms), max_delay_ms_(max_delay_ms), max_attempts_(max_attempts) {}
  // Delay before attempt + 1, for attempt >= 1
  int64_t DelayAfter(unsigned int attempt) const;
  bool CanRetry(unsigned int attempts_made) const { return attempts_made < max_attempts_; }
private:
  int64_t base_delay_ms_;
  int64_t max_delay_ms_;
  unsigned int max_attempts_;
};
