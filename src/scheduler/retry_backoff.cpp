#include "scheduler/retry_backoff.hpp"
#include <algorithm>

int64_t RetryBackoff::DelayAfter(unsigned int attempt) const {
  if (attempt == 0) return 0;
  int64_t delay = base_delay_ms_;
  for (unsigned int i = 1; i < attempt && delay < max_delay_ms_; ++i) delay *= 2;
  return std::min(delay, max_delay_ms_);
}
