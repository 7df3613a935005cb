#pragma once
#include <cstdint>

struct SlippageGuardConfig {
  uint32_t default_slippage_bps = 50;  // 0.5%
  uint32_t max_slippage_bps = 500;
};

// Minimum-output protection for a selected route.
class SlippageGuard {
public:
  explicit SlippageGuard(SlippageGuardConfig cfg) : cfg_(cfg) {}

  // floor(expected_out * (10000 - slippage_bps) / 10000)
  static uint64_t MinimumOutput(uint64_t expected_out, uint32_t slippage_bps);

  // Requested value capped at the configured maximum; 0 means "use the default"
  uint32_t ClampSlippageBps(uint32_t requested_bps) const;
private:
  SlippageGuardConfig cfg_;
};
