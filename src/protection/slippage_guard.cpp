#include "protection/slippage_guard.hpp"
#include "common/logger.hpp"
#include "common/numeric.hpp"
#include <algorithm>

uint64_t SlippageGuard::MinimumOutput(uint64_t expected_out, uint32_t slippage_bps) {
  if (slippage_bps >= 10000) return 0;
  uint128 scaled = static_cast<uint128>(expected_out) * (10000u - slippage_bps);
  return static_cast<uint64_t>(scaled / 10000u);
}

uint32_t SlippageGuard::ClampSlippageBps(uint32_t requested_bps) const {
  if (requested_bps == 0) return std::min(cfg_.default_slippage_bps, cfg_.max_slippage_bps);
  if (requested_bps > cfg_.max_slippage_bps) {
    Logger::Warning("Slippage " + std::to_string(requested_bps) + " bps capped at " + std::to_string(cfg_.max_slippage_bps));
    return cfg_.max_slippage_bps;
  }
  return requested_bps;
}
