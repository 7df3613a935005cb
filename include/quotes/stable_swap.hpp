#pragma once
#include "quotes/quote_types.hpp"

// Two-coin StableSwap invariant:
//   A*n^n*(x + y) + D = A*D*n^n + D^(n+1) / (n^n*x*y),  n = 2
namespace StableSwapMath {
  constexpr uint64_t kMinAmp = 1;
  constexpr uint64_t kMaxAmp = 1000000;
  // Reserve ratios beyond this are outside the supported range
  constexpr uint64_t kMaxReserveRatio = 1000000000ULL;
  constexpr unsigned kDefaultMaxIterations = 256;

  // Newton iteration for D. False when |D_k - D_k-1| > 1 after max_iterations.
  bool ComputeD(uint64_t amp, const uint256& x, const uint256& y, unsigned max_iterations, uint256& d,
                unsigned* iterations_used = nullptr);

  // Newton iteration for the other reserve given the new value of one reserve and D.
  bool ComputeY(uint64_t amp, const uint256& x_new, const uint256& d, unsigned max_iterations, uint256& y,
                unsigned* iterations_used = nullptr);

  // Marginal output per unit of input at (x, y) on the curve for D, before fees
  Decimal SpotPrice(uint64_t amp, const Decimal& x, const Decimal& y, const Decimal& d);

  // Current amplification of a ramping pool, linearly interpolated over [ramp_start, ramp_stop]
  uint64_t RampedAmp(uint64_t initial_amp, uint64_t target_amp, int64_t ramp_start_s, int64_t ramp_stop_s,
                     int64_t now_s);
}

bool QuoteStable(const PoolState& pool, const StableState& state, const SwapRequest& request,
                 unsigned max_iterations, QuoteResult& out, QuoteError& err);
