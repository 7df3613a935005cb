#pragma once
#include "common/numeric.hpp"
#include <cstdint>

// Q64.64 tick and liquidity math for concentrated-liquidity pools.
// sqrt_price_x64 = sqrt(1.0001^tick) * 2^64
namespace ClmmMath {
  constexpr int32_t kMinTick = -443636;
  constexpr int32_t kMaxTick = 443636;
  extern const uint128 kMinSqrtPriceX64;
  extern const uint128 kMaxSqrtPriceX64;

  // Throws std::out_of_range outside [kMinTick, kMaxTick]
  uint128 GetSqrtPriceAtTick(int32_t tick);

  // Greatest tick whose sqrt price is <= sqrt_price_x64
  int32_t GetTickAtSqrtPrice(const uint128& sqrt_price_x64);

  // Token 0 between two prices: L * (sb - sa) / (sa * sb)
  uint256 GetAmount0Delta(uint128 sqrt_a, uint128 sqrt_b, const uint128& liquidity, bool round_up);
  // Token 1 between two prices: L * (sb - sa)
  uint256 GetAmount1Delta(uint128 sqrt_a, uint128 sqrt_b, const uint128& liquidity, bool round_up);

  // Price after adding amount_in of the input token, rounded so the pool never gives more than it owes
  uint128 GetNextSqrtPriceFromInput(const uint128& sqrt_price_x64, const uint128& liquidity, const uint256& amount_in,
                                    bool zero_for_one);

  struct SwapStep {
    uint128 sqrt_price_next = 0;
    uint256 amount_in = 0;
    uint256 amount_out = 0;
    uint256 fee_amount = 0;
  };

  // One exact-input step from sqrt_current toward sqrt_target within a single liquidity range.
  // Fee rate in bps of the gross input.
  SwapStep ComputeSwapStep(const uint128& sqrt_current, const uint128& sqrt_target, const uint128& liquidity,
                           const uint256& amount_remaining, uint32_t fee_bps);
}
