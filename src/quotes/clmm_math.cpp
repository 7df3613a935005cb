#include "quotes/clmm_math.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace ClmmMath {
  const uint128 kMinSqrtPriceX64 = 4295048016ULL;
  const uint128 kMaxSqrtPriceX64("79226673521066979257578248091");

  namespace {
    const uint256 kQ64 = static_cast<uint256>(1) << 64;

    // sqrt(1.0001^-(2^i)) in Q64.64 for bit i >= 1
    const uint64_t kTickRatios[] = {
      0xfff97272373d4000ULL, 0xfff2e50f5f657000ULL, 0xffe5caca7e10f000ULL, 0xffcb9843d60f7000ULL,
      0xff973b41fa98e800ULL, 0xff2ea16466c9b000ULL, 0xfe5dee046a9a3800ULL, 0xfcbe86c7900bb000ULL,
      0xf987a7253ac65800ULL, 0xf3392b0822bb6000ULL, 0xe7159475a2caf000ULL, 0xd097f3bdfd2f2000ULL,
      0xa9f746462d9f8000ULL, 0x70d869a156f31c00ULL, 0x31be135f97ed3200ULL, 0x09aa508b5b85a500ULL,
      0x005d6af8dedc582cULL, 0x00002216e584f5faULL,
    };
  }

  uint128 GetSqrtPriceAtTick(int32_t tick) {
    if (tick < kMinTick || tick > kMaxTick) {
      throw std::out_of_range("tick " + std::to_string(tick) + " outside supported range");
    }
    uint32_t abs_tick = static_cast<uint32_t>(tick < 0 ? -static_cast<int64_t>(tick) : tick);
    uint256 ratio = (abs_tick & 0x1) ? static_cast<uint256>(0xfffcb933bd6fb800ULL) : kQ64;
    for (unsigned i = 1; i <= 18; ++i) {
      if (abs_tick & (1u << i)) ratio = (ratio * kTickRatios[i - 1]) >> 64;
    }
    if (tick > 0) {
      uint256 max128 = (static_cast<uint256>(1) << 128) - 1;
      ratio = max128 / ratio;
    }
    return static_cast<uint128>(ratio);
  }

  int32_t GetTickAtSqrtPrice(const uint128& sqrt_price_x64) {
    if (sqrt_price_x64 < kMinSqrtPriceX64 || sqrt_price_x64 > kMaxSqrtPriceX64) {
      throw std::out_of_range("sqrt price outside supported range");
    }
    int32_t lo = kMinTick, hi = kMaxTick;
    while (lo < hi) {
      int32_t mid = lo + (hi - lo + 1) / 2;
      if (GetSqrtPriceAtTick(mid) <= sqrt_price_x64) lo = mid;
      else hi = mid - 1;
    }
    return lo;
  }

  uint256 GetAmount0Delta(uint128 sqrt_a, uint128 sqrt_b, const uint128& liquidity, bool round_up) {
    if (sqrt_a > sqrt_b) std::swap(sqrt_a, sqrt_b);
    if (sqrt_a == 0) throw std::invalid_argument("zero sqrt price");
    uint256 numerator1 = static_cast<uint256>(liquidity) << 64;
    uint256 numerator2 = static_cast<uint256>(sqrt_b - sqrt_a);
    if (round_up) {
      return Numeric::DivCeil(Numeric::MulDivCeil(numerator1, numerator2, static_cast<uint256>(sqrt_b)),
                              static_cast<uint256>(sqrt_a));
    }
    return Numeric::MulDivFloor(numerator1, numerator2, static_cast<uint256>(sqrt_b)) / static_cast<uint256>(sqrt_a);
  }

  uint256 GetAmount1Delta(uint128 sqrt_a, uint128 sqrt_b, const uint128& liquidity, bool round_up) {
    if (sqrt_a > sqrt_b) std::swap(sqrt_a, sqrt_b);
    uint256 diff = static_cast<uint256>(sqrt_b - sqrt_a);
    uint256 l = static_cast<uint256>(liquidity);
    if (round_up) return Numeric::MulDivCeil(l, diff, kQ64);
    return Numeric::MulDivFloor(l, diff, kQ64);
  }

  uint128 GetNextSqrtPriceFromInput(const uint128& sqrt_price_x64, const uint128& liquidity, const uint256& amount_in,
                                    bool zero_for_one) {
    if (amount_in == 0) return sqrt_price_x64;
    if (liquidity == 0) throw std::invalid_argument("zero liquidity");
    uint256 price = static_cast<uint256>(sqrt_price_x64);
    if (zero_for_one) {
      // ceil(L * sqrtP / (L + amount * sqrtP)) with L scaled to Q64
      uint256 numerator1 = static_cast<uint256>(liquidity) << 64;
      uint256 denominator = numerator1 + amount_in * price;
      return static_cast<uint128>(Numeric::MulDivCeil(numerator1, price, denominator));
    }
    uint256 next = price + (amount_in << 64) / static_cast<uint256>(liquidity);
    if (next > static_cast<uint256>(kMaxSqrtPriceX64)) return kMaxSqrtPriceX64;
    return static_cast<uint128>(next);
  }

  SwapStep ComputeSwapStep(const uint128& sqrt_current, const uint128& sqrt_target, const uint128& liquidity,
                           const uint256& amount_remaining, uint32_t fee_bps) {
    SwapStep step;
    bool zero_for_one = sqrt_current >= sqrt_target;
    uint256 remaining_less_fee = amount_remaining * (10000 - fee_bps) / 10000;

    uint256 amount_to_target = zero_for_one
      ? GetAmount0Delta(sqrt_target, sqrt_current, liquidity, true)
      : GetAmount1Delta(sqrt_current, sqrt_target, liquidity, true);
    if (remaining_less_fee >= amount_to_target) {
      step.sqrt_price_next = sqrt_target;
    } else {
      step.sqrt_price_next = GetNextSqrtPriceFromInput(sqrt_current, liquidity, remaining_less_fee, zero_for_one);
    }
    bool reached = step.sqrt_price_next == sqrt_target;

    if (zero_for_one) {
      step.amount_in = reached ? amount_to_target : GetAmount0Delta(step.sqrt_price_next, sqrt_current, liquidity, true);
      step.amount_out = GetAmount1Delta(step.sqrt_price_next, sqrt_current, liquidity, false);
    } else {
      step.amount_in = reached ? amount_to_target : GetAmount1Delta(sqrt_current, step.sqrt_price_next, liquidity, true);
      step.amount_out = GetAmount0Delta(sqrt_current, step.sqrt_price_next, liquidity, false);
    }

    if (!reached) {
      step.fee_amount = amount_remaining - step.amount_in;
    } else if (fee_bps > 0 && fee_bps < 10000) {
      step.fee_amount = Numeric::MulDivCeil(step.amount_in, fee_bps, 10000 - fee_bps);
    }
    return step;
  }
}
