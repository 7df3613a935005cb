#include "quotes/clmm_quote.hpp"
#include "quotes/clmm_math.hpp"
#include <algorithm>
#include <iterator>
#include <limits>

namespace {
  const Decimal kQ64Dec = Numeric::ToDecimal(static_cast<uint256>(1) << 64);

  struct Coverage {
    int32_t lower;
    int32_t upper;
  };

  // Contiguous run of loaded arrays around the array holding the current tick
  Coverage LoadedCoverage(const ClmmState& state) {
    int32_t span = state.TicksInArray();
    int32_t start = state.ArrayStartFor(state.tick_current);
    int32_t lo = start, hi = start;
    while (state.loaded_array_starts.count(lo - span)) lo -= span;
    while (state.loaded_array_starts.count(hi + span)) hi += span;
    return {std::max(lo, ClmmMath::kMinTick), std::min(hi + span, ClmmMath::kMaxTick)};
  }

  // Ideal input and output of one step at constant liquidity, both in raw token units
  void IdealStepAmounts(const ClmmStep& s, bool zero_for_one, Decimal& in, Decimal& out) {
    Decimal l = Numeric::ToDecimal(static_cast<uint256>(s.liquidity));
    Decimal pa = Numeric::ToDecimal(static_cast<uint256>(s.sqrt_price_start_x64)) / kQ64Dec;
    Decimal pb = Numeric::ToDecimal(static_cast<uint256>(s.sqrt_price_end_x64)) / kQ64Dec;
    if (zero_for_one) {
      in = l * (1 / pb - 1 / pa);
      out = l * (pa - pb);
    } else {
      in = l * (pb - pa);
      out = l * (1 / pa - 1 / pb);
    }
  }
}

Decimal ClmmSpotPrice(const ClmmState& state) {
  Decimal p = Numeric::ToDecimal(static_cast<uint256>(state.sqrt_price_x64)) / kQ64Dec;
  return p * p;
}

bool QuoteClmm(const PoolState& pool, const ClmmState& state, const SwapRequest& request, QuoteResult& out,
               QuoteError& err) {
  bool zero_for_one = request.input.mint == pool.token_a.mint;
  if (state.sqrt_price_x64 < ClmmMath::kMinSqrtPriceX64 || state.sqrt_price_x64 > ClmmMath::kMaxSqrtPriceX64 ||
      state.tick_current < ClmmMath::kMinTick || state.tick_current > ClmmMath::kMaxTick) {
    err = {QuoteErrorCode::InvalidRequest, "pool price outside tick range"};
    return false;
  }
  if (!state.IsTickLoaded(state.tick_current)) {
    err = {QuoteErrorCode::MissingTickData, "tick array for current tick " + std::to_string(state.tick_current) + " not loaded"};
    return false;
  }
  Coverage coverage = LoadedCoverage(state);

  uint256 remaining = request.amount_in;
  uint256 total_out = 0;
  uint256 total_fee = 0;
  uint128 sqrt_price = state.sqrt_price_x64;
  uint128 liquidity = state.liquidity;
  int32_t tick = state.tick_current;
  std::vector<ClmmStep> steps;

  while (remaining > 0) {
    int32_t target_tick;
    const TickInfo* crossing = nullptr;
    if (zero_for_one) {
      auto it = state.ticks.upper_bound(tick);
      if (it != state.ticks.begin() && std::prev(it)->first >= coverage.lower) {
        --it;
        target_tick = it->first;
        crossing = &it->second;
      } else {
        target_tick = coverage.lower;
      }
    } else {
      auto it = state.ticks.upper_bound(tick);
      if (it != state.ticks.end() && it->first < coverage.upper) {
        target_tick = it->first;
        crossing = &it->second;
      } else {
        target_tick = coverage.upper;
      }
    }
    target_tick = std::max(ClmmMath::kMinTick, std::min(ClmmMath::kMaxTick, target_tick));
    uint128 sqrt_target = ClmmMath::GetSqrtPriceAtTick(target_tick);
    // Price already past the target; cross without consuming input
    if (zero_for_one ? sqrt_target > sqrt_price : sqrt_target < sqrt_price) sqrt_target = sqrt_price;

    ClmmMath::SwapStep step = ClmmMath::ComputeSwapStep(sqrt_price, sqrt_target, liquidity, remaining, state.fee_bps);
    remaining -= step.amount_in + step.fee_amount;
    total_out += step.amount_out;
    total_fee += step.fee_amount;

    ClmmStep trace;
    trace.tick_start = tick;
    trace.tick_target = target_tick;
    trace.sqrt_price_start_x64 = sqrt_price;
    trace.sqrt_price_end_x64 = step.sqrt_price_next;
    trace.liquidity = liquidity;
    trace.amount_in = static_cast<uint64_t>(step.amount_in);
    trace.amount_out = static_cast<uint64_t>(std::min(step.amount_out, static_cast<uint256>(std::numeric_limits<uint64_t>::max())));
    trace.fee_amount = static_cast<uint64_t>(step.fee_amount);
    sqrt_price = step.sqrt_price_next;

    if (step.sqrt_price_next != sqrt_target) {
      steps.push_back(trace);
      tick = ClmmMath::GetTickAtSqrtPrice(sqrt_price);
      continue;
    }
    tick = zero_for_one ? target_tick - 1 : target_tick;
    if (crossing) {
      BigInt next_liquidity = static_cast<BigInt>(liquidity);
      if (zero_for_one) next_liquidity -= static_cast<BigInt>(crossing->liquidity_net);
      else next_liquidity += static_cast<BigInt>(crossing->liquidity_net);
      if (next_liquidity < 0 || next_liquidity > static_cast<BigInt>(std::numeric_limits<uint128>::max())) {
        err = {QuoteErrorCode::InsufficientLiquidity, "liquidity out of range crossing tick " + std::to_string(target_tick)};
        return false;
      }
      trace.crossed = true;
      trace.liquidity_net = crossing->liquidity_net;
      liquidity = static_cast<uint128>(next_liquidity);
      steps.push_back(trace);
      continue;
    }
    steps.push_back(trace);
    if (remaining > 0) {
      bool global_bound = zero_for_one ? target_tick == ClmmMath::kMinTick : target_tick == ClmmMath::kMaxTick;
      if (global_bound) {
        err = {QuoteErrorCode::InsufficientLiquidity, "price limit reached with " + remaining.str() + " input left"};
      } else {
        err = {QuoteErrorCode::MissingTickData, "traversal needs ticks beyond loaded arrays at " + std::to_string(target_tick)};
      }
      return false;
    }
  }

  if (total_out == 0) {
    err = {QuoteErrorCode::InsufficientLiquidity, "output rounds to zero"};
    return false;
  }
  if (total_out > std::numeric_limits<uint64_t>::max()) {
    err = {QuoteErrorCode::InvalidRequest, "output exceeds u64"};
    return false;
  }

  Decimal ideal_in = 0, ideal_out = 0;
  for (const auto& s : steps) {
    Decimal in, o;
    IdealStepAmounts(s, zero_for_one, in, o);
    ideal_in += in;
    ideal_out += o;
  }
  Decimal impact = 0;
  if (ideal_in > 0) {
    Decimal spot = ClmmSpotPrice(state);
    if (!zero_for_one) spot = 1 / spot;
    impact = (1 - (ideal_out / ideal_in) / spot) * 100;
    if (impact < 0) impact = 0;
  }

  out.a_to_b = zero_for_one;
  out.amount_in = request.amount_in;
  out.amount_out = static_cast<uint64_t>(total_out);
  out.fee_amount = static_cast<uint64_t>(total_fee);
  out.price_impact_pct = impact;
  out.steps = std::move(steps);
  return true;
}
