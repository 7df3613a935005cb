#include "quotes/stable_swap.hpp"
#include <algorithm>

namespace StableSwapMath {
  namespace {
    uint256 AbsDiff(const uint256& a, const uint256& b) { return a > b ? a - b : b - a; }
  }

  bool ComputeD(uint64_t amp, const uint256& x, const uint256& y, unsigned max_iterations, uint256& d,
                unsigned* iterations_used) {
    uint256 s = x + y;
    if (iterations_used) *iterations_used = 0;
    if (s == 0) {
      d = 0;
      return true;
    }
    if (x == 0 || y == 0) return false;
    uint256 ann = static_cast<uint256>(amp) * 4;
    d = s;
    for (unsigned i = 0; i < max_iterations; ++i) {
      // D^3 / (4xy) in one division; truncating per factor can leave the iteration cycling
      uint256 d_p = d * d * d / (x * y * 4);
      uint256 prev = d;
      uint256 numerator = (ann * s + d_p * 2) * d;
      uint256 denominator = (ann - 1) * d + d_p * 3;
      if (denominator == 0) return false;
      d = numerator / denominator;
      if (iterations_used) *iterations_used = i + 1;
      if (AbsDiff(d, prev) <= 1) return true;
    }
    return false;
  }

  bool ComputeY(uint64_t amp, const uint256& x_new, const uint256& d, unsigned max_iterations, uint256& y,
                unsigned* iterations_used) {
    if (iterations_used) *iterations_used = 0;
    if (x_new == 0) return false;
    uint256 ann = static_cast<uint256>(amp) * 4;
    uint256 c = d * d * d / (x_new * ann * 4);
    uint256 b = x_new + d / ann;
    y = d;
    for (unsigned i = 0; i < max_iterations; ++i) {
      uint256 prev = y;
      uint256 lhs = y * 2 + b;
      if (lhs <= d) return false;
      y = (y * y + c) / (lhs - d);
      if (iterations_used) *iterations_used = i + 1;
      if (AbsDiff(y, prev) <= 1) return true;
    }
    return false;
  }

  Decimal SpotPrice(uint64_t amp, const Decimal& x, const Decimal& y, const Decimal& d) {
    Decimal ann = Decimal(amp) * 4;
    Decimal d3 = d * d * d;
    Decimal dfdx = ann + d3 / (4 * x * x * y);
    Decimal dfdy = ann + d3 / (4 * x * y * y);
    return dfdx / dfdy;
  }

  uint64_t RampedAmp(uint64_t initial_amp, uint64_t target_amp, int64_t ramp_start_s, int64_t ramp_stop_s,
                     int64_t now_s) {
    if (ramp_stop_s <= ramp_start_s || now_s >= ramp_stop_s) return target_amp;
    if (now_s <= ramp_start_s) return initial_amp;
    int64_t elapsed = now_s - ramp_start_s;
    int64_t duration = ramp_stop_s - ramp_start_s;
    if (target_amp >= initial_amp) {
      return initial_amp + static_cast<uint64_t>(
        static_cast<uint128>(target_amp - initial_amp) * static_cast<uint64_t>(elapsed) / static_cast<uint64_t>(duration));
    }
    return initial_amp - static_cast<uint64_t>(
      static_cast<uint128>(initial_amp - target_amp) * static_cast<uint64_t>(elapsed) / static_cast<uint64_t>(duration));
  }
}

namespace {
  // Exact real-valued y on the invariant for a given x and D: y^2 + (b - D) y - c = 0
  Decimal IdealY(const Decimal& ann, const Decimal& x, const Decimal& d) {
    Decimal c = d * d * d / (4 * x * ann);
    Decimal b = x + d / ann;
    Decimal k = b - d;
    return (boost::multiprecision::sqrt(k * k + 4 * c) - k) / 2;
  }
}

bool QuoteStable(const PoolState& pool, const StableState& state, const SwapRequest& request,
                 unsigned max_iterations, QuoteResult& out, QuoteError& err) {
  using namespace StableSwapMath;
  if (state.amp < kMinAmp || state.amp > kMaxAmp) {
    err = {QuoteErrorCode::ConvergenceError, "amplification " + std::to_string(state.amp) + " outside supported range"};
    return false;
  }
  bool a_to_b = request.input.mint == pool.token_a.mint;
  uint64_t reserve_in = a_to_b ? state.reserve_a : state.reserve_b;
  uint64_t reserve_out = a_to_b ? state.reserve_b : state.reserve_a;
  if (reserve_in == 0 || reserve_out == 0) {
    err = {QuoteErrorCode::InsufficientLiquidity, "empty reserve"};
    return false;
  }
  uint64_t hi = std::max(reserve_in, reserve_out);
  uint64_t lo = std::min(reserve_in, reserve_out);
  if (hi / lo > kMaxReserveRatio) {
    err = {QuoteErrorCode::ConvergenceError, "reserve ratio outside supported range"};
    return false;
  }
  uint256 x = reserve_in;
  uint256 y = reserve_out;
  uint256 d;
  if (!ComputeD(state.amp, x, y, max_iterations, d)) {
    err = {QuoteErrorCode::ConvergenceError, "invariant D did not converge in " + std::to_string(max_iterations) + " iterations"};
    return false;
  }
  uint256 x_new = x + request.amount_in;
  uint256 y_new;
  if (!ComputeY(state.amp, x_new, d, max_iterations, y_new)) {
    err = {QuoteErrorCode::ConvergenceError, "reserve y did not converge in " + std::to_string(max_iterations) + " iterations"};
    return false;
  }
  if (y_new + 1 >= y) {
    err = {QuoteErrorCode::InsufficientLiquidity, "output rounds to zero"};
    return false;
  }
  uint256 dy = y - y_new - 1;
  uint256 fee = dy * state.fee_bps / 10000;
  uint256 amount_out = dy - fee;
  if (amount_out == 0) {
    err = {QuoteErrorCode::InsufficientLiquidity, "output rounds to zero"};
    return false;
  }

  Decimal ann = Decimal(state.amp) * 4;
  Decimal dd = Numeric::ToDecimal(d);
  Decimal x0 = Numeric::ToDecimal(x);
  Decimal y0 = IdealY(ann, x0, dd);
  Decimal y1 = IdealY(ann, x0 + Decimal(request.amount_in), dd);
  Decimal spot = SpotPrice(state.amp, x0, y0, dd);
  Decimal effective = (y0 - y1) / Decimal(request.amount_in);
  Decimal impact = (1 - effective / spot) * 100;
  if (impact < 0) impact = 0;

  out.a_to_b = a_to_b;
  out.amount_in = request.amount_in;
  out.amount_out = static_cast<uint64_t>(amount_out);
  out.fee_amount = static_cast<uint64_t>(fee);
  out.price_impact_pct = impact;
  return true;
}
