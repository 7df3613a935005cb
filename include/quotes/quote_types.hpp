#pragma once
#include "common/numeric.hpp"
#include "pools/pool_state.hpp"
#include <cstdint>
#include <string>
#include <vector>

struct SwapRequest {
  TokenRef input;
  TokenRef output;
  uint64_t amount_in = 0;      // smallest unit of input, > 0
  uint32_t slippage_bps = 50;  // never above the configured cap
};

enum class QuoteErrorCode {
  InsufficientLiquidity,
  ConvergenceError,
  MissingTickData,
  TokenNotInPool,
  InvalidRequest,
};

std::string ToString(QuoteErrorCode code);

struct QuoteError {
  QuoteErrorCode code = QuoteErrorCode::InvalidRequest;
  std::string detail;

  std::string Describe() const { return ToString(code) + (detail.empty() ? "" : ": " + detail); }
};

// One segment of a concentrated-liquidity traversal.
struct ClmmStep {
  int32_t tick_start = 0;
  int32_t tick_target = 0;
  uint128 sqrt_price_start_x64 = 0;
  uint128 sqrt_price_end_x64 = 0;
  uint128 liquidity = 0;  // active liquidity while the step executed
  uint64_t amount_in = 0;  // excluding fee
  uint64_t amount_out = 0;
  uint64_t fee_amount = 0;
  bool crossed = false;   // reached and crossed an initialized tick
  int128 liquidity_net = 0;
};

struct QuoteResult {
  Pubkey pool;
  PoolKind kind = PoolKind::ConstantProduct;
  PoolProgram program = PoolProgram::AmmV4;
  bool a_to_b = true;
  uint64_t amount_in = 0;
  uint64_t amount_out = 0;
  // Fee charged; input token for constant-product and CLMM, output token for stable pools
  uint64_t fee_amount = 0;
  Decimal price_impact_pct = 0;
  // Output per input in whole tokens
  Decimal effective_price = 0;
  int64_t observed_at_ms = 0;
  int64_t valid_until_ms = 0;
  std::vector<ClmmStep> steps;
};
