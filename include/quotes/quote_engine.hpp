#pragma once
#include "quotes/quote_types.hpp"
#include "quotes/stable_swap.hpp"

struct QuoteEngineOptions {
  unsigned stable_max_iterations = StableSwapMath::kDefaultMaxIterations;
  int64_t pool_ttl_ms = 30000;  // valid_until = observed_at + pool_ttl_ms
};

// Dispatches to the engine for the pool's curve. Never throws for pool-specific problems;
// those come back through err.
bool QuotePool(const PoolState& pool, const SwapRequest& request, const QuoteEngineOptions& options,
               QuoteResult& out, QuoteError& err);

// Raw token_b units per raw token_a unit at the current pool state, before fees. Zero when undefined.
Decimal SpotPriceRaw(const PoolState& pool);

// Vault balances valued in whole token_b units
Decimal LiquidityInQuote(const PoolState& pool);
