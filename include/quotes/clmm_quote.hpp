#pragma once
#include "quotes/quote_types.hpp"

// Tick-by-tick exact-input traversal over the loaded tick arrays.
// Fills amount_out, fee_amount, price_impact_pct and the step trace.
bool QuoteClmm(const PoolState& pool, const ClmmState& state, const SwapRequest& request, QuoteResult& out,
               QuoteError& err);

// Raw token_b per raw token_a at the current sqrt price
Decimal ClmmSpotPrice(const ClmmState& state);
