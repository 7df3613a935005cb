#pragma once
#include "quotes/quote_types.hpp"

namespace ConstantProductMath {
  // amount_out = reserve_out - ceil(k / (reserve_in + amount_in_after_fee))
  bool GetAmountOut(uint64_t amount_in, uint64_t reserve_in, uint64_t reserve_out, uint32_t fee_bps,
                    uint64_t& amount_out, uint64_t& fee_amount, QuoteError& err);

  // Ideal (unrounded) impact of amount_in_after_fee against spot, in percent
  Decimal PriceImpactPct(uint64_t amount_in_after_fee, uint64_t reserve_in);
}

bool QuoteConstantProduct(const PoolState& pool, const ConstantProductState& state, const SwapRequest& request,
                          QuoteResult& out, QuoteError& err);
