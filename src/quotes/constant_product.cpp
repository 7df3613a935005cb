#include "quotes/constant_product.hpp"

namespace ConstantProductMath {
  bool GetAmountOut(uint64_t amount_in, uint64_t reserve_in, uint64_t reserve_out, uint32_t fee_bps,
                    uint64_t& amount_out, uint64_t& fee_amount, QuoteError& err) {
    if (fee_bps > 10000) {
      err = {QuoteErrorCode::InvalidRequest, "fee above 10000 bps"};
      return false;
    }
    if (reserve_in == 0 || reserve_out == 0) {
      err = {QuoteErrorCode::InsufficientLiquidity, "empty reserve"};
      return false;
    }
    uint256 in_after_fee = static_cast<uint256>(amount_in) * (10000 - fee_bps) / 10000;
    fee_amount = static_cast<uint64_t>(static_cast<uint256>(amount_in) - in_after_fee);
    uint256 k = static_cast<uint256>(reserve_in) * reserve_out;
    uint256 new_reserve_in = static_cast<uint256>(reserve_in) + in_after_fee;
    uint256 new_reserve_out = Numeric::DivCeil(k, new_reserve_in);
    if (new_reserve_out >= reserve_out) {
      err = {QuoteErrorCode::InsufficientLiquidity, "input too small to move the pool"};
      return false;
    }
    uint256 out = static_cast<uint256>(reserve_out) - new_reserve_out;
    if (out >= reserve_out) {
      err = {QuoteErrorCode::InsufficientLiquidity, "output would drain reserve"};
      return false;
    }
    amount_out = static_cast<uint64_t>(out);
    return true;
  }

  Decimal PriceImpactPct(uint64_t amount_in_after_fee, uint64_t reserve_in) {
    if (amount_in_after_fee == 0) return Decimal(0);
    Decimal x(amount_in_after_fee);
    return x / (Decimal(reserve_in) + x) * 100;
  }
}

bool QuoteConstantProduct(const PoolState& pool, const ConstantProductState& state, const SwapRequest& request,
                          QuoteResult& out, QuoteError& err) {
  bool a_to_b = request.input.mint == pool.token_a.mint;
  uint64_t reserve_in = a_to_b ? state.reserve_a : state.reserve_b;
  uint64_t reserve_out = a_to_b ? state.reserve_b : state.reserve_a;
  uint64_t amount_out = 0, fee = 0;
  if (!ConstantProductMath::GetAmountOut(request.amount_in, reserve_in, reserve_out, state.fee_bps, amount_out, fee, err)) {
    return false;
  }
  out.a_to_b = a_to_b;
  out.amount_in = request.amount_in;
  out.amount_out = amount_out;
  out.fee_amount = fee;
  out.price_impact_pct = ConstantProductMath::PriceImpactPct(request.amount_in - fee, reserve_in);
  return true;
}
