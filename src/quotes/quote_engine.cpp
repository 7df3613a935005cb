#include "quotes/quote_engine.hpp"
#include "quotes/clmm_quote.hpp"
#include "quotes/constant_product.hpp"

std::string ToString(QuoteErrorCode code) {
  switch (code) {
    case QuoteErrorCode::InsufficientLiquidity: return "InsufficientLiquidity";
    case QuoteErrorCode::ConvergenceError: return "ConvergenceError";
    case QuoteErrorCode::MissingTickData: return "MissingTickData";
    case QuoteErrorCode::TokenNotInPool: return "TokenNotInPool";
    case QuoteErrorCode::InvalidRequest: return "InvalidRequest";
  }
  return "Unknown";
}

namespace {
  bool ValidateRequest(const PoolState& pool, const SwapRequest& request, QuoteError& err) {
    if (request.amount_in == 0) {
      err = {QuoteErrorCode::InvalidRequest, "amount_in must be positive"};
      return false;
    }
    if (request.input.mint == request.output.mint) {
      err = {QuoteErrorCode::InvalidRequest, "input and output mint are the same"};
      return false;
    }
    if (!pool.Contains(request.input.mint) || !pool.Contains(request.output.mint)) {
      err = {QuoteErrorCode::TokenNotInPool, pool.token_a.Label() + "/" + pool.token_b.Label()};
      return false;
    }
    if (pool.FeeBps() >= 10000) {
      err = {QuoteErrorCode::InvalidRequest, "fee rate " + std::to_string(pool.FeeBps()) + " bps"};
      return false;
    }
    return true;
  }
}

bool QuotePool(const PoolState& pool, const SwapRequest& request, const QuoteEngineOptions& options,
               QuoteResult& out, QuoteError& err) {
  if (!ValidateRequest(pool, request, err)) return false;

  QuoteResult result;
  bool ok = std::visit(Overloaded{
    [&](const ConstantProductState& s) { return QuoteConstantProduct(pool, s, request, result, err); },
    [&](const StableState& s) { return QuoteStable(pool, s, request, options.stable_max_iterations, result, err); },
    [&](const ClmmState& s) { return QuoteClmm(pool, s, request, result, err); },
  }, pool.curve);
  if (!ok) return false;

  result.pool = pool.address;
  result.kind = pool.Kind();
  result.program = pool.program;
  result.observed_at_ms = pool.observed_at_ms;
  result.valid_until_ms = pool.observed_at_ms + options.pool_ttl_ms;
  const TokenRef& in = result.a_to_b ? pool.token_a : pool.token_b;
  const TokenRef& outt = result.a_to_b ? pool.token_b : pool.token_a;
  Decimal whole_in = Decimal(result.amount_in) / Numeric::Pow10(in.decimals);
  Decimal whole_out = Decimal(result.amount_out) / Numeric::Pow10(outt.decimals);
  result.effective_price = whole_out / whole_in;
  out = std::move(result);
  return true;
}

Decimal SpotPriceRaw(const PoolState& pool) {
  return std::visit(Overloaded{
    [](const ConstantProductState& s) -> Decimal {
      if (s.reserve_a == 0) return Decimal(0);
      return Decimal(s.reserve_b) / Decimal(s.reserve_a);
    },
    [](const StableState& s) -> Decimal {
      if (s.reserve_a == 0 || s.reserve_b == 0 || s.amp < StableSwapMath::kMinAmp || s.amp > StableSwapMath::kMaxAmp) {
        return Decimal(0);
      }
      uint256 d;
      if (!StableSwapMath::ComputeD(s.amp, s.reserve_a, s.reserve_b, StableSwapMath::kDefaultMaxIterations, d)) {
        return Decimal(0);
      }
      return StableSwapMath::SpotPrice(s.amp, Decimal(s.reserve_a), Decimal(s.reserve_b), Numeric::ToDecimal(d));
    },
    [](const ClmmState& s) -> Decimal { return ClmmSpotPrice(s); },
  }, pool.curve);
}

Decimal LiquidityInQuote(const PoolState& pool) {
  Decimal value_b = Decimal(pool.vault_balance_b) + Decimal(pool.vault_balance_a) * SpotPriceRaw(pool);
  return value_b / Numeric::Pow10(pool.token_b.decimals);
}
