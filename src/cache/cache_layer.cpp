#include "cache/cache_layer.hpp"

CacheLayer::CacheLayer(const Clock& clock, const CacheTtls& ttls)
  : clock_(clock),
    pools_(clock, ttls.pools_ms),
    tokens_(clock, ttls.tokens_ms),
    quotes_(clock, ttls.quotes_ms),
    pool_index_(clock, ttls.pool_index_ms) {}

void CacheLayer::Clear() {
  pools_.Clear();
  tokens_.Clear();
  quotes_.Clear();
  pool_index_.Clear();
}

std::string CacheLayer::PairKey(const Pubkey& a, const Pubkey& b) {
  // order-independent
  const Pubkey& lo = a < b ? a : b;
  const Pubkey& hi = a < b ? b : a;
  return "pair:" + lo.ToBase58() + ":" + hi.ToBase58();
}

std::string CacheLayer::TokenKey(const Pubkey& mint) { return "token:" + mint.ToBase58(); }

std::string CacheLayer::QuoteKey(const PoolState& pool, const SwapRequest& request) {
  return pool.address.ToBase58() + "|" + std::to_string(pool.observed_at_ms) + "|" +
         request.input.mint.ToBase58() + ">" + request.output.mint.ToBase58() + "|" +
         std::to_string(request.amount_in);
}
