#pragma once
#include "cache/ttl_cache.hpp"
#include "common/pubkey.hpp"
#include "pools/pool_state.hpp"
#include "quotes/quote_types.hpp"
#include <string>
#include <vector>

struct CacheTtls {
  int64_t pools_ms = 30000;
  int64_t tokens_ms = 300000;
  int64_t quotes_ms = 5000;
  int64_t pool_index_ms = 300000;
};

// All process-wide cached state, one namespace per kind of value.
class CacheLayer {
public:
  CacheLayer(const Clock& clock, const CacheTtls& ttls);

  TtlCache<Pubkey, PoolState, PubkeyHash>& Pools() { return pools_; }
  TtlCache<Pubkey, TokenRef, PubkeyHash>& Tokens() { return tokens_; }
  TtlCache<std::string, QuoteResult>& Quotes() { return quotes_; }
  // Discovery results: "pair:<a>:<b>" or "token:<mint>" -> pool addresses
  TtlCache<std::string, std::vector<Pubkey>>& PoolIndex() { return pool_index_; }

  const Clock& GetClock() const { return clock_; }
  void Clear();

  static std::string PairKey(const Pubkey& a, const Pubkey& b);
  static std::string TokenKey(const Pubkey& mint);
  static std::string QuoteKey(const PoolState& pool, const SwapRequest& request);

private:
  const Clock& clock_;
  TtlCache<Pubkey, PoolState, PubkeyHash> pools_;
  TtlCache<Pubkey, TokenRef, PubkeyHash> tokens_;
  TtlCache<std::string, QuoteResult> quotes_;
  TtlCache<std::string, std::vector<Pubkey>> pool_index_;
};
