#pragma once
#include "cache/cache_layer.hpp"
#include "node_connection/chain_data_source.hpp"
#include "pools/pool_state.hpp"
#include <vector>

// Resolves mint -> TokenRef through the token namespace of the cache.
class TokenMetadataCache {
public:
  TokenMetadataCache(ChainDataSource& chain, CacheLayer& cache) : chain_(chain), cache_(cache) {}

  // Throws DecodeError for a missing or malformed mint account
  TokenRef Resolve(const Pubkey& mint);
  // One batched fetch for every mint not already cached
  std::vector<TokenRef> ResolveMany(const std::vector<Pubkey>& mints);
  // Decimals already known from a pool account
  TokenRef Put(const Pubkey& mint, uint8_t decimals);
  bool TryGet(const Pubkey& mint, TokenRef& out) const;

  // Symbol for WSOL, USDC, USDT and RAY; empty otherwise
  static std::string KnownSymbol(const Pubkey& mint);
private:
  ChainDataSource& chain_;
  CacheLayer& cache_;
};
