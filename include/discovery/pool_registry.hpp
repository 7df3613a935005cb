#pragma once
#include "cache/cache_layer.hpp"
#include "cache/token_metadata.hpp"
#include "common/errors.hpp"
#include "node_connection/chain_data_source.hpp"
#include "pools/pool_state.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct RegistryOptions {
  // Pools valued below this many whole quote-token units are left out
  double min_liquidity_quote = 0.0;
  // Tick arrays loaded on each side of the current one
  int tick_array_radius = 3;
  std::vector<PoolProgram> programs = {PoolProgram::AmmV4, PoolProgram::CpSwap, PoolProgram::Stable, PoolProgram::Clmm};
};

struct RegistryResult {
  std::vector<std::shared_ptr<const PoolState>> pools;
  std::vector<PoolFailure> failures;
};

// Discovers pool accounts for a pair or a token and keeps decoded PoolState values
// in the pool namespace of the cache.
class PoolRegistry {
public:
  PoolRegistry(ChainDataSource& chain, CacheLayer& cache, TokenMetadataCache& tokens, RegistryOptions options);

  RegistryResult PoolsForPair(const Pubkey& mint_a, const Pubkey& mint_b);
  RegistryResult PoolsForToken(const Pubkey& mint);

  // Cached values still fresh are reused; the rest are fetched in two batched passes
  RegistryResult LoadPools(const std::vector<Pubkey>& addresses);

  std::vector<Pubkey> DiscoverPair(const Pubkey& mint_a, const Pubkey& mint_b);
  std::vector<Pubkey> DiscoverToken(const Pubkey& mint);

private:
  struct PendingPool;

  std::vector<std::optional<AccountInfo>> FetchAccounts(const std::vector<Pubkey>& keys);
  std::vector<Pubkey> Discover(const std::string& index_key, bool pair, const Pubkey& mint_a, const Pubkey& mint_b);
  bool DecodePhaseOne(const Pubkey& address, const AccountInfo& account, int64_t now_ms, PendingPool& pending,
                      std::vector<PoolFailure>& failures);
  void CollectDependencies(const PendingPool& pending, std::vector<Pubkey>& keys) const;
  bool Assemble(PendingPool& pending, const std::unordered_map<Pubkey, const AccountInfo*, PubkeyHash>& deps,
                PoolState& out, std::vector<PoolFailure>& failures);
  bool PassesLiquidityFilter(const PoolState& pool, std::vector<PoolFailure>& failures) const;

  ChainDataSource& chain_;
  CacheLayer& cache_;
  TokenMetadataCache& tokens_;
  RegistryOptions options_;
};
