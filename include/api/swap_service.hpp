#pragma once
#include "cache/cache_layer.hpp"
#include "cache/token_metadata.hpp"
#include "common/clock.hpp"
#include "config/swap_config.hpp"
#include "discovery/pool_registry.hpp"
#include "node_connection/retrying_chain_data_source.hpp"
#include "protection/slippage_guard.hpp"
#include "routing/route_selector.hpp"
#include "scheduler/thread_pool.hpp"
#include "transaction/submitter.hpp"
#include <memory>
#include <vector>

struct PoolSummary {
  Pubkey address;
  PoolProgram program = PoolProgram::AmmV4;
  PoolKind kind = PoolKind::ConstantProduct;
  TokenRef token_a;
  TokenRef token_b;
  uint64_t vault_balance_a = 0;
  uint64_t vault_balance_b = 0;
  uint32_t fee_bps = 0;
  // Whole token_b per whole token_a
  Decimal spot_price = 0;
  Decimal liquidity_quote = 0;
  int64_t observed_at_ms = 0;
};

PoolSummary Summarize(const PoolState& pool);

// Caller-facing entry point: quotes, swaps and pool listings.
class SwapService {
public:
  // signer may be null; ExecuteSwap then throws ConfigError
  SwapService(const SwapConfig& config, ChainDataSource& chain, Clock& clock,
              const TransactionSigner* signer = nullptr);

  // Ranked quotes across every pool for the pair. Throws NoRouteFound when none quoted.
  RankedQuotes GetQuotes(const SwapRequest& request);

  // Quotes, guards, simulates and submits through the best pool. 0 selects the default slippage.
  TransactionReport ExecuteSwap(const SwapRequest& request, uint32_t slippage_bps);

  // SOL <-> wSOL in the signer's associated account. actual_output is the wrapped or released amount.
  TransactionReport WrapSol(uint64_t lamports);
  TransactionReport UnwrapSol();

  std::vector<PoolSummary> ListPools(const Pubkey& token_a, const Pubkey& token_b);
  std::vector<PoolSummary> FindPoolsForToken(const Pubkey& token);
  TokenRef ResolveToken(const Pubkey& mint);

private:
  struct Candidates {
    RankedQuotes ranked;
    std::vector<std::shared_ptr<const PoolState>> pools;
  };

  Candidates Rank(const SwapRequest& request);
  SwapRequest Normalize(const SwapRequest& request);

  SwapConfig config_;
  // Every component reads through the retrying wrapper
  RetryingChainDataSource chain_;
  Clock& clock_;
  const TransactionSigner* signer_;
  CacheLayer cache_;
  TokenMetadataCache tokens_;
  PoolRegistry registry_;
  SlippageGuard guard_;
  SwapBuilder builder_;
  // Declared after the cache so queued quote tasks finish before it is destroyed
  ThreadPool workers_;
  RouteSelector router_;
  std::unique_ptr<SwapSubmitter> submitter_;
};
