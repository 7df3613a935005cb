#pragma once
#include "cache/cache_layer.hpp"
#include "common/errors.hpp"
#include "quotes/quote_engine.hpp"
#include "scheduler/thread_pool.hpp"
#include <memory>
#include <vector>

struct RouterOptions {
  QuoteEngineOptions engine;
  // Wall time allowed for the whole fan-out
  int64_t deadline_ms = 2000;
  // 0 disables the filter
  double max_price_impact_pct = 0.0;
};

// Successful quotes best-first plus every pool that did not produce one.
struct RankedQuotes {
  std::vector<QuoteResult> quotes;
  std::vector<PoolFailure> failures;

  bool Empty() const { return quotes.empty(); }
  const QuoteResult& Best() const { return quotes.front(); }
};

struct Route {
  QuoteResult quote;
  uint32_t slippage_bps = 0;
  uint64_t minimum_output = 0;
};

class RouteSelector {
public:
  RouteSelector(ThreadPool& workers, CacheLayer& cache, RouterOptions options);

  // Quotes every pool concurrently. Never throws for per-pool problems.
  RankedQuotes Rank(const std::vector<std::shared_ptr<const PoolState>>& pools, const SwapRequest& request);

  // Best quote; NoRouteFound when no pool produced one
  QuoteResult SelectBest(const std::vector<std::shared_ptr<const PoolState>>& pools, const SwapRequest& request,
                         std::vector<PoolFailure>* failures = nullptr);

  // Higher output, then lower price impact, then lower pool address
  static bool Better(const QuoteResult& a, const QuoteResult& b);

private:
  static bool QuoteOne(CacheLayer& cache, const QuoteEngineOptions& engine, const PoolState& pool,
                       const SwapRequest& request, QuoteResult& out, QuoteError& err);

  ThreadPool& workers_;
  CacheLayer& cache_;
  RouterOptions options_;
};
