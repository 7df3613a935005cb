#include "routing/route_selector.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <chrono>
#include <future>

namespace {
  struct PoolOutcome {
    bool ok = false;
    QuoteResult quote;
    QuoteError error;
  };
}

RouteSelector::RouteSelector(ThreadPool& workers, CacheLayer& cache, RouterOptions options)
  : workers_(workers), cache_(cache), options_(options) {}

bool RouteSelector::Better(const QuoteResult& a, const QuoteResult& b) {
  if (a.amount_out != b.amount_out) return a.amount_out > b.amount_out;
  if (a.price_impact_pct != b.price_impact_pct) return a.price_impact_pct < b.price_impact_pct;
  return a.pool < b.pool;
}

bool RouteSelector::QuoteOne(CacheLayer& cache, const QuoteEngineOptions& engine, const PoolState& pool,
                             const SwapRequest& request, QuoteResult& out, QuoteError& err) {
  std::string key = CacheLayer::QuoteKey(pool, request);
  if (auto cached = cache.Quotes().Get(key)) {
    out = *cached;
    return true;
  }
  if (!QuotePool(pool, request, engine, out, err)) return false;
  cache.Quotes().Put(key, out);
  return true;
}

RankedQuotes RouteSelector::Rank(const std::vector<std::shared_ptr<const PoolState>>& pools,
                                 const SwapRequest& request) {
  RankedQuotes ranked;
  std::vector<std::future<PoolOutcome>> pending;
  pending.reserve(pools.size());
  for (const auto& pool : pools) {
    // Tasks can outlive this call when the deadline passes, so nothing of *this is captured
    CacheLayer* cache = &cache_;
    QuoteEngineOptions engine = options_.engine;
    pending.push_back(workers_.Submit([cache, engine, pool, request]{
      PoolOutcome outcome;
      outcome.ok = QuoteOne(*cache, engine, *pool, request, outcome.quote, outcome.error);
      return outcome;
    }));
  }

  Logger::Debug("Quoting " + std::to_string(pools.size()) + " pool(s), " + std::to_string(workers_.Pending()) +
                " task(s) queued");
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.deadline_ms);
  for (size_t i = 0; i < pending.size(); ++i) {
    const Pubkey& address = pools[i]->address;
    if (pending[i].wait_until(deadline) != std::future_status::ready) {
      ranked.failures.push_back({address, "quote", "deadline of " + std::to_string(options_.deadline_ms) + " ms exceeded"});
      continue;
    }
    PoolOutcome outcome;
    try {
      outcome = pending[i].get();
    } catch (const std::exception& e) {
      ranked.failures.push_back({address, "quote", e.what()});
      continue;
    }
    if (!outcome.ok) {
      ranked.failures.push_back({address, "quote", outcome.error.Describe()});
      continue;
    }
    if (options_.max_price_impact_pct > 0 && outcome.quote.price_impact_pct > Decimal(options_.max_price_impact_pct)) {
      ranked.failures.push_back({address, "filter", "price impact " + Numeric::Format(outcome.quote.price_impact_pct, 4) +
                                                     "% above " + std::to_string(options_.max_price_impact_pct) + "%"});
      continue;
    }
    ranked.quotes.push_back(std::move(outcome.quote));
  }
  std::sort(ranked.quotes.begin(), ranked.quotes.end(), Better);
  Logger::Debug("Ranked " + std::to_string(ranked.quotes.size()) + " quote(s), " +
                std::to_string(ranked.failures.size()) + " failure(s)");
  return ranked;
}

QuoteResult RouteSelector::SelectBest(const std::vector<std::shared_ptr<const PoolState>>& pools,
                                      const SwapRequest& request, std::vector<PoolFailure>* failures) {
  RankedQuotes ranked = Rank(pools, request);
  if (failures) *failures = ranked.failures;
  if (ranked.Empty()) {
    std::string what = pools.empty() ? "no pools for " + request.input.Label() + "/" + request.output.Label()
                                     : "all " + std::to_string(pools.size()) + " pool(s) failed to quote";
    throw NoRouteFound(what, ranked.failures);
  }
  return ranked.Best();
}
