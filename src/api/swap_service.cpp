#include "api/swap_service.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "quotes/quote_engine.hpp"
#include "telemetry/swap_events.hpp"
#include <algorithm>
#include <stdexcept>

namespace {
  RegistryOptions RegistryOptionsFrom(const SwapConfig& c) {
    RegistryOptions o;
    o.min_liquidity_quote = c.min_liquidity_quote;
    return o;
  }

  BuilderOptions BuilderOptionsFrom(const SwapConfig& c) {
    return BuilderOptions{c.submit.compute_unit_limit, c.submit.compute_unit_price, c.submit.lookup_tables};
  }

  RetryBackoff BackoffFrom(const SwapConfig& c) {
    return RetryBackoff(c.submit.retry_base_delay_ms, c.submit.retry_max_delay_ms, c.submit.max_retries);
  }

  SubmitterOptions SubmitterOptionsFrom(const SwapConfig& c) {
    SubmitterOptions o;
    o.backoff = BackoffFrom(c);
    o.confirmation_timeout_ms = c.submit.confirmation_timeout_ms;
    o.poll_interval_ms = c.submit.confirmation_poll_ms;
    return o;
  }

  std::vector<PoolSummary> Summaries(const RegistryResult& result) {
    std::vector<PoolSummary> out;
    out.reserve(result.pools.size());
    for (const auto& p : result.pools) out.push_back(Summarize(*p));
    for (const auto& f : result.failures) {
      Logger::Debug("Pool " + f.pool.ToBase58() + " skipped at " + f.stage + ": " + f.reason);
    }
    return out;
  }
}

PoolSummary Summarize(const PoolState& pool) {
  PoolSummary s;
  s.address = pool.address;
  s.program = pool.program;
  s.kind = pool.Kind();
  s.token_a = pool.token_a;
  s.token_b = pool.token_b;
  s.vault_balance_a = pool.vault_balance_a;
  s.vault_balance_b = pool.vault_balance_b;
  s.fee_bps = pool.FeeBps();
  s.spot_price = SpotPriceRaw(pool) * Numeric::Pow10(pool.token_a.decimals) / Numeric::Pow10(pool.token_b.decimals);
  s.liquidity_quote = LiquidityInQuote(pool);
  s.observed_at_ms = pool.observed_at_ms;
  return s;
}

SwapService::SwapService(const SwapConfig& config, ChainDataSource& chain, Clock& clock,
                         const TransactionSigner* signer)
  : config_(config),
    chain_(chain, clock, BackoffFrom(config)),
    clock_(clock),
    signer_(signer),
    cache_(clock, config.ttls),
    tokens_(chain_, cache_),
    registry_(chain_, cache_, tokens_, RegistryOptionsFrom(config)),
    guard_(config.slippage),
    builder_(chain_, BuilderOptionsFrom(config)),
    workers_(config.worker_threads),
    router_(workers_, cache_, config.router) {
  if (signer_) submitter_ = std::make_unique<SwapSubmitter>(chain_, *signer_, builder_, clock_, SubmitterOptionsFrom(config));
}

TokenRef SwapService::ResolveToken(const Pubkey& mint) {
  return tokens_.Resolve(mint);
}

SwapRequest SwapService::Normalize(const SwapRequest& request) {
  if (request.amount_in == 0) throw std::invalid_argument("amount_in must be positive");
  if (request.input.mint == request.output.mint) throw std::invalid_argument("input and output mint are the same");
  auto tokens = tokens_.ResolveMany({request.input.mint, request.output.mint});
  SwapRequest out = request;
  out.input = tokens[0];
  out.output = tokens[1];
  out.slippage_bps = guard_.ClampSlippageBps(request.slippage_bps);
  return out;
}

SwapService::Candidates SwapService::Rank(const SwapRequest& request) {
  Candidates c;
  size_t expired = cache_.Quotes().Prune();
  if (expired > 0) Logger::Debug("Dropped " + std::to_string(expired) + " expired quote(s)");
  RegistryResult found = registry_.PoolsForPair(request.input.mint, request.output.mint);
  c.pools = std::move(found.pools);
  c.ranked = router_.Rank(c.pools, request);
  c.ranked.failures.insert(c.ranked.failures.begin(), found.failures.begin(), found.failures.end());
  if (c.ranked.Empty()) {
    std::string what = c.pools.empty()
      ? "no pools for " + request.input.Label() + "/" + request.output.Label()
      : "all " + std::to_string(c.pools.size()) + " pool(s) failed to quote";
    throw NoRouteFound(what, c.ranked.failures);
  }
  Logger::Info("Best of " + std::to_string(c.ranked.quotes.size()) + " quote(s) for " + request.input.Label() + "->" +
               request.output.Label() + ": " + std::to_string(c.ranked.Best().amount_out) + " via " +
               c.ranked.Best().pool.ToBase58() + " (" + ToString(c.ranked.Best().program) + ")");
  return c;
}

RankedQuotes SwapService::GetQuotes(const SwapRequest& request) {
  return Rank(Normalize(request)).ranked;
}

TransactionReport SwapService::ExecuteSwap(const SwapRequest& request, uint32_t slippage_bps) {
  if (!submitter_) throw ConfigError("WALLET_PRIVATE_KEY is required to execute swaps");
  SwapRequest r = request;
  r.slippage_bps = slippage_bps;
  r = Normalize(r);

  Candidates c = Rank(r);
  const QuoteResult& best = c.ranked.Best();
  SwapEvents::QuoteSelected(r, best, c.ranked.quotes.size(), c.ranked.failures);

  auto pool = std::find_if(c.pools.begin(), c.pools.end(),
                           [&](const std::shared_ptr<const PoolState>& p) { return p->address == best.pool; });
  if (pool == c.pools.end()) throw std::logic_error("selected pool " + best.pool.ToBase58() + " not in candidates");

  Route route{best, r.slippage_bps, SlippageGuard::MinimumOutput(best.amount_out, r.slippage_bps)};
  Logger::Info("Executing swap of " + std::to_string(r.amount_in) + " " + r.input.Label() + " with minimum output " +
               std::to_string(route.minimum_output) + " (" + std::to_string(r.slippage_bps) + " bps)");
  return submitter_->Execute(**pool, route);
}

TransactionReport SwapService::WrapSol(uint64_t lamports) {
  if (!submitter_) throw ConfigError("WALLET_PRIVATE_KEY is required to wrap SOL");
  if (lamports == 0) throw std::invalid_argument("wrap amount must be positive");
  const Pubkey owner = signer_->PublicKey();
  WrappedSolAccount before = builder_.ReadWrappedSol(owner);
  Logger::Info("Wrapping " + std::to_string(lamports) + " lamports into " + before.address.ToBase58());
  TransactionReport report = submitter_->Submit(builder_.PlanWrap(owner, lamports));
  if (report.Succeeded()) {
    WrappedSolAccount after = builder_.ReadWrappedSol(owner);
    report.actual_output = after.balance > before.balance ? after.balance - before.balance : 0;
  }
  return report;
}

TransactionReport SwapService::UnwrapSol() {
  if (!submitter_) throw ConfigError("WALLET_PRIVATE_KEY is required to unwrap SOL");
  WrappedSolAccount wsol = builder_.ReadWrappedSol(signer_->PublicKey());
  if (!wsol.exists) throw std::runtime_error("no wrapped SOL account " + wsol.address.ToBase58());
  if (wsol.balance == 0) throw std::runtime_error("wrapped SOL account " + wsol.address.ToBase58() + " is empty");
  Logger::Info("Unwrapping " + std::to_string(wsol.balance) + " lamports from " + wsol.address.ToBase58());
  TransactionReport report = submitter_->Submit(builder_.PlanUnwrap(signer_->PublicKey()));
  report.expected_output = wsol.balance;
  if (report.Succeeded()) report.actual_output = wsol.balance;
  return report;
}

std::vector<PoolSummary> SwapService::ListPools(const Pubkey& token_a, const Pubkey& token_b) {
  return Summaries(registry_.PoolsForPair(token_a, token_b));
}

std::vector<PoolSummary> SwapService::FindPoolsForToken(const Pubkey& token) {
  return Summaries(registry_.PoolsForToken(token));
}
