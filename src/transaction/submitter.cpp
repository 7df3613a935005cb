#include "transaction/submitter.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "constants/solana.hpp"
#include "discovery/pool_decoder.hpp"
#include "telemetry/swap_events.hpp"

std::string ToString(TransactionState state) {
  switch (state) {
    case TransactionState::Built: return "built";
    case TransactionState::Simulated: return "simulated";
    case TransactionState::Submitted: return "submitted";
    case TransactionState::Confirmed: return "confirmed";
    case TransactionState::Failed: return "failed";
    case TransactionState::TimedOut: return "timed_out";
  }
  return "unknown";
}

SwapSubmitter::SwapSubmitter(ChainDataSource& chain, const TransactionSigner& signer, SwapBuilder& builder,
                             Clock& clock, SubmitterOptions options)
  : chain_(chain), signer_(signer), builder_(builder), clock_(clock), options_(options) {}

uint64_t SwapSubmitter::ReadBalance(const Pubkey& token_account) {
  auto accounts = chain_.GetMultipleAccounts({token_account});
  if (accounts.empty() || !accounts[0]) return 0;
  return PoolDecoder::DecodeTokenAccount(token_account, accounts[0]->data).amount;
}

uint64_t SwapSubmitter::Simulate(const Message& message, const SwapPlan& plan, uint64_t balance_before) {
  const Route& route = plan.route;
  // Placeholder signatures; the node skips verification for simulations
  SignedTransaction unsigned_tx{message, std::vector<Signature>(message.header.num_required_signatures, Signature{})};
  SimulationResult sim = chain_.SimulateTransaction(unsigned_tx.Serialize(), {plan.output_account});
  if (!sim.success) {
    SimulationFailed failure(sim.error.empty() ? "simulation rejected" : sim.error, 0, route.minimum_output);
    SwapEvents::SimulationRejected(route, failure);
    throw failure;
  }
  uint64_t after = 0;
  if (!sim.accounts.empty() && sim.accounts[0]) {
    after = PoolDecoder::DecodeTokenAccount(plan.output_account, sim.accounts[0]->data).amount;
  }
  uint64_t simulated_out = after > balance_before ? after - balance_before : 0;
  if (simulated_out < route.minimum_output) {
    SimulationFailed failure("simulated output " + std::to_string(simulated_out) + " below minimum " +
                             std::to_string(route.minimum_output), simulated_out, route.minimum_output);
    SwapEvents::SimulationRejected(route, failure);
    throw failure;
  }
  Logger::Debug("Simulation ok: out=" + std::to_string(simulated_out) + " units=" + std::to_string(sim.units_consumed));
  return simulated_out;
}

SwapSubmitter::Outcome SwapSubmitter::Poll(const std::string& signature, std::string& reason) {
  int64_t deadline = clock_.NowMs() + options_.confirmation_timeout_ms;
  while (true) {
    try {
      SignatureStatus status = chain_.GetSignatureStatus(signature);
      if (status.state == SignatureState::Confirmed || status.state == SignatureState::Finalized) return Outcome::Confirmed;
      if (status.state == SignatureState::Failed) {
        reason = "transaction failed on chain: " + status.error;
        return Outcome::Failed;
      }
    } catch (const std::exception& e) {
      if (!IsTransientError(e)) {
        reason = e.what();
        return Outcome::Failed;
      }
      Logger::Debug(std::string("Status poll error, still waiting: ") + e.what());
    }
    if (clock_.NowMs() >= deadline) {
      reason = "not confirmed within " + std::to_string(options_.confirmation_timeout_ms) + " ms";
      return Outcome::Retry;
    }
    clock_.SleepMs(options_.poll_interval_ms);
  }
}

SwapSubmitter::Outcome SwapSubmitter::SendAndConfirm(const SwapPlan& plan, const SignedTransaction& tx,
                                                     TransactionReport& report, std::string& reason) {
  try {
    std::string sig = chain_.SendTransaction(tx.Serialize());
    if (!sig.empty() && sig != tx.Id()) Logger::Warning("Node returned signature " + sig + ", expected " + tx.Id());
  } catch (const std::exception& e) {
    reason = e.what();
    return IsTransientError(e) ? Outcome::Retry : Outcome::Failed;
  }
  report.status = TransactionState::Submitted;
  if (plan.is_swap) SwapEvents::SubmissionAttempt(report.route, report.attempts, report.signature, report.format);
  return Poll(report.signature, reason);
}

void SwapSubmitter::Finish(const PoolState& pool, const SwapPlan& plan, uint64_t balance_before,
                           TransactionReport& report) {
  const QuoteResult& q = plan.route.quote;
  try {
    uint64_t after = ReadBalance(plan.output_account);
    report.actual_output = after > balance_before ? after - balance_before : 0;
  } catch (const std::exception& e) {
    Logger::Warning("Swap " + report.signature + " confirmed but output balance unreadable: " + e.what());
    report.error = std::string("output balance unreadable: ") + e.what();
    return;
  }
  const TokenRef& in = q.a_to_b ? pool.token_a : pool.token_b;
  const TokenRef& out = q.a_to_b ? pool.token_b : pool.token_a;
  Decimal in_whole = Decimal(q.amount_in) / Numeric::Pow10(in.decimals);
  if (in_whole > 0) report.actual_price = (Decimal(report.actual_output) / Numeric::Pow10(out.decimals)) / in_whole;
  if (report.expected_output > 0) {
    report.realized_slippage_pct = (Decimal(report.expected_output) - Decimal(report.actual_output)) * 100 /
                                   Decimal(report.expected_output);
  }
}

void SwapSubmitter::Broadcast(const SwapPlan& plan, Message message, TransactionReport& report) {
  const std::string label = plan.is_swap ? plan.route.quote.pool.ToBase58() : std::string("wSOL account");
  std::vector<std::string> sent;
  std::string reason;
  while (true) {
    ++report.attempts;
    Outcome outcome = Outcome::Retry;
    // An earlier broadcast may still land; never send a replacement once one has
    for (const auto& previous : sent) {
      try {
        SignatureStatus s = chain_.GetSignatureStatus(previous);
        if (s.state == SignatureState::Confirmed || s.state == SignatureState::Finalized) {
          report.signature = previous;
          outcome = Outcome::Confirmed;
          break;
        }
      } catch (const std::exception& e) {
        if (IsTransientError(e)) continue;
        reason = e.what();
        outcome = Outcome::Failed;
        break;
      }
    }
    if (outcome == Outcome::Retry) {
      try {
        if (report.attempts > 1) message = builder_.Compile(plan, chain_.GetLatestBlockhash().blockhash);
        SignedTransaction tx = SignMessage(message, {&signer_});
        report.signature = tx.Id();
        sent.push_back(report.signature);
        outcome = SendAndConfirm(plan, tx, report, reason);
      } catch (const std::exception& e) {
        reason = e.what();
        outcome = IsTransientError(e) ? Outcome::Retry : Outcome::Failed;
      }
    }

    if (outcome == Outcome::Confirmed) {
      report.status = TransactionState::Confirmed;
      report.error.clear();
      return;
    }
    if (outcome == Outcome::Failed) {
      report.status = TransactionState::Failed;
      report.error = reason;
      return;
    }
    if (!options_.backoff.CanRetry(report.attempts)) {
      report.status = TransactionState::TimedOut;
      report.error = reason;
      return;
    }
    int64_t delay = options_.backoff.DelayAfter(report.attempts);
    Logger::Warning("Attempt " + std::to_string(report.attempts) + " for " + label + " did not confirm (" + reason +
                    "); retrying in " + std::to_string(delay) + " ms");
    if (plan.is_swap) SwapEvents::RetryScheduled(plan.route, report.attempts, delay, reason);
    clock_.SleepMs(delay);
  }
}

TransactionReport SwapSubmitter::Execute(const PoolState& pool, const Route& route) {
  int64_t started = clock_.NowMs();
  TransactionReport report;
  report.route = route;
  report.expected_output = route.quote.amount_out;
  report.expected_price = route.quote.effective_price;

  const Pubkey owner = signer_.PublicKey();
  const TokenRef& in = route.quote.a_to_b ? pool.token_a : pool.token_b;
  WrappedSolAccount wsol;
  if (in.mint == Pubkey::FromBase58(SolanaConstants::WSOL_MINT)) wsol = builder_.ReadWrappedSol(owner);
  SwapPlan plan = builder_.Plan(pool, route, owner, wsol);
  report.status = TransactionState::Built;
  uint64_t balance_before = ReadBalance(plan.output_account);
  Message message = builder_.Compile(plan, chain_.GetLatestBlockhash().blockhash);
  report.format = message.format;

  Simulate(message, plan, balance_before);
  report.status = TransactionState::Simulated;

  Broadcast(plan, message, report);

  if (report.status == TransactionState::Confirmed) Finish(pool, plan, balance_before, report);
  report.elapsed_ms = clock_.NowMs() - started;
  SwapEvents::Terminal(report);
  Logger::Info("Swap " + ToString(report.status) + " after " + std::to_string(report.attempts) + " attempt(s): " +
               (report.signature.empty() ? "no signature" : report.signature) +
               (report.error.empty() ? "" : " (" + report.error + ")"));
  return report;
}

TransactionReport SwapSubmitter::Submit(const SwapPlan& plan) {
  int64_t started = clock_.NowMs();
  TransactionReport report;
  report.expected_output = plan.wrapped_lamports;
  Message message = builder_.Compile(plan, chain_.GetLatestBlockhash().blockhash);
  report.format = message.format;

  SignedTransaction unsigned_tx{message, std::vector<Signature>(message.header.num_required_signatures, Signature{})};
  SimulationResult sim = chain_.SimulateTransaction(unsigned_tx.Serialize(), {});
  if (!sim.success) throw SimulationFailed(sim.error.empty() ? "simulation rejected" : sim.error, 0, 0);
  report.status = TransactionState::Simulated;

  Broadcast(plan, message, report);
  report.elapsed_ms = clock_.NowMs() - started;
  Logger::Info("Transaction " + ToString(report.status) + " after " + std::to_string(report.attempts) +
               " attempt(s): " + (report.signature.empty() ? "no signature" : report.signature) +
               (report.error.empty() ? "" : " (" + report.error + ")"));
  return report;
}
