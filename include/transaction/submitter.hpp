#pragma once
#include "common/clock.hpp"
#include "node_connection/chain_data_source.hpp"
#include "protection/slippage_guard.hpp"
#include "scheduler/retry_backoff.hpp"
#include "transaction/swap_builder.hpp"
#include "transaction/transaction_report.hpp"
#include "wallet/signer.hpp"

struct SubmitterOptions {
  RetryBackoff backoff;
  int64_t confirmation_timeout_ms = 60000;
  int64_t poll_interval_ms = 500;
};

// Built -> Simulated -> Submitted -> Confirmed | Failed | TimedOut
class SwapSubmitter {
public:
  SwapSubmitter(ChainDataSource& chain, const TransactionSigner& signer, SwapBuilder& builder, Clock& clock,
                SubmitterOptions options);

  // Throws SimulationFailed when the dry run fails or undershoots route.minimum_output; nothing is sent then.
  // Submission outcomes, including Failed and TimedOut, are returned in the report.
  TransactionReport Execute(const PoolState& pool, const Route& route);

  // Same protocol for plans that are not swaps, such as wrapping SOL. The dry run only has to
  // succeed. Throws SimulationFailed otherwise.
  TransactionReport Submit(const SwapPlan& plan);

private:
  enum class Outcome { Confirmed, Failed, Retry };

  uint64_t ReadBalance(const Pubkey& token_account);
  uint64_t Simulate(const Message& message, const SwapPlan& plan, uint64_t balance_before);
  // Sign, send and confirm until a terminal state; report.status is set on return
  void Broadcast(const SwapPlan& plan, Message message, TransactionReport& report);
  Outcome SendAndConfirm(const SwapPlan& plan, const SignedTransaction& tx, TransactionReport& report,
                         std::string& reason);
  Outcome Poll(const std::string& signature, std::string& reason);
  void Finish(const PoolState& pool, const SwapPlan& plan, uint64_t balance_before, TransactionReport& report);

  ChainDataSource& chain_;
  const TransactionSigner& signer_;
  SwapBuilder& builder_;
  Clock& clock_;
  SubmitterOptions options_;
};
