#pragma once
#include "common/clock.hpp"
#include "node_connection/chain_data_source.hpp"
#include "scheduler/retry_backoff.hpp"
#include <string>

// Retries reads that fail with a transient error, sleeping on the backoff schedule
// between attempts. SendTransaction and GetSignatureStatus pass straight through:
// SwapSubmitter decides when a broadcast is repeated.
class RetryingChainDataSource : public ChainDataSource {
public:
  RetryingChainDataSource(ChainDataSource& inner, Clock& clock, RetryBackoff backoff)
    : inner_(inner), clock_(clock), backoff_(backoff) {}

  std::vector<std::optional<AccountInfo>> GetMultipleAccounts(const std::vector<Pubkey>& keys) override;
  std::vector<Pubkey> GetProgramAccountKeys(const Pubkey& program, const ProgramAccountFilter& filter) override;
  LatestBlockhash GetLatestBlockhash() override;
  SimulationResult SimulateTransaction(const std::vector<uint8_t>& wire_tx,
                                       const std::vector<Pubkey>& accounts) override;
  std::string SendTransaction(const std::vector<uint8_t>& wire_tx) override;
  SignatureStatus GetSignatureStatus(const std::string& signature) override;

private:
  template <typename Call>
  auto WithRetry(const char* method, Call call) -> decltype(call());

  ChainDataSource& inner_;
  Clock& clock_;
  RetryBackoff backoff_;
};
