#include "node_connection/retrying_chain_data_source.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

template <typename Call>
auto RetryingChainDataSource::WithRetry(const char* method, Call call) -> decltype(call()) {
  for (unsigned int attempt = 1;; ++attempt) {
    try {
      return call();
    } catch (const std::exception& e) {
      if (!IsTransientError(e) || !backoff_.CanRetry(attempt)) throw;
      int64_t delay = backoff_.DelayAfter(attempt);
      Logger::Warning(std::string(method) + " attempt " + std::to_string(attempt) + " failed (" + e.what() +
                      "); retrying in " + std::to_string(delay) + " ms");
      clock_.SleepMs(delay);
    }
  }
}

std::vector<std::optional<AccountInfo>> RetryingChainDataSource::GetMultipleAccounts(const std::vector<Pubkey>& keys) {
  return WithRetry("getMultipleAccounts", [&] { return inner_.GetMultipleAccounts(keys); });
}

std::vector<Pubkey> RetryingChainDataSource::GetProgramAccountKeys(const Pubkey& program,
                                                                   const ProgramAccountFilter& filter) {
  return WithRetry("getProgramAccounts", [&] { return inner_.GetProgramAccountKeys(program, filter); });
}

LatestBlockhash RetryingChainDataSource::GetLatestBlockhash() {
  return WithRetry("getLatestBlockhash", [&] { return inner_.GetLatestBlockhash(); });
}

SimulationResult RetryingChainDataSource::SimulateTransaction(const std::vector<uint8_t>& wire_tx,
                                                              const std::vector<Pubkey>& accounts) {
  return WithRetry("simulateTransaction", [&] { return inner_.SimulateTransaction(wire_tx, accounts); });
}

std::string RetryingChainDataSource::SendTransaction(const std::vector<uint8_t>& wire_tx) {
  return inner_.SendTransaction(wire_tx);
}

SignatureStatus RetryingChainDataSource::GetSignatureStatus(const std::string& signature) {
  return inner_.GetSignatureStatus(signature);
}
