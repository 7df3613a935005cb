#pragma once
#include "common/errors.hpp"
#include "quotes/quote_types.hpp"
#include "transaction/transaction_report.hpp"
#include <nlohmann/json.hpp>
#include <vector>

// Swap lifecycle events written to the StructuredLogger sink.
namespace SwapEvents {
  nlohmann::json QuoteToJson(const QuoteResult& quote);
  nlohmann::json ReportToJson(const TransactionReport& report);

  void QuoteSelected(const SwapRequest& request, const QuoteResult& best, size_t candidates,
                     const std::vector<PoolFailure>& failures);
  void SimulationRejected(const Route& route, const SimulationFailed& failure);
  void SubmissionAttempt(const Route& route, unsigned int attempt, const std::string& signature,
                         TransactionFormat format);
  void RetryScheduled(const Route& route, unsigned int attempt, int64_t delay_ms, const std::string& reason);
  void Terminal(const TransactionReport& report);
}
