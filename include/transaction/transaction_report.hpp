#pragma once
#include "routing/route_selector.hpp"
#include "transaction/message.hpp"
#include <string>

enum class TransactionState { Built, Simulated, Submitted, Confirmed, Failed, TimedOut };

std::string ToString(TransactionState state);

struct TransactionReport {
  Route route;
  uint64_t expected_output = 0;
  uint64_t actual_output = 0;
  // Output per input in whole tokens
  Decimal expected_price = 0;
  Decimal actual_price = 0;
  // (expected - actual) / expected in percent; negative when the swap beat the quote
  Decimal realized_slippage_pct = 0;
  std::string signature;
  TransactionState status = TransactionState::Built;
  std::string error;
  unsigned int attempts = 0;
  TransactionFormat format = TransactionFormat::Legacy;
  int64_t elapsed_ms = 0;

  bool Succeeded() const { return status == TransactionState::Confirmed; }
};
