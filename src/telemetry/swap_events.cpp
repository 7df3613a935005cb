#include "telemetry/swap_events.hpp"
#include "telemetry/structured_logger.hpp"

using nlohmann::json;

namespace SwapEvents {
  json QuoteToJson(const QuoteResult& quote) {
    return json{
      {"pool", quote.pool.ToBase58()},
      {"program", ToString(quote.program)},
      {"kind", ToString(quote.kind)},
      {"a_to_b", quote.a_to_b},
      {"amount_in", quote.amount_in},
      {"amount_out", quote.amount_out},
      {"fee_amount", quote.fee_amount},
      {"price_impact_pct", Numeric::Format(quote.price_impact_pct, 6)},
      {"effective_price", Numeric::Format(quote.effective_price, 12)},
      {"observed_at_ms", quote.observed_at_ms},
      {"valid_until_ms", quote.valid_until_ms},
    };
  }

  json ReportToJson(const TransactionReport& report) {
    return json{
      {"route", QuoteToJson(report.route.quote)},
      {"slippage_bps", report.route.slippage_bps},
      {"minimum_output", report.route.minimum_output},
      {"expected_output", report.expected_output},
      {"actual_output", report.actual_output},
      {"expected_price", Numeric::Format(report.expected_price, 12)},
      {"actual_price", Numeric::Format(report.actual_price, 12)},
      {"realized_slippage_pct", Numeric::Format(report.realized_slippage_pct, 6)},
      {"signature", report.signature},
      {"status", ToString(report.status)},
      {"error", report.error},
      {"attempts", report.attempts},
      {"format", ToString(report.format)},
      {"elapsed_ms", report.elapsed_ms},
    };
  }

  void QuoteSelected(const SwapRequest& request, const QuoteResult& best, size_t candidates,
                     const std::vector<PoolFailure>& failures) {
    json failed = json::array();
    for (const auto& f : failures) {
      failed.push_back({{"pool", f.pool.ToBase58()}, {"stage", f.stage}, {"reason", f.reason}});
    }
    StructuredLogger::Instance().LogEvent("quote_selected", {
      {"input", request.input.mint.ToBase58()},
      {"output", request.output.mint.ToBase58()},
      {"amount_in", request.amount_in},
      {"candidates", candidates},
      {"best", QuoteToJson(best)},
      {"failures", failed},
    });
  }

  void SimulationRejected(const Route& route, const SimulationFailed& failure) {
    StructuredLogger::Instance().LogEvent("simulation_failed", {
      {"pool", route.quote.pool.ToBase58()},
      {"reason", failure.Reason()},
      {"simulated_out", failure.SimulatedOut()},
      {"minimum_out", failure.MinimumOut()},
    });
  }

  void SubmissionAttempt(const Route& route, unsigned int attempt, const std::string& signature,
                         TransactionFormat format) {
    StructuredLogger::Instance().LogEvent("submission_attempt", {
      {"pool", route.quote.pool.ToBase58()},
      {"attempt", attempt},
      {"signature", signature},
      {"format", ToString(format)},
    });
  }

  void RetryScheduled(const Route& route, unsigned int attempt, int64_t delay_ms, const std::string& reason) {
    StructuredLogger::Instance().LogEvent("retry_scheduled", {
      {"pool", route.quote.pool.ToBase58()},
      {"attempt", attempt},
      {"delay_ms", delay_ms},
      {"reason", reason},
    });
  }

  void Terminal(const TransactionReport& report) {
    StructuredLogger::Instance().LogEvent("swap_terminal", ReportToJson(report));
  }
}
