#include "api/swap_service.hpp"
#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "config/swap_config.hpp"
#include "net/http_client.hpp"
#include "node_connection/rpc_client.hpp"
#include "scheduler/request_limiter.hpp"
#include "telemetry/structured_logger.hpp"
#include "telemetry/swap_events.hpp"
#include "wallet/signer.hpp"
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {
  Pubkey MintFromConfig(const std::string& key) {
    std::string text = ConfigManager::GetOrThrow(key);
    Pubkey mint;
    if (!Pubkey::TryFromBase58(text, mint)) throw ConfigError(key + " is not a valid mint address: " + text);
    return mint;
  }

  SwapRequest RequestFromConfig() {
    SwapRequest request;
    request.input.mint = MintFromConfig("SWAP_INPUT_MINT");
    request.output.mint = MintFromConfig("SWAP_OUTPUT_MINT");
    request.amount_in = ConfigManager::GetUint64Or("SWAP_AMOUNT", 0);
    if (request.amount_in == 0) throw ConfigError("SWAP_AMOUNT must be a positive integer in the input's smallest unit");
    return request;
  }

  json SummaryToJson(const PoolSummary& s) {
    return json{
      {"address", s.address.ToBase58()},
      {"program", ToString(s.program)},
      {"kind", ToString(s.kind)},
      {"token_a", s.token_a.mint.ToBase58()},
      {"token_b", s.token_b.mint.ToBase58()},
      {"symbol_a", s.token_a.symbol},
      {"symbol_b", s.token_b.symbol},
      {"vault_balance_a", s.vault_balance_a},
      {"vault_balance_b", s.vault_balance_b},
      {"fee_bps", s.fee_bps},
      {"spot_price", Numeric::Format(s.spot_price, 12)},
      {"liquidity_quote", Numeric::Format(s.liquidity_quote, 2)},
    };
  }

  json FailuresToJson(const std::vector<PoolFailure>& failures) {
    json out = json::array();
    for (const auto& f : failures) out.push_back({{"pool", f.pool.ToBase58()}, {"stage", f.stage}, {"reason", f.reason}});
    return out;
  }

  int Run(SwapService& service, const std::string& mode) {
    if (mode == "quote") {
      RankedQuotes ranked = service.GetQuotes(RequestFromConfig());
      json quotes = json::array();
      for (const auto& q : ranked.quotes) quotes.push_back(SwapEvents::QuoteToJson(q));
      std::cout << json{{"quotes", quotes}, {"failures", FailuresToJson(ranked.failures)}}.dump(2) << std::endl;
      return 0;
    }
    if (mode == "pools" || mode == "token-pools") {
      std::vector<PoolSummary> pools = mode == "pools"
        ? service.ListPools(MintFromConfig("SWAP_INPUT_MINT"), MintFromConfig("SWAP_OUTPUT_MINT"))
        : service.FindPoolsForToken(MintFromConfig("SWAP_TOKEN"));
      json out = json::array();
      for (const auto& p : pools) out.push_back(SummaryToJson(p));
      std::cout << out.dump(2) << std::endl;
      return 0;
    }
    if (mode == "swap") {
      SwapRequest request = RequestFromConfig();
      uint32_t slippage = static_cast<uint32_t>(ConfigManager::GetIntOr("SWAP_SLIPPAGE_BPS", 0));
      TransactionReport report = service.ExecuteSwap(request, slippage);
      std::cout << SwapEvents::ReportToJson(report).dump(2) << std::endl;
      return report.Succeeded() ? 0 : 2;
    }
    if (mode == "wrap" || mode == "unwrap") {
      TransactionReport report;
      if (mode == "wrap") {
        uint64_t lamports = ConfigManager::GetUint64Or("SWAP_AMOUNT", 0);
        if (lamports == 0) throw ConfigError("SWAP_AMOUNT must be a positive number of lamports");
        report = service.WrapSol(lamports);
      } else {
        report = service.UnwrapSol();
      }
      std::cout << json{{"signature", report.signature}, {"status", ToString(report.status)},
                        {"lamports", report.actual_output}, {"attempts", report.attempts},
                        {"error", report.error}}.dump(2) << std::endl;
      return report.Succeeded() ? 0 : 2;
    }
    throw ConfigError("SWAP_MODE must be one of quote, pools, token-pools, swap, wrap, unwrap; got " + mode);
  }
}

int main() {
  try {
    ConfigManager::Initialize(".env");
    SwapConfig cfg = LoadSwapConfig();
    cfg.Validate();
    Logger::Initialize(LoggerOptions{cfg.log_file, cfg.log_level, ConfigManager::GetBoolOr("LOG_STDERR", false)});
    StructuredLogger::Instance().Initialize(cfg.events_file);
    Logger::Info("multipool_swap starting, RPC endpoint " + cfg.rpc.url);

    std::unique_ptr<HttpClient> http = CreateCurlHttpClient();
    if (!http) {
      Logger::Critical("HTTP client not available (libcurl missing)");
      std::cerr << "ERROR: HTTP client not available" << std::endl;
      return 1;
    }
    RequestLimiter limiter(cfg.rpc.max_in_flight, std::chrono::milliseconds(cfg.rpc.min_interval_ms));
    SolanaRpcClient rpc(*http, cfg.rpc.url, cfg.rpc.auth_header, &limiter, cfg.rpc.timeout_ms);

    std::string mode = ConfigManager::Get("SWAP_MODE").value_or("quote");
    std::unique_ptr<KeypairSigner> signer;
    if (mode == "swap" || mode == "wrap" || mode == "unwrap") {
      if (cfg.wallet_private_key.empty()) throw ConfigError("WALLET_PRIVATE_KEY is required for SWAP_MODE=" + mode);
      signer = std::make_unique<KeypairSigner>(cfg.wallet_private_key);
      Logger::Info("Wallet " + signer->PublicKey().ToBase58());
    }

    SystemClock clock;
    int rc = 1;
    {
      SwapService service(cfg, rpc, clock, signer.get());
      rc = Run(service, mode);
    }
    StructuredLogger::Instance().Shutdown();
    Logger::Shutdown();
    return rc;
  } catch (const NoRouteFound& e) {
    std::cerr << "No route: " << e.what() << std::endl;
    for (const auto& f : e.Failures()) {
      std::cerr << "  " << f.pool.ToBase58() << " [" << f.stage << "] " << f.reason << std::endl;
    }
  } catch (const SimulationFailed& e) {
    std::cerr << "Swap aborted before submission: " << e.Reason() << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "CRITICAL ERROR: " << e.what() << std::endl;
  }
  Logger::Error("multipool_swap exited with an error");
  StructuredLogger::Instance().Shutdown();
  Logger::Shutdown();
  return 1;
}
