#pragma once
#include "cache/cache_layer.hpp"
#include "common/logger.hpp"
#include "discovery/pool_registry.hpp"
#include "protection/slippage_guard.hpp"
#include "routing/route_selector.hpp"
#include <optional>
#include <string>
#include <vector>

struct RpcSettings {
  std::string url;
  std::optional<std::string> auth_header;
  int timeout_ms = 30000;
  size_t max_in_flight = 8;
  int64_t min_interval_ms = 0;
};

struct SubmitSettings {
  unsigned int max_retries = 3;
  int64_t retry_base_delay_ms = 500;
  int64_t retry_max_delay_ms = 8000;
  int64_t confirmation_timeout_ms = 60000;
  int64_t confirmation_poll_ms = 500;
  uint32_t compute_unit_limit = 400000;
  uint64_t compute_unit_price = 50000;  // micro-lamports
  std::vector<Pubkey> lookup_tables;
};

struct SwapConfig {
  RpcSettings rpc;
  SlippageGuardConfig slippage;
  CacheTtls ttls;
  double min_liquidity_quote = 0.0;
  RouterOptions router;
  size_t worker_threads = 4;
  SubmitSettings submit;
  std::string wallet_private_key;  // only required for swaps
  LogLevel log_level = LogLevel::INFO;
  std::string log_file = "swap.log";
  std::string events_file = "swap-events.jsonl";

  // Throws ConfigError on the first inconsistent value
  void Validate() const;
};

// Reads every key from ConfigManager. Missing keys keep their defaults; RPC_URL is required.
SwapConfig LoadSwapConfig();
