#include "config/swap_config.hpp"
#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include <algorithm>

namespace {
  int64_t Int64Or(const std::string& key, int64_t fallback) {
    auto v = ConfigManager::Get(key);
    if (!v) return fallback;
    try {
      return std::stoll(*v);
    } catch (const std::exception&) {
      throw ConfigError(key + " is not an integer: " + *v);
    }
  }

  void Require(bool ok, const std::string& message) {
    if (!ok) throw ConfigError(message);
  }
}

void SwapConfig::Validate() const {
  Require(!rpc.url.empty(), "RPC_URL must be set");
  Require(rpc.timeout_ms > 0, "RPC_TIMEOUT_MS must be positive");
  Require(rpc.max_in_flight > 0, "RPC_MAX_IN_FLIGHT must be positive");
  Require(rpc.min_interval_ms >= 0, "RPC_MIN_INTERVAL_MS must not be negative");
  Require(slippage.max_slippage_bps <= 10000, "MAX_SLIPPAGE_BPS above 10000");
  Require(slippage.default_slippage_bps <= slippage.max_slippage_bps, "DEFAULT_SLIPPAGE_BPS above MAX_SLIPPAGE_BPS");
  Require(ttls.pools_ms > 0 && ttls.tokens_ms > 0 && ttls.quotes_ms > 0 && ttls.pool_index_ms > 0,
          "cache TTLs must be positive");
  Require(min_liquidity_quote >= 0, "MIN_LIQUIDITY_QUOTE must not be negative");
  Require(router.max_price_impact_pct >= 0, "MAX_PRICE_IMPACT_PCT must not be negative");
  Require(router.deadline_ms > 0, "QUOTE_DEADLINE_MS must be positive");
  Require(worker_threads > 0, "WORKER_THREADS must be positive");
  Require(submit.max_retries > 0, "MAX_TRANSACTION_RETRIES must be positive");
  Require(submit.retry_base_delay_ms > 0 && submit.retry_max_delay_ms >= submit.retry_base_delay_ms,
          "retry delays must be positive with RETRY_MAX_DELAY_MS >= RETRY_BASE_DELAY_MS");
  Require(submit.confirmation_timeout_ms > 0, "CONFIRMATION_TIMEOUT_MS must be positive");
  Require(submit.confirmation_poll_ms > 0, "CONFIRMATION_POLL_MS must be positive");
  Require(submit.compute_unit_limit > 0, "COMPUTE_UNIT_LIMIT must be positive");
}

SwapConfig LoadSwapConfig() {
  SwapConfig cfg;
  cfg.rpc.url = ConfigManager::GetOrThrow("RPC_URL");
  if (auto a = ConfigManager::Get("RPC_AUTH_HEADER")) cfg.rpc.auth_header = *a;
  cfg.rpc.timeout_ms = ConfigManager::GetIntOr("RPC_TIMEOUT_MS", cfg.rpc.timeout_ms);
  cfg.rpc.max_in_flight = static_cast<size_t>(Int64Or("RPC_MAX_IN_FLIGHT", static_cast<int64_t>(cfg.rpc.max_in_flight)));
  cfg.rpc.min_interval_ms = Int64Or("RPC_MIN_INTERVAL_MS", cfg.rpc.min_interval_ms);

  int64_t default_bps = Int64Or("DEFAULT_SLIPPAGE_BPS", cfg.slippage.default_slippage_bps);
  int64_t max_bps = Int64Or("MAX_SLIPPAGE_BPS", cfg.slippage.max_slippage_bps);
  if (default_bps < 0 || max_bps < 0) throw ConfigError("slippage bps must not be negative");
  if (max_bps > 10000) throw ConfigError("MAX_SLIPPAGE_BPS above 10000");
  cfg.slippage.default_slippage_bps = static_cast<uint32_t>(std::min<int64_t>(default_bps, 10000));
  cfg.slippage.max_slippage_bps = static_cast<uint32_t>(max_bps);

  cfg.ttls.pools_ms = Int64Or("POOL_CACHE_TTL_MS", cfg.ttls.pools_ms);
  cfg.ttls.tokens_ms = Int64Or("METADATA_CACHE_TTL_MS", cfg.ttls.tokens_ms);
  cfg.ttls.quotes_ms = Int64Or("QUOTE_CACHE_TTL_MS", cfg.ttls.quotes_ms);
  cfg.ttls.pool_index_ms = Int64Or("POOL_INDEX_TTL_MS", cfg.ttls.pool_index_ms);

  cfg.min_liquidity_quote = ConfigManager::GetDoubleOr("MIN_LIQUIDITY_QUOTE", 0.0);
  cfg.router.deadline_ms = Int64Or("QUOTE_DEADLINE_MS", cfg.router.deadline_ms);
  cfg.router.max_price_impact_pct = ConfigManager::GetDoubleOr("MAX_PRICE_IMPACT_PCT", 0.0);
  cfg.router.engine.pool_ttl_ms = cfg.ttls.pools_ms;
  int64_t workers = Int64Or("WORKER_THREADS", static_cast<int64_t>(cfg.worker_threads));
  if (workers < 0) throw ConfigError("WORKER_THREADS must not be negative");
  cfg.worker_threads = static_cast<size_t>(workers);

  int64_t retries = Int64Or("MAX_TRANSACTION_RETRIES", cfg.submit.max_retries);
  if (retries < 0) throw ConfigError("MAX_TRANSACTION_RETRIES must not be negative");
  cfg.submit.max_retries = static_cast<unsigned int>(retries);
  cfg.submit.retry_base_delay_ms = Int64Or("RETRY_BASE_DELAY_MS", cfg.submit.retry_base_delay_ms);
  cfg.submit.retry_max_delay_ms = Int64Or("RETRY_MAX_DELAY_MS", cfg.submit.retry_max_delay_ms);
  cfg.submit.confirmation_timeout_ms = Int64Or("CONFIRMATION_TIMEOUT_MS", cfg.submit.confirmation_timeout_ms);
  cfg.submit.confirmation_poll_ms = Int64Or("CONFIRMATION_POLL_MS", cfg.submit.confirmation_poll_ms);
  int64_t cu_limit = Int64Or("COMPUTE_UNIT_LIMIT", cfg.submit.compute_unit_limit);
  if (cu_limit < 0 || cu_limit > 1400000) throw ConfigError("COMPUTE_UNIT_LIMIT outside [0, 1400000]");
  cfg.submit.compute_unit_limit = static_cast<uint32_t>(cu_limit);
  cfg.submit.compute_unit_price = ConfigManager::GetUint64Or("COMPUTE_UNIT_PRICE_MICROLAMPORTS", cfg.submit.compute_unit_price);
  for (const auto& text : ConfigManager::GetList("ALT_ADDRESSES")) {
    Pubkey key;
    if (!Pubkey::TryFromBase58(text, key)) throw ConfigError("ALT_ADDRESSES entry is not a valid address: " + text);
    cfg.submit.lookup_tables.push_back(key);
  }

  cfg.wallet_private_key = ConfigManager::Get("WALLET_PRIVATE_KEY").value_or("");
  cfg.log_level = Logger::ParseLevel(ConfigManager::Get("LOG_LEVEL").value_or("info"));
  cfg.log_file = ConfigManager::Get("LOG_FILE").value_or(cfg.log_file);
  cfg.events_file = ConfigManager::Get("EVENTS_FILE").value_or(cfg.events_file);
  return cfg;
}
