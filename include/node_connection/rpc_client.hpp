#pragma once
#include "node_connection/chain_data_source.hpp"
#include <atomic>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>

class HttpClient;
class RequestLimiter;

// JSON-RPC client for a Solana node. Every call passes through the shared RequestLimiter.
class SolanaRpcClient : public ChainDataSource {
public:
  SolanaRpcClient(HttpClient& http,
                  const std::string& endpoint_url,
                  const std::optional<std::string>& auth_header = std::nullopt,
                  RequestLimiter* limiter = nullptr,
                  int timeout_ms = 30000,
                  const std::string& commitment = "confirmed");

  // Sends a request and returns its "result" member
  nlohmann::json Call(const std::string& method, const nlohmann::json& params);

  std::vector<std::optional<AccountInfo>> GetMultipleAccounts(const std::vector<Pubkey>& keys) override;
  std::vector<Pubkey> GetProgramAccountKeys(const Pubkey& program, const ProgramAccountFilter& filter) override;
  LatestBlockhash GetLatestBlockhash() override;
  SimulationResult SimulateTransaction(const std::vector<uint8_t>& wire_tx,
                                       const std::vector<Pubkey>& accounts) override;
  std::string SendTransaction(const std::vector<uint8_t>& wire_tx) override;
  SignatureStatus GetSignatureStatus(const std::string& signature) override;

  static std::optional<AccountInfo> ParseAccount(const nlohmann::json& value);
private:
  HttpClient& http_;
  std::string endpoint_;
  RequestLimiter* limiter_;
  int timeout_ms_;
  std::string commitment_;
  std::atomic<uint64_t> next_id_{1};
  std::unordered_map<std::string, std::string> default_headers_;
  std::string HttpPost(const std::string& body);
};
