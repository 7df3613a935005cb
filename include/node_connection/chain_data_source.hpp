#pragma once
#include "common/pubkey.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct AccountInfo {
  Pubkey owner;
  uint64_t lamports = 0;
  std::vector<uint8_t> data;
};

struct MemcmpFilter {
  size_t offset = 0;
  Pubkey bytes;
};

struct ProgramAccountFilter {
  std::optional<uint64_t> data_size;
  std::vector<MemcmpFilter> memcmp;
};

struct LatestBlockhash {
  Pubkey blockhash;
  uint64_t last_valid_block_height = 0;
};

struct SimulationResult {
  bool success = false;
  std::string error;
  std::vector<std::string> logs;
  // Post-simulation state of the requested accounts, in request order
  std::vector<std::optional<AccountInfo>> accounts;
  uint64_t units_consumed = 0;
};

enum class SignatureState { NotFound, Processed, Confirmed, Finalized, Failed };

struct SignatureStatus {
  SignatureState state = SignatureState::NotFound;
  std::string error;
};

// Read and write access to the chain. Implementations throw RpcTransportError or
// RpcResponseError; callers decide what is retryable through IsTransientError().
class ChainDataSource {
public:
  virtual ~ChainDataSource() = default;
  // One entry per requested key, nullopt for accounts that do not exist
  virtual std::vector<std::optional<AccountInfo>> GetMultipleAccounts(const std::vector<Pubkey>& keys) = 0;
  virtual std::vector<Pubkey> GetProgramAccountKeys(const Pubkey& program, const ProgramAccountFilter& filter) = 0;
  virtual LatestBlockhash GetLatestBlockhash() = 0;
  virtual SimulationResult SimulateTransaction(const std::vector<uint8_t>& wire_tx,
                                               const std::vector<Pubkey>& accounts) = 0;
  // Returns the base58 transaction signature
  virtual std::string SendTransaction(const std::vector<uint8_t>& wire_tx) = 0;
  virtual SignatureStatus GetSignatureStatus(const std::string& signature) = 0;
};
