#pragma once
#include "common/pubkey.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

using Signature = std::array<uint8_t, 64>;

class TransactionSigner {
public:
  virtual ~TransactionSigner() = default;
  virtual Pubkey PublicKey() const = 0;
  virtual Signature Sign(const std::vector<uint8_t>& message) const = 0;
};

// ed25519 keypair. Accepts a base58 64-byte keypair, a base58 32-byte seed,
// or the JSON byte array written by the solana CLI.
class KeypairSigner : public TransactionSigner {
public:
  explicit KeypairSigner(const std::string& encoded_key);
  static KeypairSigner FromSeed(const std::array<uint8_t, 32>& seed);
  Pubkey PublicKey() const override { return public_key_; }
  Signature Sign(const std::vector<uint8_t>& message) const override;
private:
  KeypairSigner() = default;
  void InitFromSeed(const uint8_t* seed);
  std::array<uint8_t, 32> seed_{};
  Pubkey public_key_;
};

std::string SignatureToBase58(const Signature& sig);
