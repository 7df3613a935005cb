#pragma once
#include "common/pubkey.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace Crypto {
  // True when the 32 bytes decompress to a point on the ed25519 curve
  bool IsOnCurve(const uint8_t* bytes32);

  // Throws std::invalid_argument for more than 16 seeds or a seed longer than 32 bytes,
  // and std::runtime_error when the hash lands on the curve.
  Pubkey CreateProgramAddress(const std::vector<std::vector<uint8_t>>& seeds, const Pubkey& program_id);

  struct ProgramAddress {
    Pubkey address;
    uint8_t bump = 0;
  };

  // Highest bump in [255, 0] whose address is off-curve
  ProgramAddress FindProgramAddress(const std::vector<std::vector<uint8_t>>& seeds, const Pubkey& program_id);

  std::vector<uint8_t> Seed(const std::string& s);
  std::vector<uint8_t> Seed(const Pubkey& k);

  Pubkey AssociatedTokenAddress(const Pubkey& owner, const Pubkey& mint, const Pubkey& token_program);
}
