#pragma once
#include "common/pubkey.hpp"
#include <cstdint>
#include <vector>

struct AccountMeta {
  Pubkey pubkey;
  bool is_signer = false;
  bool is_writable = false;

  static AccountMeta Writable(const Pubkey& k, bool signer = false) { return {k, signer, true}; }
  static AccountMeta ReadOnly(const Pubkey& k, bool signer = false) { return {k, signer, false}; }
};

struct Instruction {
  Pubkey program_id;
  std::vector<AccountMeta> accounts;
  std::vector<uint8_t> data;
};

// Runtime program instructions used around a swap
namespace ComputeBudget {
  Instruction SetComputeUnitLimit(uint32_t units);
  Instruction SetComputeUnitPrice(uint64_t micro_lamports);
}

namespace SystemProgram {
  Instruction Transfer(const Pubkey& from, const Pubkey& to, uint64_t lamports);
}

namespace TokenProgram {
  Instruction SyncNative(const Pubkey& account, const Pubkey& token_program);
  Instruction CloseAccount(const Pubkey& account, const Pubkey& destination, const Pubkey& owner,
                           const Pubkey& token_program);
}

namespace AssociatedToken {
  // No-op when the account already exists
  Instruction CreateIdempotent(const Pubkey& payer, const Pubkey& ata, const Pubkey& owner, const Pubkey& mint,
                               const Pubkey& token_program);
}
