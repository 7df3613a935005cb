#include "transaction/instruction.hpp"
#include "constants/solana.hpp"
#include "utils/byte_io.hpp"

namespace {
  Pubkey Program(const std::string& id) { return Pubkey::FromBase58(id); }
}

namespace ComputeBudget {
  Instruction SetComputeUnitLimit(uint32_t units) {
    Instruction ix{Program(SolanaConstants::COMPUTE_BUDGET_PROGRAM), {}, {}};
    ByteIO::AppendU8(ix.data, 2);
    ByteIO::AppendU32(ix.data, units);
    return ix;
  }

  Instruction SetComputeUnitPrice(uint64_t micro_lamports) {
    Instruction ix{Program(SolanaConstants::COMPUTE_BUDGET_PROGRAM), {}, {}};
    ByteIO::AppendU8(ix.data, 3);
    ByteIO::AppendU64(ix.data, micro_lamports);
    return ix;
  }
}

namespace SystemProgram {
  Instruction Transfer(const Pubkey& from, const Pubkey& to, uint64_t lamports) {
    Instruction ix{Program(SolanaConstants::SYSTEM_PROGRAM),
                   {AccountMeta::Writable(from, true), AccountMeta::Writable(to)}, {}};
    ByteIO::AppendU32(ix.data, 2);
    ByteIO::AppendU64(ix.data, lamports);
    return ix;
  }
}

namespace TokenProgram {
  Instruction SyncNative(const Pubkey& account, const Pubkey& token_program) {
    return Instruction{token_program, {AccountMeta::Writable(account)}, {17}};
  }

  Instruction CloseAccount(const Pubkey& account, const Pubkey& destination, const Pubkey& owner,
                           const Pubkey& token_program) {
    return Instruction{token_program,
                       {AccountMeta::Writable(account), AccountMeta::Writable(destination), AccountMeta::ReadOnly(owner, true)},
                       {9}};
  }
}

namespace AssociatedToken {
  Instruction CreateIdempotent(const Pubkey& payer, const Pubkey& ata, const Pubkey& owner, const Pubkey& mint,
                               const Pubkey& token_program) {
    return Instruction{Program(SolanaConstants::ASSOCIATED_TOKEN_PROGRAM),
                       {AccountMeta::Writable(payer, true), AccountMeta::Writable(ata), AccountMeta::ReadOnly(owner),
                        AccountMeta::ReadOnly(mint), AccountMeta::ReadOnly(Program(SolanaConstants::SYSTEM_PROGRAM)),
                        AccountMeta::ReadOnly(token_program)},
                       {1}};
  }
}
