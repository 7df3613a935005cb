#include "transaction/swap_instructions.hpp"
#include "constants/solana.hpp"
#include "crypto/pda.hpp"
#include "crypto/sha256.hpp"
#include "quotes/clmm_math.hpp"
#include "utils/byte_io.hpp"
#include <algorithm>
#include <stdexcept>

namespace {
  const uint8_t kAmmV4SwapBaseInV2 = 16;
  const uint8_t kStableSwapTag = 1;

  Pubkey Program(const std::string& id) { return Pubkey::FromBase58(id); }

  void AppendDiscriminator(std::vector<uint8_t>& data, const std::string& name) {
    auto disc = Crypto::AnchorDiscriminator("global", name);
    data.insert(data.end(), disc.begin(), disc.end());
  }
}

namespace SwapInstructions {
  Instruction AmmV4SwapBaseIn(const PoolState& pool, const ConstantProductState& state, uint64_t amount_in,
                              uint64_t minimum_out, const SwapAccounts& user) {
    Instruction ix;
    ix.program_id = Program(SolanaConstants::RAYDIUM_AMM_V4);
    ix.accounts = {
      AccountMeta::ReadOnly(Program(SolanaConstants::TOKEN_PROGRAM)),
      AccountMeta::Writable(pool.address),
      AccountMeta::ReadOnly(Program(SolanaConstants::RAYDIUM_AMM_V4_AUTHORITY)),
      AccountMeta::Writable(state.vault_a),
      AccountMeta::Writable(state.vault_b),
      AccountMeta::Writable(user.source),
      AccountMeta::Writable(user.destination),
      AccountMeta::ReadOnly(user.owner, true),
    };
    ByteIO::AppendU8(ix.data, kAmmV4SwapBaseInV2);
    ByteIO::AppendU64(ix.data, amount_in);
    ByteIO::AppendU64(ix.data, minimum_out);
    return ix;
  }

  Instruction StableSwap(const PoolState& pool, const StableState& state, uint64_t amount_in, uint64_t minimum_out,
                         const SwapAccounts& user) {
    Pubkey program = Program(SolanaConstants::RAYDIUM_STABLE);
    Pubkey authority = Crypto::FindProgramAddress({Crypto::Seed(pool.address)}, program).address;
    Instruction ix;
    ix.program_id = program;
    ix.accounts = {
      AccountMeta::ReadOnly(user.owner, true),
      AccountMeta::ReadOnly(pool.address),
      AccountMeta::ReadOnly(authority),
      AccountMeta::Writable(user.source),
      AccountMeta::Writable(user.destination),
      AccountMeta::Writable(state.vault_a),
      AccountMeta::Writable(state.vault_b),
      AccountMeta::ReadOnly(Program(SolanaConstants::TOKEN_PROGRAM)),
      AccountMeta::ReadOnly(Program(SolanaConstants::SYSVAR_CLOCK)),
    };
    ByteIO::AppendU8(ix.data, kStableSwapTag);
    ByteIO::AppendU64(ix.data, amount_in);
    ByteIO::AppendU64(ix.data, minimum_out);
    return ix;
  }

  Instruction CpSwapBaseInput(const PoolState& pool, const ConstantProductState& state, bool a_to_b,
                              uint64_t amount_in, uint64_t minimum_out, const SwapAccounts& user) {
    Pubkey program = Program(SolanaConstants::RAYDIUM_CP_SWAP);
    Pubkey authority = Crypto::FindProgramAddress({Crypto::Seed("vault_and_lp_mint_auth_seed")}, program).address;
    const TokenRef& in = a_to_b ? pool.token_a : pool.token_b;
    const TokenRef& out = a_to_b ? pool.token_b : pool.token_a;

    Instruction ix;
    ix.program_id = program;
    ix.accounts = {
      AccountMeta::ReadOnly(user.owner, true),
      AccountMeta::ReadOnly(authority),
      AccountMeta::ReadOnly(state.amm_config),
      AccountMeta::Writable(pool.address),
      AccountMeta::Writable(user.source),
      AccountMeta::Writable(user.destination),
      AccountMeta::Writable(a_to_b ? state.vault_a : state.vault_b),
      AccountMeta::Writable(a_to_b ? state.vault_b : state.vault_a),
      AccountMeta::ReadOnly(a_to_b ? state.token_program_a : state.token_program_b),
      AccountMeta::ReadOnly(a_to_b ? state.token_program_b : state.token_program_a),
      AccountMeta::ReadOnly(in.mint),
      AccountMeta::ReadOnly(out.mint),
      AccountMeta::Writable(state.observation),
    };
    AppendDiscriminator(ix.data, "swap_base_input");
    ByteIO::AppendU64(ix.data, amount_in);
    ByteIO::AppendU64(ix.data, minimum_out);
    return ix;
  }

  Instruction ClmmSwap(const PoolState& pool, const ClmmState& state, bool a_to_b, uint64_t amount_in,
                       uint64_t minimum_out, const std::vector<Pubkey>& tick_arrays, const SwapAccounts& user) {
    if (tick_arrays.empty()) throw std::invalid_argument("clmm swap of " + pool.address.ToBase58() + " has no tick arrays");
    Instruction ix;
    ix.program_id = Program(SolanaConstants::RAYDIUM_CLMM);
    ix.accounts = {
      AccountMeta::ReadOnly(user.owner, true),
      AccountMeta::ReadOnly(state.amm_config),
      AccountMeta::Writable(pool.address),
      AccountMeta::Writable(user.source),
      AccountMeta::Writable(user.destination),
      AccountMeta::Writable(a_to_b ? state.vault_a : state.vault_b),
      AccountMeta::Writable(a_to_b ? state.vault_b : state.vault_a),
      AccountMeta::Writable(state.observation),
      AccountMeta::ReadOnly(Program(SolanaConstants::TOKEN_PROGRAM)),
    };
    for (const auto& ta : tick_arrays) ix.accounts.push_back(AccountMeta::Writable(ta));

    AppendDiscriminator(ix.data, "swap");
    ByteIO::AppendU64(ix.data, amount_in);
    ByteIO::AppendU64(ix.data, minimum_out);
    ByteIO::AppendU128(ix.data, 0);  // no price limit
    ByteIO::AppendU8(ix.data, 1);    // is_base_input
    return ix;
  }

  std::vector<Pubkey> TraversedTickArrays(const ClmmState& state, const QuoteResult& quote) {
    int32_t current = state.ArrayStartFor(state.tick_current);
    int32_t last = current;
    for (const auto& step : quote.steps) {
      int32_t tick = step.crossed ? (quote.a_to_b ? step.tick_target - 1 : step.tick_target)
                                  : ClmmMath::GetTickAtSqrtPrice(step.sqrt_price_end_x64);
      int32_t reached = state.ArrayStartFor(tick);
      last = quote.a_to_b ? std::min(last, reached) : std::max(last, reached);
    }
    std::vector<Pubkey> out;
    if (quote.a_to_b) {
      for (auto it = state.tick_arrays.upper_bound(current); it != state.tick_arrays.begin();) {
        --it;
        if (it->first < last) break;
        out.push_back(it->second);
      }
    } else {
      for (auto it = state.tick_arrays.lower_bound(current); it != state.tick_arrays.end() && it->first <= last; ++it) {
        out.push_back(it->second);
      }
    }
    return out;
  }

  Pubkey TokenProgramFor(const PoolState& pool, const Pubkey& mint) {
    if (auto cp = std::get_if<ConstantProductState>(&pool.curve)) {
      if (pool.program == PoolProgram::CpSwap) {
        return mint == pool.token_a.mint ? cp->token_program_a : cp->token_program_b;
      }
    }
    return Program(SolanaConstants::TOKEN_PROGRAM);
  }

  Instruction BuildForQuote(const PoolState& pool, const QuoteResult& quote, uint64_t minimum_out,
                            const SwapAccounts& user) {
    if (quote.pool != pool.address || quote.program != pool.program) {
      throw std::invalid_argument("quote for " + quote.pool.ToBase58() + " does not match pool " + pool.address.ToBase58());
    }
    return std::visit(Overloaded{
      [&](const ConstantProductState& s) {
        return pool.program == PoolProgram::CpSwap
                 ? CpSwapBaseInput(pool, s, quote.a_to_b, quote.amount_in, minimum_out, user)
                 : AmmV4SwapBaseIn(pool, s, quote.amount_in, minimum_out, user);
      },
      [&](const StableState& s) { return StableSwap(pool, s, quote.amount_in, minimum_out, user); },
      [&](const ClmmState& s) {
        return ClmmSwap(pool, s, quote.a_to_b, quote.amount_in, minimum_out, TraversedTickArrays(s, quote), user);
      },
    }, pool.curve);
  }
}
