#pragma once
#include "pools/pool_state.hpp"
#include "quotes/quote_types.hpp"
#include "transaction/instruction.hpp"
#include <vector>

// User-side accounts of a swap
struct SwapAccounts {
  Pubkey owner;
  Pubkey source;       // token account debited with the input
  Pubkey destination;  // token account credited with the output
};

// Raydium swap instructions, exact-input only
namespace SwapInstructions {
  // AMM v4 and the stable program infer the direction from the mint of user.source
  Instruction AmmV4SwapBaseIn(const PoolState& pool, const ConstantProductState& state, uint64_t amount_in,
                              uint64_t minimum_out, const SwapAccounts& user);
  Instruction StableSwap(const PoolState& pool, const StableState& state, uint64_t amount_in, uint64_t minimum_out,
                         const SwapAccounts& user);
  Instruction CpSwapBaseInput(const PoolState& pool, const ConstantProductState& state, bool a_to_b,
                              uint64_t amount_in, uint64_t minimum_out, const SwapAccounts& user);
  // tick_arrays in traversal order, current array first
  Instruction ClmmSwap(const PoolState& pool, const ClmmState& state, bool a_to_b, uint64_t amount_in,
                       uint64_t minimum_out, const std::vector<Pubkey>& tick_arrays, const SwapAccounts& user);

  // Existing tick arrays from the current one through the last array the quote reached
  std::vector<Pubkey> TraversedTickArrays(const ClmmState& state, const QuoteResult& quote);

  // Token program owning the user's account for one side of the pool
  Pubkey TokenProgramFor(const PoolState& pool, const Pubkey& mint);

  // Dispatch on the pool program. Throws std::invalid_argument when quote and pool disagree.
  Instruction BuildForQuote(const PoolState& pool, const QuoteResult& quote, uint64_t minimum_out,
                            const SwapAccounts& user);
}
