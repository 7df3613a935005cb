#pragma once
#include "node_connection/chain_data_source.hpp"
#include "routing/route_selector.hpp"
#include "transaction/address_lookup_table.hpp"
#include "transaction/message.hpp"
#include "transaction/swap_instructions.hpp"
#include <mutex>
#include <optional>
#include <vector>

struct BuilderOptions {
  uint32_t compute_unit_limit = 400000;
  uint64_t compute_unit_price = 50000;  // micro-lamports, 0 omits the instruction
  std::vector<Pubkey> lookup_tables;
};

// The owner's wrapped SOL associated account as last read from the chain
struct WrappedSolAccount {
  Pubkey address;
  bool exists = false;
  uint64_t balance = 0;
};

// Everything needed to compile a transaction against a fresh blockhash.
struct SwapPlan {
  Route route;  // empty for wrap and unwrap plans
  bool is_swap = true;
  Pubkey payer;
  Pubkey input_account;
  Pubkey output_account;
  bool wraps_sol = false;
  uint64_t wrapped_lamports = 0;
  // Only an account the plan itself created is closed again
  bool closes_input = false;
  std::vector<Instruction> instructions;
};

class SwapBuilder {
public:
  SwapBuilder(ChainDataSource& chain, BuilderOptions options);

  WrappedSolAccount ReadWrappedSol(const Pubkey& owner);

  // Throws std::invalid_argument when the route does not belong to pool. A wrapped SOL input
  // is topped up to the swap amount; an existing wSOL account keeps its remaining balance.
  SwapPlan Plan(const PoolState& pool, const Route& route, const Pubkey& owner,
                const WrappedSolAccount& wsol = WrappedSolAccount()) const;

  // Moves lamports into the owner's wSOL account, creating it when needed
  SwapPlan PlanWrap(const Pubkey& owner, uint64_t lamports) const;
  // Closes the owner's wSOL account, returning its balance and rent as SOL
  SwapPlan PlanUnwrap(const Pubkey& owner) const;

  // Legacy when it fits in one packet, otherwise v0 over the configured lookup tables.
  // Throws std::runtime_error when neither format fits.
  Message Compile(const SwapPlan& plan, const Pubkey& blockhash);

private:
  const std::vector<AddressLookupTable>& LookupTables();

  ChainDataSource& chain_;
  BuilderOptions options_;
  std::mutex tables_mutex_;
  std::optional<std::vector<AddressLookupTable>> tables_;
};
