#include "transaction/swap_builder.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "constants/solana.hpp"
#include "crypto/pda.hpp"
#include "discovery/pool_decoder.hpp"
#include <stdexcept>

SwapBuilder::SwapBuilder(ChainDataSource& chain, BuilderOptions options)
  : chain_(chain), options_(std::move(options)) {}

namespace {
  Pubkey WsolMint() { return Pubkey::FromBase58(SolanaConstants::WSOL_MINT); }
  Pubkey ClassicTokenProgram() { return Pubkey::FromBase58(SolanaConstants::TOKEN_PROGRAM); }

  Pubkey WsolAccountOf(const Pubkey& owner) {
    return Crypto::AssociatedTokenAddress(owner, WsolMint(), ClassicTokenProgram());
  }

  std::vector<Instruction> ComputeBudgetFor(const BuilderOptions& options) {
    std::vector<Instruction> ixs;
    ixs.push_back(ComputeBudget::SetComputeUnitLimit(options.compute_unit_limit));
    if (options.compute_unit_price > 0) ixs.push_back(ComputeBudget::SetComputeUnitPrice(options.compute_unit_price));
    return ixs;
  }
}

WrappedSolAccount SwapBuilder::ReadWrappedSol(const Pubkey& owner) {
  WrappedSolAccount wsol;
  wsol.address = WsolAccountOf(owner);
  auto accounts = chain_.GetMultipleAccounts({wsol.address});
  if (accounts.empty() || !accounts[0]) return wsol;
  wsol.exists = true;
  wsol.balance = PoolDecoder::DecodeTokenAccount(wsol.address, accounts[0]->data).amount;
  return wsol;
}

SwapPlan SwapBuilder::Plan(const PoolState& pool, const Route& route, const Pubkey& owner,
                           const WrappedSolAccount& wsol) const {
  const QuoteResult& q = route.quote;
  const TokenRef& in = q.a_to_b ? pool.token_a : pool.token_b;
  const TokenRef& out = q.a_to_b ? pool.token_b : pool.token_a;
  Pubkey in_program = SwapInstructions::TokenProgramFor(pool, in.mint);
  Pubkey out_program = SwapInstructions::TokenProgramFor(pool, out.mint);

  SwapPlan plan;
  plan.route = route;
  plan.payer = owner;
  plan.input_account = Crypto::AssociatedTokenAddress(owner, in.mint, in_program);
  plan.output_account = Crypto::AssociatedTokenAddress(owner, out.mint, out_program);
  plan.wraps_sol = in.mint == WsolMint();

  auto& ixs = plan.instructions;
  ixs = ComputeBudgetFor(options_);
  ixs.push_back(AssociatedToken::CreateIdempotent(owner, plan.output_account, owner, out.mint, out_program));
  if (plan.wraps_sol) {
    plan.closes_input = !wsol.exists;
    plan.wrapped_lamports = q.amount_in > wsol.balance ? q.amount_in - wsol.balance : 0;
    if (plan.closes_input) {
      ixs.push_back(AssociatedToken::CreateIdempotent(owner, plan.input_account, owner, in.mint, in_program));
    }
    if (plan.wrapped_lamports > 0) {
      ixs.push_back(SystemProgram::Transfer(owner, plan.input_account, plan.wrapped_lamports));
      ixs.push_back(TokenProgram::SyncNative(plan.input_account, in_program));
    }
  }
  SwapAccounts user{owner, plan.input_account, plan.output_account};
  ixs.push_back(SwapInstructions::BuildForQuote(pool, q, route.minimum_output, user));
  if (plan.closes_input) ixs.push_back(TokenProgram::CloseAccount(plan.input_account, owner, owner, in_program));
  return plan;
}

SwapPlan SwapBuilder::PlanWrap(const Pubkey& owner, uint64_t lamports) const {
  if (lamports == 0) throw std::invalid_argument("nothing to wrap");
  SwapPlan plan;
  plan.is_swap = false;
  plan.payer = owner;
  plan.input_account = WsolAccountOf(owner);
  plan.output_account = plan.input_account;
  plan.wraps_sol = true;
  plan.wrapped_lamports = lamports;
  plan.instructions = ComputeBudgetFor(options_);
  plan.instructions.push_back(
    AssociatedToken::CreateIdempotent(owner, plan.input_account, owner, WsolMint(), ClassicTokenProgram()));
  plan.instructions.push_back(SystemProgram::Transfer(owner, plan.input_account, lamports));
  plan.instructions.push_back(TokenProgram::SyncNative(plan.input_account, ClassicTokenProgram()));
  return plan;
}

SwapPlan SwapBuilder::PlanUnwrap(const Pubkey& owner) const {
  SwapPlan plan;
  plan.is_swap = false;
  plan.payer = owner;
  plan.input_account = WsolAccountOf(owner);
  plan.output_account = plan.input_account;
  plan.closes_input = true;
  plan.instructions = ComputeBudgetFor(options_);
  plan.instructions.push_back(TokenProgram::CloseAccount(plan.input_account, owner, owner, ClassicTokenProgram()));
  return plan;
}

const std::vector<AddressLookupTable>& SwapBuilder::LookupTables() {
  std::lock_guard<std::mutex> lock(tables_mutex_);
  if (tables_) return *tables_;
  std::vector<AddressLookupTable> tables;
  if (!options_.lookup_tables.empty()) {
    auto accounts = chain_.GetMultipleAccounts(options_.lookup_tables);
    for (size_t i = 0; i < options_.lookup_tables.size() && i < accounts.size(); ++i) {
      const Pubkey& key = options_.lookup_tables[i];
      if (!accounts[i]) {
        Logger::Warning("Lookup table " + key.ToBase58() + " does not exist");
        continue;
      }
      tables.push_back(DecodeLookupTable(key, accounts[i]->data));
    }
  }
  tables_ = std::move(tables);
  return *tables_;
}

Message SwapBuilder::Compile(const SwapPlan& plan, const Pubkey& blockhash) {
  size_t legacy_size = 0;
  try {
    Message legacy = MessageCompiler::CompileLegacy(plan.payer, plan.instructions, blockhash);
    legacy_size = legacy.TransactionSize();
    if (legacy_size <= SolanaConstants::MAX_TRANSACTION_SIZE) return legacy;
  } catch (const std::invalid_argument& e) {
    Logger::Debug(std::string("Legacy message rejected: ") + e.what());
  }

  const auto& tables = LookupTables();
  if (tables.empty()) {
    throw std::runtime_error("transaction of " + std::to_string(legacy_size) + " bytes exceeds " +
                             std::to_string(SolanaConstants::MAX_TRANSACTION_SIZE) + " and no lookup tables are configured");
  }
  Message v0 = MessageCompiler::CompileV0(plan.payer, plan.instructions, blockhash, tables);
  size_t v0_size = v0.TransactionSize();
  if (v0_size > SolanaConstants::MAX_TRANSACTION_SIZE) {
    throw std::runtime_error("v0 transaction of " + std::to_string(v0_size) + " bytes exceeds " +
                             std::to_string(SolanaConstants::MAX_TRANSACTION_SIZE));
  }
  Logger::Debug("Using v0 message: " + std::to_string(legacy_size) + " -> " + std::to_string(v0_size) + " bytes");
  return v0;
}
