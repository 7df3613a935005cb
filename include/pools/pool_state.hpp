#pragma once
#include "common/numeric.hpp"
#include "common/pubkey.hpp"
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <variant>
#include <vector>

// Pricing curve family. One quote engine per kind.
enum class PoolKind { ConstantProduct, Stable, ConcentratedLiquidity };

// On-chain program that owns the pool account.
enum class PoolProgram { AmmV4, CpSwap, Stable, Clmm };

std::string ToString(PoolKind kind);
std::string ToString(PoolProgram program);
const Pubkey& ProgramId(PoolProgram program);
bool ProgramFromId(const Pubkey& id, PoolProgram& out);

struct TokenRef {
  Pubkey mint;
  uint8_t decimals = 0;  // [0, 18]
  std::string symbol;    // empty when not a well-known mint

  std::string Label() const { return symbol.empty() ? mint.Short() : symbol; }
};

struct ConstantProductState {
  uint64_t reserve_a = 0;
  uint64_t reserve_b = 0;
  uint32_t fee_bps = 0;
  Pubkey vault_a;
  Pubkey vault_b;
  // CP-swap only
  Pubkey amm_config;
  Pubkey observation;
  Pubkey token_program_a;
  Pubkey token_program_b;
};

struct StableState {
  uint64_t reserve_a = 0;
  uint64_t reserve_b = 0;
  uint32_t fee_bps = 0;
  uint64_t amp = 0;  // amplification at observed_at
  Pubkey vault_a;
  Pubkey vault_b;
};

struct TickInfo {
  int128 liquidity_net = 0;
  uint128 liquidity_gross = 0;
};

constexpr int32_t kTicksPerArray = 60;

struct ClmmState {
  uint128 sqrt_price_x64 = 0;
  int32_t tick_current = 0;
  uint16_t tick_spacing = 1;
  uint128 liquidity = 0;
  uint32_t fee_bps = 0;
  // Initialized ticks from the loaded tick arrays only
  std::map<int32_t, TickInfo> ticks;
  // Start indices of the tick arrays that were loaded
  std::set<int32_t> loaded_array_starts;
  Pubkey amm_config;
  Pubkey vault_a;
  Pubkey vault_b;
  Pubkey observation;
  // Tick array accounts that exist on chain, by start index
  std::map<int32_t, Pubkey> tick_arrays;

  int32_t TicksInArray() const { return static_cast<int32_t>(tick_spacing) * kTicksPerArray; }
  // floor(tick / (spacing * 60)) * spacing * 60
  int32_t ArrayStartFor(int32_t tick) const;
  bool IsTickLoaded(int32_t tick) const { return loaded_array_starts.count(ArrayStartFor(tick)) != 0; }
};

using PoolCurve = std::variant<ConstantProductState, StableState, ClmmState>;

// Decoded pool snapshot. Never mutated after construction; refreshes replace the cached value.
struct PoolState {
  Pubkey address;
  PoolProgram program = PoolProgram::AmmV4;
  TokenRef token_a;
  TokenRef token_b;
  int64_t observed_at_ms = 0;
  uint64_t vault_balance_a = 0;
  uint64_t vault_balance_b = 0;
  PoolCurve curve;

  PoolKind Kind() const;
  uint32_t FeeBps() const;
  bool Contains(const Pubkey& mint) const { return token_a.mint == mint || token_b.mint == mint; }
};

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;
