#include "pools/pool_state.hpp"
#include "constants/solana.hpp"

std::string ToString(PoolKind kind) {
  switch (kind) {
    case PoolKind::ConstantProduct: return "constant-product";
    case PoolKind::Stable: return "stable";
    case PoolKind::ConcentratedLiquidity: return "concentrated-liquidity";
  }
  return "unknown";
}

std::string ToString(PoolProgram program) {
  switch (program) {
    case PoolProgram::AmmV4: return "amm-v4";
    case PoolProgram::CpSwap: return "cp-swap";
    case PoolProgram::Stable: return "stable";
    case PoolProgram::Clmm: return "clmm";
  }
  return "unknown";
}

const Pubkey& ProgramId(PoolProgram program) {
  static const Pubkey amm = Pubkey::FromBase58(SolanaConstants::RAYDIUM_AMM_V4);
  static const Pubkey cp = Pubkey::FromBase58(SolanaConstants::RAYDIUM_CP_SWAP);
  static const Pubkey stable = Pubkey::FromBase58(SolanaConstants::RAYDIUM_STABLE);
  static const Pubkey clmm = Pubkey::FromBase58(SolanaConstants::RAYDIUM_CLMM);
  switch (program) {
    case PoolProgram::AmmV4: return amm;
    case PoolProgram::CpSwap: return cp;
    case PoolProgram::Stable: return stable;
    case PoolProgram::Clmm: return clmm;
  }
  return amm;
}

bool ProgramFromId(const Pubkey& id, PoolProgram& out) {
  for (auto p : {PoolProgram::AmmV4, PoolProgram::CpSwap, PoolProgram::Stable, PoolProgram::Clmm}) {
    if (ProgramId(p) == id) {
      out = p;
      return true;
    }
  }
  return false;
}

int32_t ClmmState::ArrayStartFor(int32_t tick) const {
  int32_t span = TicksInArray();
  int32_t start = tick / span;
  if (tick < 0 && tick % span != 0) --start;
  return start * span;
}

PoolKind PoolState::Kind() const {
  return std::visit(Overloaded{
    [](const ConstantProductState&) { return PoolKind::ConstantProduct; },
    [](const StableState&) { return PoolKind::Stable; },
    [](const ClmmState&) { return PoolKind::ConcentratedLiquidity; },
  }, curve);
}

uint32_t PoolState::FeeBps() const {
  return std::visit([](const auto& c) { return c.fee_bps; }, curve);
}
