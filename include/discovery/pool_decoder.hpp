#pragma once
#include "common/numeric.hpp"
#include "common/pubkey.hpp"
#include "pools/pool_state.hpp"
#include <cstdint>
#include <utility>
#include <vector>

// Raw account decoders. Every function throws DecodeError when the bytes do not
// match the layout (length, discriminator, flag values) for that account type.
namespace PoolDecoder {
  struct AmmV4Pool {
    uint64_t status = 0;
    uint8_t base_decimals = 0;
    uint8_t quote_decimals = 0;
    uint64_t fee_numerator = 0;
    uint64_t fee_denominator = 0;
    uint64_t need_take_pnl_base = 0;
    uint64_t need_take_pnl_quote = 0;
    Pubkey base_vault;
    Pubkey quote_vault;
    Pubkey base_mint;
    Pubkey quote_mint;

    // Initialized (1) and swap-only (6) pools accept swaps
    bool SwapEnabled() const { return status == 1 || status == 6; }
    uint32_t FeeBps() const;
  };

  struct CpSwapPool {
    Pubkey amm_config;
    Pubkey vault_0;
    Pubkey vault_1;
    Pubkey mint_0;
    Pubkey mint_1;
    Pubkey token_program_0;
    Pubkey token_program_1;
    Pubkey observation;
    uint8_t status = 0;
    uint8_t decimals_0 = 0;
    uint8_t decimals_1 = 0;
    uint64_t protocol_fees_0 = 0;
    uint64_t protocol_fees_1 = 0;
    uint64_t fund_fees_0 = 0;
    uint64_t fund_fees_1 = 0;

    bool SwapEnabled() const;
  };

  struct StablePool {
    bool is_initialized = false;
    bool is_paused = false;
    uint64_t initial_amp = 0;
    uint64_t target_amp = 0;
    int64_t ramp_start_s = 0;
    int64_t ramp_stop_s = 0;
    Pubkey mint_a;
    Pubkey mint_b;
    Pubkey vault_a;
    Pubkey vault_b;
    uint64_t fee_numerator = 0;
    uint64_t fee_denominator = 0;

    uint32_t FeeBps() const;
    uint64_t AmpAt(int64_t now_s) const;
  };

  struct ClmmPool {
    Pubkey amm_config;
    Pubkey mint_0;
    Pubkey mint_1;
    Pubkey vault_0;
    Pubkey vault_1;
    Pubkey observation;
    uint8_t decimals_0 = 0;
    uint8_t decimals_1 = 0;
    uint16_t tick_spacing = 0;
    uint128 liquidity = 0;
    uint128 sqrt_price_x64 = 0;
    int32_t tick_current = 0;
  };

  struct TickArray {
    Pubkey pool;
    int32_t start_tick = 0;
    // Ticks with non-zero gross liquidity, ascending
    std::vector<std::pair<int32_t, TickInfo>> initialized;
  };

  struct TokenAccount {
    Pubkey mint;
    Pubkey owner;
    uint64_t amount = 0;
  };

  AmmV4Pool DecodeAmmV4(const Pubkey& address, const std::vector<uint8_t>& data);
  CpSwapPool DecodeCpSwap(const Pubkey& address, const std::vector<uint8_t>& data);
  StablePool DecodeStable(const Pubkey& address, const std::vector<uint8_t>& data);
  ClmmPool DecodeClmm(const Pubkey& address, const std::vector<uint8_t>& data);
  TickArray DecodeTickArray(const Pubkey& address, const std::vector<uint8_t>& data, uint16_t tick_spacing);

  // trade_fee_rate of the owning AmmConfig, converted to bps
  uint32_t DecodeCpConfigFeeBps(const Pubkey& address, const std::vector<uint8_t>& data);
  uint32_t DecodeClmmConfigFeeBps(const Pubkey& address, const std::vector<uint8_t>& data);

  TokenAccount DecodeTokenAccount(const Pubkey& address, const std::vector<uint8_t>& data);
  uint8_t DecodeMintDecimals(const Pubkey& address, const std::vector<uint8_t>& data);

  // Rounds up so quotes never understate the fee
  uint32_t PpmToBps(uint64_t ppm);

  // Tick array account for start_index: ["tick_array", pool, start_index big-endian]
  Pubkey TickArrayAddress(const Pubkey& pool, int32_t start_index);
}
