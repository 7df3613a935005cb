#include "discovery/pool_decoder.hpp"
#include "common/errors.hpp"
#include "constants/solana.hpp"
#include "crypto/pda.hpp"
#include "crypto/sha256.hpp"
#include "discovery/pool_layouts.hpp"
#include "quotes/stable_swap.hpp"
#include "utils/byte_io.hpp"
#include <algorithm>
#include <cstring>

using namespace ByteIO;

namespace PoolDecoder {
  namespace {
    void RequireSize(const Pubkey& address, const std::vector<uint8_t>& data, size_t expected, const char* what) {
      if (data.size() != expected) {
        throw DecodeError(address, std::string(what) + " expects " + std::to_string(expected) + " bytes, got " +
                                   std::to_string(data.size()));
      }
    }

    void RequireMinSize(const Pubkey& address, const std::vector<uint8_t>& data, size_t min, const char* what) {
      if (data.size() < min) {
        throw DecodeError(address, std::string(what) + " needs at least " + std::to_string(min) + " bytes, got " +
                                   std::to_string(data.size()));
      }
    }

    void RequireDiscriminator(const Pubkey& address, const std::vector<uint8_t>& data, const std::string& name) {
      auto expected = Crypto::AnchorDiscriminator("account", name);
      if (data.size() < expected.size() || std::memcmp(data.data(), expected.data(), expected.size()) != 0) {
        throw DecodeError(address, "discriminator is not " + name);
      }
    }

    bool ReadBool(const Pubkey& address, const std::vector<uint8_t>& data, size_t off, const char* field) {
      uint8_t v = ReadU8(data, off);
      if (v > 1) throw DecodeError(address, std::string(field) + " is not a boolean (" + std::to_string(v) + ")");
      return v == 1;
    }

    uint8_t CheckDecimals(const Pubkey& address, uint64_t decimals) {
      if (decimals > 18) throw DecodeError(address, "decimals " + std::to_string(decimals) + " above 18");
      return static_cast<uint8_t>(decimals);
    }

    uint32_t RatioToBps(const Pubkey& address, uint64_t numerator, uint64_t denominator) {
      if (denominator == 0) throw DecodeError(address, "fee denominator is zero");
      uint256 bps = Numeric::DivCeil(static_cast<uint256>(numerator) * 10000, denominator);
      if (bps > 10000) throw DecodeError(address, "fee above 100%");
      return static_cast<uint32_t>(bps);
    }
  }

  uint32_t PpmToBps(uint64_t ppm) { return static_cast<uint32_t>((ppm + 99) / 100); }

  uint32_t AmmV4Pool::FeeBps() const {
    if (fee_denominator == 0) return 0;
    return static_cast<uint32_t>(Numeric::DivCeil(static_cast<uint256>(fee_numerator) * 10000, fee_denominator));
  }

  bool CpSwapPool::SwapEnabled() const { return (status & PoolLayouts::CpSwap::kSwapDisabledBit) == 0; }

  uint32_t StablePool::FeeBps() const {
    if (fee_denominator == 0) return 0;
    return static_cast<uint32_t>(Numeric::DivCeil(static_cast<uint256>(fee_numerator) * 10000, fee_denominator));
  }

  uint64_t StablePool::AmpAt(int64_t now_s) const {
    return StableSwapMath::RampedAmp(initial_amp, target_amp, ramp_start_s, ramp_stop_s, now_s);
  }

  AmmV4Pool DecodeAmmV4(const Pubkey& address, const std::vector<uint8_t>& data) {
    namespace L = PoolLayouts::AmmV4;
    RequireSize(address, data, L::kSize, "amm v4 pool");
    AmmV4Pool p;
    p.status = ReadU64(data, L::kStatus);
    p.base_decimals = CheckDecimals(address, ReadU64(data, L::kBaseDecimals));
    p.quote_decimals = CheckDecimals(address, ReadU64(data, L::kQuoteDecimals));
    p.fee_numerator = ReadU64(data, L::kSwapFeeNumerator);
    p.fee_denominator = ReadU64(data, L::kSwapFeeDenominator);
    RatioToBps(address, p.fee_numerator, p.fee_denominator);
    p.need_take_pnl_base = ReadU64(data, L::kNeedTakePnlBase);
    p.need_take_pnl_quote = ReadU64(data, L::kNeedTakePnlQuote);
    p.base_vault = ReadPubkey(data, L::kBaseVault);
    p.quote_vault = ReadPubkey(data, L::kQuoteVault);
    p.base_mint = ReadPubkey(data, L::kBaseMint);
    p.quote_mint = ReadPubkey(data, L::kQuoteMint);
    return p;
  }

  CpSwapPool DecodeCpSwap(const Pubkey& address, const std::vector<uint8_t>& data) {
    namespace L = PoolLayouts::CpSwap;
    RequireSize(address, data, L::kSize, "cp-swap pool");
    RequireDiscriminator(address, data, "PoolState");
    CpSwapPool p;
    p.amm_config = ReadPubkey(data, L::kAmmConfig);
    p.vault_0 = ReadPubkey(data, L::kToken0Vault);
    p.vault_1 = ReadPubkey(data, L::kToken1Vault);
    p.mint_0 = ReadPubkey(data, L::kToken0Mint);
    p.mint_1 = ReadPubkey(data, L::kToken1Mint);
    p.token_program_0 = ReadPubkey(data, L::kToken0Program);
    p.token_program_1 = ReadPubkey(data, L::kToken1Program);
    p.observation = ReadPubkey(data, L::kObservation);
    p.status = ReadU8(data, L::kStatus);
    p.decimals_0 = CheckDecimals(address, ReadU8(data, L::kMint0Decimals));
    p.decimals_1 = CheckDecimals(address, ReadU8(data, L::kMint1Decimals));
    p.protocol_fees_0 = ReadU64(data, L::kProtocolFees0);
    p.protocol_fees_1 = ReadU64(data, L::kProtocolFees1);
    p.fund_fees_0 = ReadU64(data, L::kFundFees0);
    p.fund_fees_1 = ReadU64(data, L::kFundFees1);
    return p;
  }

  StablePool DecodeStable(const Pubkey& address, const std::vector<uint8_t>& data) {
    namespace L = PoolLayouts::Stable;
    RequireSize(address, data, L::kSize, "stable pool");
    StablePool p;
    p.is_initialized = ReadBool(address, data, L::kIsInitialized, "is_initialized");
    p.is_paused = ReadBool(address, data, L::kIsPaused, "is_paused");
    p.initial_amp = ReadU64(data, L::kInitialAmp);
    p.target_amp = ReadU64(data, L::kTargetAmp);
    p.ramp_start_s = ReadI64(data, L::kStartRamp);
    p.ramp_stop_s = ReadI64(data, L::kStopRamp);
    p.mint_a = ReadPubkey(data, L::kMintA);
    p.mint_b = ReadPubkey(data, L::kMintB);
    p.vault_a = ReadPubkey(data, L::kVaultA);
    p.vault_b = ReadPubkey(data, L::kVaultB);
    p.fee_numerator = ReadU64(data, L::kTradeFeeNumerator);
    p.fee_denominator = ReadU64(data, L::kTradeFeeDenominator);
    RatioToBps(address, p.fee_numerator, p.fee_denominator);
    return p;
  }

  ClmmPool DecodeClmm(const Pubkey& address, const std::vector<uint8_t>& data) {
    namespace L = PoolLayouts::Clmm;
    RequireSize(address, data, L::kSize, "clmm pool");
    RequireDiscriminator(address, data, "PoolState");
    ClmmPool p;
    p.amm_config = ReadPubkey(data, L::kAmmConfig);
    p.mint_0 = ReadPubkey(data, L::kTokenMint0);
    p.mint_1 = ReadPubkey(data, L::kTokenMint1);
    p.vault_0 = ReadPubkey(data, L::kTokenVault0);
    p.vault_1 = ReadPubkey(data, L::kTokenVault1);
    p.observation = ReadPubkey(data, L::kObservation);
    p.decimals_0 = CheckDecimals(address, ReadU8(data, L::kMintDecimals0));
    p.decimals_1 = CheckDecimals(address, ReadU8(data, L::kMintDecimals1));
    p.tick_spacing = ReadU16(data, L::kTickSpacing);
    if (p.tick_spacing == 0) throw DecodeError(address, "tick spacing is zero");
    p.liquidity = ReadU128(data, L::kLiquidity);
    p.sqrt_price_x64 = ReadU128(data, L::kSqrtPriceX64);
    p.tick_current = ReadI32(data, L::kTickCurrent);
    return p;
  }

  TickArray DecodeTickArray(const Pubkey& address, const std::vector<uint8_t>& data, uint16_t tick_spacing) {
    namespace L = PoolLayouts::Clmm;
    RequireSize(address, data, L::kTickArraySize, "tick array");
    RequireDiscriminator(address, data, "TickArrayState");
    if (tick_spacing == 0) throw DecodeError(address, "tick spacing is zero");
    TickArray arr;
    arr.pool = ReadPubkey(data, L::kTickArrayPool);
    arr.start_tick = ReadI32(data, L::kTickArrayStart);
    int32_t span = static_cast<int32_t>(tick_spacing) * kTicksPerArray;
    if (arr.start_tick % span != 0) {
      throw DecodeError(address, "start tick " + std::to_string(arr.start_tick) + " not aligned to " + std::to_string(span));
    }
    for (int32_t i = 0; i < kTicksPerArray; ++i) {
      size_t base = L::kTickArrayTicks + static_cast<size_t>(i) * L::kTickStride;
      TickInfo info;
      info.liquidity_gross = ReadU128(data, base + L::kTickLiquidityGross);
      if (info.liquidity_gross == 0) continue;
      int32_t tick = ReadI32(data, base + L::kTickIndex);
      if (tick < arr.start_tick || tick >= arr.start_tick + span) {
        throw DecodeError(address, "tick " + std::to_string(tick) + " outside its array");
      }
      info.liquidity_net = ReadI128(data, base + L::kTickLiquidityNet);
      arr.initialized.emplace_back(tick, info);
    }
    std::sort(arr.initialized.begin(), arr.initialized.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return arr;
  }

  uint32_t DecodeCpConfigFeeBps(const Pubkey& address, const std::vector<uint8_t>& data) {
    namespace L = PoolLayouts::CpSwap;
    RequireMinSize(address, data, L::kConfigMinSize, "cp-swap config");
    RequireDiscriminator(address, data, "AmmConfig");
    uint64_t ppm = ReadU64(data, L::kConfigTradeFeeRate);
    if (ppm > 1000000) throw DecodeError(address, "trade fee rate above 100%");
    return PpmToBps(ppm);
  }

  uint32_t DecodeClmmConfigFeeBps(const Pubkey& address, const std::vector<uint8_t>& data) {
    namespace L = PoolLayouts::Clmm;
    RequireMinSize(address, data, L::kConfigMinSize, "clmm config");
    RequireDiscriminator(address, data, "AmmConfig");
    uint32_t ppm = ReadU32(data, L::kConfigTradeFeeRate);
    if (ppm > 1000000) throw DecodeError(address, "trade fee rate above 100%");
    return PpmToBps(ppm);
  }

  TokenAccount DecodeTokenAccount(const Pubkey& address, const std::vector<uint8_t>& data) {
    namespace L = PoolLayouts::SplToken;
    RequireMinSize(address, data, L::kAccountMinSize, "token account");
    TokenAccount t;
    t.mint = ReadPubkey(data, L::kAccountMint);
    t.owner = ReadPubkey(data, L::kAccountOwner);
    t.amount = ReadU64(data, L::kAccountAmount);
    return t;
  }

  uint8_t DecodeMintDecimals(const Pubkey& address, const std::vector<uint8_t>& data) {
    namespace L = PoolLayouts::SplToken;
    RequireMinSize(address, data, L::kMintMinSize, "mint");
    return CheckDecimals(address, ReadU8(data, L::kMintDecimals));
  }

  Pubkey TickArrayAddress(const Pubkey& pool, int32_t start_index) {
    static const Pubkey program = Pubkey::FromBase58(SolanaConstants::RAYDIUM_CLMM);
    uint32_t u = static_cast<uint32_t>(start_index);
    std::vector<uint8_t> be = {static_cast<uint8_t>(u >> 24), static_cast<uint8_t>(u >> 16),
                               static_cast<uint8_t>(u >> 8), static_cast<uint8_t>(u)};
    return Crypto::FindProgramAddress({Crypto::Seed("tick_array"), Crypto::Seed(pool), be}, program).address;
  }
}
