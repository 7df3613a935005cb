#pragma once
#include <cstddef>
#include <cstdint>

// Byte offsets of the account layouts the registry decodes. All integers little-endian.
namespace PoolLayouts {
  namespace AmmV4 {
    constexpr size_t kSize = 752;
    constexpr size_t kStatus = 0;
    constexpr size_t kBaseDecimals = 32;
    constexpr size_t kQuoteDecimals = 40;
    constexpr size_t kSwapFeeNumerator = 176;
    constexpr size_t kSwapFeeDenominator = 184;
    constexpr size_t kNeedTakePnlBase = 192;
    constexpr size_t kNeedTakePnlQuote = 200;
    constexpr size_t kBaseVault = 336;
    constexpr size_t kQuoteVault = 368;
    constexpr size_t kBaseMint = 400;
    constexpr size_t kQuoteMint = 432;
  }

  namespace CpSwap {
    constexpr size_t kSize = 653;
    constexpr size_t kAmmConfig = 8;
    constexpr size_t kToken0Vault = 72;
    constexpr size_t kToken1Vault = 104;
    constexpr size_t kToken0Mint = 168;
    constexpr size_t kToken1Mint = 200;
    constexpr size_t kToken0Program = 232;
    constexpr size_t kToken1Program = 264;
    constexpr size_t kObservation = 296;
    constexpr size_t kStatus = 329;
    constexpr size_t kMint0Decimals = 331;
    constexpr size_t kMint1Decimals = 332;
    constexpr size_t kProtocolFees0 = 341;
    constexpr size_t kProtocolFees1 = 349;
    constexpr size_t kFundFees0 = 357;
    constexpr size_t kFundFees1 = 365;
    constexpr uint8_t kSwapDisabledBit = 1 << 2;

    // AmmConfig account
    constexpr size_t kConfigMinSize = 20;
    constexpr size_t kConfigTradeFeeRate = 12;  // u64, parts per million
  }

  namespace Stable {
    constexpr size_t kSize = 315;
    constexpr size_t kIsInitialized = 0;
    constexpr size_t kIsPaused = 1;
    constexpr size_t kInitialAmp = 3;
    constexpr size_t kTargetAmp = 11;
    constexpr size_t kStartRamp = 19;
    constexpr size_t kStopRamp = 27;
    constexpr size_t kMintA = 107;
    constexpr size_t kMintB = 139;
    constexpr size_t kVaultA = 171;
    constexpr size_t kVaultB = 203;
    constexpr size_t kTradeFeeNumerator = 299;
    constexpr size_t kTradeFeeDenominator = 307;
  }

  namespace Clmm {
    constexpr size_t kSize = 1544;
    constexpr size_t kAmmConfig = 9;
    constexpr size_t kTokenMint0 = 73;
    constexpr size_t kTokenMint1 = 105;
    constexpr size_t kTokenVault0 = 137;
    constexpr size_t kTokenVault1 = 169;
    constexpr size_t kObservation = 201;
    constexpr size_t kMintDecimals0 = 233;
    constexpr size_t kMintDecimals1 = 234;
    constexpr size_t kTickSpacing = 235;
    constexpr size_t kLiquidity = 237;
    constexpr size_t kSqrtPriceX64 = 253;
    constexpr size_t kTickCurrent = 269;

    // AmmConfig account
    constexpr size_t kConfigMinSize = 51;
    constexpr size_t kConfigTradeFeeRate = 47;  // u32, parts per million

    // TickArrayState account
    constexpr size_t kTickArraySize = 10240;
    constexpr size_t kTickArrayPool = 8;
    constexpr size_t kTickArrayStart = 40;
    constexpr size_t kTickArrayTicks = 44;
    constexpr size_t kTickStride = 168;
    constexpr size_t kTickIndex = 0;
    constexpr size_t kTickLiquidityNet = 4;
    constexpr size_t kTickLiquidityGross = 20;
  }

  namespace SplToken {
    constexpr size_t kAccountMinSize = 165;
    constexpr size_t kAccountMint = 0;
    constexpr size_t kAccountOwner = 32;
    constexpr size_t kAccountAmount = 64;
    constexpr size_t kMintMinSize = 82;
    constexpr size_t kMintDecimals = 44;
  }
}
