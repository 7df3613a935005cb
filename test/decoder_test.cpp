#include <gtest/gtest.h>

#include "common/errors.hpp"
#include "discovery/pool_decoder.hpp"
#include "test_support.hpp"

using namespace TestSupport;

TEST(PoolDecoderTest, AmmV4Fields) {
  AmmV4Fields f;
  f.base_vault = Key(11);
  f.quote_vault = Key(12);
  f.base_mint = Key(1);
  f.quote_mint = Key(2);
  f.need_take_pnl_base = 77;
  auto p = PoolDecoder::DecodeAmmV4(Key(10), AmmV4Blob(f));
  EXPECT_EQ(p.base_vault, Key(11));
  EXPECT_EQ(p.quote_mint, Key(2));
  EXPECT_EQ(p.base_decimals, 9);
  EXPECT_EQ(p.quote_decimals, 6);
  EXPECT_EQ(p.need_take_pnl_base, 77u);
  EXPECT_EQ(p.FeeBps(), 25u);
  EXPECT_TRUE(p.SwapEnabled());
}

TEST(PoolDecoderTest, AmmV4DisabledStatus) {
  AmmV4Fields f;
  f.status = 4;
  EXPECT_FALSE(PoolDecoder::DecodeAmmV4(Key(10), AmmV4Blob(f)).SwapEnabled());
}

TEST(PoolDecoderTest, AmmV4WrongSize) {
  auto blob = AmmV4Blob(AmmV4Fields{});
  blob.pop_back();
  EXPECT_THROW(PoolDecoder::DecodeAmmV4(Key(10), blob), DecodeError);
}

TEST(PoolDecoderTest, AmmV4ZeroFeeDenominator) {
  AmmV4Fields f;
  f.fee_denominator = 0;
  try {
    PoolDecoder::DecodeAmmV4(Key(10), AmmV4Blob(f));
    FAIL() << "expected DecodeError";
  } catch (const DecodeError& e) {
    EXPECT_EQ(e.Account(), Key(10));
    EXPECT_NE(e.Reason().find("denominator"), std::string::npos);
  }
}

TEST(PoolDecoderTest, AmmV4DecimalsAbove18) {
  AmmV4Fields f;
  f.base_decimals = 19;
  EXPECT_THROW(PoolDecoder::DecodeAmmV4(Key(10), AmmV4Blob(f)), DecodeError);
}

TEST(PoolDecoderTest, CpSwapFields) {
  CpSwapFields f;
  f.amm_config = Key(20);
  f.vault_0 = Key(21);
  f.vault_1 = Key(22);
  f.mint_0 = Key(1);
  f.mint_1 = Key(2);
  f.observation = Key(23);
  f.token_program_1 = Program(SolanaConstants::TOKEN_2022_PROGRAM);
  f.protocol_fees_0 = 5;
  f.fund_fees_1 = 9;
  auto p = PoolDecoder::DecodeCpSwap(Key(19), CpSwapBlob(f));
  EXPECT_EQ(p.amm_config, Key(20));
  EXPECT_EQ(p.vault_1, Key(22));
  EXPECT_EQ(p.observation, Key(23));
  EXPECT_EQ(p.token_program_1, Program(SolanaConstants::TOKEN_2022_PROGRAM));
  EXPECT_EQ(p.protocol_fees_0, 5u);
  EXPECT_EQ(p.fund_fees_1, 9u);
  EXPECT_TRUE(p.SwapEnabled());
}

TEST(PoolDecoderTest, CpSwapDisabledBit) {
  CpSwapFields f;
  f.status = PoolLayouts::CpSwap::kSwapDisabledBit;
  EXPECT_FALSE(PoolDecoder::DecodeCpSwap(Key(19), CpSwapBlob(f)).SwapEnabled());
}

TEST(PoolDecoderTest, CpSwapWrongDiscriminator) {
  auto blob = CpSwapBlob(CpSwapFields{});
  blob[0] ^= 0xff;
  EXPECT_THROW(PoolDecoder::DecodeCpSwap(Key(19), blob), DecodeError);
}

TEST(PoolDecoderTest, ConfigFeesConvertToBps) {
  EXPECT_EQ(PoolDecoder::DecodeCpConfigFeeBps(Key(20), CpConfigBlob(2500)), 25u);
  EXPECT_EQ(PoolDecoder::DecodeClmmConfigFeeBps(Key(20), ClmmConfigBlob(100)), 1u);
  // Rounded up
  EXPECT_EQ(PoolDecoder::PpmToBps(101), 2u);
  EXPECT_EQ(PoolDecoder::PpmToBps(0), 0u);
  EXPECT_THROW(PoolDecoder::DecodeCpConfigFeeBps(Key(20), CpConfigBlob(1000001)), DecodeError);
}

TEST(PoolDecoderTest, StableFields) {
  StableFields f;
  f.mint_a = Key(1);
  f.mint_b = Key(2);
  f.vault_a = Key(31);
  f.vault_b = Key(32);
  f.initial_amp = 100;
  f.target_amp = 200;
  f.ramp_start_s = 1000;
  f.ramp_stop_s = 2000;
  auto p = PoolDecoder::DecodeStable(Key(30), StableBlob(f));
  EXPECT_TRUE(p.is_initialized);
  EXPECT_FALSE(p.is_paused);
  EXPECT_EQ(p.vault_b, Key(32));
  EXPECT_EQ(p.FeeBps(), 4u);
  EXPECT_EQ(p.AmpAt(1500), 150u);
}

TEST(PoolDecoderTest, StableRejectsNonBooleanFlag) {
  StableFields f;
  f.is_paused = 2;
  EXPECT_THROW(PoolDecoder::DecodeStable(Key(30), StableBlob(f)), DecodeError);
}

TEST(PoolDecoderTest, ClmmFields) {
  ClmmFields f;
  f.amm_config = Key(41);
  f.mint_0 = Key(1);
  f.mint_1 = Key(2);
  f.vault_0 = Key(42);
  f.vault_1 = Key(43);
  f.tick_spacing = 10;
  f.liquidity = uint128("123456789012345678901234");
  f.sqrt_price_x64 = static_cast<uint128>(1) << 64;
  f.tick_current = -5;
  auto p = PoolDecoder::DecodeClmm(Key(40), ClmmBlob(f));
  EXPECT_EQ(p.vault_1, Key(43));
  EXPECT_EQ(p.tick_spacing, 10);
  EXPECT_EQ(p.liquidity, uint128("123456789012345678901234"));
  EXPECT_EQ(p.sqrt_price_x64, static_cast<uint128>(1) << 64);
  EXPECT_EQ(p.tick_current, -5);
}

TEST(PoolDecoderTest, ClmmZeroTickSpacing) {
  ClmmFields f;
  f.tick_spacing = 0;
  EXPECT_THROW(PoolDecoder::DecodeClmm(Key(40), ClmmBlob(f)), DecodeError);
}

TEST(PoolDecoderTest, TickArrayKeepsInitializedTicks) {
  auto blob = TickArrayBlob(Key(40), -600, {{-590, -5000, 5000}, {-10, 7000, 7000}}, 10);
  auto arr = PoolDecoder::DecodeTickArray(Key(44), blob, 10);
  EXPECT_EQ(arr.pool, Key(40));
  EXPECT_EQ(arr.start_tick, -600);
  ASSERT_EQ(arr.initialized.size(), 2u);
  EXPECT_EQ(arr.initialized[0].first, -590);
  EXPECT_EQ(arr.initialized[0].second.liquidity_net, -5000);
  EXPECT_EQ(arr.initialized[1].first, -10);
  EXPECT_EQ(arr.initialized[1].second.liquidity_gross, 7000);
}

TEST(PoolDecoderTest, TickArrayMisalignedStart) {
  auto blob = TickArrayBlob(Key(40), -60, {}, 1);
  EXPECT_THROW(PoolDecoder::DecodeTickArray(Key(44), blob, 7), DecodeError);
}

TEST(PoolDecoderTest, TokenAccountAndMint) {
  auto acct = PoolDecoder::DecodeTokenAccount(Key(60), TokenAccountBlob(Key(1), Key(61), 424242));
  EXPECT_EQ(acct.mint, Key(1));
  EXPECT_EQ(acct.owner, Key(61));
  EXPECT_EQ(acct.amount, 424242u);
  EXPECT_EQ(PoolDecoder::DecodeMintDecimals(Key(1), MintBlob(8)), 8);
  EXPECT_THROW(PoolDecoder::DecodeMintDecimals(Key(1), std::vector<uint8_t>(10, 0)), DecodeError);
}
