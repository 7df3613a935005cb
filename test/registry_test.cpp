#include <gtest/gtest.h>

#include "cache/token_metadata.hpp"
#include "discovery/pool_decoder.hpp"
#include "discovery/pool_registry.hpp"
#include "node_connection/retrying_chain_data_source.hpp"
#include "test_support.hpp"

using namespace TestSupport;

namespace {
  const uint64_t kBaseBalance = 1000000000000ULL;  // 1000 at 9 decimals
  const uint64_t kQuoteBalance = 200000000000ULL;  // 200000 at 6 decimals

  class RegistryTest : public ::testing::Test {
  protected:
    RegistryTest() : clock(0), cache(clock, CacheTtls{}), tokens(chain, cache) {}

    void SetUp() override {
      const Pubkey token = Program(SolanaConstants::TOKEN_PROGRAM);
      chain.SetAccount(Key(1), token, MintBlob(9));
      chain.SetAccount(Key(2), token, MintBlob(6));

      AmmV4Fields amm;
      amm.base_mint = Key(1);
      amm.quote_mint = Key(2);
      amm.base_vault = Key(101);
      amm.quote_vault = Key(102);
      amm.need_take_pnl_base = 1000000000;
      chain.SetAccount(Key(100), Program(SolanaConstants::RAYDIUM_AMM_V4), AmmV4Blob(amm));
      chain.SetTokenBalance(Key(101), Key(1), kBaseBalance);
      chain.SetTokenBalance(Key(102), Key(2), kQuoteBalance);

      CpSwapFields cp;
      cp.mint_0 = Key(1);
      cp.mint_1 = Key(2);
      cp.vault_0 = Key(111);
      cp.vault_1 = Key(112);
      cp.amm_config = Key(113);
      cp.observation = Key(114);
      cp.protocol_fees_0 = 5;
      cp.fund_fees_0 = 5;
      chain.SetAccount(Key(110), Program(SolanaConstants::RAYDIUM_CP_SWAP), CpSwapBlob(cp));
      chain.SetTokenBalance(Key(111), Key(1), kBaseBalance);
      chain.SetTokenBalance(Key(112), Key(2), kQuoteBalance);
      chain.SetAccount(Key(113), Program(SolanaConstants::RAYDIUM_CP_SWAP), CpConfigBlob(2500));

      StableFields stable;
      stable.mint_a = Key(1);
      stable.mint_b = Key(2);
      stable.vault_a = Key(121);
      stable.vault_b = Key(122);
      chain.SetAccount(Key(120), Program(SolanaConstants::RAYDIUM_STABLE), StableBlob(stable));
      chain.SetTokenBalance(Key(121), Key(1), kBaseBalance);
      chain.SetTokenBalance(Key(122), Key(2), kQuoteBalance);

      ClmmFields clmm;
      clmm.mint_0 = Key(1);
      clmm.mint_1 = Key(2);
      clmm.vault_0 = Key(131);
      clmm.vault_1 = Key(132);
      clmm.amm_config = Key(133);
      clmm.observation = Key(134);
      clmm.liquidity = 1000000000000ULL;
      clmm.sqrt_price_x64 = static_cast<uint128>(1) << 64;
      chain.SetAccount(Key(130), Program(SolanaConstants::RAYDIUM_CLMM), ClmmBlob(clmm));
      chain.SetTokenBalance(Key(131), Key(1), kBaseBalance);
      chain.SetTokenBalance(Key(132), Key(2), kQuoteBalance);
      chain.SetAccount(Key(133), Program(SolanaConstants::RAYDIUM_CLMM), ClmmConfigBlob(2500));
      chain.SetAccount(PoolDecoder::TickArrayAddress(Key(130), 0), Program(SolanaConstants::RAYDIUM_CLMM),
                       TickArrayBlob(Key(130), 0, {{5, 100, 100}}));

      // Matches the pair filters but cannot be decoded
      AmmV4Fields broken = amm;
      broken.fee_denominator = 0;
      chain.SetAccount(Key(140), Program(SolanaConstants::RAYDIUM_AMM_V4), AmmV4Blob(broken));
    }

    PoolRegistry Registry(double min_liquidity = 0.0) {
      RegistryOptions options;
      options.min_liquidity_quote = min_liquidity;
      return PoolRegistry(chain, cache, tokens, options);
    }

    ManualClock clock;
    FakeChainDataSource chain;
    CacheLayer cache;
    TokenMetadataCache tokens;
  };
}

TEST_F(RegistryTest, DiscoversEveryProgramAndDecodes) {
  auto registry = Registry();
  auto result = registry.PoolsForPair(Key(2), Key(1));

  ASSERT_EQ(result.pools.size(), 4u);
  EXPECT_EQ(result.pools[0]->address, Key(100));
  EXPECT_EQ(result.pools[1]->address, Key(110));
  EXPECT_EQ(result.pools[2]->address, Key(120));
  EXPECT_EQ(result.pools[3]->address, Key(130));

  ASSERT_EQ(result.failures.size(), 1u);
  EXPECT_EQ(result.failures[0].pool, Key(140));
  EXPECT_EQ(result.failures[0].stage, "decode");
}

TEST_F(RegistryTest, ReservesExcludePendingFees) {
  auto result = Registry().PoolsForPair(Key(1), Key(2));
  ASSERT_EQ(result.pools.size(), 4u);

  const PoolState& amm = *result.pools[0];
  EXPECT_EQ(amm.program, PoolProgram::AmmV4);
  EXPECT_EQ(amm.token_a.decimals, 9);
  EXPECT_EQ(amm.token_b.decimals, 6);
  EXPECT_EQ(amm.vault_balance_a, kBaseBalance);
  const auto& amm_state = std::get<ConstantProductState>(amm.curve);
  EXPECT_EQ(amm_state.reserve_a, kBaseBalance - 1000000000);
  EXPECT_EQ(amm_state.reserve_b, kQuoteBalance);
  EXPECT_EQ(amm_state.fee_bps, 25u);

  const auto& cp_state = std::get<ConstantProductState>(result.pools[1]->curve);
  EXPECT_EQ(cp_state.reserve_a, kBaseBalance - 10);
  EXPECT_EQ(cp_state.fee_bps, 25u);
  EXPECT_EQ(cp_state.amm_config, Key(113));
  EXPECT_EQ(cp_state.observation, Key(114));
}

TEST_F(RegistryTest, StablePoolResolvesDecimalsFromMints) {
  auto result = Registry().PoolsForPair(Key(1), Key(2));
  const PoolState& stable = *result.pools[2];
  EXPECT_EQ(stable.program, PoolProgram::Stable);
  EXPECT_EQ(stable.token_a.decimals, 9);
  EXPECT_EQ(stable.token_b.decimals, 6);
  const auto& s = std::get<StableState>(stable.curve);
  EXPECT_EQ(s.amp, 100u);
  EXPECT_EQ(s.fee_bps, 4u);
}

TEST_F(RegistryTest, ClmmLoadsExistingTickArrays) {
  auto result = Registry().PoolsForPair(Key(1), Key(2));
  const auto& s = std::get<ClmmState>(result.pools[3]->curve);
  EXPECT_EQ(s.fee_bps, 25u);
  // Radius 3 on each side of the current array
  EXPECT_EQ(s.loaded_array_starts.size(), 7u);
  EXPECT_TRUE(s.IsTickLoaded(-180));
  ASSERT_EQ(s.tick_arrays.size(), 1u);
  EXPECT_EQ(s.tick_arrays.at(0), PoolDecoder::TickArrayAddress(Key(130), 0));
  ASSERT_EQ(s.ticks.count(5), 1u);
  EXPECT_EQ(s.ticks.at(5).liquidity_net, 100);
}

TEST_F(RegistryTest, FreshPoolsComeFromCache) {
  auto registry = Registry();
  registry.PoolsForPair(Key(1), Key(2));
  size_t fetches = chain.get_multiple_calls;
  size_t scans = chain.program_account_calls;

  auto again = registry.PoolsForPair(Key(1), Key(2));
  EXPECT_EQ(again.pools.size(), 4u);
  EXPECT_EQ(chain.get_multiple_calls, fetches);
  EXPECT_EQ(chain.program_account_calls, scans);

  // Pool snapshots expire before the discovery index does
  clock.Advance(CacheTtls{}.pools_ms);
  auto refreshed = registry.PoolsForPair(Key(1), Key(2));
  EXPECT_EQ(refreshed.pools.size(), 4u);
  EXPECT_GT(chain.get_multiple_calls, fetches);
  EXPECT_EQ(chain.program_account_calls, scans);
  EXPECT_EQ(refreshed.pools[0]->observed_at_ms, CacheTtls{}.pools_ms);
}

TEST_F(RegistryTest, PoolSnapshotTtlBoundary) {
  const int64_t ttl = CacheTtls{}.pools_ms;
  auto registry = Registry();
  registry.PoolsForPair(Key(1), Key(2));
  size_t fetches = chain.get_multiple_calls;

  clock.Set(ttl - 1);
  auto cached = registry.PoolsForPair(Key(1), Key(2));
  EXPECT_EQ(chain.get_multiple_calls, fetches);
  EXPECT_EQ(cached.pools[0]->observed_at_ms, 0);

  clock.Set(ttl + 1);
  auto refreshed = registry.PoolsForPair(Key(1), Key(2));
  EXPECT_GT(chain.get_multiple_calls, fetches);
  ASSERT_EQ(refreshed.pools.size(), 4u);
  EXPECT_EQ(refreshed.pools[0]->observed_at_ms, ttl + 1);
}

TEST_F(RegistryTest, TransientReadFailuresAreRetried) {
  RetryingChainDataSource reads(chain, clock, RetryBackoff(100, 1000, 3));
  TokenMetadataCache retrying_tokens(reads, cache);
  PoolRegistry registry(reads, cache, retrying_tokens, RegistryOptions{});

  chain.failing_reads = 2;
  auto result = registry.PoolsForPair(Key(1), Key(2));
  EXPECT_EQ(result.pools.size(), 4u);
  EXPECT_EQ(chain.failing_reads, 0u);
  EXPECT_EQ(clock.Sleeps(), (std::vector<int64_t>{100, 200}));
}

TEST_F(RegistryTest, ReadRetriesStopAtTheCap) {
  RetryingChainDataSource reads(chain, clock, RetryBackoff(100, 1000, 3));
  TokenMetadataCache retrying_tokens(reads, cache);
  PoolRegistry registry(reads, cache, retrying_tokens, RegistryOptions{});

  chain.failing_reads = 3;
  EXPECT_THROW(registry.PoolsForPair(Key(1), Key(2)), RpcTransportError);
  EXPECT_EQ(clock.Sleeps().size(), 2u);
}

TEST_F(RegistryTest, RejectedRequestsAreNotRetried) {
  RetryingChainDataSource reads(chain, clock, RetryBackoff(100, 1000, 3));
  TokenMetadataCache retrying_tokens(reads, cache);
  PoolRegistry registry(reads, cache, retrying_tokens, RegistryOptions{});

  chain.failing_reads = 1;
  chain.failure_status = 403;
  EXPECT_THROW(registry.PoolsForPair(Key(1), Key(2)), RpcTransportError);
  EXPECT_TRUE(clock.Sleeps().empty());
}

TEST_F(RegistryTest, LiquidityFilterReportsSkippedPools) {
  auto result = Registry(1e12).PoolsForPair(Key(1), Key(2));
  EXPECT_TRUE(result.pools.empty());
  size_t filtered = 0;
  for (const auto& f : result.failures) {
    if (f.stage == "filter") ++filtered;
  }
  EXPECT_EQ(filtered, 4u);
}

TEST_F(RegistryTest, MissingVaultIsDecodeFailure) {
  chain.RemoveAccount(Key(112));
  auto result = Registry().PoolsForPair(Key(1), Key(2));
  EXPECT_EQ(result.pools.size(), 3u);
  bool reported = false;
  for (const auto& f : result.failures) {
    if (f.pool == Key(110)) {
      reported = true;
      EXPECT_EQ(f.stage, "decode");
    }
  }
  EXPECT_TRUE(reported);
}

TEST_F(RegistryTest, TokenDiscoveryMatchesEitherSide) {
  auto registry = Registry();
  auto keys = registry.DiscoverToken(Key(2));
  EXPECT_EQ(keys.size(), 5u);
  EXPECT_TRUE(registry.DiscoverToken(Key(77)).empty());
}

TEST_F(RegistryTest, UnknownPairFindsNothing) {
  auto result = Registry().PoolsForPair(Key(1), Key(77));
  EXPECT_TRUE(result.pools.empty());
  EXPECT_TRUE(result.failures.empty());
}
