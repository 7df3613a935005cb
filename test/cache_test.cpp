#include <gtest/gtest.h>

#include "cache/cache_layer.hpp"
#include "cache/token_metadata.hpp"
#include "common/errors.hpp"
#include "test_support.hpp"

using namespace TestSupport;

TEST(TtlCacheTest, ServesUntilTtlElapses) {
  ManualClock clock(1000);
  TtlCache<std::string, int> cache(clock, 500);
  cache.Put("k", 7);

  clock.Set(1499);
  auto hit = cache.Get("k");
  ASSERT_NE(hit, nullptr);
  EXPECT_EQ(*hit, 7);

  clock.Set(1500);
  EXPECT_EQ(cache.Get("k"), nullptr);
}

TEST(TtlCacheTest, RefreshReplacesValueWithoutTouchingReaders) {
  ManualClock clock(0);
  TtlCache<std::string, std::vector<int>> cache(clock, 100);
  cache.Put("k", {1, 2});
  auto reader = cache.Get("k");
  cache.Put("k", {3});
  EXPECT_EQ(*reader, (std::vector<int>{1, 2}));
  EXPECT_EQ(*cache.Get("k"), (std::vector<int>{3}));
}

TEST(TtlCacheTest, PutAtUsesObservationTime) {
  ManualClock clock(10000);
  TtlCache<std::string, int> cache(clock, 1000);
  cache.PutAt("old", 1, 8000);
  cache.PutAt("new", 2, 9500);
  EXPECT_EQ(cache.Get("old"), nullptr);
  EXPECT_NE(cache.Get("new"), nullptr);
  EXPECT_EQ(cache.Prune(), 1u);
  EXPECT_EQ(cache.Size(), 1u);
}

TEST(CacheLayerTest, PairKeyIsOrderIndependent) {
  Pubkey a = Key(1), b = Key(2);
  EXPECT_EQ(CacheLayer::PairKey(a, b), CacheLayer::PairKey(b, a));
  EXPECT_NE(CacheLayer::PairKey(a, b), CacheLayer::PairKey(a, Key(3)));
  EXPECT_NE(CacheLayer::PairKey(a, b), CacheLayer::TokenKey(a));
}

TEST(CacheLayerTest, QuoteKeyChangesWithSnapshotAndAmount) {
  PoolState pool = ConstantProductPool(100, Token(1, 9), Token(2, 6), 1000000, 2000000, 30);
  SwapRequest req = Request(pool.token_a, pool.token_b, 1000);
  std::string base = CacheLayer::QuoteKey(pool, req);

  SwapRequest bigger = req;
  bigger.amount_in = 2000;
  EXPECT_NE(base, CacheLayer::QuoteKey(pool, bigger));

  PoolState newer = pool;
  newer.observed_at_ms = 42;
  EXPECT_NE(base, CacheLayer::QuoteKey(newer, req));

  SwapRequest reverse = Request(pool.token_b, pool.token_a, 1000);
  EXPECT_NE(base, CacheLayer::QuoteKey(pool, reverse));
}

TEST(CacheLayerTest, NamespacesUseTheirOwnTtl) {
  ManualClock clock(0);
  CacheTtls ttls;
  ttls.pools_ms = 100;
  ttls.tokens_ms = 1000;
  CacheLayer cache(clock, ttls);
  cache.Pools().Put(Key(1), PoolState{});
  cache.Tokens().Put(Key(2), Token(2, 6));

  clock.Set(500);
  EXPECT_EQ(cache.Pools().Get(Key(1)), nullptr);
  EXPECT_NE(cache.Tokens().Get(Key(2)), nullptr);

  cache.Clear();
  EXPECT_EQ(cache.Tokens().Get(Key(2)), nullptr);
}

TEST(TokenMetadataTest, ResolvesOnceThenServesFromCache) {
  ManualClock clock(0);
  CacheLayer cache(clock, CacheTtls{});
  FakeChainDataSource chain;
  chain.SetAccount(Key(1), Program(SolanaConstants::TOKEN_PROGRAM), MintBlob(9));
  chain.SetAccount(Key(2), Program(SolanaConstants::TOKEN_PROGRAM), MintBlob(6));
  TokenMetadataCache tokens(chain, cache);

  auto refs = tokens.ResolveMany({Key(1), Key(2)});
  ASSERT_EQ(refs.size(), 2u);
  EXPECT_EQ(refs[0].decimals, 9);
  EXPECT_EQ(refs[1].decimals, 6);
  EXPECT_EQ(chain.get_multiple_calls, 1u);

  EXPECT_EQ(tokens.Resolve(Key(2)).decimals, 6);
  EXPECT_EQ(chain.get_multiple_calls, 1u);

  // Refetched once the token TTL has passed
  clock.Advance(CacheTtls{}.tokens_ms + 1);
  tokens.Resolve(Key(2));
  EXPECT_EQ(chain.get_multiple_calls, 2u);
}

TEST(TokenMetadataTest, MissingMintIsDecodeError) {
  ManualClock clock(0);
  CacheLayer cache(clock, CacheTtls{});
  FakeChainDataSource chain;
  TokenMetadataCache tokens(chain, cache);
  EXPECT_THROW(tokens.Resolve(Key(5)), DecodeError);
}

TEST(TokenMetadataTest, KnownMintsCarrySymbols) {
  EXPECT_EQ(TokenMetadataCache::KnownSymbol(Pubkey::FromBase58(SolanaConstants::USDC_MINT)), "USDC");
  EXPECT_EQ(TokenMetadataCache::KnownSymbol(Pubkey::FromBase58(SolanaConstants::WSOL_MINT)), "SOL");
  EXPECT_EQ(TokenMetadataCache::KnownSymbol(Key(9)), "");
}
