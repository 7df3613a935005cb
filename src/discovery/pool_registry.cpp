#include "discovery/pool_registry.hpp"
#include "common/logger.hpp"
#include "constants/solana.hpp"
#include "discovery/pool_decoder.hpp"
#include "discovery/pool_layouts.hpp"
#include "quotes/clmm_math.hpp"
#include "quotes/quote_engine.hpp"
#include <algorithm>
#include <set>

namespace {
  struct MintOffsets {
    size_t data_size;
    size_t mint_a;
    size_t mint_b;
  };

  MintOffsets OffsetsFor(PoolProgram program) {
    switch (program) {
      case PoolProgram::AmmV4:
        return {PoolLayouts::AmmV4::kSize, PoolLayouts::AmmV4::kBaseMint, PoolLayouts::AmmV4::kQuoteMint};
      case PoolProgram::CpSwap:
        return {PoolLayouts::CpSwap::kSize, PoolLayouts::CpSwap::kToken0Mint, PoolLayouts::CpSwap::kToken1Mint};
      case PoolProgram::Stable:
        return {PoolLayouts::Stable::kSize, PoolLayouts::Stable::kMintA, PoolLayouts::Stable::kMintB};
      case PoolProgram::Clmm:
        return {PoolLayouts::Clmm::kSize, PoolLayouts::Clmm::kTokenMint0, PoolLayouts::Clmm::kTokenMint1};
    }
    return {0, 0, 0};
  }

  uint64_t SaturatingSub(uint64_t a, uint64_t b) { return a > b ? a - b : 0; }
  uint64_t SaturatingSub(uint64_t a, uint64_t b, uint64_t c) { return SaturatingSub(SaturatingSub(a, b), c); }

  const Pubkey& TokenProgram() {
    static const Pubkey k = Pubkey::FromBase58(SolanaConstants::TOKEN_PROGRAM);
    return k;
  }
}

struct PoolRegistry::PendingPool {
  Pubkey address;
  PoolProgram program = PoolProgram::AmmV4;
  int64_t now_ms = 0;
  PoolDecoder::AmmV4Pool amm;
  PoolDecoder::CpSwapPool cp;
  PoolDecoder::StablePool stable;
  PoolDecoder::ClmmPool clmm;
  // CLMM tick arrays requested, by start index
  std::vector<std::pair<int32_t, Pubkey>> tick_arrays;
};

PoolRegistry::PoolRegistry(ChainDataSource& chain, CacheLayer& cache, TokenMetadataCache& tokens,
                           RegistryOptions options)
  : chain_(chain), cache_(cache), tokens_(tokens), options_(std::move(options)) {}

std::vector<std::optional<AccountInfo>> PoolRegistry::FetchAccounts(const std::vector<Pubkey>& keys) {
  std::vector<std::optional<AccountInfo>> out;
  out.reserve(keys.size());
  for (size_t off = 0; off < keys.size(); off += SolanaConstants::MAX_ACCOUNTS_PER_QUERY) {
    size_t end = std::min(keys.size(), off + SolanaConstants::MAX_ACCOUNTS_PER_QUERY);
    std::vector<Pubkey> chunk(keys.begin() + off, keys.begin() + end);
    auto part = chain_.GetMultipleAccounts(chunk);
    if (part.size() != chunk.size()) {
      throw RpcTransportError("getMultipleAccounts returned " + std::to_string(part.size()) + " entries for " +
                              std::to_string(chunk.size()) + " keys");
    }
    for (auto& a : part) out.push_back(std::move(a));
  }
  return out;
}

std::vector<Pubkey> PoolRegistry::DiscoverPair(const Pubkey& mint_a, const Pubkey& mint_b) {
  return Discover(CacheLayer::PairKey(mint_a, mint_b), true, mint_a, mint_b);
}

std::vector<Pubkey> PoolRegistry::DiscoverToken(const Pubkey& mint) {
  return Discover(CacheLayer::TokenKey(mint), false, mint, mint);
}

std::vector<Pubkey> PoolRegistry::Discover(const std::string& index_key, bool pair, const Pubkey& mint_a,
                                           const Pubkey& mint_b) {
  if (auto cached = cache_.PoolIndex().Get(index_key)) return *cached;

  std::set<Pubkey> found;
  for (PoolProgram program : options_.programs) {
    MintOffsets offsets = OffsetsFor(program);
    std::vector<ProgramAccountFilter> filters;
    if (pair) {
      filters.push_back({offsets.data_size, {{offsets.mint_a, mint_a}, {offsets.mint_b, mint_b}}});
      filters.push_back({offsets.data_size, {{offsets.mint_a, mint_b}, {offsets.mint_b, mint_a}}});
    } else {
      filters.push_back({offsets.data_size, {{offsets.mint_a, mint_a}}});
      filters.push_back({offsets.data_size, {{offsets.mint_b, mint_a}}});
    }
    for (const auto& filter : filters) {
      auto keys = chain_.GetProgramAccountKeys(ProgramId(program), filter);
      found.insert(keys.begin(), keys.end());
    }
    Logger::Debug("Discovery " + ToString(program) + ": " + std::to_string(found.size()) + " pool(s) so far");
  }
  std::vector<Pubkey> result(found.begin(), found.end());
  cache_.PoolIndex().Put(index_key, result);
  return result;
}

RegistryResult PoolRegistry::PoolsForPair(const Pubkey& mint_a, const Pubkey& mint_b) {
  return LoadPools(DiscoverPair(mint_a, mint_b));
}

RegistryResult PoolRegistry::PoolsForToken(const Pubkey& mint) {
  return LoadPools(DiscoverToken(mint));
}

bool PoolRegistry::DecodePhaseOne(const Pubkey& address, const AccountInfo& account, int64_t now_ms,
                                  PendingPool& pending, std::vector<PoolFailure>& failures) {
  pending.address = address;
  pending.now_ms = now_ms;
  if (!ProgramFromId(account.owner, pending.program)) {
    failures.push_back({address, "decode", "owner " + account.owner.ToBase58() + " is not a supported pool program"});
    return false;
  }
  try {
    switch (pending.program) {
      case PoolProgram::AmmV4:
        pending.amm = PoolDecoder::DecodeAmmV4(address, account.data);
        if (!pending.amm.SwapEnabled()) {
          Logger::Debug("Skipping amm v4 pool " + address.ToBase58() + " with status " + std::to_string(pending.amm.status));
          return false;
        }
        break;
      case PoolProgram::CpSwap:
        pending.cp = PoolDecoder::DecodeCpSwap(address, account.data);
        if (!pending.cp.SwapEnabled()) {
          Logger::Debug("Skipping cp-swap pool " + address.ToBase58() + ": swap disabled");
          return false;
        }
        break;
      case PoolProgram::Stable:
        pending.stable = PoolDecoder::DecodeStable(address, account.data);
        if (!pending.stable.is_initialized || pending.stable.is_paused) {
          Logger::Debug("Skipping stable pool " + address.ToBase58() + ": uninitialized or paused");
          return false;
        }
        break;
      case PoolProgram::Clmm: {
        pending.clmm = PoolDecoder::DecodeClmm(address, account.data);
        ClmmState layout;
        layout.tick_spacing = pending.clmm.tick_spacing;
        int32_t span = layout.TicksInArray();
        int32_t current = layout.ArrayStartFor(pending.clmm.tick_current);
        int32_t lowest = layout.ArrayStartFor(ClmmMath::kMinTick);
        for (int k = -options_.tick_array_radius; k <= options_.tick_array_radius; ++k) {
          int64_t start = static_cast<int64_t>(current) + static_cast<int64_t>(k) * span;
          if (start < lowest || start > ClmmMath::kMaxTick) continue;
          int32_t s = static_cast<int32_t>(start);
          pending.tick_arrays.emplace_back(s, PoolDecoder::TickArrayAddress(address, s));
        }
        break;
      }
    }
  } catch (const DecodeError& e) {
    failures.push_back({address, "decode", e.Reason()});
    return false;
  } catch (const std::out_of_range& e) {
    failures.push_back({address, "decode", e.what()});
    return false;
  }
  return true;
}

void PoolRegistry::CollectDependencies(const PendingPool& pending, std::vector<Pubkey>& keys) const {
  TokenRef known;
  switch (pending.program) {
    case PoolProgram::AmmV4:
      keys.push_back(pending.amm.base_vault);
      keys.push_back(pending.amm.quote_vault);
      break;
    case PoolProgram::CpSwap:
      keys.push_back(pending.cp.vault_0);
      keys.push_back(pending.cp.vault_1);
      keys.push_back(pending.cp.amm_config);
      break;
    case PoolProgram::Stable:
      keys.push_back(pending.stable.vault_a);
      keys.push_back(pending.stable.vault_b);
      // stable pools carry no decimals
      if (!tokens_.TryGet(pending.stable.mint_a, known)) keys.push_back(pending.stable.mint_a);
      if (!tokens_.TryGet(pending.stable.mint_b, known)) keys.push_back(pending.stable.mint_b);
      break;
    case PoolProgram::Clmm:
      keys.push_back(pending.clmm.vault_0);
      keys.push_back(pending.clmm.vault_1);
      keys.push_back(pending.clmm.amm_config);
      for (const auto& ta : pending.tick_arrays) keys.push_back(ta.second);
      break;
  }
}

bool PoolRegistry::Assemble(PendingPool& pending,
                            const std::unordered_map<Pubkey, const AccountInfo*, PubkeyHash>& deps,
                            PoolState& out, std::vector<PoolFailure>& failures) {
  const Pubkey& address = pending.address;
  auto require = [&](const Pubkey& key, const char* what) -> const AccountInfo& {
    auto it = deps.find(key);
    if (it == deps.end() || it->second == nullptr) throw DecodeError(address, std::string(what) + " " + key.ToBase58() + " not found");
    return *it->second;
  };
  auto balance = [&](const Pubkey& vault) {
    return PoolDecoder::DecodeTokenAccount(vault, require(vault, "vault").data).amount;
  };

  try {
    out.address = address;
    out.program = pending.program;
    out.observed_at_ms = pending.now_ms;
    switch (pending.program) {
      case PoolProgram::AmmV4: {
        const auto& p = pending.amm;
        ConstantProductState s;
        out.vault_balance_a = balance(p.base_vault);
        out.vault_balance_b = balance(p.quote_vault);
        s.reserve_a = SaturatingSub(out.vault_balance_a, p.need_take_pnl_base);
        s.reserve_b = SaturatingSub(out.vault_balance_b, p.need_take_pnl_quote);
        s.fee_bps = p.FeeBps();
        s.vault_a = p.base_vault;
        s.vault_b = p.quote_vault;
        s.token_program_a = TokenProgram();
        s.token_program_b = TokenProgram();
        out.token_a = tokens_.Put(p.base_mint, p.base_decimals);
        out.token_b = tokens_.Put(p.quote_mint, p.quote_decimals);
        out.curve = s;
        if (s.reserve_a == 0 || s.reserve_b == 0) {
          Logger::Debug("Skipping amm v4 pool " + address.ToBase58() + ": empty reserves");
          return false;
        }
        break;
      }
      case PoolProgram::CpSwap: {
        const auto& p = pending.cp;
        ConstantProductState s;
        out.vault_balance_a = balance(p.vault_0);
        out.vault_balance_b = balance(p.vault_1);
        s.reserve_a = SaturatingSub(out.vault_balance_a, p.protocol_fees_0, p.fund_fees_0);
        s.reserve_b = SaturatingSub(out.vault_balance_b, p.protocol_fees_1, p.fund_fees_1);
        s.fee_bps = PoolDecoder::DecodeCpConfigFeeBps(p.amm_config, require(p.amm_config, "amm config").data);
        s.vault_a = p.vault_0;
        s.vault_b = p.vault_1;
        s.amm_config = p.amm_config;
        s.observation = p.observation;
        s.token_program_a = p.token_program_0;
        s.token_program_b = p.token_program_1;
        out.token_a = tokens_.Put(p.mint_0, p.decimals_0);
        out.token_b = tokens_.Put(p.mint_1, p.decimals_1);
        out.curve = s;
        if (s.reserve_a == 0 || s.reserve_b == 0) {
          Logger::Debug("Skipping cp-swap pool " + address.ToBase58() + ": empty reserves");
          return false;
        }
        break;
      }
      case PoolProgram::Stable: {
        const auto& p = pending.stable;
        StableState s;
        out.vault_balance_a = balance(p.vault_a);
        out.vault_balance_b = balance(p.vault_b);
        s.reserve_a = out.vault_balance_a;
        s.reserve_b = out.vault_balance_b;
        s.fee_bps = p.FeeBps();
        s.amp = p.AmpAt(pending.now_ms / 1000);
        s.vault_a = p.vault_a;
        s.vault_b = p.vault_b;
        for (const Pubkey* mint : {&p.mint_a, &p.mint_b}) {
          TokenRef ref;
          if (!tokens_.TryGet(*mint, ref)) {
            ref = tokens_.Put(*mint, PoolDecoder::DecodeMintDecimals(*mint, require(*mint, "mint").data));
          }
          (mint == &p.mint_a ? out.token_a : out.token_b) = ref;
        }
        out.curve = s;
        if (s.reserve_a == 0 || s.reserve_b == 0) {
          Logger::Debug("Skipping stable pool " + address.ToBase58() + ": empty reserves");
          return false;
        }
        break;
      }
      case PoolProgram::Clmm: {
        const auto& p = pending.clmm;
        ClmmState s;
        out.vault_balance_a = balance(p.vault_0);
        out.vault_balance_b = balance(p.vault_1);
        s.sqrt_price_x64 = p.sqrt_price_x64;
        s.tick_current = p.tick_current;
        s.tick_spacing = p.tick_spacing;
        s.liquidity = p.liquidity;
        s.fee_bps = PoolDecoder::DecodeClmmConfigFeeBps(p.amm_config, require(p.amm_config, "amm config").data);
        s.amm_config = p.amm_config;
        s.vault_a = p.vault_0;
        s.vault_b = p.vault_1;
        s.observation = p.observation;
        for (const auto& ta : pending.tick_arrays) {
          // A tick array that was never created holds no initialized ticks
          s.loaded_array_starts.insert(ta.first);
          auto it = deps.find(ta.second);
          if (it == deps.end() || it->second == nullptr) continue;
          auto arr = PoolDecoder::DecodeTickArray(ta.second, it->second->data, p.tick_spacing);
          if (arr.pool != address || arr.start_tick != ta.first) {
            throw DecodeError(ta.second, "tick array does not belong to pool at start " + std::to_string(ta.first));
          }
          for (const auto& t : arr.initialized) s.ticks[t.first] = t.second;
          s.tick_arrays[ta.first] = ta.second;
        }
        out.token_a = tokens_.Put(p.mint_0, p.decimals_0);
        out.token_b = tokens_.Put(p.mint_1, p.decimals_1);
        out.curve = s;
        if (out.vault_balance_a == 0 && out.vault_balance_b == 0) {
          Logger::Debug("Skipping clmm pool " + address.ToBase58() + ": empty vaults");
          return false;
        }
        break;
      }
    }
  } catch (const DecodeError& e) {
    failures.push_back({address, "decode", e.what()});
    return false;
  } catch (const std::out_of_range& e) {
    failures.push_back({address, "decode", e.what()});
    return false;
  }
  return true;
}

bool PoolRegistry::PassesLiquidityFilter(const PoolState& pool, std::vector<PoolFailure>& failures) const {
  if (options_.min_liquidity_quote <= 0) return true;
  Decimal liquidity = LiquidityInQuote(pool);
  if (liquidity >= Decimal(options_.min_liquidity_quote)) return true;
  failures.push_back({pool.address, "filter",
                      "liquidity " + Numeric::Format(liquidity, 2) + " " + pool.token_b.Label() + " below minimum"});
  return false;
}

RegistryResult PoolRegistry::LoadPools(const std::vector<Pubkey>& addresses) {
  RegistryResult result;
  std::vector<std::shared_ptr<const PoolState>> loaded;
  std::vector<Pubkey> stale;
  for (const auto& address : addresses) {
    if (auto cached = cache_.Pools().Get(address)) loaded.push_back(cached);
    else stale.push_back(address);
  }

  if (!stale.empty()) {
    int64_t now_ms = cache_.GetClock().NowMs();
    auto accounts = FetchAccounts(stale);
    std::vector<PendingPool> pending;
    for (size_t i = 0; i < stale.size(); ++i) {
      if (!accounts[i]) {
        result.failures.push_back({stale[i], "decode", "pool account not found"});
        continue;
      }
      PendingPool p;
      if (DecodePhaseOne(stale[i], *accounts[i], now_ms, p, result.failures)) pending.push_back(std::move(p));
    }

    std::vector<Pubkey> dep_keys;
    for (const auto& p : pending) CollectDependencies(p, dep_keys);
    std::sort(dep_keys.begin(), dep_keys.end());
    dep_keys.erase(std::unique(dep_keys.begin(), dep_keys.end()), dep_keys.end());
    std::vector<std::optional<AccountInfo>> dep_accounts;
    if (!dep_keys.empty()) dep_accounts = FetchAccounts(dep_keys);
    std::unordered_map<Pubkey, const AccountInfo*, PubkeyHash> deps;
    for (size_t i = 0; i < dep_keys.size(); ++i) deps[dep_keys[i]] = dep_accounts[i] ? &*dep_accounts[i] : nullptr;

    for (auto& p : pending) {
      PoolState state;
      if (!Assemble(p, deps, state, result.failures)) continue;
      loaded.push_back(cache_.Pools().PutAt(state.address, std::move(state), now_ms));
    }
    Logger::Debug("Decoded " + std::to_string(pending.size()) + " of " + std::to_string(stale.size()) + " pool account(s)");
  }

  for (auto& pool : loaded) {
    if (PassesLiquidityFilter(*pool, result.failures)) result.pools.push_back(std::move(pool));
  }
  std::sort(result.pools.begin(), result.pools.end(),
            [](const auto& a, const auto& b) { return a->address < b->address; });
  return result;
}
