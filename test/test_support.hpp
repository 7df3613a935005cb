#pragma once
#include "common/errors.hpp"
#include "common/numeric.hpp"
#include "common/pubkey.hpp"
#include "constants/solana.hpp"
#include "crypto/sha256.hpp"
#include "discovery/pool_layouts.hpp"
#include "node_connection/chain_data_source.hpp"
#include "pools/pool_state.hpp"
#include "quotes/quote_types.hpp"
#include "utils/base58.hpp"
#include "utils/byte_io.hpp"
#include "wallet/signer.hpp"
#include <algorithm>
#include <cstring>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace TestSupport {
  // Distinct deterministic address; never a real program or mint
  inline Pubkey Key(uint32_t n) {
    std::array<uint8_t, 32> b{};
    b[0] = 0xA5;
    b[28] = static_cast<uint8_t>(n >> 24);
    b[29] = static_cast<uint8_t>(n >> 16);
    b[30] = static_cast<uint8_t>(n >> 8);
    b[31] = static_cast<uint8_t>(n);
    return Pubkey(b);
  }

  inline Pubkey Program(const std::string& id) { return Pubkey::FromBase58(id); }

  inline TokenRef Token(uint32_t n, uint8_t decimals) { return TokenRef{Key(n), decimals, ""}; }

  // In-place little-endian writers over a fixed-size blob
  inline void PutU8(std::vector<uint8_t>& d, size_t off, uint8_t v) { d.at(off) = v; }
  inline void PutLE(std::vector<uint8_t>& d, size_t off, uint64_t v, size_t width) {
    for (size_t i = 0; i < width; ++i) d.at(off + i) = static_cast<uint8_t>(v >> (8 * i));
  }
  inline void PutU16(std::vector<uint8_t>& d, size_t off, uint16_t v) { PutLE(d, off, v, 2); }
  inline void PutU32(std::vector<uint8_t>& d, size_t off, uint32_t v) { PutLE(d, off, v, 4); }
  inline void PutU64(std::vector<uint8_t>& d, size_t off, uint64_t v) { PutLE(d, off, v, 8); }
  inline void PutI32(std::vector<uint8_t>& d, size_t off, int32_t v) { PutU32(d, off, static_cast<uint32_t>(v)); }
  inline void PutU128(std::vector<uint8_t>& d, size_t off, const uint128& v) {
    PutU64(d, off, static_cast<uint64_t>(v & 0xffffffffffffffffULL));
    PutU64(d, off + 8, static_cast<uint64_t>(v >> 64));
  }
  inline void PutI128(std::vector<uint8_t>& d, size_t off, const int128& v) {
    uint128 raw = v >= 0 ? static_cast<uint128>(v) : ~static_cast<uint128>(-v) + 1;
    PutU128(d, off, raw);
  }
  inline void PutKey(std::vector<uint8_t>& d, size_t off, const Pubkey& k) {
    std::memcpy(d.data() + off, k.bytes.data(), 32);
  }
  inline void PutDiscriminator(std::vector<uint8_t>& d, const std::string& account_name) {
    auto disc = Crypto::AnchorDiscriminator("account", account_name);
    std::memcpy(d.data(), disc.data(), disc.size());
  }

  inline std::vector<uint8_t> TokenAccountBlob(const Pubkey& mint, const Pubkey& owner, uint64_t amount) {
    namespace L = PoolLayouts::SplToken;
    std::vector<uint8_t> d(L::kAccountMinSize, 0);
    PutKey(d, L::kAccountMint, mint);
    PutKey(d, L::kAccountOwner, owner);
    PutU64(d, L::kAccountAmount, amount);
    return d;
  }

  inline std::vector<uint8_t> MintBlob(uint8_t decimals) {
    std::vector<uint8_t> d(PoolLayouts::SplToken::kMintMinSize, 0);
    PutU8(d, PoolLayouts::SplToken::kMintDecimals, decimals);
    return d;
  }

  struct AmmV4Fields {
    uint64_t status = 6;
    uint64_t base_decimals = 9;
    uint64_t quote_decimals = 6;
    uint64_t fee_numerator = 25;
    uint64_t fee_denominator = 10000;
    uint64_t need_take_pnl_base = 0;
    uint64_t need_take_pnl_quote = 0;
    Pubkey base_vault, quote_vault, base_mint, quote_mint;
  };

  inline std::vector<uint8_t> AmmV4Blob(const AmmV4Fields& f) {
    namespace L = PoolLayouts::AmmV4;
    std::vector<uint8_t> d(L::kSize, 0);
    PutU64(d, L::kStatus, f.status);
    PutU64(d, L::kBaseDecimals, f.base_decimals);
    PutU64(d, L::kQuoteDecimals, f.quote_decimals);
    PutU64(d, L::kSwapFeeNumerator, f.fee_numerator);
    PutU64(d, L::kSwapFeeDenominator, f.fee_denominator);
    PutU64(d, L::kNeedTakePnlBase, f.need_take_pnl_base);
    PutU64(d, L::kNeedTakePnlQuote, f.need_take_pnl_quote);
    PutKey(d, L::kBaseVault, f.base_vault);
    PutKey(d, L::kQuoteVault, f.quote_vault);
    PutKey(d, L::kBaseMint, f.base_mint);
    PutKey(d, L::kQuoteMint, f.quote_mint);
    return d;
  }

  struct CpSwapFields {
    Pubkey amm_config, vault_0, vault_1, mint_0, mint_1, observation;
    Pubkey token_program_0 = Program(SolanaConstants::TOKEN_PROGRAM);
    Pubkey token_program_1 = Program(SolanaConstants::TOKEN_PROGRAM);
    uint8_t status = 0;
    uint8_t decimals_0 = 9;
    uint8_t decimals_1 = 6;
    uint64_t protocol_fees_0 = 0, protocol_fees_1 = 0, fund_fees_0 = 0, fund_fees_1 = 0;
  };

  inline std::vector<uint8_t> CpSwapBlob(const CpSwapFields& f) {
    namespace L = PoolLayouts::CpSwap;
    std::vector<uint8_t> d(L::kSize, 0);
    PutDiscriminator(d, "PoolState");
    PutKey(d, L::kAmmConfig, f.amm_config);
    PutKey(d, L::kToken0Vault, f.vault_0);
    PutKey(d, L::kToken1Vault, f.vault_1);
    PutKey(d, L::kToken0Mint, f.mint_0);
    PutKey(d, L::kToken1Mint, f.mint_1);
    PutKey(d, L::kToken0Program, f.token_program_0);
    PutKey(d, L::kToken1Program, f.token_program_1);
    PutKey(d, L::kObservation, f.observation);
    PutU8(d, L::kStatus, f.status);
    PutU8(d, L::kMint0Decimals, f.decimals_0);
    PutU8(d, L::kMint1Decimals, f.decimals_1);
    PutU64(d, L::kProtocolFees0, f.protocol_fees_0);
    PutU64(d, L::kProtocolFees1, f.protocol_fees_1);
    PutU64(d, L::kFundFees0, f.fund_fees_0);
    PutU64(d, L::kFundFees1, f.fund_fees_1);
    return d;
  }

  inline std::vector<uint8_t> CpConfigBlob(uint64_t trade_fee_ppm) {
    std::vector<uint8_t> d(236, 0);
    PutDiscriminator(d, "AmmConfig");
    PutU64(d, PoolLayouts::CpSwap::kConfigTradeFeeRate, trade_fee_ppm);
    return d;
  }

  struct StableFields {
    uint8_t is_initialized = 1;
    uint8_t is_paused = 0;
    uint64_t initial_amp = 100;
    uint64_t target_amp = 100;
    int64_t ramp_start_s = 0;
    int64_t ramp_stop_s = 0;
    Pubkey mint_a, mint_b, vault_a, vault_b;
    uint64_t fee_numerator = 4;
    uint64_t fee_denominator = 10000;
  };

  inline std::vector<uint8_t> StableBlob(const StableFields& f) {
    namespace L = PoolLayouts::Stable;
    std::vector<uint8_t> d(L::kSize, 0);
    PutU8(d, L::kIsInitialized, f.is_initialized);
    PutU8(d, L::kIsPaused, f.is_paused);
    PutU64(d, L::kInitialAmp, f.initial_amp);
    PutU64(d, L::kTargetAmp, f.target_amp);
    PutU64(d, L::kStartRamp, static_cast<uint64_t>(f.ramp_start_s));
    PutU64(d, L::kStopRamp, static_cast<uint64_t>(f.ramp_stop_s));
    PutKey(d, L::kMintA, f.mint_a);
    PutKey(d, L::kMintB, f.mint_b);
    PutKey(d, L::kVaultA, f.vault_a);
    PutKey(d, L::kVaultB, f.vault_b);
    PutU64(d, L::kTradeFeeNumerator, f.fee_numerator);
    PutU64(d, L::kTradeFeeDenominator, f.fee_denominator);
    return d;
  }

  struct ClmmFields {
    Pubkey amm_config, mint_0, mint_1, vault_0, vault_1, observation;
    uint8_t decimals_0 = 9;
    uint8_t decimals_1 = 6;
    uint16_t tick_spacing = 1;
    uint128 liquidity = 0;
    uint128 sqrt_price_x64 = 0;
    int32_t tick_current = 0;
  };

  inline std::vector<uint8_t> ClmmBlob(const ClmmFields& f) {
    namespace L = PoolLayouts::Clmm;
    std::vector<uint8_t> d(L::kSize, 0);
    PutDiscriminator(d, "PoolState");
    PutKey(d, L::kAmmConfig, f.amm_config);
    PutKey(d, L::kTokenMint0, f.mint_0);
    PutKey(d, L::kTokenMint1, f.mint_1);
    PutKey(d, L::kTokenVault0, f.vault_0);
    PutKey(d, L::kTokenVault1, f.vault_1);
    PutKey(d, L::kObservation, f.observation);
    PutU8(d, L::kMintDecimals0, f.decimals_0);
    PutU8(d, L::kMintDecimals1, f.decimals_1);
    PutU16(d, L::kTickSpacing, f.tick_spacing);
    PutU128(d, L::kLiquidity, f.liquidity);
    PutU128(d, L::kSqrtPriceX64, f.sqrt_price_x64);
    PutI32(d, L::kTickCurrent, f.tick_current);
    return d;
  }

  inline std::vector<uint8_t> ClmmConfigBlob(uint32_t trade_fee_ppm) {
    std::vector<uint8_t> d(117, 0);
    PutDiscriminator(d, "AmmConfig");
    PutU32(d, PoolLayouts::Clmm::kConfigTradeFeeRate, trade_fee_ppm);
    return d;
  }

  struct TickEntry {
    int32_t tick;
    int128 liquidity_net;
    uint128 liquidity_gross;
  };

  inline std::vector<uint8_t> TickArrayBlob(const Pubkey& pool, int32_t start, const std::vector<TickEntry>& ticks,
                                            uint16_t tick_spacing = 1) {
    namespace L = PoolLayouts::Clmm;
    std::vector<uint8_t> d(L::kTickArraySize, 0);
    PutDiscriminator(d, "TickArrayState");
    PutKey(d, L::kTickArrayPool, pool);
    PutI32(d, L::kTickArrayStart, start);
    for (const auto& t : ticks) {
      size_t slot = static_cast<size_t>((t.tick - start) / tick_spacing);
      size_t base = L::kTickArrayTicks + slot * L::kTickStride;
      PutI32(d, base + L::kTickIndex, t.tick);
      PutI128(d, base + L::kTickLiquidityNet, t.liquidity_net);
      PutU128(d, base + L::kTickLiquidityGross, t.liquidity_gross);
    }
    return d;
  }

  // In-memory chain. Program account queries apply data-size and memcmp filters
  // to the stored accounts owned by the program.
  class FakeChainDataSource : public ChainDataSource {
  public:
    void SetAccount(const Pubkey& key, const Pubkey& owner, std::vector<uint8_t> data, uint64_t lamports = 1) {
      std::lock_guard<std::mutex> lock(mutex_);
      accounts_[key] = AccountInfo{owner, lamports, std::move(data)};
    }
    void RemoveAccount(const Pubkey& key) {
      std::lock_guard<std::mutex> lock(mutex_);
      accounts_.erase(key);
    }
    void SetTokenBalance(const Pubkey& account, const Pubkey& mint, uint64_t amount) {
      SetAccount(account, Program(SolanaConstants::TOKEN_PROGRAM), TokenAccountBlob(mint, Key(999999), amount));
    }

    std::vector<std::optional<AccountInfo>> GetMultipleAccounts(const std::vector<Pubkey>& keys) override {
      std::lock_guard<std::mutex> lock(mutex_);
      ++get_multiple_calls;
      FailReadIfScheduled();
      max_batch = std::max(max_batch, keys.size());
      std::vector<std::optional<AccountInfo>> out;
      for (const auto& k : keys) {
        auto it = accounts_.find(k);
        if (it == accounts_.end()) out.push_back(std::nullopt);
        else out.push_back(it->second);
      }
      return out;
    }

    std::vector<Pubkey> GetProgramAccountKeys(const Pubkey& program, const ProgramAccountFilter& filter) override {
      std::lock_guard<std::mutex> lock(mutex_);
      ++program_account_calls;
      FailReadIfScheduled();
      std::vector<Pubkey> out;
      for (const auto& kv : accounts_) {
        const AccountInfo& a = kv.second;
        if (a.owner != program) continue;
        if (filter.data_size && a.data.size() != *filter.data_size) continue;
        bool match = true;
        for (const auto& m : filter.memcmp) {
          if (m.offset + 32 > a.data.size() || std::memcmp(a.data.data() + m.offset, m.bytes.data(), 32) != 0) {
            match = false;
            break;
          }
        }
        if (match) out.push_back(kv.first);
      }
      return out;
    }

    LatestBlockhash GetLatestBlockhash() override {
      std::lock_guard<std::mutex> lock(mutex_);
      ++blockhash_calls;
      FailReadIfScheduled();
      return LatestBlockhash{Key(0xB10C0000u + static_cast<uint32_t>(blockhash_calls)), 1000};
    }

    SimulationResult SimulateTransaction(const std::vector<uint8_t>& wire_tx,
                                         const std::vector<Pubkey>& accounts) override {
      std::lock_guard<std::mutex> lock(mutex_);
      ++simulate_calls;
      FailReadIfScheduled();
      last_simulated = wire_tx;
      if (simulate) return simulate(accounts);
      SimulationResult r;
      r.success = true;
      return r;
    }

    std::string SendTransaction(const std::vector<uint8_t>& wire_tx) override {
      std::function<std::string(size_t)> hook;
      size_t n;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        sent.push_back(wire_tx);
        n = sent.size();
        hook = send;
      }
      std::string result = hook ? hook(n) : "";
      // Single-signer transactions: compact length 1, then the signature
      std::string id = Base58::Encode(wire_tx.data() + 1, 64);
      std::lock_guard<std::mutex> lock(mutex_);
      landed.insert(id);
      return result.empty() ? id : result;
    }

    SignatureStatus GetSignatureStatus(const std::string& signature) override {
      std::function<SignatureStatus(const std::string&)> hook;
      bool was_sent;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        ++status_calls;
        hook = status;
        was_sent = landed.count(signature) != 0;
      }
      if (hook) return hook(signature);
      return SignatureStatus{was_sent ? SignatureState::Confirmed : SignatureState::NotFound, ""};
    }

    // Hooks; default behaviour when unset
    std::function<SimulationResult(const std::vector<Pubkey>&)> simulate;
    std::function<std::string(size_t)> send;  // argument: 1-based send count; throwing rejects the transaction
    std::function<SignatureStatus(const std::string&)> status;

    // The next `failing_reads` reads throw RpcTransportError with `failure_status` (0: no response)
    size_t failing_reads = 0;
    long failure_status = 0;

    size_t get_multiple_calls = 0;
    size_t max_batch = 0;
    size_t program_account_calls = 0;
    size_t blockhash_calls = 0;
    size_t simulate_calls = 0;
    size_t status_calls = 0;
    std::vector<uint8_t> last_simulated;
    std::vector<std::vector<uint8_t>> sent;
    std::set<std::string> landed;

  private:
    void FailReadIfScheduled() {
      if (failing_reads == 0) return;
      --failing_reads;
      throw RpcTransportError(failure_status ? "HTTP POST failed status=" + std::to_string(failure_status)
                                             : std::string("connection reset by peer"), failure_status);
    }

    std::mutex mutex_;
    std::map<Pubkey, AccountInfo> accounts_;
  };

  // Simulated post-state of one token account
  inline SimulationResult SimulatedBalance(const Pubkey& mint, uint64_t amount) {
    SimulationResult r;
    r.success = true;
    r.accounts.push_back(AccountInfo{Program(SolanaConstants::TOKEN_PROGRAM), 1,
                                     TokenAccountBlob(mint, Key(999999), amount)});
    return r;
  }

  inline PoolState ConstantProductPool(uint32_t id, const TokenRef& a, const TokenRef& b, uint64_t reserve_a,
                                       uint64_t reserve_b, uint32_t fee_bps) {
    PoolState p;
    p.address = Key(id);
    p.program = PoolProgram::AmmV4;
    p.token_a = a;
    p.token_b = b;
    p.vault_balance_a = reserve_a;
    p.vault_balance_b = reserve_b;
    ConstantProductState s;
    s.reserve_a = reserve_a;
    s.reserve_b = reserve_b;
    s.fee_bps = fee_bps;
    s.vault_a = Key(id + 1);
    s.vault_b = Key(id + 2);
    p.curve = s;
    return p;
  }

  inline PoolState StablePoolState(uint32_t id, const TokenRef& a, const TokenRef& b, uint64_t reserve_a,
                                   uint64_t reserve_b, uint32_t fee_bps, uint64_t amp) {
    PoolState p;
    p.address = Key(id);
    p.program = PoolProgram::Stable;
    p.token_a = a;
    p.token_b = b;
    p.vault_balance_a = reserve_a;
    p.vault_balance_b = reserve_b;
    StableState s;
    s.reserve_a = reserve_a;
    s.reserve_b = reserve_b;
    s.fee_bps = fee_bps;
    s.amp = amp;
    s.vault_a = Key(id + 1);
    s.vault_b = Key(id + 2);
    p.curve = s;
    return p;
  }

  // Signature derived from the message hash, so each blockhash gives a distinct transaction id
  class HashSigner : public TransactionSigner {
  public:
    explicit HashSigner(const Pubkey& key) : key_(key) {}
    Pubkey PublicKey() const override { return key_; }
    Signature Sign(const std::vector<uint8_t>& message) const override {
      auto h = Crypto::Sha256(message);
      Signature sig{};
      std::copy(h.begin(), h.end(), sig.begin());
      std::copy(key_.bytes.begin(), key_.bytes.end(), sig.begin() + 32);
      return sig;
    }
  private:
    Pubkey key_;
  };

  inline SwapRequest Request(const TokenRef& in, const TokenRef& out, uint64_t amount, uint32_t slippage_bps = 50) {
    SwapRequest r;
    r.input = in;
    r.output = out;
    r.amount_in = amount;
    r.slippage_bps = slippage_bps;
    return r;
  }
}
