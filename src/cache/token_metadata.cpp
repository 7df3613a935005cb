#include "cache/token_metadata.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "constants/solana.hpp"
#include "discovery/pool_decoder.hpp"
#include <algorithm>
#include <unordered_map>

std::string TokenMetadataCache::KnownSymbol(const Pubkey& mint) {
  static const std::unordered_map<Pubkey, std::string, PubkeyHash> known = {
    {Pubkey::FromBase58(SolanaConstants::WSOL_MINT), "SOL"},
    {Pubkey::FromBase58(SolanaConstants::USDC_MINT), "USDC"},
    {Pubkey::FromBase58(SolanaConstants::USDT_MINT), "USDT"},
    {Pubkey::FromBase58(SolanaConstants::RAY_MINT), "RAY"},
  };
  auto it = known.find(mint);
  return it == known.end() ? std::string() : it->second;
}

TokenRef TokenMetadataCache::Put(const Pubkey& mint, uint8_t decimals) {
  TokenRef ref{mint, decimals, KnownSymbol(mint)};
  cache_.Tokens().Put(mint, ref);
  return ref;
}

bool TokenMetadataCache::TryGet(const Pubkey& mint, TokenRef& out) const {
  auto cached = cache_.Tokens().Get(mint);
  if (!cached) return false;
  out = *cached;
  return true;
}

TokenRef TokenMetadataCache::Resolve(const Pubkey& mint) {
  return ResolveMany({mint}).front();
}

std::vector<TokenRef> TokenMetadataCache::ResolveMany(const std::vector<Pubkey>& mints) {
  std::vector<TokenRef> out(mints.size());
  std::vector<Pubkey> missing;
  std::vector<size_t> missing_idx;
  for (size_t i = 0; i < mints.size(); ++i) {
    if (!TryGet(mints[i], out[i])) {
      missing.push_back(mints[i]);
      missing_idx.push_back(i);
    }
  }
  if (missing.empty()) return out;

  for (size_t off = 0; off < missing.size(); off += SolanaConstants::MAX_ACCOUNTS_PER_QUERY) {
    size_t end = std::min(missing.size(), off + SolanaConstants::MAX_ACCOUNTS_PER_QUERY);
    std::vector<Pubkey> chunk(missing.begin() + off, missing.begin() + end);
    auto accounts = chain_.GetMultipleAccounts(chunk);
    for (size_t j = 0; j < chunk.size(); ++j) {
      if (j >= accounts.size() || !accounts[j]) throw DecodeError(chunk[j], "mint account not found");
      uint8_t decimals = PoolDecoder::DecodeMintDecimals(chunk[j], accounts[j]->data);
      out[missing_idx[off + j]] = Put(chunk[j], decimals);
    }
  }
  Logger::Debug("Resolved " + std::to_string(missing.size()) + " mint(s) from chain");
  return out;
}
