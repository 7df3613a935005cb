#include "common/pubkey.hpp"
#include "utils/base58.hpp"
#include <algorithm>
#include <stdexcept>

bool Pubkey::TryFromBase58(const std::string& text, Pubkey& out) {
  std::vector<uint8_t> raw;
  if (text.empty() || text.size() > 44) return false;
  if (!Base58::Decode(text, raw) || raw.size() != 32) return false;
  std::copy(raw.begin(), raw.end(), out.bytes.begin());
  return true;
}

Pubkey Pubkey::FromBase58(const std::string& text) {
  Pubkey k;
  if (!TryFromBase58(text, k)) throw std::invalid_argument("invalid pubkey: " + text);
  return k;
}

Pubkey Pubkey::FromBytes(const uint8_t* data) {
  Pubkey k;
  std::copy(data, data + 32, k.bytes.begin());
  return k;
}

std::string Pubkey::ToBase58() const { return Base58::Encode(bytes.data(), bytes.size()); }

std::string Pubkey::Short() const {
  auto s = ToBase58();
  if (s.size() <= 10) return s;
  return s.substr(0, 4) + ".." + s.substr(s.size() - 4);
}

bool Pubkey::IsZero() const {
  return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b){ return b == 0; });
}
