#include "wallet/signer.hpp"
#include "common/logger.hpp"
#include "utils/base58.hpp"
#include <cryptopp/cryptlib.h>
#include <cryptopp/xed25519.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <stdexcept>

static std::vector<uint8_t> ParseKeyMaterial(const std::string& encoded) {
  std::vector<uint8_t> raw;
  if (!encoded.empty() && encoded.front() == '[') {
    auto j = nlohmann::json::parse(encoded);
    for (const auto& v : j) {
      int b = v.get<int>();
      if (b < 0 || b > 255) throw std::invalid_argument("keypair byte out of range");
      raw.push_back(static_cast<uint8_t>(b));
    }
    return raw;
  }
  if (!Base58::Decode(encoded, raw)) throw std::invalid_argument("keypair is not valid base58");
  return raw;
}

KeypairSigner::KeypairSigner(const std::string& encoded_key) {
  if (encoded_key.empty()) throw std::invalid_argument("empty private key");
  auto raw = ParseKeyMaterial(encoded_key);
  if (raw.size() != 32 && raw.size() != 64) throw std::invalid_argument("invalid private key length");
  InitFromSeed(raw.data());
  if (raw.size() == 64 && !std::equal(raw.begin() + 32, raw.end(), public_key_.bytes.begin())) {
    throw std::invalid_argument("keypair public half does not match secret");
  }
}

KeypairSigner KeypairSigner::FromSeed(const std::array<uint8_t, 32>& seed) {
  KeypairSigner s;
  s.InitFromSeed(seed.data());
  return s;
}

void KeypairSigner::InitFromSeed(const uint8_t* seed) {
  std::copy(seed, seed + 32, seed_.begin());
  CryptoPP::ed25519::Signer signer(seed_.data());
  const auto& key = dynamic_cast<const CryptoPP::ed25519PrivateKey&>(signer.GetPrivateKey());
  public_key_ = Pubkey::FromBytes(key.GetPublicKeyBytePtr());
}

Signature KeypairSigner::Sign(const std::vector<uint8_t>& message) const {
  CryptoPP::ed25519::Signer signer(seed_.data());
  Signature sig{};
  size_t len = signer.SignMessage(CryptoPP::NullRNG(), message.data(), message.size(), sig.data());
  if (len != sig.size()) throw std::runtime_error("unexpected ed25519 signature length");
  return sig;
}

std::string SignatureToBase58(const Signature& sig) { return Base58::Encode(sig.data(), sig.size()); }
