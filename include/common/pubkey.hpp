#pragma once
#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <vector>

// 32-byte account address.
struct Pubkey {
  std::array<uint8_t, 32> bytes{};

  Pubkey() = default;
  explicit Pubkey(const std::array<uint8_t, 32>& b) : bytes(b) {}

  // Throws std::invalid_argument when the text is not a 32-byte base58 key
  static Pubkey FromBase58(const std::string& text);
  static bool TryFromBase58(const std::string& text, Pubkey& out);
  static Pubkey FromBytes(const uint8_t* data);

  std::string ToBase58() const;
  std::string Short() const;
  bool IsZero() const;
  const uint8_t* data() const { return bytes.data(); }

  bool operator==(const Pubkey& o) const { return bytes == o.bytes; }
  bool operator!=(const Pubkey& o) const { return bytes != o.bytes; }
  bool operator<(const Pubkey& o) const { return bytes < o.bytes; }
};

struct PubkeyHash {
  size_t operator()(const Pubkey& k) const {
    size_t h;
    std::memcpy(&h, k.bytes.data(), sizeof(h));
    return h;
  }
};

namespace std {
  template <> struct hash<Pubkey> {
    size_t operator()(const Pubkey& k) const { return PubkeyHash()(k); }
  };
}
