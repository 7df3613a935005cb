#include "crypto/pda.hpp"
#include "common/numeric.hpp"
#include "constants/solana.hpp"
#include "crypto/sha256.hpp"
#include <stdexcept>

namespace Crypto {
  namespace {
    const BigInt& FieldPrime() {
      static const BigInt p = (BigInt(1) << 255) - 19;
      return p;
    }

    // d = -121665 / 121666 mod p
    const BigInt& CurveD() {
      static const BigInt d = [] {
        const BigInt& p = FieldPrime();
        BigInt inv = boost::multiprecision::powm(BigInt(121666), p - 2, p);
        return ((p - 121665) * inv) % p;
      }();
      return d;
    }

    const char kPdaMarker[] = "ProgramDerivedAddress";
  }

  bool IsOnCurve(const uint8_t* bytes32) {
    const BigInt& p = FieldPrime();
    BigInt y = 0;
    for (int i = 31; i >= 0; --i) {
      uint8_t b = bytes32[i];
      if (i == 31) b &= 0x7f;
      y = (y << 8) | b;
    }
    y %= p;
    BigInt y2 = (y * y) % p;
    BigInt u = (y2 + p - 1) % p;
    BigInt v = (CurveD() * y2 + 1) % p;
    BigInt w = (u * BigInt(boost::multiprecision::powm(v, p - 2, p))) % p;
    if (w == 0) return true;
    // Euler's criterion: x^2 = w must have a root
    return boost::multiprecision::powm(w, (p - 1) / 2, p) == 1;
  }

  namespace {
    // Throws std::invalid_argument for malformed seeds; false when the hash lands on the curve
    bool TryCreateProgramAddress(const std::vector<std::vector<uint8_t>>& seeds, const Pubkey& program_id, Pubkey& out) {
      if (seeds.size() > 16) throw std::invalid_argument("too many seeds");
      std::vector<uint8_t> buf;
      for (const auto& s : seeds) {
        if (s.size() > 32) throw std::invalid_argument("seed longer than 32 bytes");
        buf.insert(buf.end(), s.begin(), s.end());
      }
      buf.insert(buf.end(), program_id.bytes.begin(), program_id.bytes.end());
      buf.insert(buf.end(), kPdaMarker, kPdaMarker + sizeof(kPdaMarker) - 1);
      auto digest = Sha256(buf);
      if (IsOnCurve(digest.data())) return false;
      out = Pubkey(digest);
      return true;
    }
  }

  Pubkey CreateProgramAddress(const std::vector<std::vector<uint8_t>>& seeds, const Pubkey& program_id) {
    Pubkey out;
    if (!TryCreateProgramAddress(seeds, program_id, out)) throw std::runtime_error("derived address is on curve");
    return out;
  }

  ProgramAddress FindProgramAddress(const std::vector<std::vector<uint8_t>>& seeds, const Pubkey& program_id) {
    std::vector<std::vector<uint8_t>> with_bump = seeds;
    with_bump.push_back({0});
    for (int bump = 255; bump >= 0; --bump) {
      with_bump.back()[0] = static_cast<uint8_t>(bump);
      Pubkey address;
      if (TryCreateProgramAddress(with_bump, program_id, address)) return ProgramAddress{address, static_cast<uint8_t>(bump)};
    }
    throw std::runtime_error("no viable bump for program address");
  }

  std::vector<uint8_t> Seed(const std::string& s) { return std::vector<uint8_t>(s.begin(), s.end()); }

  std::vector<uint8_t> Seed(const Pubkey& k) { return std::vector<uint8_t>(k.bytes.begin(), k.bytes.end()); }

  Pubkey AssociatedTokenAddress(const Pubkey& owner, const Pubkey& mint, const Pubkey& token_program) {
    static const Pubkey ata_program = Pubkey::FromBase58(SolanaConstants::ASSOCIATED_TOKEN_PROGRAM);
    return FindProgramAddress({Seed(owner), Seed(token_program), Seed(mint)}, ata_program).address;
  }
}
