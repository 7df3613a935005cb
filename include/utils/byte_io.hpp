#pragma once
#include "common/numeric.hpp"
#include "common/pubkey.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// Little-endian readers over account data and writers for instruction payloads.
namespace ByteIO {
  inline void RequireRange(const std::vector<uint8_t>& d, size_t off, size_t width) {
    if (off + width > d.size() || off + width < off) {
      throw std::out_of_range("read of " + std::to_string(width) + " bytes at offset " +
                              std::to_string(off) + " exceeds buffer of " + std::to_string(d.size()));
    }
  }

  template <typename T>
  inline T ReadLE(const std::vector<uint8_t>& d, size_t off) {
    RequireRange(d, off, sizeof(T));
    T v = 0;
    for (size_t i = 0; i < sizeof(T); ++i) v |= static_cast<T>(static_cast<T>(d[off + i]) << (8 * i));
    return v;
  }

  inline uint8_t ReadU8(const std::vector<uint8_t>& d, size_t off) { RequireRange(d, off, 1); return d[off]; }
  inline uint16_t ReadU16(const std::vector<uint8_t>& d, size_t off) { return ReadLE<uint16_t>(d, off); }
  inline uint32_t ReadU32(const std::vector<uint8_t>& d, size_t off) { return ReadLE<uint32_t>(d, off); }
  inline uint64_t ReadU64(const std::vector<uint8_t>& d, size_t off) { return ReadLE<uint64_t>(d, off); }
  inline int32_t ReadI32(const std::vector<uint8_t>& d, size_t off) { return static_cast<int32_t>(ReadU32(d, off)); }
  inline int64_t ReadI64(const std::vector<uint8_t>& d, size_t off) { return static_cast<int64_t>(ReadU64(d, off)); }

  inline uint128 ReadU128(const std::vector<uint8_t>& d, size_t off) {
    uint128 lo = ReadU64(d, off);
    uint128 hi = ReadU64(d, off + 8);
    return (hi << 64) | lo;
  }

  // Two's complement 128-bit value
  inline int128 ReadI128(const std::vector<uint8_t>& d, size_t off) {
    uint128 raw = ReadU128(d, off);
    if (((raw >> 127) & 1) == 0) return static_cast<int128>(raw);
    uint128 magnitude = (~raw) + 1;
    return -static_cast<int128>(magnitude);
  }

  inline Pubkey ReadPubkey(const std::vector<uint8_t>& d, size_t off) {
    RequireRange(d, off, 32);
    return Pubkey::FromBytes(d.data() + off);
  }

  inline void AppendU8(std::vector<uint8_t>& out, uint8_t v) { out.push_back(v); }

  template <typename T>
  inline void AppendLE(std::vector<uint8_t>& out, T v) {
    for (size_t i = 0; i < sizeof(T); ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
  }

  inline void AppendU32(std::vector<uint8_t>& out, uint32_t v) { AppendLE(out, v); }
  inline void AppendU64(std::vector<uint8_t>& out, uint64_t v) { AppendLE(out, v); }

  inline void AppendU128(std::vector<uint8_t>& out, const uint128& v) {
    AppendU64(out, static_cast<uint64_t>(v & 0xffffffffffffffffULL));
    AppendU64(out, static_cast<uint64_t>(v >> 64));
  }

  inline void AppendPubkey(std::vector<uint8_t>& out, const Pubkey& k) {
    out.insert(out.end(), k.bytes.begin(), k.bytes.end());
  }

  inline void AppendBytes(std::vector<uint8_t>& out, const std::vector<uint8_t>& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
  }
}
