#pragma once
#include <boost/multiprecision/cpp_dec_float.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <string>

using uint128 = boost::multiprecision::uint128_t;
using int128 = boost::multiprecision::int128_t;
using uint256 = boost::multiprecision::uint256_t;
using uint512 = boost::multiprecision::uint512_t;
using BigInt = boost::multiprecision::cpp_int;
using Decimal = boost::multiprecision::cpp_dec_float_50;

namespace Numeric {
  // floor(a * b / denominator) without intermediate overflow
  inline uint256 MulDivFloor(const uint256& a, const uint256& b, const uint256& denominator) {
    uint512 r = static_cast<uint512>(a) * static_cast<uint512>(b) / static_cast<uint512>(denominator);
    return static_cast<uint256>(r);
  }

  inline uint256 MulDivCeil(const uint256& a, const uint256& b, const uint256& denominator) {
    uint512 product = static_cast<uint512>(a) * static_cast<uint512>(b);
    uint512 d = static_cast<uint512>(denominator);
    uint512 q = product / d;
    if (product % d != 0) ++q;
    return static_cast<uint256>(q);
  }

  inline uint256 DivCeil(const uint256& a, const uint256& b) {
    uint256 q = a / b;
    if (a % b != 0) ++q;
    return q;
  }

  inline Decimal ToDecimal(const uint256& v) { return static_cast<Decimal>(v); }

  // Fixed-point rendering for logs and CLI output
  inline std::string Format(const Decimal& v, int digits = 6) {
    return v.str(digits, std::ios_base::fixed);
  }

  inline Decimal Pow10(unsigned n) {
    Decimal r = 1;
    for (unsigned i = 0; i < n; ++i) r *= 10;
    return r;
  }
}
