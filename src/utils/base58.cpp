#include "utils/base58.hpp"
#include <algorithm>

namespace Base58 {
  static const char* kAlphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

  static int DigitValue(char c) {
    static int8_t table[128];
    static bool ready = [] {
      std::fill(std::begin(table), std::end(table), static_cast<int8_t>(-1));
      for (int i = 0; i < 58; ++i) table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
      return true;
    }();
    (void)ready;
    auto u = static_cast<unsigned char>(c);
    if (u >= 128) return -1;
    return table[u];
  }

  std::string Encode(const uint8_t* data, size_t len) {
    size_t zeros = 0;
    while (zeros < len && data[zeros] == 0) ++zeros;
    // log(256)/log(58) ~ 1.37
    std::vector<uint8_t> digits((len - zeros) * 138 / 100 + 1, 0);
    size_t used = 0;
    for (size_t i = zeros; i < len; ++i) {
      int carry = data[i];
      size_t j = 0;
      for (auto it = digits.rbegin(); (carry != 0 || j < used) && it != digits.rend(); ++it, ++j) {
        carry += 256 * (*it);
        *it = static_cast<uint8_t>(carry % 58);
        carry /= 58;
      }
      used = j;
    }
    auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - used);
    while (it != digits.end() && *it == 0) ++it;
    std::string out(zeros, '1');
    for (; it != digits.end(); ++it) out.push_back(kAlphabet[*it]);
    return out;
  }

  std::string Encode(const std::vector<uint8_t>& data) { return Encode(data.data(), data.size()); }

  bool Decode(const std::string& text, std::vector<uint8_t>& out) {
    out.clear();
    size_t zeros = 0;
    while (zeros < text.size() && text[zeros] == '1') ++zeros;
    // log(58)/log(256) ~ 0.733
    std::vector<uint8_t> bytes((text.size() - zeros) * 733 / 1000 + 1, 0);
    size_t used = 0;
    for (size_t i = zeros; i < text.size(); ++i) {
      int carry = DigitValue(text[i]);
      if (carry < 0) return false;
      size_t j = 0;
      for (auto it = bytes.rbegin(); (carry != 0 || j < used) && it != bytes.rend(); ++it, ++j) {
        carry += 58 * (*it);
        *it = static_cast<uint8_t>(carry % 256);
        carry /= 256;
      }
      used = j;
    }
    auto it = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - used);
    while (it != bytes.end() && *it == 0) ++it;
    out.assign(zeros, 0);
    out.insert(out.end(), it, bytes.end());
    return true;
  }
}
