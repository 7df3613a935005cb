#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace Base58 {
  std::string Encode(const uint8_t* data, size_t len);
  std::string Encode(const std::vector<uint8_t>& data);
  // Returns false on characters outside the bitcoin alphabet
  bool Decode(const std::string& text, std::vector<uint8_t>& out);
}
