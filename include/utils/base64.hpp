#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace Base64 {
  std::string Encode(const std::vector<uint8_t>& data);
  // Throws std::invalid_argument on malformed input
  std::vector<uint8_t> Decode(const std::string& text);
}
