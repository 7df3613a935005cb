#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace Crypto {
  std::array<uint8_t, 32> Sha256(const uint8_t* data, size_t len);
  std::array<uint8_t, 32> Sha256(const std::vector<uint8_t>& data);
  // First 8 bytes of sha256("<namespace>:<name>"), e.g. AnchorDiscriminator("account", "PoolState")
  std::array<uint8_t, 8> AnchorDiscriminator(const std::string& ns, const std::string& name);
}
