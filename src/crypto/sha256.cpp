#include "crypto/sha256.hpp"
#include <cryptopp/sha.h>
#include <algorithm>

namespace Crypto {
  std::array<uint8_t, 32> Sha256(const uint8_t* data, size_t len) {
    std::array<uint8_t, 32> digest{};
    CryptoPP::SHA256 hash;
    hash.CalculateDigest(digest.data(), data, len);
    return digest;
  }

  std::array<uint8_t, 32> Sha256(const std::vector<uint8_t>& data) { return Sha256(data.data(), data.size()); }

  std::array<uint8_t, 8> AnchorDiscriminator(const std::string& ns, const std::string& name) {
    std::string preimage = ns + ":" + name;
    auto digest = Sha256(reinterpret_cast<const uint8_t*>(preimage.data()), preimage.size());
    std::array<uint8_t, 8> out{};
    std::copy(digest.begin(), digest.begin() + 8, out.begin());
    return out;
  }
}
