#include "utils/base64.hpp"
#include <cryptopp/base64.h>
#include <cryptopp/filters.h>
#include <stdexcept>

namespace Base64 {
  std::string Encode(const std::vector<uint8_t>& data) {
    std::string out;
    CryptoPP::StringSource src(data.data(), data.size(), true,
      new CryptoPP::Base64Encoder(new CryptoPP::StringSink(out), false));
    return out;
  }

  std::vector<uint8_t> Decode(const std::string& text) {
    for (char c : text) {
      bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                c == '+' || c == '/' || c == '=';
      if (!ok) throw std::invalid_argument("invalid base64 character");
    }
    std::string decoded;
    CryptoPP::StringSource src(text, true, new CryptoPP::Base64Decoder(new CryptoPP::StringSink(decoded)));
    return std::vector<uint8_t>(decoded.begin(), decoded.end());
  }
}
