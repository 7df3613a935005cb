#include "common/errors.hpp"
#include <algorithm>
#include <cctype>

static std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}

bool RpcTransportError::IsTransient() const {
  return http_status_ == 0 || http_status_ == 408 || http_status_ == 429 || http_status_ >= 500;
}

bool RpcResponseError::IsTransient() const {
  // -32004 block not available, -32005 node unhealthy/behind, -32014 status not yet available
  if (code_ == -32004 || code_ == -32005 || code_ == -32014) return true;
  if (code_ == 429) return true;
  std::string m = Lower(message_);
  return m.find("blockhash not found") != std::string::npos ||
         m.find("block height exceeded") != std::string::npos ||
         m.find("too many requests") != std::string::npos ||
         m.find("timeout") != std::string::npos;
}

bool IsTransientError(const std::exception& e) {
  if (auto* t = dynamic_cast<const RpcTransportError*>(&e)) return t->IsTransient();
  if (auto* r = dynamic_cast<const RpcResponseError*>(&e)) return r->IsTransient();
  return false;
}
