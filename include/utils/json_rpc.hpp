#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace JsonRpcUtil {
  // {"jsonrpc":"2.0","id":id,"method":method,"params":params}
  std::string BuildRequest(const std::string& method, const nlohmann::json& params, uint64_t id);
  // Returns the "result" member. Throws RpcResponseError for an "error" member and
  // RpcTransportError when the body is not a JSON-RPC response.
  nlohmann::json ExtractResult(const std::string& json_body);
}
