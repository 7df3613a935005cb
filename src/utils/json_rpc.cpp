#include "utils/json_rpc.hpp"
#include "common/errors.hpp"

using json = nlohmann::json;

namespace JsonRpcUtil {
  std::string BuildRequest(const std::string& method, const json& params, uint64_t id) {
    json j;
    j["jsonrpc"] = "2.0";
    j["id"] = id;
    j["method"] = method;
    j["params"] = params;
    return j.dump();
  }

  json ExtractResult(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) throw RpcTransportError("malformed JSON-RPC response");
    if (j.contains("error") && !j["error"].is_null()) {
      const auto& e = j["error"];
      int code = e.value("code", 0);
      std::string message = e.value("message", e.dump());
      throw RpcResponseError(code, message);
    }
    if (!j.contains("result")) throw RpcTransportError("missing result");
    return j["result"];
  }
}
