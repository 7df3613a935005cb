#include "node_connection/rpc_client.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "constants/solana.hpp"
#include "net/http_client.hpp"
#include "scheduler/request_limiter.hpp"
#include "utils/base58.hpp"
#include "utils/base64.hpp"
#include "utils/json_rpc.hpp"
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

static inline std::string Trim(const std::string& s) {
  size_t start = 0, end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end-1]))) --end;
  return s.substr(start, end - start);
}

static void ApplyAuthHeader(std::unordered_map<std::string, std::string>& headers,
                            const std::optional<std::string>& auth_header_opt) {
  if (!auth_header_opt || auth_header_opt->empty()) return;
  const std::string& raw = *auth_header_opt;
  auto pos = raw.find(':');
  if (pos != std::string::npos) {
    std::string name = Trim(raw.substr(0, pos));
    std::string value = Trim(raw.substr(pos + 1));
    if (!name.empty() && !value.empty()) {
      headers[name] = value;
      return;
    }
  }
  headers["Authorization"] = raw;
}

SolanaRpcClient::SolanaRpcClient(HttpClient& http,
                                 const std::string& endpoint_url,
                                 const std::optional<std::string>& auth_header,
                                 RequestLimiter* limiter,
                                 int timeout_ms,
                                 const std::string& commitment)
  : http_(http), endpoint_(endpoint_url), limiter_(limiter), timeout_ms_(timeout_ms), commitment_(commitment) {
  default_headers_.reserve(2);
  default_headers_["Content-Type"] = "application/json";
  ApplyAuthHeader(default_headers_, auth_header);
}

std::string SolanaRpcClient::HttpPost(const std::string& body) {
  RequestLimiter::Permit permit(limiter_);
  auto resp = http_.Post(endpoint_, body, default_headers_, timeout_ms_);
  if (!resp.error.empty()) throw RpcTransportError(resp.error);
  if (resp.status < 200 || resp.status >= 300) {
    Logger::Warning("HTTP POST failed status=" + std::to_string(resp.status));
    throw RpcTransportError("HTTP POST failed status=" + std::to_string(resp.status), resp.status);
  }
  return resp.body;
}

json SolanaRpcClient::Call(const std::string& method, const json& params) {
  auto payload = JsonRpcUtil::BuildRequest(method, params, next_id_.fetch_add(1));
  auto body = HttpPost(payload);
  return JsonRpcUtil::ExtractResult(body);
}

std::optional<AccountInfo> SolanaRpcClient::ParseAccount(const json& value) {
  if (value.is_null()) return std::nullopt;
  AccountInfo info;
  info.owner = Pubkey::FromBase58(value.at("owner").get<std::string>());
  info.lamports = value.value("lamports", static_cast<uint64_t>(0));
  const auto& data = value.at("data");
  if (data.is_array() && !data.empty()) {
    info.data = Base64::Decode(data.at(0).get<std::string>());
  } else if (data.is_string()) {
    info.data = Base64::Decode(data.get<std::string>());
  }
  return info;
}

std::vector<std::optional<AccountInfo>> SolanaRpcClient::GetMultipleAccounts(const std::vector<Pubkey>& keys) {
  std::vector<std::optional<AccountInfo>> out;
  out.reserve(keys.size());
  const size_t chunk = SolanaConstants::MAX_ACCOUNTS_PER_QUERY;
  for (size_t start = 0; start < keys.size(); start += chunk) {
    size_t end = std::min(keys.size(), start + chunk);
    json addrs = json::array();
    for (size_t i = start; i < end; ++i) addrs.push_back(keys[i].ToBase58());
    json cfg = {{"encoding", "base64"}, {"commitment", commitment_}};
    auto result = Call("getMultipleAccounts", json::array({addrs, cfg}));
    const auto& value = result.at("value");
    if (!value.is_array() || value.size() != end - start) {
      throw RpcTransportError("getMultipleAccounts returned " + std::to_string(value.size()) +
                              " entries for " + std::to_string(end - start) + " keys");
    }
    for (const auto& v : value) out.push_back(ParseAccount(v));
  }
  return out;
}

std::vector<Pubkey> SolanaRpcClient::GetProgramAccountKeys(const Pubkey& program, const ProgramAccountFilter& filter) {
  json filters = json::array();
  if (filter.data_size) filters.push_back(json{{"dataSize", *filter.data_size}});
  for (const auto& m : filter.memcmp) {
    json memcmp = {{"offset", m.offset}, {"bytes", m.bytes.ToBase58()}};
    filters.push_back(json{{"memcmp", memcmp}});
  }
  json cfg = {
    {"encoding", "base64"},
    {"commitment", commitment_},
    {"dataSlice", json{{"offset", 0}, {"length", 0}}},
    {"filters", filters}
  };
  auto result = Call("getProgramAccounts", json::array({program.ToBase58(), cfg}));
  std::vector<Pubkey> keys;
  const json& list = result.is_object() && result.contains("value") ? result["value"] : result;
  for (const auto& entry : list) keys.push_back(Pubkey::FromBase58(entry.at("pubkey").get<std::string>()));
  return keys;
}

LatestBlockhash SolanaRpcClient::GetLatestBlockhash() {
  json params = json::array();
  params.push_back(json{{"commitment", commitment_}});
  auto result = Call("getLatestBlockhash", params);
  const auto& value = result.at("value");
  LatestBlockhash lb;
  lb.blockhash = Pubkey::FromBase58(value.at("blockhash").get<std::string>());
  lb.last_valid_block_height = value.value("lastValidBlockHeight", static_cast<uint64_t>(0));
  return lb;
}

SimulationResult SolanaRpcClient::SimulateTransaction(const std::vector<uint8_t>& wire_tx,
                                                      const std::vector<Pubkey>& accounts) {
  json cfg = {
    {"encoding", "base64"},
    {"commitment", "processed"},
    {"sigVerify", false},
    {"replaceRecentBlockhash", true}
  };
  if (!accounts.empty()) {
    json addrs = json::array();
    for (const auto& k : accounts) addrs.push_back(k.ToBase58());
    cfg["accounts"] = json{{"encoding", "base64"}, {"addresses", addrs}};
  }
  auto result = Call("simulateTransaction", json::array({Base64::Encode(wire_tx), cfg}));
  const auto& value = result.at("value");
  SimulationResult sim;
  sim.success = !value.contains("err") || value["err"].is_null();
  if (!sim.success) sim.error = value["err"].dump();
  if (value.contains("logs") && value["logs"].is_array()) {
    for (const auto& l : value["logs"]) sim.logs.push_back(l.get<std::string>());
  }
  if (value.contains("accounts") && value["accounts"].is_array()) {
    for (const auto& a : value["accounts"]) sim.accounts.push_back(ParseAccount(a));
  }
  if (value.contains("unitsConsumed") && value["unitsConsumed"].is_number()) {
    sim.units_consumed = value["unitsConsumed"].get<uint64_t>();
  }
  return sim;
}

std::string SolanaRpcClient::SendTransaction(const std::vector<uint8_t>& wire_tx) {
  json cfg = {
    {"encoding", "base64"},
    {"skipPreflight", true},
    {"maxRetries", 0}
  };
  auto result = Call("sendTransaction", json::array({Base64::Encode(wire_tx), cfg}));
  return result.get<std::string>();
}

SignatureStatus SolanaRpcClient::GetSignatureStatus(const std::string& signature) {
  json params = json::array();
  params.push_back(json::array({signature}));
  params.push_back(json{{"searchTransactionHistory", false}});
  auto result = Call("getSignatureStatuses", params);
  const auto& value = result.at("value");
  SignatureStatus st;
  if (!value.is_array() || value.empty() || value[0].is_null()) return st;
  const auto& s = value[0];
  if (s.contains("err") && !s["err"].is_null()) {
    st.state = SignatureState::Failed;
    st.error = s["err"].dump();
    return st;
  }
  std::string level = s.value("confirmationStatus", std::string("processed"));
  if (level == "finalized") st.state = SignatureState::Finalized;
  else if (level == "confirmed") st.state = SignatureState::Confirmed;
  else st.state = SignatureState::Processed;
  return st;
}
