#pragma once
#include "common/pubkey.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Account bytes that do not match the expected layout for their owner program.
class DecodeError : public std::runtime_error {
public:
  DecodeError(const Pubkey& account, const std::string& reason)
    : std::runtime_error("decode " + account.ToBase58() + ": " + reason), account_(account), reason_(reason) {}
  const Pubkey& Account() const { return account_; }
  const std::string& Reason() const { return reason_; }
private:
  Pubkey account_;
  std::string reason_;
};

// Connection failures, timeouts and non-2xx HTTP responses. http_status is 0 when
// no response arrived.
class RpcTransportError : public std::runtime_error {
public:
  RpcTransportError(const std::string& what, long http_status = 0)
    : std::runtime_error(what), http_status_(http_status) {}
  long HttpStatus() const { return http_status_; }
  // No response, 408, 429 and 5xx. Other 4xx mean a bad endpoint, auth header or request.
  bool IsTransient() const;
private:
  long http_status_;
};

// JSON-RPC "error" object returned by the node.
class RpcResponseError : public std::runtime_error {
public:
  RpcResponseError(int code, const std::string& message)
    : std::runtime_error("rpc error " + std::to_string(code) + ": " + message), code_(code), message_(message) {}
  int Code() const { return code_; }
  const std::string& Message() const { return message_; }
  bool IsTransient() const;
private:
  int code_;
  std::string message_;
};

// True for transient RpcTransportError and RpcResponseError values.
bool IsTransientError(const std::exception& e);

struct PoolFailure {
  Pubkey pool;
  std::string stage;  // "discover", "decode", "quote", "filter"
  std::string reason;
};

class NoRouteFound : public std::runtime_error {
public:
  NoRouteFound(const std::string& what, std::vector<PoolFailure> failures)
    : std::runtime_error(what), failures_(std::move(failures)) {}
  const std::vector<PoolFailure>& Failures() const { return failures_; }
private:
  std::vector<PoolFailure> failures_;
};

class SimulationFailed : public std::runtime_error {
public:
  SimulationFailed(const std::string& reason, uint64_t simulated_out, uint64_t minimum_out)
    : std::runtime_error("simulation failed: " + reason), reason_(reason),
      simulated_out_(simulated_out), minimum_out_(minimum_out) {}
  const std::string& Reason() const { return reason_; }
  uint64_t SimulatedOut() const { return simulated_out_; }
  uint64_t MinimumOut() const { return minimum_out_; }
private:
  std::string reason_;
  uint64_t simulated_out_;
  uint64_t minimum_out_;
};
