#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "cryoql/json.h"

namespace cryoql {

/// Raw outcome of one JSON-RPC POST.
/// `ok` means the transport succeeded and the body decoded as JSON; the body may
/// still carry a JSON-RPC `error` member.
struct RpcResponse {
  bool ok = false;
  json body;
  std::string error;
};

/// Seam for the HTTP leg of JSON-RPC calls.
class RpcTransport {
 public:
  virtual ~RpcTransport() = default;
  virtual RpcResponse post(const std::string& url, const json& payload) = 0;
};

/// libcurl POST with a JSON body.
/// MUST NOT throw; curl and parse failures are reported through RpcResponse::error.
class CurlRpcTransport final : public RpcTransport {
 public:
  explicit CurlRpcTransport(int timeout_ms = 30000);
  RpcResponse post(const std::string& url, const json& payload) override;

 private:
  int timeout_ms_;
};

/// Builds `{"jsonrpc":"2.0","method":...,"params":...,"id":...}`.
json make_rpc_request(const std::string& method, const json& params, int id);

/// Ethereum node calls needed by the tool surface.
class ChainClient {
 public:
  ChainClient(std::string rpc_url, RpcTransport& transport);

  /// eth_blockNumber decoded from hex.
  /// Returns nullopt on transport failure, an RPC error, or a missing/malformed result;
  /// never substitutes a default height.
  std::optional<int64_t> latest_block_number();
  /// eth_getTransactionByHash + eth_getTransactionReceipt merged into one document.
  /// Failures come back as {"error": ...}.
  json transaction_by_hash(const std::string& tx_hash);

 private:
  std::string rpc_url_;
  RpcTransport& transport_;
};

}  // namespace cryoql
