#include "cryoql/chain_rpc.h"

#include <utility>
#include <vector>

#include <curl/curl.h>

#include "cryoql/log.h"
#include "util/string_util.h"

namespace cryoql {

namespace {

/// Appends curl response bytes into a caller-provided buffer.
/// MUST return the full byte count or curl treats it as an error.
size_t write_to_string(void* contents, size_t size, size_t nmemb, void* userp) {
  size_t total = size * nmemb;
  auto* out = static_cast<std::string*>(userp);
  out->append(static_cast<const char*>(contents), total);
  return total;
}

/// Converts an arbitrarily long hex quantity to base-10 text (wei values exceed int64).
std::string hex_to_decimal_string(const std::string& text) {
  std::string hex = util::trim_ws(text);
  if (util::starts_with(hex, "0x") || util::starts_with(hex, "0X")) hex = hex.substr(2);
  std::vector<int> digits{0};  // little-endian base 10
  for (char c : hex) {
    int value = 0;
    if (c >= '0' && c <= '9') {
      value = c - '0';
    } else if (c >= 'a' && c <= 'f') {
      value = c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      value = c - 'A' + 10;
    } else {
      return "";
    }
    int carry = value;
    for (int& d : digits) {
      int next = d * 16 + carry;
      d = next % 10;
      carry = next / 10;
    }
    while (carry > 0) {
      digits.push_back(carry % 10);
      carry /= 10;
    }
  }
  std::string out;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    out.push_back(static_cast<char>('0' + *it));
  }
  size_t first = out.find_first_not_of('0');
  return first == std::string::npos ? "0" : out.substr(first);
}

json string_or_null(const json& obj, const char* key) {
  if (obj.contains(key) && obj[key].is_string()) return obj[key];
  return nullptr;
}

int64_t hex_field(const json& obj, const char* key) {
  if (!obj.contains(key) || !obj[key].is_string()) return 0;
  return util::parse_hex_quantity(obj[key].get<std::string>()).value_or(0);
}

/// Decimal rendering of a possibly huge quantity: a number when it fits int64, text otherwise.
json big_hex_field(const json& obj, const char* key) {
  if (!obj.contains(key) || !obj[key].is_string()) return 0;
  const std::string raw = obj[key].get<std::string>();
  if (auto small = util::parse_hex_quantity(raw)) return *small;
  return hex_to_decimal_string(raw);
}

json transaction_fields(const std::string& tx_hash, const json& tx) {
  json out = {
      {"transaction_hash", tx_hash},
      {"block_number", hex_field(tx, "blockNumber")},
      {"block_hash", string_or_null(tx, "blockHash")},
      {"from_address", string_or_null(tx, "from")},
      {"to_address", string_or_null(tx, "to")},
      {"value", string_or_null(tx, "value")},
      {"value_decimal", big_hex_field(tx, "value")},
      {"gas_limit", hex_field(tx, "gas")},
      {"gas_price", big_hex_field(tx, "gasPrice")},
      {"nonce", hex_field(tx, "nonce")},
      {"input", string_or_null(tx, "input")},
      {"transaction_index", hex_field(tx, "transactionIndex")},
  };
  return out;
}

}  // namespace

CurlRpcTransport::CurlRpcTransport(int timeout_ms) : timeout_ms_(timeout_ms) {}

RpcResponse CurlRpcTransport::post(const std::string& url, const json& payload) {
  RpcResponse response;
  CURL* curl = curl_easy_init();
  if (!curl) {
    response.error = "Failed to initialize curl";
    return response;
  }
  const std::string body = dump_text(payload);
  std::string buffer;
  struct curl_slist* headers = nullptr;
  headers = curl_slist_append(headers, "Content-Type: application/json");
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "cryoql/0.1");
  CURLcode res = curl_easy_perform(curl);
  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);
  if (res != CURLE_OK) {
    response.error = std::string("RPC request failed: ") + curl_easy_strerror(res);
    return response;
  }

  json decoded = json::parse(buffer, nullptr, false);
  if (decoded.is_discarded()) {
    response.error = "RPC response is not valid JSON (HTTP " + std::to_string(status) + "): " +
                     buffer.substr(0, 200);
    return response;
  }
  response.ok = true;
  response.body = std::move(decoded);
  return response;
}

json make_rpc_request(const std::string& method, const json& params, int id) {
  return json{{"jsonrpc", "2.0"}, {"method", method}, {"params", params}, {"id", id}};
}

ChainClient::ChainClient(std::string rpc_url, RpcTransport& transport)
    : rpc_url_(std::move(rpc_url)), transport_(transport) {}

std::optional<int64_t> ChainClient::latest_block_number() {
  RpcResponse response = transport_.post(rpc_url_, make_rpc_request("eth_blockNumber", json::array(), 1));
  if (!response.ok) {
    log::warn("Exception when fetching latest block: " + response.error);
    return std::nullopt;
  }
  const json& body = response.body;
  if (!body.is_object() || !body.contains("result") || !body["result"].is_string()) {
    std::string detail = "Unknown error";
    if (body.is_object() && body.contains("error")) detail = dump_text(body["error"]);
    log::warn("Error fetching latest block: " + detail);
    return std::nullopt;
  }
  auto block = util::parse_hex_quantity(body["result"].get<std::string>());
  if (!block.has_value()) {
    log::warn("Malformed eth_blockNumber result: " + dump_text(body["result"]));
    return std::nullopt;
  }
  log::info("Latest block number: " + std::to_string(*block));
  return block;
}

json ChainClient::transaction_by_hash(const std::string& tx_hash) {
  RpcResponse tx_response =
      transport_.post(rpc_url_, make_rpc_request("eth_getTransactionByHash", json::array({tx_hash}), 1));
  if (!tx_response.ok) {
    return json{{"error", "Exception when fetching transaction: " + tx_response.error}};
  }
  const json& tx_body = tx_response.body;
  if (!tx_body.is_object() || !tx_body.contains("result") || !tx_body["result"].is_object()) {
    return json{{"error", "Transaction not found: " + tx_hash}};
  }
  const json& tx = tx_body["result"];
  json out = transaction_fields(tx_hash, tx);

  RpcResponse receipt_response =
      transport_.post(rpc_url_, make_rpc_request("eth_getTransactionReceipt", json::array({tx_hash}), 2));
  const bool has_receipt = receipt_response.ok && receipt_response.body.is_object() &&
                           receipt_response.body.contains("result") &&
                           receipt_response.body["result"].is_object();
  if (!has_receipt) {
    out["error"] = "Failed to retrieve transaction receipt";
    return out;
  }

  const json& receipt = receipt_response.body["result"];
  out["gas_used"] = hex_field(receipt, "gasUsed");
  out["status"] = hex_field(receipt, "status");
  out["logs_count"] = receipt.contains("logs") && receipt["logs"].is_array() ? receipt["logs"].size() : 0;
  out["contract_address"] = string_or_null(receipt, "contractAddress");

  if (tx.contains("maxFeePerGas")) {
    out["max_fee_per_gas"] = big_hex_field(tx, "maxFeePerGas");
    out["max_priority_fee_per_gas"] = big_hex_field(tx, "maxPriorityFeePerGas");
    out["transaction_type"] = hex_field(tx, "type");
  }
  return out;
}

}  // namespace cryoql
