#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "cryoql/block_range.h"
#include "cryoql/chain_rpc.h"
#include "cryoql/config.h"
#include "cryoql/json.h"
#include "cryoql/process.h"

namespace cryoql {

/// Name, summary and JSON-Schema input description of one caller-facing tool.
struct ToolDescriptor {
  std::string name;
  std::string description;
  json input_schema;
};

const std::vector<ToolDescriptor>& tool_descriptors();
json tool_descriptors_json();

/// Raised for malformed tool arguments; transports report it as a usage error.
class ToolArgumentError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Result of dispatching a tool call.
/// `ok` is false only when the call could not be made (unknown tool, bad arguments);
/// failures inside the tool come back as a document with `error` or `success: false`.
struct ToolCallOutcome {
  bool ok = false;
  json document;
  std::string error;
};

/// True when a tool document reports a failure.
bool is_failure_document(const json& document);

/// Caller-facing operations over one process-wide configuration layer.
/// Every operation resolves its Config at entry and returns a JSON document;
/// no exception crosses an operation boundary.
class ToolService {
 public:
  ToolService(ConfigOverrides process_wide, ProcessRunner& runner, RpcTransport& transport);

  ToolCallOutcome call(const std::string& name, const json& args);

  json list_datasets(const json& args);
  json query_dataset(const json& args);
  json get_dataset_info(const json& args);
  json lookup_dataset(const json& args);
  json query_sql(const json& args);
  json list_available_sql_tables(const json& args);
  json get_sql_table_schema(const json& args);
  json query_blockchain_sql(const json& args);
  json get_sql_examples(const json& args);
  json get_latest_ethereum_block(const json& args);
  json get_transaction_by_hash(const json& args);

  /// Per-call `rpc_url` / `data_dir` arguments over the process-wide layer.
  Config config_for(const json& args) const;

 private:
  json dataset_info(const Config& config, const std::string& name);

  ConfigOverrides process_wide_;
  ProcessRunner& runner_;
  RpcTransport& transport_;
};

constexpr int kSampleTimeoutMs = 30000;

}  // namespace cryoql
